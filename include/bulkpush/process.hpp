#pragma once
#include <bulkpush/error.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bulkpush {

// Copies share one flag; cancel() is visible to every holder.
class CancelToken {
public:
  CancelToken() : flag_(std::make_shared<std::atomic_bool>(false)) {}

  void cancel() { flag_->store(true); }
  bool cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic_bool> flag_;
};

struct CommandInvocation {
  std::vector<std::string> args; // without the binary itself
  std::filesystem::path cwd;
  std::optional<std::string> input;
  std::optional<CancelToken> cancel;
  std::function<void(int pid)> on_spawn;
  std::optional<std::chrono::milliseconds> timeout;
};

struct CommandResult {
  int exit_code{0};
  std::string out;
  std::string err;
};

class Executor {
public:
  virtual ~Executor() = default;

  // Throws ExecutionError on non-zero exit, spawn failure, timeout or
  // cancellation.
  virtual CommandResult execute(const CommandInvocation &inv) = 0;
};

class ProcessExecutor : public Executor {
public:
  explicit ProcessExecutor(std::string binary = "git");

  CommandResult execute(const CommandInvocation &inv) override;

  const std::string &binary() const { return binary_; }

  // Variables forced into the child environment so the tool never waits on
  // an interactive prompt.
  static std::unordered_map<std::string, std::string> prompt_free_env();

private:
  std::string binary_;
};

} // namespace bulkpush
