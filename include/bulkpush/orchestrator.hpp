#pragma once
#include <bulkpush/analyzer.hpp>
#include <bulkpush/chunked_push.hpp>
#include <bulkpush/config.hpp>
#include <bulkpush/process.hpp>
#include <bulkpush/strategy.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bulkpush {

struct RepositoryReport {
  RepositoryStats stats;
  BranchState branch;
  std::vector<std::string> recommendations;
};

// Entry points used by front ends. Wires configuration into the analyzer,
// the strategy analyzer and the push engine, all sharing one executor and
// one cancellation token.
class Orchestrator {
public:
  explicit Orchestrator(Config cfg = Config{});
  // exec must outlive the orchestrator
  Orchestrator(Config cfg, Executor &exec);

  RepositoryReport analyze_repository(const std::filesystem::path &repo) const;

  StrategyAnalysis recommend_strategy(const RepositoryStats &stats,
                                      const BranchState &branch) const;

  ChunkedPushResult
  execute_chunked_push(const std::filesystem::path &repo,
                       std::optional<int> batch_size = std::nullopt,
                       std::function<void(const PushProgress &)> on_progress = {}) const;

  // Stops the running operation at the next process boundary.
  void cancel() { cancel_.cancel(); }
  const CancelToken &cancel_token() const { return cancel_; }

  const Config &config() const { return cfg_; }

private:
  AnalyzerOptions analyzer_options() const;

  Config cfg_;
  std::unique_ptr<Executor> owned_;
  Executor *exec_;
  CancelToken cancel_;
};

} // namespace bulkpush
