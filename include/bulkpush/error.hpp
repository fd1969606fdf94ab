#pragma once
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace bulkpush {

enum class ErrorKind {
  ToolNotFound,
  AuthenticationFailed,
  NoRemoteConfigured,
  NotARepository,
  RepositoryLocked,
  Conflict,
  DirtyWorkTree,
  PushRejected,
  RemoteConnectionError,
  PermissionDenied,
  InvalidRef,
  Cancelled,
};

const char *to_string(ErrorKind k);
std::string to_string(const std::optional<ErrorKind> &k);

struct ClassifyRule {
  std::regex pattern;
  ErrorKind kind;
};

// Ordered: the first matching rule wins.
const std::vector<ClassifyRule> &classify_rules();

std::optional<ErrorKind> classify_stderr(const std::string &err);

struct ExecutionErrorInfo {
  std::string message;
  std::optional<int> exit_code;
  std::string out;
  std::string err;
  std::optional<ErrorKind> kind;
  std::string command;
  std::vector<std::string> args;
};

class ExecutionError : public std::runtime_error {
public:
  explicit ExecutionError(ExecutionErrorInfo info)
      : std::runtime_error(info.message), info_(std::move(info)) {}

  const ExecutionErrorInfo &info() const { return info_; }
  std::optional<ErrorKind> kind() const { return info_.kind; }
  std::optional<int> exit_code() const { return info_.exit_code; }
  const std::string &out() const { return info_.out; }
  const std::string &err() const { return info_.err; }

private:
  ExecutionErrorInfo info_;
};

} // namespace bulkpush
