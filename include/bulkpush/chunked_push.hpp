#pragma once
#include <bulkpush/process.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bulkpush {

enum class PushOutcome { Completed, Partial, Failed };

const char *to_string(PushOutcome o);

struct SkippedCommit {
  std::string sha;
  std::string reason;
  std::optional<ErrorKind> kind;
};

struct BatchAttempt {
  std::size_t start{0}; // index of the first commit in the batch
  int size{0};
  bool ok{false};
};

struct PushProgress {
  std::size_t total{0};
  std::size_t pushed{0};
  std::size_t skipped{0};
  int batch_size{0};
  std::string phase; // "splitting", "pushing", "pushed", "retrying", "skipped", "done"
};

struct ChunkedPushResult {
  bool success{false};
  PushOutcome outcome{PushOutcome::Failed};
  std::string branch;
  std::size_t total_commits{0};
  std::size_t pushed_count{0};
  std::vector<SkippedCommit> skipped;
  bool upstream_established{false};
  std::string message;
  std::optional<ErrorKind> error_kind;
  std::string error_output;
  std::vector<BatchAttempt> attempts;
};

struct ChunkedPushOptions {
  std::string remote = "origin";
  int initial_batch_size = 50;
  std::chrono::milliseconds batch_timeout{std::chrono::minutes(10)};
  std::chrono::milliseconds query_timeout{std::chrono::minutes(2)};
  // how far back to look when the branch has no upstream yet
  int max_commits_without_upstream = 1000;
  // estimated pack size above which a batch is split before it is sent
  std::optional<std::uint64_t> max_pack_bytes;
  std::optional<CancelToken> cancel;
  std::function<void(const PushProgress &)> on_progress;
};

// Only size- or connection-related failures are worth a smaller batch.
bool is_retryable(const std::optional<ErrorKind> &kind);

// Pushes unpushed commits oldest-first in batches that halve on retryable
// failures. Batches run sequentially; only one run per clone at a time.
class ChunkedPushEngine {
public:
  explicit ChunkedPushEngine(Executor &exec, ChunkedPushOptions opts = {});

  // Throws ExecutionError when the starting state cannot be read (no
  // repository, detached HEAD); push failures are reported in the result.
  ChunkedPushResult push_in_batches(const std::filesystem::path &repo);
  ChunkedPushResult push_in_batches(const std::filesystem::path &repo,
                                    int initial_batch_size);

private:
  // Where the commits are listed against and pushed to.
  struct Upstream {
    std::string name;   // "origin/main", as rev-list takes it
    std::string remote; // "origin"
    std::string ref;    // "refs/heads/main"
  };

  CommandResult git(const std::filesystem::path &repo, std::vector<std::string> args,
                    std::chrono::milliseconds timeout,
                    std::optional<std::string> input = std::nullopt) const;

  std::string current_branch(const std::filesystem::path &repo) const;
  std::optional<Upstream> upstream(const std::filesystem::path &repo,
                                   const std::string &branch) const;
  std::vector<std::string> unpushed_commits(const std::filesystem::path &repo,
                                            const std::optional<Upstream> &upstream) const;
  // On-disk size of the objects reachable from target but not from base.
  std::uint64_t estimate_bytes(const std::filesystem::path &repo, const std::string &target,
                               const std::string &base) const;

  void report(const PushProgress &p) const;

  Executor &exec_;
  ChunkedPushOptions opts_;
};

} // namespace bulkpush
