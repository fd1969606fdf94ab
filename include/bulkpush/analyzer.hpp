#pragma once
#include <bulkpush/process.hpp>
#include <bulkpush/repo_stats.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bulkpush {

struct AnalyzerOptions {
  std::uint64_t large_file_threshold_bytes = 50ull * 1024 * 1024;
  std::chrono::milliseconds query_timeout{std::chrono::minutes(2)};
  // used when the repository gives no average to derive one from
  std::uint64_t fallback_bytes_per_commit = 1024 * 1024;
  std::optional<CancelToken> cancel;
};

// Read-only measurements of a repository. Independent queries run
// concurrently; a failed query zeroes its field and is listed in
// RepositoryStats::failed_queries.
class RepositoryAnalyzer {
public:
  explicit RepositoryAnalyzer(Executor &exec, AnalyzerOptions opts = {});

  // Throws ExecutionError if repo is not a repository.
  RepositoryStats analyze(const std::filesystem::path &repo) const;
  // Same, also handing back the branch state the measurements were based on.
  RepositoryStats analyze(const std::filesystem::path &repo, BranchState &branch) const;

  BranchState branch_state(const std::filesystem::path &repo) const;

  // Housekeeping advice, independent of the push strategy decision.
  std::vector<std::string> recommendations(const RepositoryStats &stats) const;

private:
  CommandResult git(const std::filesystem::path &repo,
                    std::vector<std::string> args,
                    std::optional<std::string> input = std::nullopt) const;

  std::uint64_t file_count(const std::filesystem::path &repo) const;
  std::uint64_t commit_count(const std::filesystem::path &repo) const;
  std::uint64_t branch_count(const std::filesystem::path &repo) const;
  std::uint64_t objects_size(const std::filesystem::path &repo) const;
  std::uint64_t largest_pack(const std::filesystem::path &repo) const;
  std::uint64_t working_tree_size(const std::filesystem::path &repo) const;
  std::uint64_t lfs_tracked_size(const std::filesystem::path &repo) const;
  std::vector<LargeFile> large_files(const std::filesystem::path &repo) const;

  struct PushMeasure {
    std::uint64_t commits{0};
    std::optional<std::uint64_t> bytes; // absent: could not measure
  };
  PushMeasure push_measure(const std::filesystem::path &repo,
                           const BranchState &branch) const;

  Executor &exec_;
  AnalyzerOptions opts_;
};

} // namespace bulkpush
