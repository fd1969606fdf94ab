#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bulkpush {

enum class BranchStatus { New, Existing, Diverged };

const char *to_string(BranchStatus s);

struct BranchState {
  std::string current_branch;
  std::string upstream;
  bool has_upstream{false};
  int ahead{0};
  int behind{0};

  BranchStatus branch_status() const;
  bool is_protected() const;
  bool is_fresh() const;

  bool operator==(const BranchState &o) const;
};

bool is_protected_branch(const std::string &name);

struct LargeFile {
  std::string path;
  std::uint64_t size_bytes{0};
  bool in_working_tree{false};
  bool in_history{false};

  bool operator==(const LargeFile &o) const;
};

struct RepositoryStats {
  std::uint64_t total_size_bytes{0};
  std::uint64_t objects_size_bytes{0};
  std::uint64_t working_tree_size_bytes{0};
  std::uint64_t lfs_tracked_size_bytes{0};
  std::uint64_t file_count{0};
  std::uint64_t commit_count{0};
  std::uint64_t branch_count{0};
  std::uint64_t largest_pack_bytes{0};
  std::optional<std::uint64_t> push_size_bytes;
  std::optional<std::uint64_t> push_commit_count;
  // push_size_bytes is a per-commit estimate, not a measurement
  bool push_size_approximate{false};
  std::vector<LargeFile> large_files;
  // sub-queries that failed; their fields are left at zero
  std::vector<std::string> failed_queries;

  bool operator==(const RepositoryStats &o) const;
  bool operator!=(const RepositoryStats &o) const { return !(*this == o); }
};

// Parsers for the line-oriented tool output the analyzer consumes.
BranchState parse_branch_status(const std::string &porcelain_v2);
std::optional<std::uint64_t> parse_count_objects(const std::string &out);
std::optional<std::uint64_t> parse_human_size(const std::string &text);
std::uint64_t parse_lfs_sizes(const std::string &out);
// Sum of `cat-file --batch-check='%(objectsize:disk) %(rest)'` output.
// Lines not starting with a size ("<sha> missing") are ignored.
std::uint64_t parse_object_sizes(const std::string &batch_check_out);
std::uint64_t count_nul_separated(const std::string &out);
std::uint64_t count_lines(const std::string &out);
std::vector<std::string> split_lines(const std::string &out);

std::string format_bytes(std::uint64_t bytes);

} // namespace bulkpush
