#pragma once
#include <cstdint>
#include <string>

namespace bulkpush {

struct Config {
  std::string git = "git";
  std::string remote = "origin";
  int batch_size = 50;
  int batch_timeout_sec = 600;
  int query_timeout_sec = 120;
  std::uint64_t large_file_threshold_mb = 50;
  int max_commits_without_upstream = 1000;
  // batches estimated above this are split before they are sent; 0 disables
  std::uint64_t max_pack_mb = 1536;
  std::string log_level = "info";
  std::string log_file;
  std::uint64_t log_max_mb = 5;

  // Defaults overridden by BULKPUSH_* environment variables.
  static Config from_env();
};

} // namespace bulkpush
