#include <bulkpush/config.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace bulkpush {

static void env_string(const char *name, std::string &dst) {
  if (const char *v = ::getenv(name); v && *v)
    dst = v;
}

template <typename T>
static void env_number(const char *name, T &dst, long min_value) {
  const char *v = ::getenv(name);
  if (!v || !*v)
    return;
  char *end = nullptr;
  errno = 0;
  long n = std::strtol(v, &end, 10);
  if (errno != 0 || end == v || *end != '\0' || n < min_value) {
    spdlog::warn("[config] ignoring {}='{}': expected an integer >= {}", name, v,
                 min_value);
    return;
  }
  if (static_cast<unsigned long long>(n) >
      static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
    spdlog::warn("[config] ignoring {}='{}': larger than {}", name, v,
                 std::numeric_limits<T>::max());
    return;
  }
  dst = static_cast<T>(n);
}

Config Config::from_env() {
  Config c;
  env_string("BULKPUSH_GIT", c.git);
  env_string("BULKPUSH_REMOTE", c.remote);
  env_number("BULKPUSH_BATCH_SIZE", c.batch_size, 1);
  env_number("BULKPUSH_BATCH_TIMEOUT_SEC", c.batch_timeout_sec, 1);
  env_number("BULKPUSH_QUERY_TIMEOUT_SEC", c.query_timeout_sec, 1);
  env_number("BULKPUSH_LARGE_FILE_MB", c.large_file_threshold_mb, 1);
  env_number("BULKPUSH_MAX_UNTRACKED_COMMITS", c.max_commits_without_upstream, 1);
  env_number("BULKPUSH_MAX_PACK_MB", c.max_pack_mb, 0);
  env_string("BULKPUSH_LOG_LEVEL", c.log_level);
  env_string("BULKPUSH_LOG_FILE", c.log_file);
  env_number("BULKPUSH_LOG_MAX_MB", c.log_max_mb, 1);
  return c;
}

} // namespace bulkpush
