#include <bulkpush/cli.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string_view>

namespace bulkpush {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static std::optional<int> parse_positive(const char *s) {
  errno = 0;
  char *end = nullptr;
  long v = std::strtol(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0' || v < 1 || v > INT_MAX)
    return std::nullopt;
  return static_cast<int>(v);
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  // shared by all commands: [path] [--json] [--verbose]; returns false on an
  // argument the caller did not consume
  bool path_seen = false;
  auto common = [&](std::string_view a, std::string &path, bool &json) {
    if (a == "--json") {
      json = true;
      return true;
    }
    if (a == "--verbose" || a == "-v") {
      r.verbose = true;
      return true;
    }
    if (!a.empty() && a[0] != '-' && !path_seen) {
      path = std::string(a);
      path_seen = true;
      return true;
    }
    return false;
  };

  if (cmd == "analyze" || cmd == "recommend") {
    std::string path = ".";
    bool json = false;
    for (int i = 2; i < argc; i++) {
      if (!common(argv[i], path, json)) {
        r.error = cmd + ": unexpected argument '" + argv[i] + "'";
        return r;
      }
    }
    if (cmd == "analyze")
      r.cmd = CmdAnalyze{path, json};
    else
      r.cmd = CmdRecommend{path, json};
    return r;
  }

  if (cmd == "push") {
    CmdPush c{};
    for (int i = 2; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--batch-size" || a == "--timeout-sec") {
        if (!has_arg(i, argc)) {
          r.error = "push: " + std::string(a) + " requires a value";
          return r;
        }
        auto v = parse_positive(argv[++i]);
        if (!v) {
          r.error = "push: " + std::string(a) + " must be a positive integer";
          return r;
        }
        (a == "--batch-size" ? c.batch_size : c.timeout_sec) = *v;
      } else if (a == "--remote") {
        if (!has_arg(i, argc)) {
          r.error = "push: --remote requires a value";
          return r;
        }
        c.remote = argv[++i];
      } else if (!common(a, c.path, c.json)) {
        r.error = "push: unexpected argument '" + std::string(a) + "'";
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace bulkpush
