#include <bulkpush/app.hpp>
#include <bulkpush/cli.hpp>
#include <bulkpush/orchestrator.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

#ifndef BULKPUSH_COMMIT
#define BULKPUSH_COMMIT "unknown"
#endif
#ifndef BULKPUSH_BRANCH
#define BULKPUSH_BRANCH "unknown"
#endif
#ifndef BULKPUSH_BUILD_TIME
#define BULKPUSH_BUILD_TIME "unknown"
#endif

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace bulkpush {

static void print_help() {
  std::cout <<
      R"(bulkpush - analyze a repository and push large histories in batches

Usage:
  bulkpush analyze   [path] [--json]
  bulkpush recommend [path] [--json]
  bulkpush push      [path] [--batch-size N] [--remote NAME] [--timeout-sec S] [--json]
  bulkpush version

Options:
  --verbose, -v   debug logging on stderr

Environment:
  BULKPUSH_GIT, BULKPUSH_REMOTE, BULKPUSH_BATCH_SIZE, BULKPUSH_BATCH_TIMEOUT_SEC,
  BULKPUSH_QUERY_TIMEOUT_SEC, BULKPUSH_LARGE_FILE_MB, BULKPUSH_MAX_UNTRACKED_COMMITS,
  BULKPUSH_MAX_PACK_MB,
  BULKPUSH_LOG_LEVEL, BULKPUSH_LOG_FILE, BULKPUSH_LOG_MAX_MB
)";
}

static constexpr const char *kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

// Logs go to stderr so that stdout carries only command output.
static void setup_logging(const Config *cfg, bool verbose) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (cfg && !cfg->log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg->log_file, cfg->log_max_mb * 1024 * 1024, 3));
    } catch (const spdlog::spdlog_ex &e) {
      spdlog::warn("failed to open log file {}: {}", cfg->log_file, e.what());
    }
  }
  auto logger = std::make_shared<spdlog::logger>("bulkpush", sinks.begin(), sinks.end());
  logger->set_pattern(kLogPattern);
  auto level = spdlog::level::info;
  if (cfg) {
    level = spdlog::level::from_str(cfg->log_level);
    if (level == spdlog::level::off && cfg->log_level != "off")
      level = spdlog::level::info;
  }
  if (verbose)
    level = spdlog::level::debug;
  logger->set_level(level);
  spdlog::set_default_logger(logger);
}

static std::atomic<bool> g_interrupted{false};

static void on_signal(int) { g_interrupted.store(true); }

// Turns SIGINT/SIGTERM into cancellation of the running operation. Children
// run in their own process group and do not see the terminal's signals.
class InterruptGuard {
public:
  explicit InterruptGuard(CancelToken token) : token_(std::move(token)) {
    g_interrupted.store(false);
    prev_int_ = std::signal(SIGINT, on_signal);
    prev_term_ = std::signal(SIGTERM, on_signal);
    th_ = std::thread([this] {
      while (!done_.load()) {
        if (g_interrupted.exchange(false)) {
          spdlog::warn("interrupted; stopping after the current command");
          token_.cancel();
        }
        std::this_thread::sleep_for(100ms);
      }
    });
  }
  ~InterruptGuard() {
    done_.store(true);
    th_.join();
    std::signal(SIGINT, prev_int_);
    std::signal(SIGTERM, prev_term_);
  }
  InterruptGuard(const InterruptGuard &) = delete;
  InterruptGuard &operator=(const InterruptGuard &) = delete;

private:
  CancelToken token_;
  std::atomic<bool> done_{false};
  void (*prev_int_)(int) = SIG_DFL;
  void (*prev_term_)(int) = SIG_DFL;
  std::thread th_;
};

static std::string json_str(const std::string &s) {
  std::string out = "\"";
  for (unsigned char c : s) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (c < 0x20)
        out += fmt::format("\\u{:04x}", c);
      else
        out += static_cast<char>(c);
    }
  }
  return out + "\"";
}

static std::string json_bool(bool b) { return b ? "true" : "false"; }

template <typename T, typename Fn>
static std::string json_array(const std::vector<T> &v, Fn item) {
  std::string out = "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i)
      out += ",";
    out += item(v[i]);
  }
  return out + "]";
}

static std::string json_strings(const std::vector<std::string> &v) {
  return json_array(v, [](const std::string &s) { return json_str(s); });
}

template <typename T> static std::string json_opt(const std::optional<T> &v) {
  return v ? fmt::format("{}", *v) : "null";
}

static std::string json_kind(const std::optional<ErrorKind> &k) {
  return k ? json_str(to_string(*k)) : "null";
}

static std::string branch_json(const BranchState &b) {
  return fmt::format(
      R"({{"name":{},"upstream":{},"has_upstream":{},"ahead":{},"behind":{},"status":{},"protected":{}}})",
      json_str(b.current_branch), b.has_upstream ? json_str(b.upstream) : "null",
      json_bool(b.has_upstream), b.ahead, b.behind, json_str(to_string(b.branch_status())),
      json_bool(b.is_protected()));
}

static std::string stats_json(const RepositoryStats &s) {
  auto large = json_array(s.large_files, [](const LargeFile &f) {
    return fmt::format(R"({{"path":{},"size_bytes":{},"in_working_tree":{},"in_history":{}}})",
                       json_str(f.path), f.size_bytes, json_bool(f.in_working_tree),
                       json_bool(f.in_history));
  });
  return fmt::format(
      R"({{"total_size_bytes":{},"objects_size_bytes":{},"working_tree_size_bytes":{},)"
      R"("lfs_tracked_size_bytes":{},"file_count":{},"commit_count":{},"branch_count":{},)"
      R"("largest_pack_bytes":{},"push_size_bytes":{},"push_commit_count":{},)"
      R"("push_size_approximate":{},"large_files":{},"failed_queries":{}}})",
      s.total_size_bytes, s.objects_size_bytes, s.working_tree_size_bytes,
      s.lfs_tracked_size_bytes, s.file_count, s.commit_count, s.branch_count,
      s.largest_pack_bytes, json_opt(s.push_size_bytes), json_opt(s.push_commit_count),
      json_bool(s.push_size_approximate), large, json_strings(s.failed_queries));
}

static std::string risks_json(const std::vector<RiskNote> &risks) {
  return json_array(risks, [](const RiskNote &r) {
    return fmt::format(R"({{"severity":{},"text":{}}})", json_str(to_string(r.severity)),
                       json_str(r.text));
  });
}

static std::string analysis_json(const StrategyAnalysis &a) {
  auto options = json_array(a.options, [](const StrategyOption &o) {
    return fmt::format(
        R"({{"kind":{},"label":{},"description":{},"recommended":{},"pros":{},"cons":{},)"
        R"("requirements":{},"estimated_duration":{},"command":{}}})",
        json_str(to_string(o.kind)), json_str(o.label), json_str(o.description),
        json_bool(o.recommended), json_strings(o.rationale), json_strings(o.risks),
        json_strings(o.requirements),
        o.estimated_duration ? json_str(*o.estimated_duration) : "null",
        json_str(o.command_template));
  });
  return fmt::format(
      R"({{"recommendation":{},"matched_rule":{},"branch_status":{},"protected_branch":{},)"
      R"("fresh_branch":{},"decision_size_mb":{:.2f},"size_approximate":{},"rationale":{},)"
      R"("risks":{},"explanation":{},"options":{}}})",
      json_str(to_string(a.recommendation)), json_str(a.matched_rule),
      json_str(to_string(a.branch_status)), json_bool(a.protected_branch),
      json_bool(a.fresh_branch), a.decision_size_mb, json_bool(a.size_approximate),
      json_strings(a.rationale), risks_json(a.risks), json_str(a.explanation), options);
}

static std::string push_json(const ChunkedPushResult &r) {
  auto skipped = json_array(r.skipped, [](const SkippedCommit &s) {
    return fmt::format(R"({{"sha":{},"reason":{},"kind":{}}})", json_str(s.sha),
                       json_str(s.reason), json_kind(s.kind));
  });
  return fmt::format(
      R"({{"success":{},"outcome":{},"branch":{},"total_commits":{},"pushed":{},)"
      R"("skipped":{},"upstream_established":{},"attempts":{},"message":{},)"
      R"("error_kind":{},"error_output":{}}})",
      json_bool(r.success), json_str(to_string(r.outcome)), json_str(r.branch),
      r.total_commits, r.pushed_count, skipped, json_bool(r.upstream_established),
      r.attempts.size(), json_str(r.message), json_kind(r.error_kind),
      r.error_output.empty() ? "null" : json_str(r.error_output));
}

static void print_report(const fs::path &path, const RepositoryReport &r) {
  const auto &s = r.stats;
  const auto &b = r.branch;
  std::cout << "Repository:    " << path.string() << "\n";
  std::cout << fmt::format("Branch:        {} ({}", b.current_branch.empty() ? "-" : b.current_branch,
                           to_string(b.branch_status()));
  if (b.has_upstream)
    std::cout << fmt::format(", upstream {}, ahead {}, behind {}", b.upstream, b.ahead, b.behind);
  std::cout << ")\n";
  std::cout << fmt::format("Total size:    {} (objects {}, LFS {})\n", format_bytes(s.total_size_bytes),
                           format_bytes(s.objects_size_bytes),
                           format_bytes(s.lfs_tracked_size_bytes));
  std::cout << fmt::format("Working tree:  {}\n", format_bytes(s.working_tree_size_bytes));
  std::cout << fmt::format("Largest pack:  {}\n", format_bytes(s.largest_pack_bytes));
  std::cout << fmt::format("Files: {}  Commits: {}  Branches: {}\n", s.file_count,
                           s.commit_count, s.branch_count);
  if (s.push_size_bytes)
    std::cout << fmt::format("To push:       {} in {} commit(s){}\n",
                             format_bytes(*s.push_size_bytes), s.push_commit_count.value_or(0),
                             s.push_size_approximate ? " (estimated)" : "");
  for (const auto &f : s.large_files)
    std::cout << fmt::format("Large file:    {} {}{}\n", format_bytes(f.size_bytes), f.path,
                             f.in_working_tree ? "" : " (history only)");
  if (!r.recommendations.empty()) {
    std::cout << "\nRecommendations:\n";
    for (const auto &rec : r.recommendations)
      std::cout << "  - " << rec << "\n";
  }
}

static void print_analysis(const StrategyAnalysis &a) {
  std::cout << fmt::format("Recommended strategy: {} ({:.0f} MB{})\n\n",
                           to_string(a.recommendation), a.decision_size_mb,
                           a.size_approximate ? ", estimated" : "");
  std::cout << a.explanation << "\n";
  if (!a.risks.empty()) {
    std::cout << "\nRisks:\n";
    for (const auto &r : a.risks)
      std::cout << fmt::format("  [{}] {}\n", to_string(r.severity), r.text);
  }
  std::cout << "\nOptions:\n";
  for (const auto &o : a.options) {
    std::cout << fmt::format("  {} {}{}\n", o.recommended ? "*" : "-", o.label,
                             o.recommended ? " (recommended)" : "");
    std::cout << "      " << o.description << "\n";
    for (const auto &p : o.rationale)
      std::cout << "      + " << p << "\n";
    for (const auto &c : o.risks)
      std::cout << "      - " << c << "\n";
    for (const auto &q : o.requirements)
      std::cout << "      requires: " << q << "\n";
    if (o.estimated_duration)
      std::cout << "      duration: " << *o.estimated_duration << "\n";
    if (!o.command_template.empty())
      std::cout << "      $ " << o.command_template << "\n";
  }
}

static void print_push(const ChunkedPushResult &r) {
  std::cout << fmt::format("{}: {}\n", to_string(r.outcome), r.message);
  std::cout << fmt::format("Branch {}: {}/{} commits pushed in {} attempt(s)\n", r.branch,
                           r.pushed_count, r.total_commits, r.attempts.size());
  if (r.upstream_established)
    std::cout << "Upstream tracking is set\n";
  for (const auto &s : r.skipped)
    std::cout << fmt::format("Skipped {} ({}): {}\n", s.sha, to_string(s.kind), s.reason);
  if (!r.success && !r.error_output.empty())
    std::cout << "\n" << r.error_output << (r.error_output.back() == '\n' ? "" : "\n");
}

int App::run(int argc, char **argv) {
  setup_logging(nullptr, false);

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  Config cfg = cfg_ ? *cfg_ : Config::from_env();
  setup_logging(&cfg, pr.verbose);

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("bulkpush {} ({}, built {})\n", BULKPUSH_COMMIT,
                                     BULKPUSH_BRANCH, BULKPUSH_BUILD_TIME);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdAnalyze>) {
            Orchestrator orch(cfg);
            InterruptGuard guard(orch.cancel_token());
            auto report = orch.analyze_repository(c.path);
            if (c.json) {
              std::cout << fmt::format(R"({{"branch":{},"stats":{},"recommendations":{}}})",
                                       branch_json(report.branch), stats_json(report.stats),
                                       json_strings(report.recommendations))
                        << "\n";
            } else {
              print_report(c.path, report);
            }
            return 0;

          } else if constexpr (std::is_same_v<T, CmdRecommend>) {
            Orchestrator orch(cfg);
            InterruptGuard guard(orch.cancel_token());
            auto report = orch.analyze_repository(c.path);
            auto analysis = orch.recommend_strategy(report.stats, report.branch);
            if (c.json) {
              std::cout << fmt::format(R"({{"branch":{},"stats":{},"analysis":{}}})",
                                       branch_json(report.branch), stats_json(report.stats),
                                       analysis_json(analysis))
                        << "\n";
            } else {
              print_analysis(analysis);
            }
            return 0;

          } else if constexpr (std::is_same_v<T, CmdPush>) {
            if (c.remote)
              cfg.remote = *c.remote;
            if (c.timeout_sec)
              cfg.batch_timeout_sec = *c.timeout_sec;
            Orchestrator orch(cfg);
            InterruptGuard guard(orch.cancel_token());
            auto result = orch.execute_chunked_push(
                c.path, c.batch_size, [](const PushProgress &p) {
                  spdlog::debug("[push] {} pushed={} skipped={} total={} batch={}", p.phase,
                                p.pushed, p.skipped, p.total, p.batch_size);
                });
            if (c.json)
              std::cout << push_json(result) << "\n";
            else
              print_push(result);
            return result.success ? 0 : 1;
          }
          return 2;
        },
        *pr.cmd);
  } catch (const ExecutionError &e) {
    spdlog::error("{} [{}]", e.what(), to_string(e.kind()));
    if (!e.err().empty())
      std::cerr << e.err() << (e.err().back() == '\n' ? "" : "\n");
    return 1;
  } catch (const std::invalid_argument &e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

} // namespace bulkpush
