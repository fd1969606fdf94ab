#include <bulkpush/orchestrator.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace bulkpush {

Orchestrator::Orchestrator(Config cfg)
    : cfg_(std::move(cfg)), owned_(std::make_unique<ProcessExecutor>(cfg_.git)),
      exec_(owned_.get()) {}

Orchestrator::Orchestrator(Config cfg, Executor &exec)
    : cfg_(std::move(cfg)), exec_(&exec) {}

AnalyzerOptions Orchestrator::analyzer_options() const {
  AnalyzerOptions o;
  o.large_file_threshold_bytes = cfg_.large_file_threshold_mb * 1024 * 1024;
  o.query_timeout = std::chrono::seconds(cfg_.query_timeout_sec);
  o.cancel = cancel_;
  return o;
}

RepositoryReport Orchestrator::analyze_repository(const fs::path &repo) const {
  RepositoryAnalyzer analyzer(*exec_, analyzer_options());
  RepositoryReport r;
  r.stats = analyzer.analyze(repo, r.branch);
  r.recommendations = analyzer.recommendations(r.stats);
  return r;
}

StrategyAnalysis Orchestrator::recommend_strategy(const RepositoryStats &stats,
                                                  const BranchState &branch) const {
  auto a = StrategyAnalyzer::analyze(stats, branch);
  spdlog::info("[strategy] {} (rule {}, {:.0f} MB{})", to_string(a.recommendation),
               a.matched_rule, a.decision_size_mb, a.size_approximate ? ", estimated" : "");
  return a;
}

ChunkedPushResult
Orchestrator::execute_chunked_push(const fs::path &repo, std::optional<int> batch_size,
                                   std::function<void(const PushProgress &)> on_progress) const {
  ChunkedPushOptions o;
  o.remote = cfg_.remote;
  o.initial_batch_size = cfg_.batch_size;
  o.batch_timeout = std::chrono::seconds(cfg_.batch_timeout_sec);
  o.query_timeout = std::chrono::seconds(cfg_.query_timeout_sec);
  o.max_commits_without_upstream = cfg_.max_commits_without_upstream;
  if (cfg_.max_pack_mb > 0)
    o.max_pack_bytes = cfg_.max_pack_mb * 1024 * 1024;
  o.cancel = cancel_;
  o.on_progress = std::move(on_progress);

  ChunkedPushEngine engine(*exec_, std::move(o));
  return engine.push_in_batches(repo, batch_size.value_or(cfg_.batch_size));
}

} // namespace bulkpush
