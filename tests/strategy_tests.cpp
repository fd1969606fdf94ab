#include <catch2/catch_all.hpp>
#include <bulkpush/strategy.hpp>

#include <algorithm>

using namespace bulkpush;

static constexpr std::uint64_t MiB = 1024 * 1024;

static RepositoryStats push_of(std::uint64_t mb, std::uint64_t commits = 10) {
  RepositoryStats s;
  s.total_size_bytes = mb * MiB;
  s.objects_size_bytes = mb * MiB;
  s.push_size_bytes = mb * MiB;
  s.push_commit_count = commits;
  s.commit_count = commits;
  return s;
}

static BranchState tracked(const std::string &name, int ahead = 1, int behind = 0) {
  BranchState b;
  b.current_branch = name;
  b.has_upstream = true;
  b.upstream = "origin/" + name;
  b.ahead = ahead;
  b.behind = behind;
  return b;
}

static const StrategyOption *find_option(const StrategyAnalysis &a, StrategyKind k) {
  auto it = std::find_if(a.options.begin(), a.options.end(),
                         [k](const StrategyOption &o) { return o.kind == k; });
  return it == a.options.end() ? nullptr : &*it;
}

static bool has_high_risk(const StrategyAnalysis &a) {
  return std::any_of(a.risks.begin(), a.risks.end(),
                     [](const RiskNote &r) { return r.severity == Severity::High; });
}

TEST_CASE("huge push on a protected branch means cleanup first") {
  auto a = StrategyAnalyzer::analyze(push_of(15000), tracked("main"));
  REQUIRE(a.recommendation == StrategyKind::CleanupFirst);
  REQUIRE(a.matched_rule == "huge-protected");
  REQUIRE(a.protected_branch);

  REQUIRE(find_option(a, StrategyKind::Force) == nullptr);
  REQUIRE(find_option(a, StrategyKind::Bundle) != nullptr);
  auto *cleanup = find_option(a, StrategyKind::CleanupFirst);
  REQUIRE(cleanup != nullptr);
  REQUIRE(cleanup->recommended);
}

TEST_CASE("large push with many commits is chunked") {
  auto a = StrategyAnalyzer::analyze(push_of(3000, 1500), tracked("feature/x", 3));
  REQUIRE(a.recommendation == StrategyKind::Chunked);
  REQUIRE(a.matched_rule == "large-many-commits");
  REQUIRE(find_option(a, StrategyKind::Chunked)->recommended);
  REQUIRE_FALSE(find_option(a, StrategyKind::Standard)->recommended);
}

TEST_CASE("diverged unprotected branch may be force pushed") {
  auto a = StrategyAnalyzer::analyze(push_of(1200), tracked("feature", 5, 3));
  REQUIRE(a.branch_status == BranchStatus::Diverged);
  REQUIRE(a.raw_recommendation == StrategyKind::Force);
  REQUIRE(a.recommendation == StrategyKind::Force);
  auto *force = find_option(a, StrategyKind::Force);
  REQUIRE(force != nullptr);
  REQUIRE(force->recommended);
  REQUIRE(force->command_template.find("--force-with-lease") != std::string::npos);
}

TEST_CASE("force on a protected branch is overridden to chunked") {
  auto a = StrategyAnalyzer::analyze(push_of(1200), tracked("main", 5, 3));
  REQUIRE(a.raw_recommendation == StrategyKind::Force);
  REQUIRE(a.recommendation == StrategyKind::Chunked);
  REQUIRE(has_high_risk(a));
  REQUIRE(std::any_of(a.risks.begin(), a.risks.end(), [](const RiskNote &r) {
    return r.text.find("protected branch 'main'") != std::string::npos;
  }));
  REQUIRE(find_option(a, StrategyKind::Force) == nullptr);
  REQUIRE(find_option(a, StrategyKind::Chunked)->recommended);
}

TEST_CASE("new branch with a large push is squashed") {
  BranchState b;
  b.current_branch = "topic";
  auto a = StrategyAnalyzer::analyze(push_of(2500, 40), b);
  REQUIRE(a.branch_status == BranchStatus::New);
  REQUIRE(a.recommendation == StrategyKind::Squash);
  REQUIRE(find_option(a, StrategyKind::Squash)->recommended);
}

TEST_CASE("huge push off the protected branches goes to a fresh branch") {
  auto a = StrategyAnalyzer::analyze(push_of(12000), tracked("feature"));
  REQUIRE(a.recommendation == StrategyKind::FreshBranch);
  auto *fresh = find_option(a, StrategyKind::FreshBranch);
  REQUIRE(fresh != nullptr);
  REQUIRE(fresh->recommended);
  REQUIRE(fresh->command_template.find("feature-fresh-") != std::string::npos);
}

TEST_CASE("fresh branch without upstream is pushed normally") {
  BranchState b;
  b.current_branch = "main-fresh-1700000000";
  auto a = StrategyAnalyzer::analyze(push_of(800), b);
  REQUIRE(a.fresh_branch);
  REQUIRE(a.recommendation == StrategyKind::Standard);
  REQUIRE(a.matched_rule == "fresh-branch-untracked");
  REQUIRE(find_option(a, StrategyKind::FreshBranch) == nullptr);
  auto it = std::find_if(a.options.begin(), a.options.end(), [](const StrategyOption &o) {
    return o.label == "Push Fresh Branch to Remote";
  });
  REQUIRE(it != a.options.end());
  REQUIRE(it->recommended);
  REQUIRE(it->command_template == "git push -u origin main-fresh-1700000000");
}

TEST_CASE("degenerate input falls back to a standard push") {
  auto a = StrategyAnalyzer::analyze(RepositoryStats{}, BranchState{});
  REQUIRE(a.recommendation == StrategyKind::Standard);
  REQUIRE(a.matched_rule == "default");
  REQUIRE(a.decision_size_mb == 0);
  REQUIRE_FALSE(a.options.empty());
  REQUIRE_FALSE(a.explanation.empty());
}

TEST_CASE("a zero push size falls back to the total size") {
  auto s = push_of(3000, 10);
  s.push_size_bytes = 0;
  auto a = StrategyAnalyzer::analyze(s, tracked("feature"));
  REQUIRE(a.decision_size_mb == Catch::Approx(3000.0));
  REQUIRE(a.recommendation == StrategyKind::Chunked);
}

TEST_CASE("estimated push size is flagged") {
  auto s = push_of(100);
  s.push_size_approximate = true;
  auto a = StrategyAnalyzer::analyze(s, tracked("feature"));
  REQUIRE(a.size_approximate);
  REQUIRE(std::any_of(a.risks.begin(), a.risks.end(),
                      [](const RiskNote &r) { return r.severity == Severity::Low; }));
}

TEST_CASE("bundle and cleanup options appear only above 5000 MB") {
  auto small = StrategyAnalyzer::analyze(push_of(4000), tracked("feature"));
  REQUIRE(find_option(small, StrategyKind::Bundle) == nullptr);
  REQUIRE(find_option(small, StrategyKind::CleanupFirst) == nullptr);

  auto big = StrategyAnalyzer::analyze(push_of(6000), tracked("feature"));
  REQUIRE(find_option(big, StrategyKind::Bundle) != nullptr);
  REQUIRE(find_option(big, StrategyKind::CleanupFirst) != nullptr);
}

TEST_CASE("options keep a fixed order") {
  BranchState b;
  b.current_branch = "topic";
  auto a = StrategyAnalyzer::analyze(push_of(6000), b);
  std::vector<StrategyKind> kinds;
  for (const auto &o : a.options)
    kinds.push_back(o.kind);
  REQUIRE((kinds == std::vector<StrategyKind>{StrategyKind::Standard, StrategyKind::Chunked,
                                              StrategyKind::Force, StrategyKind::FreshBranch,
                                              StrategyKind::Squash, StrategyKind::Bundle,
                                              StrategyKind::CleanupFirst}));
}

TEST_CASE("decision rules are evaluated in a fixed order") {
  std::vector<std::string> names;
  for (const auto &r : decision_rules())
    names.emplace_back(r.name);
  REQUIRE((names == std::vector<std::string>{
                        "fresh-branch-untracked", "fresh-branch-tracked", "huge-protected",
                        "huge", "large-many-commits", "large-new-branch", "large",
                        "medium-diverged", "medium", "default"}));
}

TEST_CASE("analysis is deterministic and never forces a protected branch") {
  const std::uint64_t sizes[] = {0, 500, 1001, 1500, 2500, 6000, 12000};
  const std::uint64_t commits[] = {1, 1001};
  const char *names[] = {"main", "master", "develop", "development", "feature", "release/1"};
  struct Shape {
    bool upstream;
    int ahead;
    int behind;
  };
  const Shape shapes[] = {{false, 0, 0}, {true, 0, 0}, {true, 20, 0}, {true, 5, 3}};

  for (auto mb : sizes)
    for (auto c : commits)
      for (auto name : names)
        for (const auto &sh : shapes) {
          auto stats = push_of(mb, c);
          BranchState b;
          b.current_branch = name;
          b.has_upstream = sh.upstream;
          b.upstream = sh.upstream ? std::string("origin/") + name : "";
          b.ahead = sh.ahead;
          b.behind = sh.behind;

          auto a = StrategyAnalyzer::analyze(stats, b);
          INFO(name << " " << mb << "MB ahead=" << sh.ahead << " behind=" << sh.behind);
          REQUIRE(a == StrategyAnalyzer::analyze(stats, b));
          if (b.is_protected()) {
            REQUIRE(a.recommendation != StrategyKind::Force);
            REQUIRE(find_option(a, StrategyKind::Force) == nullptr);
          }
          if (a.raw_recommendation == StrategyKind::Force && b.is_protected()) {
            REQUIRE(a.recommendation == StrategyKind::Chunked);
            REQUIRE(has_high_risk(a));
          }
          auto recommended = std::count_if(
              a.options.begin(), a.options.end(), [&](const StrategyOption &o) {
                return o.recommended && o.kind == a.recommendation;
              });
          REQUIRE(recommended == 1);
          REQUIRE(std::none_of(a.options.begin(), a.options.end(),
                               [&](const StrategyOption &o) {
                                 return o.recommended && o.kind != a.recommendation;
                               }));
        }
}
