#pragma once
#include <bulkpush/repo_stats.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bulkpush {

enum class StrategyKind {
  Standard,
  Chunked,
  Force,
  FreshBranch,
  Squash,
  Bundle,
  CleanupFirst,
};

const char *to_string(StrategyKind k);

enum class Severity { Low, Medium, High };

const char *to_string(Severity s);

struct RiskNote {
  Severity severity{Severity::Medium};
  std::string text;

  bool operator==(const RiskNote &o) const {
    return severity == o.severity && text == o.text;
  }
};

struct StrategyOption {
  StrategyKind kind{StrategyKind::Standard};
  std::string label;
  std::string description;
  bool recommended{false};
  std::vector<std::string> rationale; // pros
  std::vector<std::string> risks;     // cons
  std::vector<std::string> requirements;
  std::optional<std::string> estimated_duration;
  std::string command_template;

  bool operator==(const StrategyOption &o) const;
};

// What the decision tree looks at, derived once from stats and branch state.
struct DecisionInput {
  double size_mb{0};
  bool size_approximate{false};
  std::uint64_t commit_count{0};
  int ahead{0};
  BranchStatus branch_status{BranchStatus::Existing};
  bool has_upstream{false};
  bool protected_branch{false};
  bool fresh_branch{false};
  std::string branch;
};

DecisionInput make_decision_input(const RepositoryStats &stats,
                                  const BranchState &branch);

struct DecisionRule {
  const char *name;
  std::function<bool(const DecisionInput &)> when;
  StrategyKind outcome;
  std::vector<std::string> rationale;
  std::vector<RiskNote> risks;
};

// Ordered: the first rule whose predicate holds decides.
const std::vector<DecisionRule> &decision_rules();

struct StrategyAnalysis {
  StrategyKind recommendation{StrategyKind::Standard};
  // what the rule table chose before the protected-branch override
  StrategyKind raw_recommendation{StrategyKind::Standard};
  std::string matched_rule;
  BranchStatus branch_status{BranchStatus::Existing};
  bool protected_branch{false};
  bool fresh_branch{false};
  double decision_size_mb{0};
  bool size_approximate{false};
  std::vector<std::string> rationale;
  std::vector<RiskNote> risks;
  std::vector<StrategyOption> options;
  std::string explanation;

  bool operator==(const StrategyAnalysis &o) const;
};

class StrategyAnalyzer {
public:
  static StrategyAnalysis analyze(const RepositoryStats &stats,
                                  const BranchState &branch);

  static std::vector<StrategyOption> options(const DecisionInput &in,
                                             StrategyKind recommendation);

  static std::string explanation(const DecisionInput &in, StrategyKind recommendation);
};

} // namespace bulkpush
