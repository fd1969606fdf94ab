#include <bulkpush/strategy.hpp>

#include <fmt/format.h>

#include <cmath>

namespace bulkpush {

const char *to_string(StrategyKind k) {
  switch (k) {
  case StrategyKind::Standard: return "standard";
  case StrategyKind::Chunked: return "chunked";
  case StrategyKind::Force: return "force";
  case StrategyKind::FreshBranch: return "fresh-branch";
  case StrategyKind::Squash: return "squash";
  case StrategyKind::Bundle: return "bundle";
  case StrategyKind::CleanupFirst: return "cleanup-first";
  }
  return "standard";
}

const char *to_string(Severity s) {
  switch (s) {
  case Severity::Low: return "low";
  case Severity::Medium: return "medium";
  case Severity::High: return "high";
  }
  return "medium";
}

bool StrategyOption::operator==(const StrategyOption &o) const {
  return kind == o.kind && label == o.label && description == o.description &&
         recommended == o.recommended && rationale == o.rationale &&
         risks == o.risks && requirements == o.requirements &&
         estimated_duration == o.estimated_duration &&
         command_template == o.command_template;
}

bool StrategyAnalysis::operator==(const StrategyAnalysis &o) const {
  return recommendation == o.recommendation &&
         raw_recommendation == o.raw_recommendation &&
         matched_rule == o.matched_rule && branch_status == o.branch_status &&
         protected_branch == o.protected_branch && fresh_branch == o.fresh_branch &&
         decision_size_mb == o.decision_size_mb &&
         size_approximate == o.size_approximate && rationale == o.rationale &&
         risks == o.risks && options == o.options && explanation == o.explanation;
}

static constexpr double kHugeMb = 10000;
static constexpr double kLargeMb = 2000;
static constexpr double kMediumMb = 1000;
static constexpr double kEscapeMb = 5000;
static constexpr std::uint64_t kManyCommits = 1000;

DecisionInput make_decision_input(const RepositoryStats &stats,
                                  const BranchState &branch) {
  DecisionInput in;
  std::uint64_t bytes = stats.total_size_bytes;
  if (stats.push_size_bytes && *stats.push_size_bytes > 0) {
    bytes = *stats.push_size_bytes;
    in.size_approximate = stats.push_size_approximate;
  }
  in.size_mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
  in.commit_count = stats.commit_count;
  in.ahead = branch.ahead;
  in.branch_status = branch.branch_status();
  in.has_upstream = branch.has_upstream;
  in.protected_branch = branch.is_protected();
  in.fresh_branch = branch.is_fresh();
  in.branch = branch.current_branch;
  return in;
}

const std::vector<DecisionRule> &decision_rules() {
  static const std::vector<DecisionRule> rules = {
      {"fresh-branch-untracked",
       [](const DecisionInput &in) { return in.fresh_branch && !in.has_upstream; },
       StrategyKind::Standard,
       {"Fresh branch created successfully",
        "Push to establish upstream and enable collaboration",
        "After pushing, open a merge request back to the main branch"},
       {}},
      {"fresh-branch-tracked",
       [](const DecisionInput &in) { return in.fresh_branch; },
       StrategyKind::Standard,
       {"Fresh branch already established",
        "Continue pushing changes normally",
        "Consider a merge request to the main branch when ready"},
       {}},
      {"huge-protected",
       [](const DecisionInput &in) { return in.size_mb > kHugeMb && in.protected_branch; },
       StrategyKind::CleanupFirst,
       {"Push exceeds 10 GB; cleanup is essential",
        "Protected branches should stay clean and efficient"},
       {{Severity::High, "Pushing this much data will likely fail"}}},
      {"huge",
       [](const DecisionInput &in) { return in.size_mb > kHugeMb; },
       StrategyKind::FreshBranch,
       {"Push is extremely large (over 10 GB)",
        "A fresh branch avoids transferring the problematic history"},
       {{Severity::Medium, "Current branch carries too much historical data"}}},
      {"large-many-commits",
       [](const DecisionInput &in) {
         return in.size_mb > kLargeMb && in.commit_count > kManyCommits;
       },
       StrategyKind::Chunked,
       {"Large push with many commits",
        "Chunked push stays under size limits incrementally"},
       {}},
      {"large-new-branch",
       [](const DecisionInput &in) {
         return in.size_mb > kLargeMb && in.branch_status == BranchStatus::New;
       },
       StrategyKind::Squash,
       {"New branch with large changes", "Squashing reduces push size significantly"},
       {{Severity::Medium, "Individual commit history is lost"}}},
      {"large",
       [](const DecisionInput &in) { return in.size_mb > kLargeMb; },
       StrategyKind::Chunked,
       {"Push is approaching common host limits",
        "Incremental push is most likely to succeed"},
       {}},
      {"medium-diverged",
       [](const DecisionInput &in) {
         return in.size_mb > kMediumMb && in.branch_status == BranchStatus::Diverged;
       },
       StrategyKind::Force,
       {"Branch has diverged from its upstream", "Force push avoids a complex merge"},
       {{Severity::High, "Will overwrite remote changes"}}},
      {"medium",
       [](const DecisionInput &in) { return in.size_mb > kMediumMb; },
       StrategyKind::Standard,
       {"Size is manageable for a standard push"},
       {}},
      {"default",
       [](const DecisionInput &) { return true; },
       StrategyKind::Standard,
       {"Push size is within normal limits"},
       {}},
  };
  return rules;
}

static long ceil_div(double v, double d) { return static_cast<long>(std::ceil(v / d)); }

static std::string branch_or_placeholder(const DecisionInput &in) {
  return in.branch.empty() || in.branch == "(detached)" ? "<branch>" : in.branch;
}

std::vector<StrategyOption> StrategyAnalyzer::options(const DecisionInput &in,
                                                      StrategyKind rec) {
  const std::string branch = branch_or_placeholder(in);
  const double mb = in.size_mb;
  std::vector<StrategyOption> out;

  {
    StrategyOption o;
    o.kind = StrategyKind::Standard;
    o.label = "Standard Push";
    o.description = "Normal push to the remote repository";
    o.recommended = rec == StrategyKind::Standard;
    o.rationale = {"Preserves all history", "Standard workflow", "No data loss"};
    o.risks = {"May fail for large repositories", "Subject to 2 GB pack limits",
               "Can be slow for many commits"};
    if (mb < 100)
      o.estimated_duration = "< 1 minute";
    else if (mb > kLargeMb)
      o.estimated_duration = "will likely fail: exceeds the 2 GB pack limit";
    else
      o.estimated_duration = fmt::format("~{} minutes", ceil_div(mb, 100));
    o.command_template = fmt::format("git push origin {}", branch);
    out.push_back(std::move(o));
  }

  {
    StrategyOption o;
    o.kind = StrategyKind::Chunked;
    o.label = "Chunked Push";
    o.description = "Push commits in smaller batches to stay under size limits";
    o.recommended = rec == StrategyKind::Chunked;
    o.rationale = {"Handles large repositories", "Retries automatically with smaller batches",
                   "Preserves complete history"};
    o.risks = {"Takes longer than a standard push", "May still fail for huge single commits",
               "Many network operations"};
    o.requirements = {"Stable network connection"};
    auto commits = static_cast<double>(in.commit_count);
    o.estimated_duration = fmt::format("{}-{} minutes", ceil_div(commits, 50) * 2,
                                       ceil_div(commits, 10) * 2);
    o.command_template =
        fmt::format("git push origin <commit>:refs/heads/{} (batches halving from 50 to 1)",
                    branch);
    out.push_back(std::move(o));
  }

  if (!in.protected_branch) {
    StrategyOption o;
    o.kind = StrategyKind::Force;
    o.label = "Force Push";
    o.description = "Replace the remote branch with the local version";
    o.recommended = rec == StrategyKind::Force;
    o.rationale = {"Bypasses merge conflicts", "Simple and direct", "Fine for feature branches"};
    o.risks = {"Destructive: loses remote history", "Can break other developers' work",
               "Not suitable for shared branches"};
    o.requirements = {"No other developers on the branch", "Backup recommended"};
    o.estimated_duration = fmt::format("~{} minutes", ceil_div(mb, 200));
    o.command_template = fmt::format("git push --force-with-lease origin {}", branch);
    out.push_back(std::move(o));
  }

  if (!in.fresh_branch) {
    StrategyOption o;
    o.kind = StrategyKind::FreshBranch;
    o.label = "Create Fresh Branch";
    o.description = "Push to a new branch name";
    o.recommended = rec == StrategyKind::FreshBranch;
    o.rationale = {"Avoids conflicts with the existing remote branch",
                   "Preserves the original branch", "Good for experiments"};
    o.risks = {"Requires a manual merge request", "Branch proliferation"};
    o.estimated_duration = fmt::format("~{} minutes", ceil_div(mb, 150));
    o.command_template = fmt::format("git push origin HEAD:{}-fresh-<timestamp>", branch);
    out.push_back(std::move(o));
  } else {
    StrategyOption o;
    o.kind = StrategyKind::Standard;
    o.label = "Push Fresh Branch to Remote";
    o.description = "Establish upstream for the fresh branch";
    o.recommended = rec == StrategyKind::Standard && !in.has_upstream && mb < 1500;
    o.rationale = {"Establishes remote tracking", "Enables merge request creation",
                   "Preserves the fresh start"};
    if (mb > 1500)
      o.risks = {"May fail due to repository size"};
    o.estimated_duration = mb > kLargeMb ? std::string("will likely fail: use chunked push")
                                         : fmt::format("~{} minutes", ceil_div(mb, 150));
    o.command_template = fmt::format("git push -u origin {}", branch);
    out.push_back(std::move(o));
  }

  if (in.branch_status == BranchStatus::New || in.ahead > 10) {
    StrategyOption o;
    o.kind = StrategyKind::Squash;
    o.label = "Squash & Push";
    o.description = "Combine all unpushed commits into one and push";
    o.recommended = rec == StrategyKind::Squash;
    o.rationale = {"Dramatically reduces push size", "Clean commit history",
                   "Bypasses per-commit limits"};
    o.risks = {"Loses granular history", "Cannot revert individual changes"};
    o.requirements = {"A good summary commit message"};
    o.estimated_duration = "< 2 minutes";
    o.command_template =
        fmt::format("git reset --soft <base> && git commit && git push origin {}", branch);
    out.push_back(std::move(o));
  }

  if (mb > kEscapeMb) {
    StrategyOption b;
    b.kind = StrategyKind::Bundle;
    b.label = "Create Bundle File";
    b.description = "Export the repository as a file for manual transfer";
    b.recommended = rec == StrategyKind::Bundle;
    b.rationale = {"Bypasses the transfer protocol entirely", "Works for any size",
                   "Can be shared by other means"};
    b.risks = {"Manual process", "Not integrated with merge requests"};
    b.requirements = {"Somewhere to upload the file"};
    b.estimated_duration = "varies with upload speed";
    b.command_template = "git bundle create repo.bundle --all";
    out.push_back(std::move(b));

    StrategyOption c;
    c.kind = StrategyKind::CleanupFirst;
    c.label = "Clean History First";
    c.description = "Remove large files from history before pushing";
    c.recommended = rec == StrategyKind::CleanupFirst;
    c.rationale = {"Permanent size reduction", "Improves repository performance",
                   "Best long-term solution"};
    c.risks = {"Rewrites history", "Requires coordination", "Time consuming"};
    c.requirements = {"BFG Repo-Cleaner or git filter-repo", "A backup"};
    c.estimated_duration = "30-60 minutes";
    c.command_template = "bfg --strip-blobs-bigger-than 100M";
    out.push_back(std::move(c));
  }

  return out;
}

std::string StrategyAnalyzer::explanation(const DecisionInput &in, StrategyKind rec) {
  if (in.fresh_branch) {
    return in.has_upstream
               ? "The fresh branch is established on the remote. Continue working "
                 "normally or open a merge request when ready."
               : "Fresh branch created. Push it to establish remote tracking, then "
                 "open a merge request to bring the changes back.";
  }
  switch (rec) {
  case StrategyKind::Standard:
    return "The push is within normal size limits. A standard push should work.";
  case StrategyKind::Chunked:
    return "The push is large but manageable. A chunked push splits it into "
           "smaller pieces to avoid size limits.";
  case StrategyKind::Force:
    return "The branch has diverged from its upstream. A force push replaces the "
           "remote branch with the local version.";
  case StrategyKind::FreshBranch:
    return "The push is extremely large. A fresh branch avoids transferring the "
           "entire history.";
  case StrategyKind::Squash:
    return "There are many unpushed commits. Squashing them into one reduces the "
           "push size significantly.";
  case StrategyKind::Bundle:
    return "The repository exceeds normal limits. A bundle file can be transferred "
           "outside the push protocol.";
  case StrategyKind::CleanupFirst:
    return "The push is too large to transfer effectively. Cleaning the history "
           "first is essential.";
  }
  return {};
}

StrategyAnalysis StrategyAnalyzer::analyze(const RepositoryStats &stats,
                                           const BranchState &branch) {
  const DecisionInput in = make_decision_input(stats, branch);

  StrategyAnalysis a;
  a.branch_status = in.branch_status;
  a.protected_branch = in.protected_branch;
  a.fresh_branch = in.fresh_branch;
  a.decision_size_mb = in.size_mb;
  a.size_approximate = in.size_approximate;

  for (const auto &rule : decision_rules()) {
    if (!rule.when(in))
      continue;
    a.matched_rule = rule.name;
    a.raw_recommendation = rule.outcome;
    a.rationale = rule.rationale;
    a.risks = rule.risks;
    break;
  }

  a.recommendation = a.raw_recommendation;
  if (a.raw_recommendation == StrategyKind::Force && in.protected_branch) {
    a.recommendation = StrategyKind::Chunked;
    a.risks.push_back(RiskNote{
        Severity::High,
        fmt::format("Force-pushing protected branch '{}' is not allowed; using chunked push instead",
                    in.branch)});
  }
  if (in.size_approximate) {
    a.risks.push_back(RiskNote{Severity::Low,
                               "Push size is estimated from commit count, not measured"});
  }

  a.options = options(in, a.recommendation);
  a.explanation = explanation(in, a.recommendation);
  return a;
}

} // namespace bulkpush
