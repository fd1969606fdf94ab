#include <bulkpush/chunked_push.hpp>
#include <bulkpush/repo_stats.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace bulkpush {

const char *to_string(PushOutcome o) {
  switch (o) {
  case PushOutcome::Completed: return "completed";
  case PushOutcome::Partial: return "partial";
  case PushOutcome::Failed: return "failed";
  }
  return "failed";
}

bool is_retryable(const std::optional<ErrorKind> &kind) {
  return kind == ErrorKind::PushRejected || kind == ErrorKind::RemoteConnectionError;
}

static std::string short_sha(const std::string &sha) { return sha.substr(0, 7); }

static std::string first_line(const std::string &s) {
  auto nl = s.find('\n');
  return nl == std::string::npos ? s : s.substr(0, nl);
}

ChunkedPushEngine::ChunkedPushEngine(Executor &exec, ChunkedPushOptions opts)
    : exec_(exec), opts_(std::move(opts)) {}

CommandResult ChunkedPushEngine::git(const fs::path &repo, std::vector<std::string> args,
                                     std::chrono::milliseconds timeout,
                                     std::optional<std::string> input) const {
  CommandInvocation inv;
  inv.args = std::move(args);
  inv.cwd = repo;
  inv.input = std::move(input);
  inv.cancel = opts_.cancel;
  inv.timeout = timeout;
  return exec_.execute(inv);
}

std::string ChunkedPushEngine::current_branch(const fs::path &repo) const {
  auto r = git(repo, {"rev-parse", "--abbrev-ref", "HEAD"}, opts_.query_timeout);
  auto name = first_line(r.out);
  if (name.empty() || name == "HEAD") {
    throw ExecutionError(ExecutionErrorInfo{
        "HEAD is detached; check out a branch before pushing", 0, r.out, r.err,
        ErrorKind::InvalidRef, "git", {"rev-parse", "--abbrev-ref", "HEAD"}});
  }
  return name;
}

std::optional<ChunkedPushEngine::Upstream>
ChunkedPushEngine::upstream(const fs::path &repo, const std::string &branch) const {
  Upstream up;
  try {
    auto r = git(repo, {"rev-parse", "--abbrev-ref", "--symbolic-full-name", "@{u}"},
                 opts_.query_timeout);
    up.name = first_line(r.out);
    if (up.name.empty())
      return std::nullopt;
  } catch (const ExecutionError &e) {
    if (e.kind() == ErrorKind::Cancelled)
      throw;
    return std::nullopt;
  }

  try {
    auto r = git(repo,
                 {"for-each-ref", "--format=%(upstream:remotename) %(upstream:remoteref)",
                  "refs/heads/" + branch},
                 opts_.query_timeout);
    auto line = first_line(r.out);
    auto sp = line.find(' ');
    if (sp != std::string::npos) {
      up.remote = line.substr(0, sp);
      up.ref = line.substr(sp + 1);
    }
  } catch (const ExecutionError &e) {
    if (e.kind() == ErrorKind::Cancelled)
      throw;
    spdlog::warn("[push] cannot resolve upstream {}: {}", up.name, first_line(e.what()));
  }
  // "." is a local upstream; there is nothing to push it to
  if (up.remote.empty() || up.remote == "." || up.ref.empty()) {
    spdlog::warn("[push] upstream {} has no remote ref; pushing to {}/{}", up.name,
                 opts_.remote, branch);
    up.remote = opts_.remote;
    up.ref = "refs/heads/" + branch;
  } else if (up.remote != opts_.remote) {
    spdlog::info("[push] upstream {} is on remote '{}', not '{}'", up.name, up.remote,
                 opts_.remote);
  }
  return up;
}

std::vector<std::string>
ChunkedPushEngine::unpushed_commits(const fs::path &repo,
                                    const std::optional<Upstream> &up) const {
  if (up) {
    auto r = git(repo, {"rev-list", "--reverse", up->name + "..HEAD"}, opts_.query_timeout);
    return split_lines(r.out);
  }
  // --max-count applies before --reverse: the newest N, oldest first
  const int limit = std::max(1, opts_.max_commits_without_upstream);
  auto r = git(repo,
               {"rev-list", "--reverse", fmt::format("--max-count={}", limit), "HEAD",
                "--not", "--remotes"},
               opts_.query_timeout);
  auto commits = split_lines(r.out);
  if (commits.size() == static_cast<size_t>(limit))
    spdlog::warn("[push] no upstream; limited to the newest {} unpushed commits", limit);
  return commits;
}

std::uint64_t ChunkedPushEngine::estimate_bytes(const fs::path &repo,
                                                const std::string &target,
                                                const std::string &base) const {
  auto objects = git(repo, {"rev-list", "--objects", target, "--not", base},
                     opts_.query_timeout);
  if (objects.out.empty())
    return 0;
  auto sizes = git(repo, {"cat-file", "--batch-check=%(objectsize:disk) %(rest)"},
                   opts_.query_timeout, objects.out);
  return parse_object_sizes(sizes.out);
}

void ChunkedPushEngine::report(const PushProgress &p) const {
  if (opts_.on_progress)
    opts_.on_progress(p);
}

ChunkedPushResult ChunkedPushEngine::push_in_batches(const fs::path &repo) {
  return push_in_batches(repo, opts_.initial_batch_size);
}

ChunkedPushResult ChunkedPushEngine::push_in_batches(const fs::path &repo,
                                                     int initial_batch_size) {
  if (initial_batch_size < 1)
    throw std::invalid_argument("batch size must be at least 1");

  const std::string branch = current_branch(repo);
  const auto up = upstream(repo, branch);
  const std::string push_remote = up ? up->remote : opts_.remote;
  const std::string push_ref = up ? up->ref : "refs/heads/" + branch;

  struct BatchPushState {
    std::vector<std::string> commits; // oldest first
    std::size_t next{0};              // first commit not yet pushed or skipped
    int batch_size{1};
    std::size_t pushed{0};
    std::vector<SkippedCommit> skipped;
    bool upstream_established{false};
  } st;
  st.commits = unpushed_commits(repo, up);
  st.batch_size = initial_batch_size;
  st.upstream_established = up.has_value();

  ChunkedPushResult res;
  res.branch = branch;
  res.total_commits = st.commits.size();

  spdlog::info("[push] branch={} upstream={} target={} {} commits={} batch={}", branch,
               up ? up->name : "-", push_remote, push_ref, st.commits.size(),
               st.batch_size);

  auto progress = [&](const char *phase) {
    report(PushProgress{st.commits.size(), st.pushed, st.skipped.size(), st.batch_size,
                        phase});
  };

  auto finish = [&]() -> ChunkedPushResult & {
    res.pushed_count = st.pushed;
    res.skipped = st.skipped;
    res.upstream_established = st.upstream_established;
    return res;
  };

  auto abort_with = [&](const ExecutionError &e) -> ChunkedPushResult & {
    res.success = false;
    res.outcome = PushOutcome::Failed;
    res.error_kind = e.kind();
    res.error_output = e.err().empty() ? std::string(e.what()) : e.err();
    res.message = fmt::format("push aborted after {} of {} commits ({}): {}", st.pushed,
                              st.commits.size(), to_string(e.kind()), first_line(e.what()));
    spdlog::error("[push] {}", res.message);
    progress("done");
    return finish();
  };

  if (st.commits.empty()) {
    res.success = true;
    res.outcome = PushOutcome::Completed;
    res.message = "Everything up-to-date";
    progress("done");
    return finish();
  }

  std::optional<ErrorKind> last_kind;
  std::string last_output;

  while (st.next < st.commits.size()) {
    int size = static_cast<int>(
        std::min<std::size_t>(static_cast<std::size_t>(st.batch_size),
                              st.commits.size() - st.next));

    if (opts_.max_pack_bytes) {
      // everything before this batch is on the remote or was skipped
      const std::string base =
          st.next > 0 ? st.commits[st.next - 1] : (up ? up->name : "--remotes");
      try {
        for (;;) {
          auto bytes = estimate_bytes(repo, st.commits[st.next + size - 1], base);
          if (bytes <= *opts_.max_pack_bytes)
            break;
          if (size == 1) {
            spdlog::warn("[push] {} alone is about {}, over the {} cap; sending it anyway",
                         short_sha(st.commits[st.next]), format_bytes(bytes),
                         format_bytes(*opts_.max_pack_bytes));
            break;
          }
          spdlog::info("[push] commits {}-{} are about {}, over the {} cap; splitting",
                       st.next + 1, st.next + size, format_bytes(bytes),
                       format_bytes(*opts_.max_pack_bytes));
          size = std::max(1, size / 2);
          st.batch_size = size;
          progress("splitting");
        }
      } catch (const ExecutionError &e) {
        if (e.kind() == ErrorKind::Cancelled)
          return abort_with(e);
        spdlog::warn("[push] cannot estimate batch size: {}", first_line(e.what()));
      }
    }

    const std::string &target = st.commits[st.next + size - 1];

    spdlog::info("[push] commits {}-{} of {} (up to {})", st.next + 1, st.next + size,
                 st.commits.size(), short_sha(target));
    progress("pushing");

    std::optional<ExecutionError> failure;
    try {
      git(repo, {"push", push_remote, target + ":" + push_ref}, opts_.batch_timeout);
    } catch (const ExecutionError &e) {
      failure = e;
    }
    res.attempts.push_back(BatchAttempt{st.next, size, !failure});

    if (!failure) {
      st.next += static_cast<std::size_t>(size);
      st.pushed += static_cast<std::size_t>(size);
      progress("pushed");
      if (!st.upstream_established) {
        try {
          git(repo,
              {"branch", "--set-upstream-to=" + opts_.remote + "/" + branch, branch},
              opts_.query_timeout);
          st.upstream_established = true;
          spdlog::info("[push] upstream set to {}/{}", opts_.remote, branch);
        } catch (const ExecutionError &e) {
          if (e.kind() == ErrorKind::Cancelled)
            return abort_with(e);
          spdlog::warn("[push] could not set upstream: {}", first_line(e.what()));
        }
      }
      continue;
    }

    if (!is_retryable(failure->kind()))
      return abort_with(*failure);

    last_kind = failure->kind();
    last_output = failure->err().empty() ? std::string(failure->what()) : failure->err();

    if (size > 1) {
      st.batch_size = std::max(1, size / 2);
      spdlog::warn("[push] batch of {} rejected ({}); retrying with {}", size,
                   to_string(failure->kind()), st.batch_size);
      progress("retrying");
      continue;
    }

    const std::string &sha = st.commits[st.next];
    spdlog::warn("[push] skipping {}: {}", short_sha(sha), first_line(failure->what()));
    st.skipped.push_back(SkippedCommit{sha, first_line(failure->what()), failure->kind()});
    st.next += 1;
    st.batch_size = 1;
    progress("skipped");
  }

  progress("done");
  if (st.skipped.empty()) {
    res.success = true;
    res.outcome = PushOutcome::Completed;
    res.message = fmt::format("Pushed {} commits in {} attempts", st.pushed,
                              res.attempts.size());
  } else if (st.pushed == 0) {
    res.success = false;
    res.outcome = PushOutcome::Failed;
    res.error_kind = last_kind;
    res.error_output = last_output;
    res.message = fmt::format("No commits pushed; all {} were rejected ({}): {}",
                              st.commits.size(), to_string(last_kind),
                              first_line(last_output));
  } else {
    res.success = true;
    res.outcome = PushOutcome::Partial;
    res.message = fmt::format("Pushed {} of {} commits; {} skipped", st.pushed,
                              st.commits.size(), st.skipped.size());
  }
  spdlog::info("[push] {}", res.message);
  return finish();
}

} // namespace bulkpush
