#include <bulkpush/analyzer.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <future>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace bulkpush {

namespace {

std::string first_line(const std::string &s) {
  auto nl = s.find('\n');
  return nl == std::string::npos ? s : s.substr(0, nl);
}

template <typename Fn> auto spawn_query(const char *name, Fn fn) {
  using T = decltype(fn());
  return std::async(std::launch::async, [name, fn]() -> std::optional<T> {
    try {
      return fn();
    } catch (const ExecutionError &e) {
      if (e.kind() == ErrorKind::Cancelled)
        throw;
      spdlog::warn("[analyze] {} failed ({}): {}", name, to_string(e.kind()),
                   first_line(e.what()));
    } catch (const fs::filesystem_error &e) {
      spdlog::warn("[analyze] {} failed: {}", name, e.what());
    }
    return std::nullopt;
  });
}

template <typename T>
T collect(const char *name, std::future<std::optional<T>> &f,
          std::vector<std::string> &failed) {
  auto v = f.get();
  if (!v) {
    failed.emplace_back(name);
    return T{};
  }
  return std::move(*v);
}

} // namespace

RepositoryAnalyzer::RepositoryAnalyzer(Executor &exec, AnalyzerOptions opts)
    : exec_(exec), opts_(std::move(opts)) {}

CommandResult RepositoryAnalyzer::git(const fs::path &repo,
                                      std::vector<std::string> args,
                                      std::optional<std::string> input) const {
  CommandInvocation inv;
  inv.args = std::move(args);
  inv.cwd = repo;
  inv.input = std::move(input);
  inv.cancel = opts_.cancel;
  inv.timeout = opts_.query_timeout;
  return exec_.execute(inv);
}

BranchState RepositoryAnalyzer::branch_state(const fs::path &repo) const {
  auto r = git(repo, {"status", "--porcelain=v2", "--branch", "--untracked-files=no"});
  return parse_branch_status(r.out);
}

std::uint64_t RepositoryAnalyzer::file_count(const fs::path &repo) const {
  return count_nul_separated(git(repo, {"ls-files", "-z"}).out);
}

std::uint64_t RepositoryAnalyzer::commit_count(const fs::path &repo) const {
  auto r = git(repo, {"rev-list", "--count", "HEAD"});
  return std::strtoull(r.out.c_str(), nullptr, 10);
}

std::uint64_t RepositoryAnalyzer::branch_count(const fs::path &repo) const {
  return count_lines(git(repo, {"for-each-ref", "--format=%(refname)", "refs/heads"}).out);
}

std::uint64_t RepositoryAnalyzer::objects_size(const fs::path &repo) const {
  auto r = git(repo, {"count-objects", "-v"});
  auto bytes = parse_count_objects(r.out);
  if (!bytes) {
    throw ExecutionError(ExecutionErrorInfo{
        "unexpected count-objects output", 0, r.out, r.err, std::nullopt, "git",
        {"count-objects", "-v"}});
  }
  return *bytes;
}

std::uint64_t RepositoryAnalyzer::largest_pack(const fs::path &repo) const {
  auto r = git(repo, {"rev-parse", "--git-path", "objects/pack"});
  fs::path dir = first_line(r.out);
  if (dir.is_relative())
    dir = repo / dir;
  std::uint64_t largest = 0;
  if (!fs::exists(dir))
    return 0;
  for (const auto &e : fs::directory_iterator(dir)) {
    if (!e.is_regular_file() || e.path().extension() != ".pack")
      continue;
    largest = std::max<std::uint64_t>(largest, e.file_size());
  }
  return largest;
}

std::uint64_t RepositoryAnalyzer::working_tree_size(const fs::path &repo) const {
  auto r = git(repo, {"ls-files", "-z"});
  std::uint64_t total = 0;
  std::istringstream in(r.out);
  std::string rel;
  while (std::getline(in, rel, '\0')) {
    if (rel.empty())
      continue;
    std::error_code ec;
    auto p = repo / rel;
    if (!fs::is_regular_file(p, ec))
      continue; // deleted in the working tree, or a submodule
    auto sz = fs::file_size(p, ec);
    if (!ec)
      total += sz;
  }
  return total;
}

std::uint64_t RepositoryAnalyzer::lfs_tracked_size(const fs::path &repo) const {
  return parse_lfs_sizes(git(repo, {"lfs", "ls-files", "--size"}).out);
}

std::vector<LargeFile> RepositoryAnalyzer::large_files(const fs::path &repo) const {
  const auto threshold = opts_.large_file_threshold_bytes;
  std::map<std::string, LargeFile> found;

  auto ls = git(repo, {"ls-files", "-z"});
  std::istringstream in(ls.out);
  std::string rel;
  while (std::getline(in, rel, '\0')) {
    if (rel.empty())
      continue;
    std::error_code ec;
    auto p = repo / rel;
    if (!fs::is_regular_file(p, ec))
      continue;
    auto sz = fs::file_size(p, ec);
    if (ec || sz < threshold)
      continue;
    auto &lf = found[rel];
    lf.path = rel;
    lf.size_bytes = std::max<std::uint64_t>(lf.size_bytes, sz);
    lf.in_working_tree = true;
  }

  // every blob reachable from any ref, with the path it was first seen at
  auto objects = git(repo, {"rev-list", "--objects", "--all"});
  if (!objects.out.empty()) {
    auto sizes = git(repo,
                     {"cat-file", "--batch-check=%(objecttype) %(objectsize) %(rest)"},
                     objects.out);
    for (const auto &line : split_lines(sizes.out)) {
      std::istringstream ls_in(line);
      std::string type;
      std::uint64_t sz = 0;
      if (!(ls_in >> type >> sz) || type != "blob" || sz < threshold)
        continue;
      std::string path;
      std::getline(ls_in >> std::ws, path);
      if (path.empty())
        continue;
      auto &lf = found[path];
      lf.path = path;
      lf.size_bytes = std::max(lf.size_bytes, sz);
      lf.in_history = true;
    }
  }

  std::vector<LargeFile> out;
  out.reserve(found.size());
  for (auto &[_, lf] : found)
    out.push_back(std::move(lf));
  return out;
}

RepositoryAnalyzer::PushMeasure
RepositoryAnalyzer::push_measure(const fs::path &repo, const BranchState &branch) const {
  PushMeasure m;
  if (!branch.has_upstream) {
    auto r = git(repo, {"rev-list", "--count", "HEAD", "--not", "--remotes"});
    m.commits = std::strtoull(r.out.c_str(), nullptr, 10);
    return m;
  }

  m.commits = static_cast<std::uint64_t>(std::max(branch.ahead, 0));
  if (m.commits == 0) {
    m.bytes = 0;
    return m;
  }
  try {
    auto objects = git(repo, {"rev-list", "--objects", branch.upstream + "..HEAD"});
    // %(rest) makes cat-file split "<sha> <path>" input lines at the sha
    auto sizes = git(repo, {"cat-file", "--batch-check=%(objectsize:disk) %(rest)"},
                     objects.out);
    m.bytes = parse_object_sizes(sizes.out);
  } catch (const ExecutionError &e) {
    if (e.kind() == ErrorKind::Cancelled)
      throw;
    spdlog::info("[analyze] push size not measurable ({}); estimating",
                 first_line(e.what()));
  }
  return m;
}

RepositoryStats RepositoryAnalyzer::analyze(const fs::path &repo) const {
  BranchState branch;
  return analyze(repo, branch);
}

RepositoryStats RepositoryAnalyzer::analyze(const fs::path &repo, BranchState &branch) const {
  git(repo, {"rev-parse", "--git-dir"});

  std::vector<std::string> failed;
  branch = BranchState{};
  try {
    branch = branch_state(repo);
  } catch (const ExecutionError &e) {
    if (e.kind() == ErrorKind::Cancelled)
      throw;
    spdlog::warn("[analyze] branch-state failed: {}", first_line(e.what()));
    failed.emplace_back("branch-state");
  }

  spdlog::info("[analyze] {} branch={} upstream={} ahead={} behind={}",
               repo.string(), branch.current_branch,
               branch.has_upstream ? branch.upstream : "-", branch.ahead,
               branch.behind);

  auto f_files = spawn_query("file-count", [&] { return file_count(repo); });
  auto f_commits = spawn_query("commit-count", [&] { return commit_count(repo); });
  auto f_branches = spawn_query("branch-count", [&] { return branch_count(repo); });
  auto f_objects = spawn_query("object-store-size", [&] { return objects_size(repo); });
  auto f_pack = spawn_query("largest-pack", [&] { return largest_pack(repo); });
  auto f_tree = spawn_query("working-tree-size", [&] { return working_tree_size(repo); });
  auto f_lfs = spawn_query("lfs-tracked-size", [&] { return lfs_tracked_size(repo); });
  auto f_large = spawn_query("large-file-scan", [&] { return large_files(repo); });
  auto f_push = spawn_query("push-size", [&] { return push_measure(repo, branch); });

  RepositoryStats s;
  s.file_count = collect("file-count", f_files, failed);
  s.commit_count = collect("commit-count", f_commits, failed);
  s.branch_count = collect("branch-count", f_branches, failed);
  s.objects_size_bytes = collect("object-store-size", f_objects, failed);
  s.largest_pack_bytes = collect("largest-pack", f_pack, failed);
  s.working_tree_size_bytes = collect("working-tree-size", f_tree, failed);
  s.lfs_tracked_size_bytes = collect("lfs-tracked-size", f_lfs, failed);
  s.large_files = collect("large-file-scan", f_large, failed);
  auto push = f_push.get();
  if (!push)
    failed.emplace_back("push-size");

  s.total_size_bytes = s.objects_size_bytes + s.lfs_tracked_size_bytes;

  if (push) {
    s.push_commit_count = push->commits;
    if (push->bytes) {
      s.push_size_bytes = *push->bytes;
    } else {
      std::uint64_t per_commit = opts_.fallback_bytes_per_commit;
      if (s.commit_count > 0 && s.objects_size_bytes > 0)
        per_commit = s.objects_size_bytes / s.commit_count;
      s.push_size_bytes = push->commits * per_commit;
      s.push_size_approximate = true;
    }
  }
  s.failed_queries = std::move(failed);

  spdlog::info("[analyze] objects={} tree={} lfs={} files={} commits={} push={}{}",
               format_bytes(s.objects_size_bytes),
               format_bytes(s.working_tree_size_bytes),
               format_bytes(s.lfs_tracked_size_bytes), s.file_count, s.commit_count,
               s.push_size_bytes ? format_bytes(*s.push_size_bytes) : "-",
               s.push_size_approximate ? " (estimate)" : "");
  return s;
}

std::vector<std::string>
RepositoryAnalyzer::recommendations(const RepositoryStats &s) const {
  constexpr std::uint64_t GiB = 1024ull * 1024 * 1024;
  std::vector<std::string> out;

  if (!s.large_files.empty()) {
    std::string names;
    size_t shown = 0;
    for (const auto &lf : s.large_files) {
      if (shown++ == 3) {
        names += ", ...";
        break;
      }
      if (!names.empty())
        names += ", ";
      names += fmt::format("{} ({})", lf.path, format_bytes(lf.size_bytes));
    }
    out.push_back(fmt::format("{} file(s) of at least {}: {}; consider tracking them with Git LFS",
                              s.large_files.size(),
                              format_bytes(opts_.large_file_threshold_bytes), names));
    bool history_only = std::any_of(s.large_files.begin(), s.large_files.end(),
                                    [](const LargeFile &lf) {
                                      return lf.in_history && !lf.in_working_tree;
                                    });
    if (history_only)
      out.push_back("Some large files exist only in history; removing them requires rewriting history");
  }
  if (s.largest_pack_bytes > 2 * GiB)
    out.push_back(fmt::format("Largest pack is {}; many hosts reject packs over 2 GB",
                              format_bytes(s.largest_pack_bytes)));
  if (s.objects_size_bytes > GiB)
    out.push_back(fmt::format("Object store is {}; 'git gc' may reduce it",
                              format_bytes(s.objects_size_bytes)));
  if (s.lfs_tracked_size_bytes > 0)
    out.push_back(fmt::format("{} of LFS content is uploaded separately from the pack",
                              format_bytes(s.lfs_tracked_size_bytes)));
  if (s.push_size_approximate)
    out.push_back("Push size is estimated from commit count; there is no upstream to measure against");
  if (!s.failed_queries.empty()) {
    std::string joined;
    for (const auto &q : s.failed_queries)
      joined += (joined.empty() ? "" : ", ") + q;
    out.push_back("Some measurements failed and read as zero: " + joined);
  }
  return out;
}

} // namespace bulkpush
