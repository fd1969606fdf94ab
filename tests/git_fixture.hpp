#pragma once
#include <catch2/catch_all.hpp>

#include <bulkpush/process.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Temp directory that starts empty on every run.
inline fs::path fresh_dir(const std::string &name) {
  auto d = fs::temp_directory_path() / ("bulkpush_" + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

inline void write_file(const fs::path &p, const std::string &content) {
  fs::create_directories(p.parent_path());
  std::ofstream o(p, std::ios::binary);
  o << content;
}

inline void git_ok(const fs::path &repo, const std::string &args) {
  const std::string cmd = "git -C '" + repo.string() +
                          "' -c user.name=bulkpush -c user.email=bulkpush@example.com "
                          "-c commit.gpgsign=false " +
                          args + " >/dev/null 2>&1";
  REQUIRE(std::system(cmd.c_str()) == 0);
}

inline std::string git_out(const fs::path &repo, std::vector<std::string> args) {
  bulkpush::ProcessExecutor git;
  bulkpush::CommandInvocation inv;
  inv.args = std::move(args);
  inv.cwd = repo;
  auto r = git.execute(inv);
  auto s = r.out;
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
  return s;
}

inline void commit_file(const fs::path &repo, const std::string &name,
                        const std::string &content) {
  write_file(repo / name, content);
  git_ok(repo, "add -- '" + name + "'");
  git_ok(repo, "commit -q -m 'add " + name + "'");
}

// Empty repository whose unborn branch is "main".
inline fs::path init_repo(const std::string &name) {
  auto d = fresh_dir(name);
  git_ok(d, "init -q");
  git_ok(d, "symbolic-ref HEAD refs/heads/main");
  return d;
}

// A bare "remote" seeded with one commit on main, and a clone tracking it.
struct RemoteAndClone {
  fs::path remote;
  fs::path work;
};

inline RemoteAndClone remote_and_clone(const std::string &name) {
  auto root = fresh_dir(name);
  auto seed = root / "seed";
  fs::create_directories(seed);
  git_ok(seed, "init -q");
  git_ok(seed, "symbolic-ref HEAD refs/heads/main");
  commit_file(seed, "README", "seed\n");

  RemoteAndClone rc{root / "remote.git", root / "work"};
  git_ok(root, "clone -q --bare seed remote.git");
  git_ok(root, "clone -q remote.git work");
  return rc;
}
