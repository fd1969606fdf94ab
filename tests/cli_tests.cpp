#include "git_fixture.hpp"

#include <bulkpush/app.hpp>
#include <bulkpush/cli.hpp>
#include <bulkpush/config.hpp>

#include <cstdlib>
#include <vector>

using namespace bulkpush;

static ParseResult parse(std::vector<std::string> args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(args.size()), argv.data());
}

static int run_app(std::vector<std::string> args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  return App{Config{}}.run(static_cast<int>(args.size()), argv.data());
}

TEST_CASE("no arguments and help print usage") {
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"bulkpush"}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"bulkpush", "--help"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"bulkpush", "version"}).cmd));
}

TEST_CASE("analyze and recommend take an optional path and --json") {
  auto r = parse({"bulkpush", "analyze"});
  REQUIRE(r.error.empty());
  auto a = std::get<CmdAnalyze>(*r.cmd);
  REQUIRE(a.path == ".");
  REQUIRE_FALSE(a.json);

  r = parse({"bulkpush", "recommend", "/src/repo", "--json", "--verbose"});
  auto rec = std::get<CmdRecommend>(*r.cmd);
  REQUIRE(rec.path == "/src/repo");
  REQUIRE(rec.json);
  REQUIRE(r.verbose);
}

TEST_CASE("push options") {
  auto r = parse({"bulkpush", "push", "repo", "--batch-size", "25", "--remote", "backup",
                  "--timeout-sec", "90"});
  REQUIRE(r.error.empty());
  auto p = std::get<CmdPush>(*r.cmd);
  REQUIRE(p.path == "repo");
  REQUIRE(p.batch_size == 25);
  REQUIRE(p.remote == std::string("backup"));
  REQUIRE(p.timeout_sec == 90);
  REQUIRE_FALSE(p.json);

  auto d = std::get<CmdPush>(*parse({"bulkpush", "push"}).cmd);
  REQUIRE(d.path == ".");
  REQUIRE_FALSE(d.batch_size.has_value());
  REQUIRE_FALSE(d.remote.has_value());
}

TEST_CASE("usage errors") {
  REQUIRE(parse({"bulkpush", "frobnicate"}).error == "unknown command: frobnicate");
  REQUIRE_FALSE(parse({"bulkpush", "push", "--batch-size", "0"}).error.empty());
  REQUIRE_FALSE(parse({"bulkpush", "push", "--batch-size", "ten"}).error.empty());
  REQUIRE_FALSE(parse({"bulkpush", "push", "--batch-size"}).error.empty());
  REQUIRE_FALSE(parse({"bulkpush", "push", "--remote"}).error.empty());
  REQUIRE_FALSE(parse({"bulkpush", "analyze", "a", "b"}).error.empty());
  REQUIRE_FALSE(parse({"bulkpush", "analyze", "--force"}).error.empty());
}

TEST_CASE("config reads BULKPUSH_ variables and ignores bad numbers") {
  ::setenv("BULKPUSH_REMOTE", "mirror", 1);
  ::setenv("BULKPUSH_BATCH_SIZE", "12", 1);
  ::setenv("BULKPUSH_BATCH_TIMEOUT_SEC", "-4", 1);
  ::setenv("BULKPUSH_LARGE_FILE_MB", "abc", 1);
  auto c = Config::from_env();
  ::unsetenv("BULKPUSH_REMOTE");
  ::unsetenv("BULKPUSH_BATCH_SIZE");
  ::unsetenv("BULKPUSH_BATCH_TIMEOUT_SEC");
  ::unsetenv("BULKPUSH_LARGE_FILE_MB");

  REQUIRE(c.remote == "mirror");
  REQUIRE(c.batch_size == 12);
  REQUIRE(c.batch_timeout_sec == 600);
  REQUIRE(c.large_file_threshold_mb == 50);
  REQUIRE(c.git == "git");
}

TEST_CASE("config rejects numbers that do not fit the field") {
  ::setenv("BULKPUSH_BATCH_SIZE", "4294967296", 1);
  ::setenv("BULKPUSH_MAX_UNTRACKED_COMMITS", "2147483647", 1);
  ::setenv("BULKPUSH_MAX_PACK_MB", "0", 1);
  auto c = Config::from_env();
  ::unsetenv("BULKPUSH_BATCH_SIZE");
  ::unsetenv("BULKPUSH_MAX_UNTRACKED_COMMITS");
  ::unsetenv("BULKPUSH_MAX_PACK_MB");

  REQUIRE(c.batch_size == 50);
  REQUIRE(c.max_commits_without_upstream == 2147483647);
  REQUIRE(c.max_pack_mb == 0u);
}

TEST_CASE("app exit codes") {
  REQUIRE(run_app({"bulkpush", "help"}) == 0);
  REQUIRE(run_app({"bulkpush", "version"}) == 0);
  REQUIRE(run_app({"bulkpush", "nope"}) == 2);
  REQUIRE(run_app({"bulkpush", "push", "--batch-size", "-1"}) == 2);

  auto dir = fresh_dir("cli_not_repo");
  REQUIRE(run_app({"bulkpush", "analyze", dir.string()}) == 1);
}

TEST_CASE("app analyzes, recommends and pushes a repository") {
  auto rc = remote_and_clone("cli_push");
  for (int i = 0; i < 3; ++i)
    commit_file(rc.work, "n" + std::to_string(i) + ".txt", std::to_string(i) + "\n");

  REQUIRE(run_app({"bulkpush", "analyze", rc.work.string(), "--json"}) == 0);
  REQUIRE(run_app({"bulkpush", "recommend", rc.work.string()}) == 0);
  REQUIRE(run_app({"bulkpush", "push", rc.work.string(), "--batch-size", "2"}) == 0);
  REQUIRE(git_out(rc.remote, {"rev-parse", "main"}) ==
          git_out(rc.work, {"rev-parse", "HEAD"}));
}
