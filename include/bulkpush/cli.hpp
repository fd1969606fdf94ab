#pragma once
#include <optional>
#include <string>
#include <variant>

namespace bulkpush {

struct CmdAnalyze {
  std::string path = ".";
  bool json = false;
};
struct CmdRecommend {
  std::string path = ".";
  bool json = false;
};
struct CmdPush {
  std::string path = ".";
  std::optional<int> batch_size;
  std::optional<std::string> remote;
  std::optional<int> timeout_sec;
  bool json = false;
};

struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdAnalyze, CmdRecommend, CmdPush, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
  bool verbose = false;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace bulkpush
