#include <bulkpush/repo_stats.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace bulkpush {

const char *to_string(BranchStatus s) {
  switch (s) {
  case BranchStatus::New: return "new";
  case BranchStatus::Existing: return "existing";
  case BranchStatus::Diverged: return "diverged";
  }
  return "existing";
}

bool is_protected_branch(const std::string &name) {
  static const std::array<const char *, 4> names{"main", "master", "develop",
                                                 "development"};
  return std::find(names.begin(), names.end(), name) != names.end();
}

BranchStatus BranchState::branch_status() const {
  if (!has_upstream)
    return BranchStatus::New;
  if (ahead > 0 && behind > 0)
    return BranchStatus::Diverged;
  return BranchStatus::Existing;
}

bool BranchState::is_protected() const { return is_protected_branch(current_branch); }

bool BranchState::is_fresh() const {
  return current_branch.find("-fresh-") != std::string::npos;
}

bool BranchState::operator==(const BranchState &o) const {
  return current_branch == o.current_branch && upstream == o.upstream &&
         has_upstream == o.has_upstream && ahead == o.ahead && behind == o.behind;
}

bool LargeFile::operator==(const LargeFile &o) const {
  return path == o.path && size_bytes == o.size_bytes &&
         in_working_tree == o.in_working_tree && in_history == o.in_history;
}

bool RepositoryStats::operator==(const RepositoryStats &o) const {
  return total_size_bytes == o.total_size_bytes &&
         objects_size_bytes == o.objects_size_bytes &&
         working_tree_size_bytes == o.working_tree_size_bytes &&
         lfs_tracked_size_bytes == o.lfs_tracked_size_bytes &&
         file_count == o.file_count && commit_count == o.commit_count &&
         branch_count == o.branch_count &&
         largest_pack_bytes == o.largest_pack_bytes &&
         push_size_bytes == o.push_size_bytes &&
         push_commit_count == o.push_commit_count &&
         push_size_approximate == o.push_size_approximate &&
         large_files == o.large_files && failed_queries == o.failed_queries;
}

std::vector<std::string> split_lines(const std::string &out) {
  std::vector<std::string> lines;
  std::istringstream in(out);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (!line.empty())
      lines.push_back(std::move(line));
  }
  return lines;
}

std::uint64_t count_lines(const std::string &out) { return split_lines(out).size(); }

std::uint64_t count_nul_separated(const std::string &out) {
  std::uint64_t n = 0;
  size_t start = 0;
  while (start < out.size()) {
    auto end = out.find('\0', start);
    if (end == std::string::npos)
      end = out.size();
    if (end > start)
      ++n;
    start = end + 1;
  }
  return n;
}

BranchState parse_branch_status(const std::string &porcelain_v2) {
  BranchState st;
  static const std::regex ab_re(R"(\+(\d+) -(\d+)\s*$)");
  for (const auto &line : split_lines(porcelain_v2)) {
    if (line.rfind("# branch.head ", 0) == 0) {
      st.current_branch = line.substr(14);
    } else if (line.rfind("# branch.upstream ", 0) == 0) {
      st.upstream = line.substr(18);
      st.has_upstream = !st.upstream.empty();
    } else if (line.rfind("# branch.ab ", 0) == 0) {
      std::smatch m;
      if (std::regex_search(line, m, ab_re)) {
        st.ahead = std::atoi(m[1].str().c_str());
        st.behind = std::atoi(m[2].str().c_str());
      }
    }
  }
  return st;
}

std::optional<std::uint64_t> parse_count_objects(const std::string &out) {
  std::uint64_t kib = 0;
  bool found = false;
  for (const auto &line : split_lines(out)) {
    auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    auto key = line.substr(0, colon);
    if (key != "size" && key != "size-pack")
      continue;
    kib += std::strtoull(line.c_str() + colon + 1, nullptr, 10);
    found = true;
  }
  if (!found)
    return std::nullopt;
  return kib * 1024;
}

std::optional<std::uint64_t> parse_human_size(const std::string &text) {
  static const std::regex re(R"(([0-9]+(?:\.[0-9]+)?)\s*([KMGT]?i?B)\b)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return std::nullopt;
  double value = std::strtod(m[1].str().c_str(), nullptr);
  const std::string unit = m[2].str();
  double mult = 1;
  if (unit.size() >= 2) {
    const bool binary = unit.find('i') != std::string::npos;
    const double base = binary ? 1024.0 : 1000.0;
    const std::string prefixes = "KMGT";
    auto idx = prefixes.find(unit[0]);
    if (idx != std::string::npos) {
      for (size_t i = 0; i <= idx; ++i)
        mult *= base;
    }
  }
  return static_cast<std::uint64_t>(value * mult + 0.5);
}

std::uint64_t parse_lfs_sizes(const std::string &out) {
  // "<oid> * <path> (1.2 MB)"
  std::uint64_t total = 0;
  for (const auto &line : split_lines(out)) {
    auto open = line.rfind('(');
    auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open)
      continue;
    if (auto sz = parse_human_size(line.substr(open + 1, close - open - 1)))
      total += *sz;
  }
  return total;
}

std::uint64_t parse_object_sizes(const std::string &batch_check_out) {
  std::uint64_t total = 0;
  for (const auto &line : split_lines(batch_check_out)) {
    auto tok = line.substr(0, line.find(' '));
    if (tok.empty() || tok.find_first_not_of("0123456789") != std::string::npos)
      continue;
    total += std::strtoull(tok.c_str(), nullptr, 10);
  }
  return total;
}

std::string format_bytes(std::uint64_t bytes) {
  if (bytes == 0)
    return "0 B";
  static const std::array<const char *, 5> units{"B", "KB", "MB", "GB", "TB"};
  double v = static_cast<double>(bytes);
  size_t i = 0;
  while (v >= 1024.0 && i + 1 < units.size()) {
    v /= 1024.0;
    ++i;
  }
  return fmt::format("{:.2f} {}", v, units[i]);
}

} // namespace bulkpush
