#include <bulkpush/error.hpp>

namespace bulkpush {

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::ToolNotFound: return "tool-not-found";
  case ErrorKind::AuthenticationFailed: return "authentication-failed";
  case ErrorKind::NoRemoteConfigured: return "no-remote-configured";
  case ErrorKind::NotARepository: return "not-a-repository";
  case ErrorKind::RepositoryLocked: return "repository-locked";
  case ErrorKind::Conflict: return "conflict";
  case ErrorKind::DirtyWorkTree: return "dirty-working-tree";
  case ErrorKind::PushRejected: return "push-rejected";
  case ErrorKind::RemoteConnectionError: return "remote-connection-error";
  case ErrorKind::PermissionDenied: return "permission-denied";
  case ErrorKind::InvalidRef: return "invalid-ref";
  case ErrorKind::Cancelled: return "cancelled";
  }
  return "unclassified";
}

std::string to_string(const std::optional<ErrorKind> &k) {
  return k ? to_string(*k) : "unclassified";
}

static ClassifyRule rule(const char *re, ErrorKind kind) {
  return ClassifyRule{std::regex(re, std::regex::ECMAScript | std::regex::icase),
                      kind};
}

const std::vector<ClassifyRule> &classify_rules() {
  // order matters: "failed to push some refs" accompanies most push errors,
  // so the generic rejection goes last
  static const std::vector<ClassifyRule> rules = {
      rule(R"(Another git process seems to be running|Unable to create '[^']*\.lock')",
           ErrorKind::RepositoryLocked),
      rule(R"(Authentication failed|could not read Username|could not read Password|)"
           R"(terminal prompts disabled|Permission denied \(publickey|)"
           R"(Invalid username or password)",
           ErrorKind::AuthenticationFailed),
      rule(R"(not a git repository)", ErrorKind::NotARepository),
      rule(R"(No configured push destination|does not appear to be a git repository|)"
           R"(No such remote)",
           ErrorKind::NoRemoteConfigured),
      rule(R"(is not a valid branch name|Couldn't find remote ref|)"
           R"(src refspec .* does not match any|unknown revision|bad revision|)"
           R"(ambiguous argument|no upstream configured|no upstream branch|)"
           R"(does not have an upstream branch)",
           ErrorKind::InvalidRef),
      rule(R"(is not fully merged|CONFLICT|unmerged files|non-fast-forward|)"
           R"(\(fetch first\)|Updates were rejected because)",
           ErrorKind::Conflict),
      rule(R"(Please,? commit your changes or stash them|would be overwritten|)"
           R"(You have unstaged changes)",
           ErrorKind::DirtyWorkTree),
      rule(R"(Permission denied|unable to unlink old|)"
           R"(The requested URL returned error: 403)",
           ErrorKind::PermissionDenied),
      rule(R"(pack exceeds maximum allowed size|the remote end hung up unexpectedly|)"
           R"(RPC failed|unexpected disconnect|early EOF|unable to access|)"
           R"(Could not resolve host|Connection (timed out|refused|reset)|)"
           R"(HTTP 413|remote: fatal)",
           ErrorKind::RemoteConnectionError),
      rule(R"(failed to push some refs|\[remote rejected\]|\[rejected\])",
           ErrorKind::PushRejected),
  };
  return rules;
}

std::optional<ErrorKind> classify_stderr(const std::string &err) {
  if (err.empty())
    return std::nullopt;
  for (const auto &r : classify_rules()) {
    if (std::regex_search(err, r.pattern))
      return r.kind;
  }
  return std::nullopt;
}

} // namespace bulkpush
