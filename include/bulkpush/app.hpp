#pragma once
#include <bulkpush/config.hpp>

#include <optional>

namespace bulkpush {

class App {
public:
  App() = default;
  // Uses cfg instead of reading BULKPUSH_* from the environment.
  explicit App(Config cfg) : cfg_(std::move(cfg)) {}

  // Returns the process exit code: 0 success, 1 failure, 2 usage error.
  int run(int argc, char **argv);

private:
  std::optional<Config> cfg_;
};

} // namespace bulkpush
