#pragma once
#include "gitling/repo.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitling::cli {

inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

// How much repository a command needs before it runs.
enum class RepoNeed : std::uint8_t {
  None,     // works on plain paths (init)
  Optional, // looked up, absent is fine (hash-object without -w)
  Required, // NotARepository if discovery fails
};

struct Command;

// One parsed command line: everything after the command name plus the
// repository the dispatcher discovered for it.
struct Invocation {
  const Command *command = nullptr;
  std::vector<std::string> args;
  std::optional<Repository> repo;

  // The discovered repository; NotARepository if there is none.
  [[nodiscard]] const Repository &repository() const;
};

using command_fn = int (*)(const Invocation &inv);

struct Command {
  std::string name;
  std::string synopsis; // arguments, e.g. "<type> <object>"
  std::string help;
  RepoNeed needs = RepoNeed::None;
  command_fn fn = nullptr;
};

void register_command(Command cmd);
const Command *find_command(std::string_view name);
void print_usage(std::ostream &os);

// Print "usage: gitling <name> <synopsis>" and return kExitUsage.
int usage_error(const Invocation &inv);

// Starting directory for repository discovery: $GITLING_WORKDIR or ".".
std::filesystem::path discovery_root();

// Look up argv[1], discover the repository it needs, run it, and turn any
// escaping error into "<command>: <code>: <message>" on stderr.
int run(int argc, char **argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitling::cli
