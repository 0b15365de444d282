#include "cli/registry.hpp"

#include "gitling/error.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <utility>

namespace gitling::cli {

namespace {

std::map<std::string, Command, std::less<>> &table() {
  static std::map<std::string, Command, std::less<>> t;
  return t;
}

} // namespace

const Repository &Invocation::repository() const {
  if (!repo) {
    throw Error(ErrorCode::NotARepository,
                "not a git repository (or any parent up to /): " + discovery_root().string());
  }
  return *repo;
}

void register_command(Command cmd) {
  std::string name = cmd.name;
  table().insert_or_assign(std::move(name), std::move(cmd));
}

const Command *find_command(std::string_view name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : &it->second;
}

void print_usage(std::ostream &os) {
  os << "usage: gitling <command> [args]\n\n";
  os << "commands:\n";
  for (const auto &[name, cmd] : table()) {
    os << "  " << name << ' ' << cmd.synopsis << "\n      " << cmd.help << "\n";
  }
}

int usage_error(const Invocation &inv) {
  std::cerr << "usage: gitling " << inv.command->name << ' ' << inv.command->synopsis << "\n";
  return kExitUsage;
}

std::filesystem::path discovery_root() {
  const char *env = std::getenv("GITLING_WORKDIR");
  if (env != nullptr && *env != '\0') {
    return env;
  }
  return ".";
}

int run(int argc, char **argv) {
  register_all_commands();

  if (argc < 2) {
    print_usage(std::cerr);
    return kExitUsage;
  }
  const Command *cmd = find_command(argv[1]);
  if (cmd == nullptr) {
    std::cerr << "unknown command: " << argv[1] << "\n";
    print_usage(std::cerr);
    return kExitUsage;
  }

  Invocation inv;
  inv.command = cmd;
  inv.args.assign(argv + 2, argv + argc);
  try {
    if (cmd->needs != RepoNeed::None) {
      inv.repo = Repository::find(discovery_root(), cmd->needs == RepoNeed::Required);
    }
    return cmd->fn(inv);
  } catch (const Error &e) {
    std::cerr << cmd->name << ": " << error_code_name(e.code()) << ": " << e.what() << "\n";
  } catch (const std::exception &e) {
    std::cerr << cmd->name << ": " << e.what() << "\n";
  }
  return kExitFailure;
}

} // namespace gitling::cli
