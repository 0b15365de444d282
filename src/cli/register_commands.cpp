#include "cli/registry.hpp"

namespace gitling::cli {

int cmd_init(const Invocation &inv);
int cmd_cat_file(const Invocation &inv);
int cmd_hash_object(const Invocation &inv);
int cmd_log(const Invocation &inv);
int cmd_ls_tree(const Invocation &inv);
int cmd_checkout(const Invocation &inv);
int cmd_show_ref(const Invocation &inv);

void register_all_commands() {
  register_command({.name = "init",
                    .synopsis = "<path>",
                    .help = "Initialize a new, empty repository",
                    .needs = RepoNeed::None,
                    .fn = cmd_init});
  register_command({.name = "cat-file",
                    .synopsis = "<type> <object>",
                    .help = "Provide content of repository objects",
                    .needs = RepoNeed::Required,
                    .fn = cmd_cat_file});
  register_command({.name = "hash-object",
                    .synopsis = "[-w] [-t <type>] <file>",
                    .help = "Compute object ID, optionally write it",
                    .needs = RepoNeed::Optional,
                    .fn = cmd_hash_object});
  register_command({.name = "log",
                    .synopsis = "<commit>",
                    .help = "Display history of a commit as Graphviz",
                    .needs = RepoNeed::Required,
                    .fn = cmd_log});
  register_command({.name = "ls-tree",
                    .synopsis = "<tree>",
                    .help = "Pretty-print a tree object",
                    .needs = RepoNeed::Required,
                    .fn = cmd_ls_tree});
  register_command({.name = "checkout",
                    .synopsis = "<commit> <path>",
                    .help = "Check out a commit into an empty directory",
                    .needs = RepoNeed::Required,
                    .fn = cmd_checkout});
  register_command({.name = "show-ref",
                    .synopsis = "",
                    .help = "List references",
                    .needs = RepoNeed::Required,
                    .fn = cmd_show_ref});
}

} // namespace gitling::cli
