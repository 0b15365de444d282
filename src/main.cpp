#include "cli/registry.hpp"

int main(int argc, char **argv) { return gitling::cli::run(argc, argv); }
