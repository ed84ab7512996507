#include "llmshield/cli/commands.hpp"

int main(int argc, char **argv) { return llmshield::cli::run_cli(argc, argv); }
