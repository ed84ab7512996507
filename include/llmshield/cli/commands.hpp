#pragma once

namespace llmshield::cli {

int run_cli(int argc, char **argv);

} // namespace llmshield::cli
