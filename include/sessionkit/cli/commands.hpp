#pragma once

namespace sessionkit::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace sessionkit::cli
