#include "sessionkit/cli/commands.hpp"

int main(int argc, char **argv) { return sessionkit::cli::run_cli(argc, argv); }
