#pragma once

namespace recollect::cli {

/// Entry point for the `recollect` executable. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace recollect::cli
