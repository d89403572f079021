#pragma once

namespace tgassist::cli {

/// Entry point behind main(). Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace tgassist::cli
