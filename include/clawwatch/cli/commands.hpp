#pragma once

namespace clawwatch::cli {

[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace clawwatch::cli
