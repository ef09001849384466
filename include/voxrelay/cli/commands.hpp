#pragma once

namespace voxrelay::cli {

[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace voxrelay::cli
