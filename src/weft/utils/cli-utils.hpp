
#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup cli Command Line Utils
 * @ingroup weft-utils
 *
 * The `weft` method for parsing command-line arguments. Each `safe_arg_*`
 * function consumes the value following the flag at `argv[i]`, advancing `i`,
 * and throws `std::runtime_error` when the value is missing or malformed.
 */

namespace weft::cli
{
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);

// ------------------------------------------------------------------ parse args

std::vector<std::string> parse_cmd_args(const std::string_view line);

} // namespace weft::cli
