
#include "cli-utils.hpp"

#include <regex>
#include <stdexcept>

#include "base-include.hpp"

namespace weft::cli
{
// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief Get the argument after `i` from command line arguments `argc` and
 *        `argv`. `i` must be in the range `[0..argc)`. If `i+1 == argc`
 *        then an exception is thrown.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`.
 */
std::string safe_arg_str(int argc, char** argv, int& i) {
  Expects(argc >= 0);
  Expects(i >= 0 && i < argc);
  const string arg = argv[i];
  ++i;
  if (i >= argc)
    throw std::runtime_error(format("expected string after argument '{}'", arg));
  return std::string(argv[i]);
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief Parse the argument (as an integer) after `i` from command line
 *        arguments `argc` and `argv`. `i` must be in the range `[0..argc)`.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc` or if `argv[i+1]` cannot be
 *   parsed as an integer.
 */
int safe_arg_int(int argc, char** argv, int& i) {
  Expects(argc >= 0);
  Expects(i >= 0 && i < argc);
  const auto arg = argv[i];
  ++i;
  auto badness = (i >= argc);
  auto ret = 0;

  if (!badness) {
    char* end = nullptr;
    const auto long_ret = strtol(argv[i], &end, 10);
    if (end == argv[i] or *end != '\0' or long_ret > std::numeric_limits<int>::max() or
        long_ret < std::numeric_limits<int>::lowest())
      badness = true;
    else
      ret = static_cast<int>(long_ret);
  }

  if (badness)
    throw std::runtime_error(format("expected integer after argument '{}'", arg));

  return ret;
}

// ------------------------------------------------------------------ parse args
/**
 * @ingroup cli
 * @brief Parses the passes string as if it were command-line arguments
 *        for a shell command. Quoted words keep their spaces, and the usual
 *        backslash escapes are honoured inside quotes.
 */
std::vector<std::string> parse_cmd_args(const std::string_view ss) {
  std::string line{ss};
  std::vector<std::string> args;
  const auto pattern = "('(\\\\'|[^'])*')|(\"(\\\\\"|[^\"])*\")|([\\S]+)";

  auto unquote = [](std::string& s) {
    Expects(s.size() >= 2);
    auto pos = 0u;
    const auto end = unsigned(s.size() - 1);
    for (auto i = 1u; i < end; ++i) {
      const auto ch = s[i];
      if (ch == '\\' && i + 1 < end) {
        const auto c2 = s[++i];
        switch (c2) {
        case 'n': s[pos++] = '\n'; break;
        case 't': s[pos++] = '\t'; break;
        case 'r': s[pos++] = '\r'; break;
        default: s[pos++] = c2;
        }
      } else {
        s[pos++] = ch;
      }
    }
    s.resize(pos);
  };

  std::regex expr{pattern};
  auto words_begin = std::sregex_iterator(line.begin(), line.end(), expr);
  auto words_end = std::sregex_iterator();
  while (words_begin != words_end) {
    auto s = (words_begin++)->str();

    const bool is_squote = s.size() >= 2 and s.front() == '\'' and s.back() == '\'';
    const bool is_dquote = s.size() >= 2 and s.front() == '"' and s.back() == '"';
    if (is_squote or is_dquote)
      unquote(s);

    args.push_back(std::move(s));
  }

  return args;
}

} // namespace weft::cli
