#ifndef SPINDOWN_HELPERS_ARGS_HPP
#define SPINDOWN_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parsing plus positional collection for CLI tools and the
 * daemon. Cold-path only.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace spindown {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--foo" or "-i"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/// Positional (non-flag) tokens in command-line order.
using Positionals = std::vector<std::string_view>;

namespace detail {

/// Compact, parse-ready view of an argument definition.
struct ArgDefView {
  std::uint8_t key;
  std::uint8_t need;
  bool required;
  std::string_view flag;
};

/// A token that looks like a flag ("-x", "--xyz") rather than a value.
inline bool looksLikeFlag(std::string_view tok) noexcept {
  return tok.size() > 1 && tok[0] == '-';
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * Fixed-arity parser: when a flag is matched, it consumes the next nargs tokens
 * literally as its values. Tokens that are not flags and not consumed as flag
 * values are appended to @p positionals. Unknown flags are an error.
 *
 * @param args        Argument list (non-owning views; must outlive the call).
 * @param map         Definitions of accepted flags and their requirements.
 * @param pargs       Output map of parsed values (entries are overwritten per key).
 * @param positionals Output list of positional tokens.
 * @param error       Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          Positionals& positionals,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  const std::size_t N = args.size();

  std::unordered_map<std::string_view, detail::ArgDefView> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag,
                detail::ArgDefView{KV.first, KV.second.nargs, KV.second.required, KV.second.flag});
  }

  std::bitset<256> seen;

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    auto it = lut.find(TOK);
    if (it == lut.end()) {
      if (detail::looksLikeFlag(TOK)) {
        if (error) {
          error->get() = fmt::format("Unknown flag '{}'", TOK);
        }
        return false;
      }
      positionals.emplace_back(TOK);
      continue;
    }

    const detail::ArgDefView& D = it->second;

    // Need tokens in [i+1, i+D.need]
    if (i + static_cast<std::size_t>(D.need) >= N) {
      if (error) {
        error->get() =
            fmt::format("Argument out of bounds: expected {} values for flag '{}'", D.need, D.flag);
      }
      return false;
    }

    auto& out = pargs[D.key];
    out.clear();
    out.reserve(D.need);
    for (std::uint8_t k = 0; k < D.need; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(D.key);
    i += D.need;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      if (error) {
        error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * @param progName    Program name (typically argv[0]).
 * @param positional  Positional synopsis (e.g. "DEVICE:TIMEOUT..."), may be empty.
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 * @param out         Stream to print to (stdout for --help, stderr on error).
 */
inline void printUsage(const char* progName, std::string_view positional,
                       std::string_view description, const ArgMap& map,
                       std::FILE* out = stdout) {
  if (positional.empty()) {
    fmt::print(out, "Usage: {} [OPTIONS]\n\n", progName);
  } else {
    fmt::print(out, "Usage: {} [OPTIONS] {}\n\n", progName, positional);
  }

  if (!description.empty()) {
    fmt::print(out, "{}\n\n", description);
  }

  fmt::print(out, "Options:\n");

  // Collect and sort flags for consistent output
  std::vector<std::pair<std::string_view, const ArgDef*>> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.emplace_back(KV.second.flag, &KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  std::size_t maxFlagWidth = 16;
  for (const auto& ENTRY : entries) {
    const std::size_t WIDTH = ENTRY.second->flag.size() + (ENTRY.second->nargs > 0 ? 8 : 0);
    maxFlagWidth = std::max(maxFlagWidth, WIDTH);
  }
  maxFlagWidth = std::min<std::size_t>(maxFlagWidth, 32);

  for (const auto& ENTRY : entries) {
    const ArgDef& DEF = *ENTRY.second;

    std::string flagStr(DEF.flag);
    if (DEF.nargs > 0) {
      flagStr.append(" <value>");
    }

    fmt::print(out, "  {:<{}}  {}", flagStr, maxFlagWidth, DEF.desc);
    if (DEF.required) {
      fmt::print(out, "{}(required)", DEF.desc.empty() ? "" : " ");
    }
    fmt::print(out, "\n");
  }
}

} // namespace args
} // namespace helpers
} // namespace spindown

#endif // SPINDOWN_HELPERS_ARGS_HPP
