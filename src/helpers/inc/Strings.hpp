#ifndef SPINDOWN_HELPERS_STRINGS_HPP
#define SPINDOWN_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for fixed-size buffers and strict number parsing.
 *
 * @note All functions are noexcept and do not allocate.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring> // strlen, strncmp, strcmp, memcpy
#include <string_view>

namespace spindown {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Skip leading whitespace (spaces, tabs, newlines).
 * @param ptr Pointer into string.
 * @return Pointer to first non-whitespace character (or end of string).
 */
[[nodiscard]] inline const char* skipWhitespace(const char* ptr) noexcept {
  if (ptr == nullptr) {
    return nullptr;
  }
  while (*ptr == ' ' || *ptr == '\t' || *ptr == '\n' || *ptr == '\r') {
    ++ptr;
  }
  return ptr;
}

/**
 * @brief Parse a whole string as an unsigned decimal integer.
 * @param text Input text. Must contain only digits.
 * @param out Parsed value (unchanged on failure).
 * @return true if text is a non-empty run of digits that fits in 64 bits.
 *
 * Stricter than strtoull: rejects signs, whitespace and trailing garbage.
 */
[[nodiscard]] inline bool parseUint64(std::string_view text, std::uint64_t& out) noexcept {
  if (text.empty()) {
    return false;
  }

  std::uint64_t value = 0;
  for (const char C : text) {
    if (C < '0' || C > '9') {
      return false;
    }
    const auto DIGIT = static_cast<std::uint64_t>(C - '0');
    if (value > (UINT64_MAX - DIGIT) / 10) {
      return false;
    }
    value = value * 10 + DIGIT;
  }

  out = value;
  return true;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0) {
    const char C = buf[len - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --len;
      buf[len] = '\0';
    } else {
      break;
    }
  }
}

/**
 * @brief Copy a string view into fixed-size array with null termination.
 * @tparam N Array size.
 * @param dest Destination array.
 * @param src Source text (truncated to N - 1 bytes).
 */
template <std::size_t N>
inline void copyToFixedArray(std::array<char, N>& dest, std::string_view src) noexcept {
  const std::size_t COPY_LEN = (src.size() < N - 1) ? src.size() : (N - 1);
  if (COPY_LEN > 0) {
    std::memcpy(dest.data(), src.data(), COPY_LEN);
  }
  dest[COPY_LEN] = '\0';
}

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix.
 */
[[nodiscard]] inline bool startsWith(const char* str, const char* prefix) noexcept {
  if (str == nullptr || prefix == nullptr) {
    return false;
  }
  const std::size_t PREFIX_LEN = std::strlen(prefix);
  return std::strncmp(str, prefix, PREFIX_LEN) == 0;
}

/* ----------------------------- Sorting ----------------------------- */

/**
 * @brief Insertion sort for a counted subrange of fixed-size char arrays.
 * @tparam N Element char array size.
 * @tparam M Container capacity.
 * @param arr Array of fixed-size char arrays.
 * @param count Number of valid elements to sort (clamped to M).
 */
template <std::size_t N, std::size_t M>
inline void sortFixedStrings(std::array<std::array<char, N>, M>& arr, std::size_t count) noexcept {
  const std::size_t LIMIT = (count < M) ? count : M;
  for (std::size_t i = 1; i < LIMIT; ++i) {
    for (std::size_t j = i; j > 0 && std::strcmp(arr[j - 1].data(), arr[j].data()) > 0; --j) {
      arr[j - 1].swap(arr[j]);
    }
  }
}

} // namespace strings
} // namespace helpers
} // namespace spindown

#endif // SPINDOWN_HELPERS_STRINGS_HPP
