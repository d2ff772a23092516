#ifndef PLUGEVAL_CORE_STRING_UTILS_HPP_
#define PLUGEVAL_CORE_STRING_UTILS_HPP_

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace plugeval::core {

inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

inline std::string ToLowerAscii(std::string_view input) {
  std::string lowered(input);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

inline std::string_view TrimView(std::string_view input) {
  const auto begin = input.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = input.find_last_not_of(kWhitespace);
  return input.substr(begin, end - begin + 1);
}

inline std::string Trim(std::string_view input) {
  return std::string(TrimView(input));
}

// Splits on runs of ASCII whitespace; empty tokens are never produced.
inline std::vector<std::string> SplitWhitespace(std::string_view input) {
  std::vector<std::string> tokens;
  std::size_t pos = 0;
  while (pos < input.size()) {
    const auto begin = input.find_first_not_of(kWhitespace, pos);
    if (begin == std::string_view::npos) {
      break;
    }
    auto end = input.find_first_of(kWhitespace, begin);
    if (end == std::string_view::npos) {
      end = input.size();
    }
    tokens.emplace_back(input.substr(begin, end - begin));
    pos = end;
  }
  return tokens;
}

// Keeps at most `max_chars` leading UTF-8 code points of `text`. Continuation
// bytes never start a new code point, so a multi-byte sequence is kept whole.
inline std::string TruncateCopy(std::string_view text, std::size_t max_chars) {
  std::size_t chars = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto byte = static_cast<unsigned char>(text[i]);
    if ((byte & 0xC0U) != 0x80U) {
      if (chars == max_chars) {
        return std::string(text.substr(0, i));
      }
      ++chars;
    }
  }
  return std::string(text);
}

// Half-away-from-zero rounding to one decimal place, used for percentages.
inline double RoundToOneDecimal(double value) {
  return std::round(value * 10.0) / 10.0;
}

inline std::string FormatFixedDouble(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

} // namespace plugeval::core

#endif // PLUGEVAL_CORE_STRING_UTILS_HPP_
