#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace pmatch::core {

// Locale-independent normalization of categorical values (education, income bracket,
// occupation, marital status) so that "Upper Middle", "upper-middle" and "UPPER_MIDDLE"
// compare equal.

// ASCII A-Z -> a-z. Other bytes pass through unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// normalize_category lower-cases, trims and joins words with '_'.
// Returns nullopt for values that carry no information: empty, "unknown", "n/a", "none".
inline std::optional<std::string> normalize_category(const std::string_view input) {
  const std::string lowered = normalize_ascii_lower(trim(input));

  std::string result;
  result.reserve(lowered.size());
  bool pending_sep = false;
  for (const char ch : lowered) {
    if (ch == ' ' || ch == '-' || ch == '_' || ch == '\t') {
      pending_sep = !result.empty();
      continue;
    }
    if (pending_sep) {
      result.push_back('_');
      pending_sep = false;
    }
    result.push_back(ch);
  }

  if (result.empty() || result == "unknown" || result == "n/a" || result == "none") {
    return std::nullopt;
  }
  return result;
}

}  // namespace pmatch::core
