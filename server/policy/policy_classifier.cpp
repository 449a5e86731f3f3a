#include "server/policy/policy_classifier.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace chatwarden {
namespace {
// The leading boundary is checked outside the regex (std::regex has no
// lookbehind), so a rule keeps its own capture group numbering.
constexpr const char* kWordEnd = ")(?!\\w)";
constexpr uint32_t kInvalidCodePoint = 0xFFFFFFFF;

std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t\r\n");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::string EscapeLiteral(const std::string& term) {
  static const std::string kSpecial = "\\^$.|?*+()[]{}/";
  std::string escaped;
  escaped.reserve(term.size() * 2);
  for (char c : term) {
    if (kSpecial.find(c) != std::string::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

uint32_t DecodeAt(const std::string& text, std::size_t pos) {
  auto lead = static_cast<unsigned char>(text[pos]);
  if (lead < 0x80) {
    return lead;
  }
  std::size_t length = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 0;
  if (length == 0 || pos + length > text.size()) {
    return kInvalidCodePoint;
  }
  uint32_t cp = lead & (0x7F >> length);
  for (std::size_t i = 1; i < length; ++i) {
    auto next = static_cast<unsigned char>(text[pos + i]);
    if ((next & 0xC0) != 0x80) {
      return kInvalidCodePoint;
    }
    cp = (cp << 6) | (next & 0x3F);
  }
  return cp;
}

// Punctuation, symbol and emoji blocks are non-word; every other non-ASCII
// code point counts as a letter.
bool IsWordCodePoint(uint32_t cp) {
  if (cp < 0x80) {
    return std::isalnum(static_cast<int>(cp)) || cp == '_';
  }
  if (cp == kInvalidCodePoint) {
    return false;
  }
  struct Range {
    uint32_t first;
    uint32_t last;
  };
  static constexpr Range kNonWord[] = {
      {0x0080, 0x00BF},   {0x00D7, 0x00D7},   {0x00F7, 0x00F7},
      {0x2000, 0x2BFF},   {0x3000, 0x303F},   {0xFE00, 0xFE0F},
      {0xFE30, 0xFE4F},   {0xFEFF, 0xFEFF},   {0xFF00, 0xFF0F},
      {0xFF1A, 0xFF20},   {0xFF3B, 0xFF40},   {0xFF5B, 0xFF65},
      {0x1F000, 0x1FAFF},
  };
  for (const auto& range : kNonWord) {
    if (cp >= range.first && cp <= range.last) {
      return false;
    }
  }
  return true;
}

bool WordBefore(const std::string& text, std::size_t pos) {
  if (pos == 0) {
    return false;
  }
  std::size_t start = pos - 1;
  while (start > 0 && pos - start < 4 &&
         (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
    --start;
  }
  return IsWordCodePoint(DecodeAt(text, start));
}

bool WordAt(const std::string& text, std::size_t pos) {
  return pos < text.size() && IsWordCodePoint(DecodeAt(text, pos));
}
}  // namespace

PolicyClassifier::PolicyClassifier(const std::vector<std::string>& terms,
                                   const std::vector<std::string>& patterns) {
  for (const auto& raw : terms) {
    auto term = Trim(raw);
    if (!term.empty()) {
      AddRule(term, EscapeLiteral(term));
    }
  }
  for (const auto& raw : patterns) {
    auto pattern = Trim(raw);
    if (!pattern.empty()) {
      AddRule(pattern, pattern);
    }
  }
}

void PolicyClassifier::AddRule(const std::string& source,
                               const std::string& expression) {
  try {
    Rule rule;
    rule.source = source;
    rule.regex = std::regex("(?:" + expression + kWordEnd,
                            std::regex::ECMAScript | std::regex::icase |
                                std::regex::optimize);
    rules_.push_back(std::move(rule));
  } catch (const std::regex_error& e) {
    throw std::invalid_argument("invalid policy pattern '" + source +
                                "': " + e.what());
  }
}

bool PolicyClassifier::Classify(const std::string& text,
                                PolicyMatch* match) const {
  if (text.empty()) {
    return false;
  }
  for (const auto& rule : rules_) {
    if (MatchRule(rule, text, match)) {
      return true;
    }
  }
  return false;
}

bool PolicyClassifier::MatchRule(const Rule& rule, const std::string& text,
                                 PolicyMatch* match) const {
  const std::size_t size = text.size();
  std::size_t window_begin = 0;
  while (true) {
    const std::size_t window_end = std::min(size, window_begin + kWindowBytes);
    const bool last_window = window_end == size;
    const auto window_stop = text.begin() + window_end;
    auto cursor = text.begin() + window_begin;

    while (cursor != window_stop) {
      auto flags = std::regex_constants::match_default;
      if (cursor != text.begin()) {
        flags |= std::regex_constants::match_prev_avail;
      }
      if (!last_window) {
        flags |= std::regex_constants::match_not_eol;
      }
      std::smatch m;
      if (!std::regex_search(cursor, window_stop, m, rule.regex, flags)) {
        break;
      }
      auto start = static_cast<std::size_t>(m[0].first - text.begin());
      auto end = static_cast<std::size_t>(m[0].second - text.begin());
      const bool cut = !last_window && end == window_end;
      if (cut && end - start <= kWindowOverlap) {
        // The next window starts before this match and sees it whole.
        break;
      }
      if (end > start && !WordBefore(text, start) &&
          (cut || !WordAt(text, end))) {
        if (match) {
          match->rule = rule.source;
          match->excerpt = m[0].str();
        }
        return true;
      }
      cursor = text.begin() + start + 1;
    }

    if (last_window) {
      return false;
    }
    window_begin = window_end - kWindowOverlap;
  }
}

}  // namespace chatwarden
