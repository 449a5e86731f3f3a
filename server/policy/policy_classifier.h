#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace chatwarden {

struct PolicyMatch {
  std::string rule;     // configured term or pattern that fired
  std::string excerpt;  // text the rule matched
};

// Decides whether a piece of text violates the content policy. The guards and
// the sanitizer depend on this seam so their failure handling can be driven
// from tests.
class ContentClassifier {
 public:
  virtual ~ContentClassifier() = default;

  // True when `text` violates the policy. Throws when classification itself
  // fails; callers pick fail-open or fail-closed.
  virtual bool Classify(const std::string& text,
                        PolicyMatch* match = nullptr) const = 0;
};

// Case-insensitive whole-word matcher over a fixed rule set. Immutable after
// construction, so one instance is shared by every request thread.
//
// std::regex recurses once per character it consumes, so rules never see more
// than kWindowBytes at a time. Windows overlap by kWindowOverlap bytes; a
// match must fit in one window to be found, except that a match running into
// the end of its window longer than the overlap counts as a hit.
class PolicyClassifier : public ContentClassifier {
 public:
  static constexpr std::size_t kWindowBytes = 4096;
  static constexpr std::size_t kWindowOverlap = 512;

  PolicyClassifier() = default;

  // `terms` are literal words or phrases; `patterns` are ECMAScript regular
  // expressions. Both must start and end on a word boundary, where letters
  // outside ASCII count as word characters. Throws std::invalid_argument
  // when a pattern does not compile.
  PolicyClassifier(const std::vector<std::string>& terms,
                   const std::vector<std::string>& patterns);

  // Empty text never matches. May throw std::regex_error if the matcher
  // exhausts its resources on hostile input.
  bool Classify(const std::string& text,
                PolicyMatch* match = nullptr) const override;

  bool Enabled() const { return !rules_.empty(); }
  std::size_t RuleCount() const { return rules_.size(); }

 private:
  struct Rule {
    std::string source;
    std::regex regex;
  };

  void AddRule(const std::string& source, const std::string& expression);
  bool MatchRule(const Rule& rule, const std::string& text,
                 PolicyMatch* match) const;

  std::vector<Rule> rules_;
};

}  // namespace chatwarden
