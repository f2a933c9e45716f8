#ifndef CNP_ANALYZER_CNP_EXTRACTOR_H_
#define CNP_ANALYZER_CNP_EXTRACTOR_H_

#include <regex>
#include <set>
#include <string>

#include "CNPUtil.hpp"

// Scans free text for CNPs. Derived classes decide what a candidate looks
// like, the base class validates candidates and keeps the results.
class CNPExtractor {
 public:
  virtual ~CNPExtractor() = default;

  // To be implemented in the derived classes.
  virtual void Process(const std::string& text) = 0;

  // Sanitized CNPs found so far, in ascending order.
  const std::set<std::string>& Results() const {
    return results_;
  }

 protected:
  static int CountDigitGroups(const std::string& s) {
    size_t i = 0;
    int count = 0;
    while (i < s.size()) {
      // Skip non digit sequence.
      while (i < s.size() && !CNPUtil::IsDigit(s[i])) {
        ++i;
      }
      if (i == s.size()) {
        return count;
      }
      ++count;
      // Skip the digit sequence.
      while (i < s.size() && CNPUtil::IsDigit(s[i])) {
        ++i;
      }
    }
    return count;
  }

  // True if the match starting at pos with the given length touches another
  // digit on either side, i.e. it was cut out of a longer number.
  static bool IsEmbedded(const std::string& text, size_t pos, size_t length) {
    if (pos > 0 && CNPUtil::IsDigit(text[pos - 1])) {
      return true;
    }
    size_t end = pos + length;
    return end < text.size() && CNPUtil::IsDigit(text[end]);
  }

  // This method should be called each time a potential CNP is found at a
  // higher level. It extracts the digits out of a match, checks the control
  // digit and adds the result to the set (if valid). Returns true if the
  // match was kept.
  bool Matched(const std::string& match) {
    std::string cnp;
    if (!CNPUtil::ExtractDigits(match, &cnp)) {
      return false;
    }
    results_.insert(cnp);
    return true;
  }

  // Runs the regex over the whole text. A rejected match only moves the
  // search one character forward, since a real CNP may start inside it
  // (e.g. right after a date: "12.03.2024 6080904000000").
  void Scan(const std::string& text, const std::regex& regex,
            int max_digit_groups) {
    std::smatch match;
    std::string::const_iterator from = text.cbegin();
    while (std::regex_search(from, text.cend(), match, regex)) {
      size_t pos = match[0].first - text.cbegin();
      std::string candidate = match.str();
      if (!IsEmbedded(text, pos, candidate.size()) &&
          CountDigitGroups(candidate) <= max_digit_groups &&
          Matched(candidate)) {
        from = match[0].second;
      } else {
        from = match[0].first + 1;
      }
    }
  }

  // A set, so the same CNP mentioned twice is reported once.
  std::set<std::string> results_;
};

#endif  // CNP_ANALYZER_CNP_EXTRACTOR_H_
