#ifndef CNP_ANALYZER_CNP_EXTRACTOR_STANDARD_H_
#define CNP_ANALYZER_CNP_EXTRACTOR_STANDARD_H_

#include <regex>
#include <string>

#include "CNPExtractor.hpp"

// In STANDARD mode we only look for the forms CNPs are usually written in:
//   * Separators can only be one of ' ', '.', '-'.
//   * There is no more than one separator between two digits.
//   * There's no more than 7 digit groups ("D YY MM DD SS NNN C").
class CNPExtractorStandard : public CNPExtractor {
 public:
  CNPExtractorStandard()
      : regex_("[1-9]([ \\.\\-]?[0-9]){12}", std::regex::optimize) {}

  void Process(const std::string& text) override {
    const int max_digit_groups = 7;
    Scan(text, regex_, max_digit_groups);
  }

 private:
  std::regex regex_;
};

#endif  // CNP_ANALYZER_CNP_EXTRACTOR_STANDARD_H_
