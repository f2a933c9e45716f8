#ifndef CNP_ANALYZER_CNP_EXTRACTOR_THOROUGH_H_
#define CNP_ANALYZER_CNP_EXTRACTOR_THOROUGH_H_

#include <regex>
#include <string>

#include "CNPExtractor.hpp"

// In THOROUGH mode we accept more separators and sloppier grouping, but still
// only the saner forms:
//   * Separators also include '/', '_', tab and the typos ',', '*', ':', ';'
//     (keys next to, or shifted from, the standard ones).
//   * Up to two separators between two digits.
//   * Up to 9 digit groups.
class CNPExtractorThorough : public CNPExtractor {
 public:
  CNPExtractorThorough()
      : regex_("[1-9]([" + Separators() + "]{0,2}[0-9]){12}",
               std::regex::optimize) {}

  void Process(const std::string& text) override {
    const int max_digit_groups = 9;
    Scan(text, regex_, max_digit_groups);
  }

 private:
  static std::string Separators() {
    const std::string standard_separators = " \\.\\-";
    const std::string other_separators = "\\/_\\t";
    const std::string typo_separators = ",\\*:;";
    return standard_separators + other_separators + typo_separators;
  }

  std::regex regex_;
};

#endif  // CNP_ANALYZER_CNP_EXTRACTOR_THOROUGH_H_
