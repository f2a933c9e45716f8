#ifndef CNP_ANALYZER_CNP_DEMOGRAPHICS_H_
#define CNP_ANALYZER_CNP_DEMOGRAPHICS_H_

#include <string>

#include "CNPTypes.hpp"

class CNPDemographics {
 public:
  // 9 marks a foreign citizen, otherwise even digits are female and odd
  // digits male.
  static Sex ClassifySex(int leading_digit) {
    if (leading_digit == 9) {
      return Sex::kForeign;
    }
    return leading_digit % 2 == 0 ? Sex::kFemale : Sex::kMale;
  }

  static bool IsForeignResident(int leading_digit) {
    return leading_digit == 7 || leading_digit == 8;
  }

  // "Female born in 21st century", "Male foreign resident born in 20th
  // century", "Foreign citizen".
  static std::string Describe(int leading_digit, int century) {
    Sex sex = ClassifySex(leading_digit);
    if (sex == Sex::kForeign) {
      return "Foreign citizen";
    }
    std::string description = sex == Sex::kFemale ? "Female" : "Male";
    if (IsForeignResident(leading_digit)) {
      description += " foreign resident";
    }
    return description + " born in " + Ordinal(century + 1) + " century";
  }

 private:
  static std::string Ordinal(int n) {
    int tens = n % 100;
    if (tens >= 11 && tens <= 13) {
      return std::to_string(n) + "th";
    }
    switch (n % 10) {
      case 1: return std::to_string(n) + "st";
      case 2: return std::to_string(n) + "nd";
      case 3: return std::to_string(n) + "rd";
      default: return std::to_string(n) + "th";
    }
  }
};

#endif  // CNP_ANALYZER_CNP_DEMOGRAPHICS_H_
