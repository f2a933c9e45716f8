#ifndef CNP_ANALYZER_CNP_CENTURY_RESOLVER_AGE_PLAUSIBILITY_H_
#define CNP_ANALYZER_CNP_CENTURY_RESOLVER_AGE_PLAUSIBILITY_H_

#include <chrono>
#include <ctime>

#include "CNPCenturyResolver_Base.hpp"
#include "CNPCenturyResolver_FixedTable.hpp"

// Legacy data does not always respect the official table, so for the digits
// of native citizens (1, 2, 5, 6) this resolver picks whichever of the 1900s
// and the 2000s gives an age between 0 and 100 years on the reference year.
// When both do, the younger age wins. When neither does, the 1900s are used.
// The 1800s digits (3, 4) and the foreign digits (7, 8, 9) keep their table
// value.
class CNPCenturyResolver_AgePlausibility : public CNPCenturyResolver_Base {
 public:
  // Uses the current local year as reference.
  CNPCenturyResolver_AgePlausibility()
      : reference_year_(CurrentYear()) {}

  explicit CNPCenturyResolver_AgePlausibility(int reference_year)
      : reference_year_(reference_year) {}

  bool Resolve(int leading_digit, int year_code, int* century) const override {
    switch (leading_digit) {
      case 1: case 2: case 5: case 6:
        break;
      default:
        return fixed_table_.Resolve(leading_digit, year_code, century);
    }

    const int max_age = 100;
    int age_in_1900s = reference_year_ - (1900 + year_code);
    int age_in_2000s = reference_year_ - (2000 + year_code);
    bool plausible_1900s = age_in_1900s >= 0 && age_in_1900s <= max_age;
    bool plausible_2000s = age_in_2000s >= 0 && age_in_2000s <= max_age;

    if (plausible_2000s && (!plausible_1900s || age_in_2000s < age_in_1900s)) {
      *century = 20;
    } else {
      *century = 19;
    }
    return true;
  }

  int reference_year() const {
    return reference_year_;
  }

 private:
  static int CurrentYear() {
    std::time_t now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_now;
    localtime_r(&now, &local_now);
    return local_now.tm_year + 1900;
  }

  int reference_year_;
  CNPCenturyResolver_FixedTable fixed_table_;
};

#endif  // CNP_ANALYZER_CNP_CENTURY_RESOLVER_AGE_PLAUSIBILITY_H_
