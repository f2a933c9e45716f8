#ifndef CNP_ANALYZER_CNP_CENTURY_RESOLVER_FIXED_TABLE_H_
#define CNP_ANALYZER_CNP_CENTURY_RESOLVER_FIXED_TABLE_H_

#include "CNPCenturyResolver_Base.hpp"

// The official digit to century table. Foreign residents are read as born in
// the 1900s (7) or the 2000s (8), foreign citizens (9) as born in the 2000s.
class CNPCenturyResolver_FixedTable : public CNPCenturyResolver_Base {
 public:
  bool Resolve(int leading_digit, int year_code, int* century) const override {
    switch (leading_digit) {
      case 1: case 2: *century = 19; break;
      case 3: case 4: *century = 18; break;
      case 5: case 6: *century = 20; break;
      case 7: *century = 19; break;
      case 8: *century = 20; break;
      case 9: *century = 20; break;
      default: return false;
    }
    return true;
  }
};

#endif  // CNP_ANALYZER_CNP_CENTURY_RESOLVER_FIXED_TABLE_H_
