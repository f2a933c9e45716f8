#ifndef CNP_ANALYZER_CNP_DATE_DECODER_H_
#define CNP_ANALYZER_CNP_DATE_DECODER_H_

#include <ctime>
#include <string>

#include "CNPTypes.hpp"
#include "CNPUtil.hpp"

class CNPDateDecoder {
 public:
  // Builds the birth date out of its encoded parts. The date is handed to
  // mktime, which normalizes out of range fields (April 31st becomes May 1st),
  // and read back. Any difference from the input means the date does not
  // exist and false is returned with *date untouched.
  static bool Decode(int century, int year_code, int month_code, int day_code,
                     BirthDate* date) {
    int year = century * 100 + year_code;
    int month_index = month_code - 1;
    int day = day_code;

    std::tm calendar = {};
    calendar.tm_year = year - 1900;
    calendar.tm_mon = month_index;
    calendar.tm_mday = day;
    // Noon keeps daylight saving transitions from moving the day.
    calendar.tm_hour = 12;
    calendar.tm_isdst = -1;
    if (std::mktime(&calendar) == static_cast<std::time_t>(-1)) {
      return false;
    }

    if (calendar.tm_year + 1900 != year || calendar.tm_mon != month_index ||
        calendar.tm_mday != day) {
      return false;
    }

    date->year = year;
    date->month = month_code;
    date->day = day_code;
    return true;
  }

  // Same as above, reading the year, month and day codes from digits 2-7 of
  // a well formed CNP.
  static bool Decode(int century, const std::string& cnp, BirthDate* date) {
    if (!CNPUtil::IsWellFormed(cnp)) {
      return false;
    }
    return Decode(century, TwoDigits(cnp, 1), TwoDigits(cnp, 3),
                  TwoDigits(cnp, 5), date);
  }

  static int TwoDigits(const std::string& cnp, size_t pos) {
    return (cnp[pos] - '0') * 10 + (cnp[pos + 1] - '0');
  }
};

#endif  // CNP_ANALYZER_CNP_DATE_DECODER_H_
