#ifndef CNP_ANALYZER_CNP_UTIL_H_
#define CNP_ANALYZER_CNP_UTIL_H_

#include <cctype>
#include <string>

#include "CNPTypes.hpp"

class CNPUtil {
 public:
  // Removes every character that is not a decimal digit.
  static std::string Sanitize(const std::string& cnp) {
    std::string result;
    result.reserve(cnp.size());
    for (char c : cnp) {
      if (IsDigit(c)) {
        result += c;
      }
    }
    return result;
  }

  // True for the characters people type between digit groups.
  static bool IsSeparator(char c) {
    return isspace(static_cast<unsigned char>(c)) || c == '-' || c == '.' ||
           c == '/' || c == '_';
  }

  static bool IsDigit(char c) {
    return c >= '0' && c <= '9';
  }

  // Checks whether the string has nothing but whitespace in it.
  static bool IsBlank(const std::string& s) {
    for (char c : s) {
      if (!isspace(static_cast<unsigned char>(c))) {
        return false;
      }
    }
    return true;
  }

  // Checks whether the string is exactly 13 decimal digits.
  static bool IsWellFormed(const std::string& cnp) {
    if (cnp.size() != kCNPLength) {
      return false;
    }
    for (char c : cnp) {
      if (!IsDigit(c)) {
        return false;
      }
    }
    return true;
  }

  // Computes the control digit of the first 12 digits of the supplied
  // string. The caller guarantees there are at least 12 digits.
  static int ComputeControlDigit(const std::string& digits) {
    static const int coefficients[12] = {2, 7, 9, 1, 4, 6, 3, 5, 8, 2, 7, 9};
    int sum = 0;
    for (size_t i = 0; i < 12; ++i) {
      sum += coefficients[i] * (digits[i] - '0');
    }
    int remainder = sum % 11;
    return remainder == 10 ? 1 : remainder;
  }

  // Checks the 13th digit of a well formed CNP against the control sum.
  static bool HasValidControlDigit(const std::string& cnp) {
    if (!IsWellFormed(cnp)) {
      return false;
    }
    return ComputeControlDigit(cnp) == cnp[12] - '0';
  }

  // Groups a 13 character string as "D YY MM DD SS NNN C". Anything else is
  // returned unchanged.
  static std::string FormatForDisplay(const std::string& cnp) {
    if (cnp.size() != kCNPLength) {
      return cnp;
    }
    return cnp.substr(0, 1) + " " + cnp.substr(1, 2) + " " + cnp.substr(3, 2) +
           " " + cnp.substr(5, 2) + " " + cnp.substr(7, 2) + " " +
           cnp.substr(9, 3) + " " + cnp.substr(12, 1);
  }

  // Display form with the day, county, sequence and control digits hidden,
  // safe to write to logs.
  static std::string MaskForLog(const std::string& cnp) {
    std::string digits = Sanitize(cnp);
    if (digits.size() != kCNPLength) {
      return "<" + std::to_string(digits.size()) + " digits>";
    }
    return digits.substr(0, 1) + " " + digits.substr(1, 2) + " " +
           digits.substr(3, 2) + " ** ** *** *";
  }

  // Takes a matched chunk of text and converts it into the canonical
  // representation (13 digits). Returns true if the digits found in the
  // supplied string form a CNP with a correct control digit, false otherwise.
  static bool ExtractDigits(const std::string& cnp_in, std::string* cnp_out) {
    *cnp_out = "";
    int digit_count = 0;
    for (char c : cnp_in) {
      if (IsDigit(c)) {
        ++digit_count;
        // More than 13 digits means the match was cut out of something else.
        if (digit_count > kCNPLength) {
          *cnp_out = "";
          return false;
        }
        *cnp_out += c;
      }
    }

    bool is_valid = cnp_out->size() == kCNPLength && (*cnp_out)[0] != '0' &&
                    HasValidControlDigit(*cnp_out);
    if (!is_valid) {
      *cnp_out = "";
    }
    return is_valid;
  }
};

#endif  // CNP_ANALYZER_CNP_UTIL_H_
