#ifndef CNP_ANALYZER_CNP_MESSAGES_H_
#define CNP_ANALYZER_CNP_MESSAGES_H_

#include <string>

#include "CNPTypes.hpp"

// Short messages meant to be shown as they are next to a form field.
class CNPMessages {
 public:
  static std::string ErrorMessage(ErrorKind kind, Language language) {
    if (language == Language::kEnglish) {
      return EnglishErrorMessage(kind);
    }
    return RomanianErrorMessage(kind);
  }

 private:
  static std::string RomanianErrorMessage(ErrorKind kind) {
    switch (kind) {
      case ErrorKind::kNone:
        return "";
      case ErrorKind::kNotAValue:
        return "CNP-ul trebuie să fie o valoare validă";
      case ErrorKind::kWrongLength:
        return "CNP-ul trebuie să aibă exact 13 cifre";
      case ErrorKind::kNonDigit:
        return "CNP-ul trebuie să conțină doar cifre";
      case ErrorKind::kChecksumError:
        return "Cifra de control a CNP-ului nu este corectă";
      case ErrorKind::kImpossibleDate:
        return "Data nașterii din CNP nu este validă";
    }
    return "";
  }

  static std::string EnglishErrorMessage(ErrorKind kind) {
    switch (kind) {
      case ErrorKind::kNone:
        return "";
      case ErrorKind::kNotAValue:
        return "CNP must be a valid value";
      case ErrorKind::kWrongLength:
        return "CNP must have exactly 13 digits";
      case ErrorKind::kNonDigit:
        return "CNP must contain only digits";
      case ErrorKind::kChecksumError:
        return "CNP control digit is incorrect";
      case ErrorKind::kImpossibleDate:
        return "CNP birth date is not a valid date";
    }
    return "";
  }
};

#endif  // CNP_ANALYZER_CNP_MESSAGES_H_
