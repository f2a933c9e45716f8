#ifndef CNP_ANALYZER_CNP_TYPES_H_
#define CNP_ANALYZER_CNP_TYPES_H_

#include <cstddef>
#include <string>

// Length of a sanitized CNP.
const size_t kCNPLength = 13;

enum class ErrorKind {
  kNone,
  kNotAValue,
  kWrongLength,
  kNonDigit,
  kChecksumError,
  kImpossibleDate,
};

enum class Sex {
  kUnknown,
  kMale,
  kFemale,
  kForeign,
};

// Which 13-digit strings the validator accepts. kChecksum is the system of
// record, kFormatOnly only checks the structure.
enum class ValidationMode {
  kChecksum,
  kFormatOnly,
};

// How the leading digit is turned into a birth century.
enum class CenturyPolicy {
  kFixedTable,
  kAgePlausibility,
};

enum class Language {
  kRomanian,
  kEnglish,
};

// Calendar date, month is 1-based.
struct BirthDate {
  int year = 0;
  int month = 0;
  int day = 0;

  bool operator==(const BirthDate& other) const {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const BirthDate& other) const {
    return !(*this == other);
  }

  // Zero-based month, the way calendar APIs index months.
  int month_index() const {
    return month - 1;
  }
};

struct ValidationOutcome {
  bool is_valid = false;
  ErrorKind error_kind = ErrorKind::kNone;

  static ValidationOutcome Valid() {
    ValidationOutcome outcome;
    outcome.is_valid = true;
    return outcome;
  }

  static ValidationOutcome Invalid(ErrorKind kind) {
    ValidationOutcome outcome;
    outcome.error_kind = kind;
    return outcome;
  }
};

// The decoded fields (birth_date, sex, county, century, description) are
// filled in only when is_valid is true. On failure they keep their defaults
// and error_message carries the text to show to the user.
struct AnalysisResult {
  bool is_valid = false;
  ErrorKind error_kind = ErrorKind::kNone;
  std::string error_message;

  BirthDate birth_date;
  Sex sex = Sex::kUnknown;
  std::string county;
  int century = 0;
  std::string description;
};

// Stable lower case names, used on the wire and in tool output.
inline std::string ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone: return "none";
    case ErrorKind::kNotAValue: return "not_a_value";
    case ErrorKind::kWrongLength: return "wrong_length";
    case ErrorKind::kNonDigit: return "non_digit";
    case ErrorKind::kChecksumError: return "checksum_error";
    case ErrorKind::kImpossibleDate: return "impossible_date";
  }
  return "none";
}

inline std::string SexName(Sex sex) {
  switch (sex) {
    case Sex::kUnknown: return "unknown";
    case Sex::kMale: return "male";
    case Sex::kFemale: return "female";
    case Sex::kForeign: return "foreign";
  }
  return "unknown";
}

// The Parse* helpers below return false on unknown names and leave the
// output untouched.
inline bool ParseValidationMode(const std::string& name, ValidationMode* mode) {
  if (name == "checksum") {
    *mode = ValidationMode::kChecksum;
  } else if (name == "format-only") {
    *mode = ValidationMode::kFormatOnly;
  } else {
    return false;
  }
  return true;
}

inline bool ParseCenturyPolicy(const std::string& name, CenturyPolicy* policy) {
  if (name == "fixed") {
    *policy = CenturyPolicy::kFixedTable;
  } else if (name == "age") {
    *policy = CenturyPolicy::kAgePlausibility;
  } else {
    return false;
  }
  return true;
}

inline bool ParseLanguage(const std::string& name, Language* language) {
  if (name == "ro") {
    *language = Language::kRomanian;
  } else if (name == "en") {
    *language = Language::kEnglish;
  } else {
    return false;
  }
  return true;
}

#endif  // CNP_ANALYZER_CNP_TYPES_H_
