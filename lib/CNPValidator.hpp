#ifndef CNP_ANALYZER_CNP_VALIDATOR_H_
#define CNP_ANALYZER_CNP_VALIDATOR_H_

#include <string>

#include "CNPTypes.hpp"
#include "CNPUtil.hpp"

class CNPValidator {
 public:
  // Structural checks only. Runs on the raw input so it can tell a blank
  // field from a short one and letters from separators.
  static ValidationOutcome ValidateStructure(const std::string& raw) {
    if (CNPUtil::IsBlank(raw)) {
      return ValidationOutcome::Invalid(ErrorKind::kNotAValue);
    }

    std::string cnp = CNPUtil::Sanitize(raw);
    if (cnp.size() != kCNPLength) {
      return ValidationOutcome::Invalid(ErrorKind::kWrongLength);
    }

    // Thirteen digits were found, but the rest of the input must be
    // separators, otherwise digits were picked out of some other payload.
    for (char c : raw) {
      if (!CNPUtil::IsDigit(c) && !CNPUtil::IsSeparator(c)) {
        return ValidationOutcome::Invalid(ErrorKind::kNonDigit);
      }
    }
    return ValidationOutcome::Valid();
  }

  // Expects a sanitized, well formed CNP.
  static ValidationOutcome ValidateChecksum(const std::string& cnp) {
    if (!CNPUtil::HasValidControlDigit(cnp)) {
      return ValidationOutcome::Invalid(ErrorKind::kChecksumError);
    }
    return ValidationOutcome::Valid();
  }

  // Runs the checks the supplied mode asks for, stopping at the first
  // failure.
  static ValidationOutcome Validate(const std::string& raw,
                                    ValidationMode mode) {
    ValidationOutcome outcome = ValidateStructure(raw);
    if (!outcome.is_valid || mode == ValidationMode::kFormatOnly) {
      return outcome;
    }
    return ValidateChecksum(CNPUtil::Sanitize(raw));
  }
};

#endif  // CNP_ANALYZER_CNP_VALIDATOR_H_
