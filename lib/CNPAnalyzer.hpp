#ifndef CNP_ANALYZER_CNP_ANALYZER_H_
#define CNP_ANALYZER_CNP_ANALYZER_H_

#include <memory>
#include <string>

#include "CNPCenturyResolver_AgePlausibility.hpp"
#include "CNPCenturyResolver_Base.hpp"
#include "CNPCenturyResolver_FixedTable.hpp"
#include "CNPCounty.hpp"
#include "CNPDateDecoder.hpp"
#include "CNPDemographics.hpp"
#include "CNPMessages.hpp"
#include "CNPTypes.hpp"
#include "CNPUtil.hpp"
#include "CNPValidator.hpp"

struct CNPAnalyzerOptions {
  ValidationMode mode = ValidationMode::kChecksum;
  CenturyPolicy century_policy = CenturyPolicy::kFixedTable;
  Language language = Language::kRomanian;
  // Year the age heuristic measures ages against, 0 means the current year.
  int reference_year = 0;
};

// Runs the whole pipeline on one input: sanitize, structure, checksum (when
// enabled), century, date, sex. The first failing stage decides the error.
// The analyzer only holds its configuration, so a single instance may be
// shared between threads.
class CNPAnalyzer {
 public:
  CNPAnalyzer() : CNPAnalyzer(CNPAnalyzerOptions()) {}

  explicit CNPAnalyzer(const CNPAnalyzerOptions& options)
      : options_(options),
        century_resolver_(NewCenturyResolver(options.century_policy,
                                             options.reference_year)) {}

  AnalysisResult Analyze(const std::string& input) const {
    ValidationOutcome outcome = CNPValidator::Validate(input, options_.mode);
    if (!outcome.is_valid) {
      return Failure(outcome.error_kind);
    }

    std::string cnp = CNPUtil::Sanitize(input);
    int leading_digit = cnp[0] - '0';
    int year_code = CNPDateDecoder::TwoDigits(cnp, 1);

    int century = 0;
    if (!century_resolver_->Resolve(leading_digit, year_code, &century)) {
      // No century, so no date can be built either.
      return Failure(ErrorKind::kImpossibleDate);
    }

    BirthDate birth_date;
    if (!CNPDateDecoder::Decode(century, cnp, &birth_date)) {
      return Failure(ErrorKind::kImpossibleDate);
    }

    AnalysisResult result;
    result.is_valid = true;
    result.birth_date = birth_date;
    result.sex = CNPDemographics::ClassifySex(leading_digit);
    result.county = CNPCounty::NameOf(CNPDateDecoder::TwoDigits(cnp, 7));
    result.century = century;
    result.description = CNPDemographics::Describe(leading_digit, century);
    return result;
  }

  // Validation only, with the analyzer's mode.
  ValidationOutcome Validate(const std::string& input) const {
    return CNPValidator::Validate(input, options_.mode);
  }

  // Birth date alone. Returns false for anything Analyze would reject.
  bool DecodeBirthDate(const std::string& input, BirthDate* date) const {
    AnalysisResult result = Analyze(input);
    if (!result.is_valid) {
      return false;
    }
    *date = result.birth_date;
    return true;
  }

  const CNPAnalyzerOptions& options() const {
    return options_;
  }

  static std::unique_ptr<CNPCenturyResolver_Base> NewCenturyResolver(
      CenturyPolicy policy, int reference_year) {
    if (policy == CenturyPolicy::kAgePlausibility) {
      if (reference_year == 0) {
        return std::make_unique<CNPCenturyResolver_AgePlausibility>();
      }
      return std::make_unique<CNPCenturyResolver_AgePlausibility>(
          reference_year);
    }
    return std::make_unique<CNPCenturyResolver_FixedTable>();
  }

 private:
  AnalysisResult Failure(ErrorKind kind) const {
    AnalysisResult result;
    result.error_kind = kind;
    result.error_message = CNPMessages::ErrorMessage(kind, options_.language);
    return result;
  }

  CNPAnalyzerOptions options_;
  std::unique_ptr<CNPCenturyResolver_Base> century_resolver_;
};

#endif  // CNP_ANALYZER_CNP_ANALYZER_H_
