#ifndef CNP_ANALYZER_CNP_ANALYSIS_PROTO_H_
#define CNP_ANALYZER_CNP_ANALYSIS_PROTO_H_

#include "cnpanalyzer.pb.h"

#include "CNPTypes.hpp"

// Conversions between the engine types and their wire messages.
class CNPAnalysisProto {
 public:
  static cnpanalyzer::ErrorKind ToProto(ErrorKind kind) {
    switch (kind) {
      case ErrorKind::kNone: return cnpanalyzer::ERROR_KIND_NONE;
      case ErrorKind::kNotAValue: return cnpanalyzer::ERROR_KIND_NOT_A_VALUE;
      case ErrorKind::kWrongLength: return cnpanalyzer::ERROR_KIND_WRONG_LENGTH;
      case ErrorKind::kNonDigit: return cnpanalyzer::ERROR_KIND_NON_DIGIT;
      case ErrorKind::kChecksumError:
        return cnpanalyzer::ERROR_KIND_CHECKSUM_ERROR;
      case ErrorKind::kImpossibleDate:
        return cnpanalyzer::ERROR_KIND_IMPOSSIBLE_DATE;
    }
    return cnpanalyzer::ERROR_KIND_NONE;
  }

  static ErrorKind FromProto(cnpanalyzer::ErrorKind kind) {
    switch (kind) {
      case cnpanalyzer::ERROR_KIND_NOT_A_VALUE: return ErrorKind::kNotAValue;
      case cnpanalyzer::ERROR_KIND_WRONG_LENGTH: return ErrorKind::kWrongLength;
      case cnpanalyzer::ERROR_KIND_NON_DIGIT: return ErrorKind::kNonDigit;
      case cnpanalyzer::ERROR_KIND_CHECKSUM_ERROR:
        return ErrorKind::kChecksumError;
      case cnpanalyzer::ERROR_KIND_IMPOSSIBLE_DATE:
        return ErrorKind::kImpossibleDate;
      default: return ErrorKind::kNone;
    }
  }

  static cnpanalyzer::Sex ToProto(Sex sex) {
    switch (sex) {
      case Sex::kUnknown: return cnpanalyzer::SEX_UNKNOWN;
      case Sex::kMale: return cnpanalyzer::SEX_MALE;
      case Sex::kFemale: return cnpanalyzer::SEX_FEMALE;
      case Sex::kForeign: return cnpanalyzer::SEX_FOREIGN;
    }
    return cnpanalyzer::SEX_UNKNOWN;
  }

  static Sex FromProto(cnpanalyzer::Sex sex) {
    switch (sex) {
      case cnpanalyzer::SEX_MALE: return Sex::kMale;
      case cnpanalyzer::SEX_FEMALE: return Sex::kFemale;
      case cnpanalyzer::SEX_FOREIGN: return Sex::kForeign;
      default: return Sex::kUnknown;
    }
  }

  static void ToProto(const AnalysisResult& result,
                      cnpanalyzer::AnalyzeResponse* response) {
    response->set_valid(result.is_valid);
    response->set_error_kind(ToProto(result.error_kind));
    if (!result.is_valid) {
      response->set_error_message(result.error_message);
      return;
    }
    cnpanalyzer::Date* date = response->mutable_birth_date();
    date->set_year(result.birth_date.year);
    date->set_month(result.birth_date.month);
    date->set_day(result.birth_date.day);
    response->set_sex(ToProto(result.sex));
    response->set_county(result.county);
    response->set_century(result.century);
    response->set_description(result.description);
  }

  static AnalysisResult FromProto(const cnpanalyzer::AnalyzeResponse& response) {
    AnalysisResult result;
    result.is_valid = response.valid();
    result.error_kind = FromProto(response.error_kind());
    if (!result.is_valid) {
      result.error_message = response.error_message();
      return result;
    }
    result.birth_date.year = response.birth_date().year();
    result.birth_date.month = response.birth_date().month();
    result.birth_date.day = response.birth_date().day();
    result.sex = FromProto(response.sex());
    result.county = response.county();
    result.century = response.century();
    result.description = response.description();
    return result;
  }
};

#endif  // CNP_ANALYZER_CNP_ANALYSIS_PROTO_H_
