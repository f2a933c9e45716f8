/**
 * @file test_cnp_analyzer.cc
 * @brief Unit tests for the CNPAnalyzer pipeline
 */

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "CNPAnalyzer.hpp"

namespace {

CNPAnalyzerOptions Options(ValidationMode mode, CenturyPolicy policy) {
  CNPAnalyzerOptions options;
  options.mode = mode;
  options.century_policy = policy;
  options.reference_year = 2026;
  return options;
}

void ExpectNoDecodedFields(const AnalysisResult& result) {
  EXPECT_EQ(result.birth_date, BirthDate());
  EXPECT_EQ(result.sex, Sex::kUnknown);
  EXPECT_TRUE(result.county.empty());
  EXPECT_EQ(result.century, 0);
  EXPECT_TRUE(result.description.empty());
}

}  // namespace

class CNPAnalyzerTest : public ::testing::Test {
 protected:
  CNPAnalyzerTest()
      : analyzer_(Options(ValidationMode::kChecksum, CenturyPolicy::kFixedTable)),
        age_analyzer_(Options(ValidationMode::kChecksum,
                              CenturyPolicy::kAgePlausibility)) {}

  CNPAnalyzer analyzer_;
  CNPAnalyzer age_analyzer_;
};

// ============================================================================
// Successful decoding
// ============================================================================

TEST_F(CNPAnalyzerTest, FemaleBornIn2008) {
  for (const CNPAnalyzer* analyzer : {&analyzer_, &age_analyzer_}) {
    AnalysisResult result = analyzer->Analyze("6080904000000");
    ASSERT_TRUE(result.is_valid);
    EXPECT_EQ(result.error_kind, ErrorKind::kNone);
    EXPECT_TRUE(result.error_message.empty());
    EXPECT_EQ(result.sex, Sex::kFemale);
    EXPECT_EQ(result.birth_date.year, 2008);
    EXPECT_EQ(result.birth_date.month, 9);
    EXPECT_EQ(result.birth_date.day, 4);
    EXPECT_EQ(result.century, 20);
    EXPECT_EQ(result.description, "Female born in 21st century");
    EXPECT_EQ(result.county, CNPCounty::UnknownName());
  }
}

TEST_F(CNPAnalyzerTest, MaleBornIn1980InIasi) {
  AnalysisResult result = analyzer_.Analyze("1800101221144");
  ASSERT_TRUE(result.is_valid);
  EXPECT_EQ(result.birth_date, (BirthDate{1980, 1, 1}));
  EXPECT_EQ(result.sex, Sex::kMale);
  EXPECT_EQ(result.county, "Iași");
  EXPECT_EQ(result.century, 19);
  EXPECT_EQ(result.description, "Male born in 20th century");
}

TEST_F(CNPAnalyzerTest, SeparatorsAreIgnored) {
  AnalysisResult result = analyzer_.Analyze("180-010.122 114 4");
  ASSERT_TRUE(result.is_valid);
  EXPECT_EQ(result.birth_date, (BirthDate{1980, 1, 1}));
}

TEST_F(CNPAnalyzerTest, NineteenthCentury) {
  AnalysisResult result = analyzer_.Analyze("3990607123459");
  ASSERT_TRUE(result.is_valid);
  EXPECT_EQ(result.birth_date, (BirthDate{1899, 6, 7}));
  EXPECT_EQ(result.county, "Cluj");
  EXPECT_EQ(result.description, "Male born in 19th century");
}

TEST_F(CNPAnalyzerTest, ForeignResidentAndCitizen) {
  AnalysisResult resident = analyzer_.Analyze("7900615001230");
  ASSERT_TRUE(resident.is_valid);
  EXPECT_EQ(resident.sex, Sex::kMale);
  EXPECT_EQ(resident.birth_date, (BirthDate{1990, 6, 15}));
  EXPECT_EQ(resident.description, "Male foreign resident born in 20th century");

  AnalysisResult citizen = analyzer_.Analyze("9800101700110");
  ASSERT_TRUE(citizen.is_valid);
  EXPECT_EQ(citizen.sex, Sex::kForeign);
  EXPECT_EQ(citizen.century, 20);
  EXPECT_EQ(citizen.description, "Foreign citizen");
}

TEST_F(CNPAnalyzerTest, BucharestSector) {
  AnalysisResult result = analyzer_.Analyze("2010420456783");
  ASSERT_TRUE(result.is_valid);
  EXPECT_EQ(result.county, "București (Sector 5)");
}

// ============================================================================
// Century policies
// ============================================================================

TEST_F(CNPAnalyzerTest, PoliciesDisagreeOnOldDates) {
  // Digit 2, year code 01: the table says 1901, which would make the person
  // 125 years old, the heuristic picks 2001.
  AnalysisResult fixed = analyzer_.Analyze("2010420456783");
  AnalysisResult age = age_analyzer_.Analyze("2010420456783");
  ASSERT_TRUE(fixed.is_valid);
  ASSERT_TRUE(age.is_valid);
  EXPECT_EQ(fixed.birth_date, (BirthDate{1901, 4, 20}));
  EXPECT_EQ(age.birth_date, (BirthDate{2001, 4, 20}));
  EXPECT_EQ(age.county, "București (Sector 5)");
  EXPECT_EQ(fixed.description, "Female born in 20th century");
  EXPECT_EQ(age.description, "Female born in 21st century");
}

TEST_F(CNPAnalyzerTest, HeuristicMovesNativeDigitToTwoThousands) {
  AnalysisResult fixed = analyzer_.Analyze("1111111111118");
  AnalysisResult age = age_analyzer_.Analyze("1111111111118");
  ASSERT_TRUE(fixed.is_valid);
  ASSERT_TRUE(age.is_valid);
  EXPECT_EQ(fixed.birth_date.year, 1911);
  EXPECT_EQ(age.birth_date.year, 2011);
  EXPECT_EQ(age.county, "Caraș-Severin");
}

TEST_F(CNPAnalyzerTest, ForeignResidentCenturyIgnoresPolicy) {
  for (const CNPAnalyzer* analyzer : {&analyzer_, &age_analyzer_}) {
    AnalysisResult female = analyzer->Analyze("8001014012345");
    ASSERT_TRUE(female.is_valid);
    EXPECT_EQ(female.birth_date, (BirthDate{2000, 10, 14}));
    EXPECT_EQ(female.century, 20);
    EXPECT_EQ(female.county, "Alba");
    EXPECT_EQ(female.description,
              "Female foreign resident born in 21st century");

    AnalysisResult male = analyzer->Analyze("7111111111119");
    ASSERT_TRUE(male.is_valid);
    EXPECT_EQ(male.birth_date.year, 1911);
    EXPECT_EQ(male.century, 19);
  }
}

// ============================================================================
// Leap years
// ============================================================================

TEST_F(CNPAnalyzerTest, LeapDay2004) {
  AnalysisResult result = analyzer_.Analyze("5040229400011");
  ASSERT_TRUE(result.is_valid);
  EXPECT_EQ(result.birth_date.month_index(), 1);
  EXPECT_EQ(result.birth_date.day, 29);
  EXPECT_EQ(result.county, "București");

  BirthDate date;
  EXPECT_TRUE(analyzer_.DecodeBirthDate("5040229400011", &date));
  EXPECT_EQ(date, (BirthDate{2004, 2, 29}));
}

TEST_F(CNPAnalyzerTest, NoLeapDayIn2003) {
  AnalysisResult result = analyzer_.Analyze("5030229400013");
  EXPECT_FALSE(result.is_valid);
  EXPECT_EQ(result.error_kind, ErrorKind::kImpossibleDate);
  ExpectNoDecodedFields(result);

  BirthDate date;
  EXPECT_FALSE(analyzer_.DecodeBirthDate("5030229400013", &date));
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(CNPAnalyzerTest, ShortInput) {
  AnalysisResult result = analyzer_.Analyze("123456789012");
  EXPECT_FALSE(result.is_valid);
  EXPECT_EQ(result.error_kind, ErrorKind::kWrongLength);
  EXPECT_EQ(result.error_message, "CNP-ul trebuie să aibă exact 13 cifre");
  ExpectNoDecodedFields(result);
}

TEST_F(CNPAnalyzerTest, EnglishMessages) {
  CNPAnalyzerOptions options;
  options.language = Language::kEnglish;
  CNPAnalyzer analyzer(options);
  AnalysisResult result = analyzer.Analyze("123456789012");
  EXPECT_FALSE(result.is_valid);
  EXPECT_NE(result.error_message.find("must have exactly 13 digits"),
            std::string::npos);
  EXPECT_EQ(analyzer.Analyze("").error_message, "CNP must be a valid value");
}

TEST_F(CNPAnalyzerTest, BlankInput) {
  AnalysisResult result = analyzer_.Analyze("  ");
  EXPECT_FALSE(result.is_valid);
  EXPECT_EQ(result.error_kind, ErrorKind::kNotAValue);
  EXPECT_EQ(result.error_message, "CNP-ul trebuie să fie o valoare validă");
}

TEST_F(CNPAnalyzerTest, NonDigitPayload) {
  AnalysisResult result = analyzer_.Analyze("CNP: 6080904000000");
  EXPECT_FALSE(result.is_valid);
  EXPECT_EQ(result.error_kind, ErrorKind::kNonDigit);
  EXPECT_EQ(result.error_message, "CNP-ul trebuie să conțină doar cifre");
}

TEST_F(CNPAnalyzerTest, WrongControlDigit) {
  AnalysisResult result = analyzer_.Analyze("6080904000001");
  EXPECT_FALSE(result.is_valid);
  EXPECT_EQ(result.error_kind, ErrorKind::kChecksumError);
  ExpectNoDecodedFields(result);
}

TEST_F(CNPAnalyzerTest, ImpossibleDates) {
  // Month 45.
  EXPECT_EQ(analyzer_.Analyze("1234567890128").error_kind, ErrorKind::kImpossibleDate);
  // Day 34.
  EXPECT_EQ(analyzer_.Analyze("5201234100010").error_kind, ErrorKind::kImpossibleDate);
  // Leading zero encodes no century.
  EXPECT_EQ(analyzer_.Analyze("0000000000000").error_kind, ErrorKind::kImpossibleDate);
}

TEST_F(CNPAnalyzerTest, WrongLengthForAnySanitizedLengthOtherThanThirteen) {
  std::string digits;
  for (int length = 0; length <= 20; ++length) {
    if (length != 13 && length > 0) {
      AnalysisResult result = analyzer_.Analyze("x" + digits);
      EXPECT_EQ(result.error_kind, ErrorKind::kWrongLength) << length;
    }
    digits += static_cast<char>('0' + length % 10);
  }
}

// ============================================================================
// Format-only mode
// ============================================================================

TEST(CNPAnalyzerFormatOnlyTest, ValidateAcceptsAnyThirteenDigits) {
  CNPAnalyzer analyzer(Options(ValidationMode::kFormatOnly, CenturyPolicy::kFixedTable));
  EXPECT_TRUE(analyzer.Validate("1234567890123").is_valid);
  EXPECT_FALSE(analyzer.Validate("123456789012").is_valid);
}

TEST(CNPAnalyzerFormatOnlyTest, SkipsChecksumButStillDecodes) {
  CNPAnalyzer analyzer(Options(ValidationMode::kFormatOnly, CenturyPolicy::kFixedTable));
  AnalysisResult result = analyzer.Analyze("6080904000001");
  ASSERT_TRUE(result.is_valid);
  EXPECT_EQ(result.birth_date, (BirthDate{2008, 9, 4}));
  // Structure passes, the date does not.
  EXPECT_EQ(analyzer.Analyze("1234567890123").error_kind, ErrorKind::kImpossibleDate);
}

TEST(CNPAnalyzerChecksumModeTest, ValidateRejectsWrongControlDigit) {
  CNPAnalyzer analyzer;
  ValidationOutcome outcome = analyzer.Validate("1234567890123");
  EXPECT_FALSE(outcome.is_valid);
  EXPECT_EQ(outcome.error_kind, ErrorKind::kChecksumError);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(CNPAnalyzerTest, SharedAcrossThreads) {
  const std::string inputs[] = {"6080904000000", "1800101221144",
                                "5030229400013", "123"};
  std::vector<AnalysisResult> expected;
  for (const std::string& input : inputs) {
    expected.push_back(analyzer_.Analyze(input));
  }

  const int thread_count = 8;
  std::vector<int> mismatches(thread_count, 0);
  std::vector<std::thread> threads;
  for (int t = 0; t < thread_count; ++t) {
    threads.emplace_back([&, t] () -> void {
      for (int round = 0; round < 200; ++round) {
        for (size_t i = 0; i < expected.size(); ++i) {
          AnalysisResult result = analyzer_.Analyze(inputs[i]);
          if (result.is_valid != expected[i].is_valid ||
              result.error_kind != expected[i].error_kind ||
              result.birth_date != expected[i].birth_date) {
            ++mismatches[t];
          }
        }
      }
    });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }
  for (int t = 0; t < thread_count; ++t) {
    EXPECT_EQ(mismatches[t], 0);
  }
}
