#include <iostream>
#include <string>
#include <random>
#include <cstdlib>

#include "CNPAnalyzer.hpp"
#include "CNPUtil.hpp"

void PrintUsage() {
  std::cout << "Usage: ./cnp-gen count [leading_digit]" << std::endl;
}

std::string TwoDigits(int value) {
  return std::string(1, (char) ('0' + value / 10)) + (char) ('0' + value % 10);
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc < 2 || argc > 3) {
    PrintUsage();
    exit(1);
  }

  int n = atoi(argv[1]);
  int fixed_digit = argc == 3 ? atoi(argv[2]) : 0;
  if (n < 0 || fixed_digit < 0 || fixed_digit > 9) {
    PrintUsage();
    exit(1);
  }

  std::random_device rd;
  std::mt19937 mt(rd());
  std::uniform_int_distribution<int> leading_dist(1, 9);
  std::uniform_int_distribution<int> year_dist(0, 99);
  std::uniform_int_distribution<int> month_dist(1, 12);
  std::uniform_int_distribution<int> day_dist(1, 31);
  std::uniform_int_distribution<int> county_dist(1, 46);
  std::uniform_int_distribution<int> sequence_dist(1, 999);

  // Every candidate goes through the analyzer so only decodable CNPs are
  // printed; impossible dates are drawn again.
  CNPAnalyzer analyzer;
  while (n > 0) {
    int leading_digit = fixed_digit != 0 ? fixed_digit : leading_dist(mt);
    int sequence = sequence_dist(mt);
    std::string cnp = std::to_string(leading_digit) + TwoDigits(year_dist(mt)) +
                      TwoDigits(month_dist(mt)) + TwoDigits(day_dist(mt)) +
                      TwoDigits(county_dist(mt)) +
                      std::to_string(sequence / 100) + TwoDigits(sequence % 100);
    cnp += (char) ('0' + CNPUtil::ComputeControlDigit(cnp));
    if (!analyzer.Analyze(cnp).is_valid) {
      continue;
    }
    std::cout << cnp << std::endl;
    --n;
  }

  return 0;
}
