#include <iostream>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <string>
#include <functional>

#include "CNPAnalysisClient.hpp"
#include "CNPTypes.hpp"

using namespace std::chrono;

void PrintUsage() {
  std::cerr << "Usage: ./cli server_address analyze|validate|format [quiet|time]" << std::endl;
}

// One line per analysis: "valid <date> <sex> <county> | <description>" or
// "invalid <error kind> | <message>".
std::string DescribeAnalysis(const AnalysisResult& result) {
  if (!result.is_valid) {
    return "invalid " + ErrorKindName(result.error_kind) + " | " + result.error_message;
  }
  char date[16];
  snprintf(date, sizeof(date), "%04d-%02d-%02d", result.birth_date.year,
           result.birth_date.month, result.birth_date.day);
  return "valid " + std::string(date) + " " + SexName(result.sex) + " " +
         result.county + " | " + result.description;
}

struct RunStats {
  int requests = 0;
  microseconds elapsed{0};
};

// Sends every line of the input through action, one request per line.
RunStats RunLines(std::istream& in,
                  const std::function<void(const std::string&)>& action) {
  RunStats stats;
  std::string cnp;
  auto start = steady_clock::now();
  while (std::getline(in, cnp)) {
    action(cnp);
    ++stats.requests;
  }
  stats.elapsed = duration_cast<microseconds>(steady_clock::now() - start);
  return stats;
}

void PrintTiming(const RunStats& stats) {
  double total_ms = stats.elapsed.count() / 1000.0;
  std::cout << stats.requests << " requests in " << total_ms << "ms, "
            << total_ms / stats.requests << "ms per request";
  if (stats.elapsed.count() > 0) {
    std::cout << ", " << static_cast<long long>(
        stats.requests * 1000000.0 / stats.elapsed.count()) << " QPS";
  }
  std::cout << "." << std::endl;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc < 3 || argc > 4) {
    PrintUsage();
    exit(1);
  }

  std::string target(argv[1]);
  std::string action(argv[2]);

  bool quiet = false, time = false;
  if (argc == 4) {
    if (strcmp(argv[3], "quiet") == 0) {
      quiet = true;
    } else if (strcmp(argv[3], "time") == 0) {
      time = true;
    } else {
      PrintUsage();
      exit(1);
    }
  }

  auto analysis_client = CNPAnalysisClient::New(target);

  // One lambda per action.
  auto analyze_fn = [&] (const std::string& cnp) -> void {
    AnalysisResult result = analysis_client->Analyze(cnp);
    if (quiet) return;
    std::cout << DescribeAnalysis(result) << std::endl;
  };
  auto validate_fn = [&] (const std::string& cnp) -> void {
    std::string message;
    bool valid = analysis_client->Validate(cnp, &message);
    if (quiet) return;
    std::cout << (valid ? "true" : "false | " + message) << std::endl;
  };
  auto format_fn = [&] (const std::string& cnp) -> void {
    std::string formatted = analysis_client->Format(cnp);
    if (quiet) return;
    std::cout << formatted << std::endl;
  };

  std::function<void(const std::string& cnp)> f;
  if (action == "analyze") {
    f = analyze_fn;
  } else if (action == "validate") {
    f = validate_fn;
  } else if (action == "format") {
    f = format_fn;
  } else {
    std::cerr << "Unknown action \"" << action << "\"." << std::endl;
    PrintUsage();
    exit(1);
  }

  std::ios::sync_with_stdio(false);
  RunStats stats = RunLines(std::cin, f);
  if (stats.requests == 0) {
    std::cerr << "No input." << std::endl;
    return 1;
  }
  if (time) {
    PrintTiming(stats);
  }

  return 0;
}
