#include <iostream>
#include <memory>
#include <string>
#include <sstream>
#include <cstdlib>

#include "CNPAnalysisClient.hpp"
#include "CNPExtractor.hpp"
#include "CNPExtractorFactory.hpp"
#include "CNPUtil.hpp"

std::string ReadAllFromStdin() {
  std::ios::sync_with_stdio(false);
  std::ostringstream sstream;
  sstream << std::cin.rdbuf();
  return sstream.str();
}

void PrintUsage() {
  std::cerr << "Usage: ./cnp-scanner standard|thorough|paranoid [server_address]" << std::endl;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc < 2 || argc > 3) {
    PrintUsage();
    exit(1);
  }

  auto extractor = NewExtractorFromSpec(argv[1]);
  if (extractor == nullptr) {
    PrintUsage();
    exit(1);
  }

  // Initialize an analysis client if the target argument was supplied.
  auto analysis_client =
      argc == 3 ? CNPAnalysisClient::New(argv[2])
                : std::unique_ptr<CNPAnalysisClient>(nullptr);

  extractor->Process(ReadAllFromStdin());
  for (const std::string& cnp : extractor->Results()) {
    if (analysis_client == nullptr) {
      std::cout << cnp << std::endl;
      continue;
    }
    AnalysisResult result = analysis_client->Analyze(cnp);
    if (!result.is_valid) {
      // Checksum passed locally but the server disagrees (date, or a server
      // running another century policy).
      std::cout << CNPUtil::FormatForDisplay(cnp) << " | " << result.error_message << std::endl;
    } else {
      std::cout << CNPUtil::FormatForDisplay(cnp) << " | " << result.description
                << ", " << result.county << std::endl;
    }
  }

  return 0;
}
