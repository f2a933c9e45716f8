#ifndef CNP_ANALYZER_CNP_EXTRACTOR_FACTORY_H_
#define CNP_ANALYZER_CNP_EXTRACTOR_FACTORY_H_

#include <memory>
#include <string>

#include "CNPExtractor.hpp"
#include "CNPExtractorParanoid.hpp"
#include "CNPExtractorStandard.hpp"
#include "CNPExtractorThorough.hpp"

// Builds a new CNPExtractor from the supplied string specification. Returns
// nullptr for anything other than standard, thorough or paranoid.
inline std::unique_ptr<CNPExtractor> NewExtractorFromSpec(
    const std::string& spec) {
  if (spec == "standard") {
    return std::make_unique<CNPExtractorStandard>();
  } else if (spec == "thorough") {
    return std::make_unique<CNPExtractorThorough>();
  } else if (spec == "paranoid") {
    return std::make_unique<CNPExtractorParanoid>();
  }
  return nullptr;
}

#endif  // CNP_ANALYZER_CNP_EXTRACTOR_FACTORY_H_
