#ifndef CNP_ANALYZER_CNP_ANALYSIS_SERVICE_IMPL_H_
#define CNP_ANALYZER_CNP_ANALYSIS_SERVICE_IMPL_H_

#include <iostream>
#include <memory>
#include <mutex>

#include "cnpanalyzer.grpc.pb.h"

#include "CNPAnalysisProto.hpp"
#include "CNPAnalyzer.hpp"
#include "CNPUtil.hpp"

using grpc::ServerContext;
using grpc::Status;

using cnpanalyzer::CNPAnalysis;
using cnpanalyzer::AnalyzeRequest;
using cnpanalyzer::AnalyzeResponse;
using cnpanalyzer::ValidateRequest;
using cnpanalyzer::ValidateResponse;
using cnpanalyzer::FormatRequest;
using cnpanalyzer::FormatResponse;

// Invalid CNPs are a normal answer, every call returns Status::OK and puts
// the verdict in the response.
class CNPAnalysisServiceImpl final : public CNPAnalysis::Service {
 public:
  CNPAnalysisServiceImpl(std::unique_ptr<CNPAnalyzer> analyzer)
      : analyzer_(std::move(analyzer)) {
  }

  Status Analyze(ServerContext* context, const AnalyzeRequest* request, AnalyzeResponse* response) override {
    AnalysisResult result = analyzer_->Analyze(request->cnp());
    Log("Analyze", request->cnp(), result.error_kind);
    CNPAnalysisProto::ToProto(result, response);
    return Status::OK;
  }

  Status Validate(ServerContext* context, const ValidateRequest* request, ValidateResponse* response) override {
    ValidationOutcome outcome = analyzer_->Validate(request->cnp());
    Log("Validate", request->cnp(), outcome.error_kind);
    response->set_valid(outcome.is_valid);
    response->set_error_kind(CNPAnalysisProto::ToProto(outcome.error_kind));
    response->set_error_message(
        CNPMessages::ErrorMessage(outcome.error_kind, analyzer_->options().language));
    return Status::OK;
  }

  Status Format(ServerContext* context, const FormatRequest* request, FormatResponse* response) override {
    response->set_formatted(
        CNPUtil::FormatForDisplay(CNPUtil::Sanitize(request->cnp())));
    return Status::OK;
  }

 private:
  // Only the masked form of the CNP reaches the log.
  void Log(const char* method, const std::string& cnp, ErrorKind kind) {
    std::lock_guard<std::mutex> lock(cout_mutex_);
    std::cout << method << " " << CNPUtil::MaskForLog(cnp) << " "
              << ErrorKindName(kind) << std::endl;
  }

  std::mutex cout_mutex_;
  std::unique_ptr<CNPAnalyzer> analyzer_;
};

#endif  // CNP_ANALYZER_CNP_ANALYSIS_SERVICE_IMPL_H_
