#ifndef CNP_ANALYZER_CNP_ANALYSIS_CLIENT_H_
#define CNP_ANALYZER_CNP_ANALYSIS_CLIENT_H_

#include <grpcpp/grpcpp.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "cnpanalyzer.grpc.pb.h"

#include "CNPAnalysisProto.hpp"
#include "CNPTypes.hpp"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;

using cnpanalyzer::CNPAnalysis;
using cnpanalyzer::AnalyzeRequest;
using cnpanalyzer::AnalyzeResponse;
using cnpanalyzer::ValidateRequest;
using cnpanalyzer::ValidateResponse;
using cnpanalyzer::FormatRequest;
using cnpanalyzer::FormatResponse;

// Blocking client for the analysis service. A failed call means the server is
// unreachable, which the command line tools cannot recover from, so it ends
// the process.
class CNPAnalysisClient {
 public:
  AnalysisResult Analyze(const std::string& cnp) {
    AnalyzeRequest request;
    request.set_cnp(cnp);
    AnalyzeResponse response;
    ClientContext context;
    Status status = stub_->Analyze(&context, request, &response);
    CheckStatus(status);
    return CNPAnalysisProto::FromProto(response);
  }

  // Stores the error message (empty when valid) if message is not null.
  bool Validate(const std::string& cnp, std::string* message) {
    ValidateRequest request;
    request.set_cnp(cnp);
    ValidateResponse response;
    ClientContext context;
    Status status = stub_->Validate(&context, request, &response);
    CheckStatus(status);
    if (message != nullptr) {
      *message = response.error_message();
    }
    return response.valid();
  }

  std::string Format(const std::string& cnp) {
    FormatRequest request;
    request.set_cnp(cnp);
    FormatResponse response;
    ClientContext context;
    Status status = stub_->Format(&context, request, &response);
    CheckStatus(status);
    return response.formatted();
  }

  static std::unique_ptr<CNPAnalysisClient> New(const std::string& target) {
    auto insecure_credentials = grpc::InsecureChannelCredentials();
    auto grpc_channel = grpc::CreateChannel(target, insecure_credentials);
    return std::unique_ptr<CNPAnalysisClient>(new CNPAnalysisClient(grpc_channel));
  }

 private:
  CNPAnalysisClient(std::shared_ptr<Channel> channel)
      : stub_(CNPAnalysis::NewStub(channel)) {}

  static void CheckStatus(const Status& status) {
    if (!status.ok()) {
      std::cerr << status.error_code() << ": " << status.error_message() << std::endl;
      exit(1);
    }
  }

  std::unique_ptr<CNPAnalysis::Stub> stub_;
};

#endif  // CNP_ANALYZER_CNP_ANALYSIS_CLIENT_H_
