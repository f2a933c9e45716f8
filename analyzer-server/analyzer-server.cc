#include <iostream>
#include <memory>
#include <string>
#include <cstdlib>
#include <csignal>
#include <pthread.h>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>

#include "CNPAnalysisServiceImpl.hpp"
#include "CNPAnalyzer.hpp"
#include "CNPTypes.hpp"

using grpc::Server;
using grpc::ServerBuilder;

void PrintUsage() {
  std::cerr << "Usage: ./analyzer-server [checksum|format-only] [fixed|age] [ro|en] [port]" << std::endl;
}

// SIGINT is blocked in every thread (gRPC threads inherit the mask) and
// collected synchronously by WaitForSigInt.
void BlockSigInt(sigset_t* set) {
  sigemptyset(set);
  sigaddset(set, SIGINT);
  pthread_sigmask(SIG_BLOCK, set, nullptr);
}

void WaitForSigInt(const sigset_t* set) {
  int signal_number = 0;
  sigwait(set, &signal_number);
  std::cout << "Caught SIGINT." << std::endl;
}

void RunServer(const CNPAnalyzerOptions& options, const std::string& port) {
  sigset_t sig_int_set;
  BlockSigInt(&sig_int_set);

  std::string server_address("0.0.0.0:" + port);
  CNPAnalysisServiceImpl service(std::make_unique<CNPAnalyzer>(options));
  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();
  ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (server == nullptr) {
    std::cerr << "Could not listen on " << server_address << std::endl;
    exit(1);
  }
  std::cout << "Server listening on " << server_address << std::endl;
  std::thread t([&] () -> void { server->Wait(); });
  WaitForSigInt(&sig_int_set);
  server->Shutdown();
  t.join();
}

int main(int argc, char** argv) {
  if (argc > 5) {
    PrintUsage();
    exit(1);
  }

  // Positional arguments, each one optional.
  CNPAnalyzerOptions options;
  std::string port = "12000";
  if (argc > 1 && !ParseValidationMode(argv[1], &options.mode)) {
    PrintUsage();
    exit(1);
  }
  if (argc > 2 && !ParseCenturyPolicy(argv[2], &options.century_policy)) {
    PrintUsage();
    exit(1);
  }
  if (argc > 3 && !ParseLanguage(argv[3], &options.language)) {
    PrintUsage();
    exit(1);
  }
  if (argc > 4) {
    port = argv[4];
  }

  RunServer(options, port);
  std::cout << "Bye." << std::endl;
  return 0;
}
