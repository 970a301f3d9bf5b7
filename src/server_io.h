#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>
#include <memory>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <jrunner/submission.h>

extern std::string kListenHost;
extern int kListenPort;
// empty certificate: plain HTTP, for local testing only
extern std::string kTlsCert;
extern std::string kTlsKey;
extern std::string kTlsClientCa;
extern std::string kRunnerKey;
extern std::string kOrchestratorUrl;
extern std::string kOrchestratorKey;
extern bool kOrchestratorInsecure;
extern int kReportRetries;

// report body of a finished job
nlohmann::json ResultJSON(const Submission&, const SubmissionResult&);

// Reporter that pushes results into the outgoing queue.
// Final results are stored in the database first.
Submission::Reporter ServerReporter();

// Register the endpoints on svr
void SetupRoutes(httplib::Server& svr);

// Deliver stored results, oldest first, until one fails; return the number delivered
size_t RedeliverPending();

// Final results not acknowledged by the orchestrator yet
size_t PendingReportCount();

// Create the server with its routes and bind it to kListenHost:kListenPort;
// nullptr if the certificate cannot be loaded or the port cannot be bound
std::unique_ptr<httplib::Server> CreateServer();

// This function starts the report thread and serves requests on svr.
// It will not return.
void ServerWorkLoop(std::unique_ptr<httplib::Server> svr);

#endif  // SERVER_IO_H_
