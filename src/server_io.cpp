#include "server_io.h"

#include <deque>
#include <mutex>
#include <chrono>
#include <thread>
#include <condition_variable>

#include <spdlog/spdlog.h>

#include <jrunner/paths.h>
#include <jrunner/utils.h>
#include "database.h"
#include "http_utils.h"
#include "job_request.h"

std::string kListenHost = "0.0.0.0";
int kListenPort = 8443;
std::string kTlsCert = "";
std::string kTlsKey = "";
std::string kTlsClientCa = "";
std::string kRunnerKey = "";
std::string kOrchestratorUrl = "";
std::string kOrchestratorKey = "";
bool kOrchestratorInsecure = false;
int kReportRetries = 5;

namespace {

using nlohmann::json;
using namespace std::chrono_literals;

const std::string kResultEndpoint = "/runner/result";
const std::string kProgressEndpoint = "/runner/progress";
constexpr auto kRedeliverInterval = 60s;
constexpr size_t kRedeliverBatch = 100;

/// --- database ---
fs::path DatabasePath() {
  return internal::kDataDir / "pending.sqlite";
}

Database& PendingDB() {
  static Database db(DatabasePath());
  return db;
}

// output may not be valid UTF-8
std::string Dump(const json& obj) {
  return obj.dump(-1, ' ', false, json::error_handler_t::replace);
}

/// --- outgoing reports ---
// Final results are written to the database before they are queued and
// removed once acknowledged, so a crash or redeploy cannot lose them.
// Progress reports are best-effort and only kept in memory.
struct Report {
  bool is_final;
  std::string submission_id;
  long job_id;
  std::string payload; // empty for stored final results
  int64_t row; // -1 if the result could not be stored
};

constexpr size_t kMaxQueuedProgress = 1024;

std::deque<Report> report_queue;
size_t queued_progress = 0;
size_t unstored_finals = 0;
std::mutex report_mtx;
std::condition_variable report_cv;

void PushReport(Report&& rep) {
  {
    std::lock_guard lck(report_mtx);
    if (!rep.is_final) {
      if (queued_progress >= kMaxQueuedProgress) {
        spdlog::debug("Progress dropped: sub_id={} job_id={} queue full", rep.submission_id, rep.job_id);
        return;
      }
      queued_progress++;
    } else if (rep.row < 0) {
      unstored_finals++;
    }
    report_queue.push_back(std::move(rep));
  }
  report_cv.notify_one();
}

void PushFinal(const std::string& submission_id, long job_id, std::string&& payload) {
  PendingResult item{
    .id = 0,
    .submission_id = submission_id,
    .job_id = job_id,
    .payload = payload,
    .created_at = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count(),
    .attempts = 0,
  };
  try {
    int64_t row = PendingDB().Save(item);
    spdlog::debug("Result stored: sub_id={} job_id={} row={}", submission_id, job_id, row);
    PushReport({true, submission_id, job_id, "", row});
  } catch (std::system_error& err) {
    spdlog::error("Failed to store result: sub_id={} job_id={} error={}", submission_id, job_id, err.what());
    PushReport({true, submission_id, job_id, std::move(payload), -1});
  }
}

std::unique_ptr<httplib::Client> OrchestratorClient() {
  auto cli = std::make_unique<httplib::Client>(kOrchestratorUrl);
  cli->set_bearer_token_auth(kOrchestratorKey.c_str());
  cli->set_connection_timeout(10);
  cli->set_read_timeout(30);
  cli->enable_server_certificate_verification(!kOrchestratorInsecure);
  return cli;
}

bool Deliver(const std::string& endpoint, const std::string& payload, const RetryPolicy& policy) {
  if (kOrchestratorUrl.empty()) return false;
  auto cli = OrchestratorClient();
  return IsSuccess(RequestRetry<HTTPPost>(policy, *cli, endpoint, payload, "application/json"));
}

// Deliver stored results oldest first until one fails; drained is set if none are left
size_t DeliverStored(const RetryPolicy& policy, bool* drained) {
  size_t delivered = 0;
  if (drained) *drained = false;
  while (true) {
    std::vector<PendingResult> pending;
    try {
      pending = PendingDB().Pending(kRedeliverBatch);
    } catch (std::system_error& err) {
      spdlog::error("Failed to read stored results: {}", err.what());
      return delivered;
    }
    if (pending.empty()) {
      if (drained) *drained = true;
      return delivered;
    }
    for (auto& item : pending) {
      try {
        if (!Deliver(kResultEndpoint, item.payload, policy)) {
          PendingDB().MarkAttempt(item.id);
          spdlog::warn("Result kept for redelivery: sub_id={} job_id={} attempts={}",
                       item.submission_id, item.job_id, item.attempts + 1);
          return delivered;
        }
        PendingDB().Remove(item.id);
      } catch (std::system_error& err) {
        spdlog::error("Failed to update stored result {}: {}", item.id, err.what());
        return delivered;
      }
      spdlog::info("Result delivered: sub_id={} job_id={} attempts={}", item.submission_id, item.job_id, item.attempts + 1);
      delivered++;
    }
  }
}

// This function deals with all outgoing reports in order. While the
// orchestrator is unreachable, progress is dropped and stored results wait
// for the next redelivery round.
void ReportLoop() {
  const RetryPolicy final_policy{kReportRetries, 1s, 16s};
  const RetryPolicy progress_policy{0, 0ms, 0ms};
  // results left over from an earlier run go out first
  auto next_redeliver = std::chrono::steady_clock::now();
  bool down = false;
  std::unique_lock lck(report_mtx);
  while (true) {
    if (!report_cv.wait_until(lck, next_redeliver, []{ return !report_queue.empty(); })) {
      lck.unlock();
      bool drained;
      DeliverStored(progress_policy, &drained);
      down = !drained;
      next_redeliver = std::chrono::steady_clock::now() + kRedeliverInterval;
      lck.lock();
      continue;
    }
    Report rep = std::move(report_queue.front());
    report_queue.pop_front();
    if (!rep.is_final) queued_progress--;
    lck.unlock();
    if (!rep.is_final) {
      if (down || !Deliver(kProgressEndpoint, rep.payload, progress_policy)) {
        spdlog::debug("Progress dropped: sub_id={} job_id={}", rep.submission_id, rep.job_id);
        down = true;
      }
    } else if (rep.row < 0) {
      if (Deliver(kResultEndpoint, rep.payload, final_policy)) {
        spdlog::info("Result delivered: sub_id={} job_id={}", rep.submission_id, rep.job_id);
      } else {
        spdlog::error("Result lost: sub_id={} job_id={}", rep.submission_id, rep.job_id);
      }
    } else if (!down) {
      bool drained;
      DeliverStored(final_policy, &drained);
      down = !drained;
    }
    lck.lock();
    if (rep.is_final && rep.row < 0) unstored_finals--;
  }
}

/// --- JSON ---
json CaseJSON(const SubmissionResult::CaseResult& res, const std::string& name, size_t position) {
  return {
    {"position", position},
    {"name", name},
    {"verdict", VerdictToAbr(res.verdict)},
    {"time_us", res.time},
    {"wall_us", res.wall},
    {"memory_kib", res.rss},
    {"exit_code", res.exit_code},
    {"signal", res.signal},
    {"score", ScoreToString(res.score)},
    {"output", res.output},
    {"output_truncated", res.output_truncated},
    {"error", res.error},
    {"message", res.message},
  };
}

json ProgressJSON(const Submission& sub, const char* status) {
  return {
    {"submission_id", sub.submission_id},
    {"job_id", sub.submission_internal_id},
    {"status", status},
  };
}

/// --- request handlers ---
void Reply(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(Dump(body), "application/json");
}

bool Authorized(const httplib::Request& req) {
  return !kRunnerKey.empty() && req.get_header_value("Authorization") == "Bearer " + kRunnerKey;
}

httplib::Server::Handler WithAuth(httplib::Server::Handler handler) {
  return [handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
    if (!Authorized(req)) return Reply(res, 401, {{"error", "Unauthorized"}});
    handler(req, res);
  };
}

void RemoveSubmissionFiles(long id) {
  std::error_code ec;
  fs::remove_all(SubmissionCodePath(id), ec);
  if (ec) spdlog::warn("Failed to remove {}: {}", SubmissionCodePath(id).string(), ec.message());
}

void HandleJudge(const httplib::Request& req, httplib::Response& res) {
  if (IsDraining()) return Reply(res, 503, {{"error", "Runner is draining"}});
  Submission sub;
  sub.submission_internal_id = GetUniqueSubmissionInternalId();
  const long id = sub.submission_internal_id;
  try {
    ParseJobRequest(json::parse(req.body), sub);
  } catch (UnsupportedLanguage& err) {
    // well-formed: the job exists and ends with IE
    RemoveSubmissionFiles(id);
    spdlog::warn("Unsupported language: id={} sub_id={} lang={}", id, sub.submission_id, err.Language());
    SubmissionResult result;
    result.verdict = Verdict::IE;
    result.ie_message = err.what();
    PushFinal(sub.submission_id, id, Dump(ResultJSON(sub, result)));
    return Reply(res, 202, {{"job_id", id}});
  } catch (RequestError& err) {
    RemoveSubmissionFiles(id);
    spdlog::info("Rejected request: {}", err.what());
    return Reply(res, 400, {{"error", err.what()}});
  } catch (json::exception& err) {
    RemoveSubmissionFiles(id);
    spdlog::info("Rejected request: {}", err.what());
    return Reply(res, 400, {{"error", err.what()}});
  } catch (std::runtime_error& err) {
    RemoveSubmissionFiles(id);
    spdlog::error("Failed to store request: id={} error={}", id, err.what());
    return Reply(res, 500, {{"error", err.what()}});
  }
  sub.reporter = ServerReporter();
  std::string sub_id = sub.submission_id;
  if (!PushSubmission(std::move(sub), kMaxQueue)) {
    RemoveSubmissionFiles(id);
    spdlog::info("Submission refused: sub_id={} draining={}", sub_id, IsDraining());
    return Reply(res, 503, {{"error", IsDraining() ? "Runner is draining" : "Queue is full"}});
  }
  Reply(res, 202, {{"job_id", id}});
}

void HandleCancel(const httplib::Request& req, httplib::Response& res) {
  std::string sub_id;
  try {
    sub_id = json::parse(req.body).at("submission_id").get<std::string>();
  } catch (json::exception& err) {
    return Reply(res, 400, {{"error", err.what()}});
  }
  if (!CancelSubmission(sub_id)) return Reply(res, 404, {{"error", "No such submission"}});
  Reply(res, 200, {{"submission_id", sub_id}});
}

void HandleStatus(const httplib::Request&, httplib::Response& res) {
  PoolStatus status = GetPoolStatus();
  Reply(res, 200, {
    {"state", status.draining ? "draining" : "accepting"},
    {"workers", status.workers},
    {"busy", status.busy},
    {"queued", status.queued},
    {"submissions", GetQueuedSubmissionID()},
    {"pending_reports", PendingReportCount()},
  });
}

void HandleHealth(const httplib::Request&, httplib::Response& res) {
  bool draining = IsDraining();
  res.status = draining ? 503 : 200;
  res.set_content(draining ? "draining" : "accepting", "text/plain");
}

void HandleDrain(const httplib::Request&, httplib::Response& res) {
  SetDraining(true);
  Reply(res, 200, {{"state", "draining"}});
}

} // namespace

json ResultJSON(const Submission& sub, const SubmissionResult& res) {
  json results = json::array();
  for (size_t i = 0; i < res.case_results.size(); i++) {
    auto& item = res.case_results[i];
    // skipped cases are not reported
    if (item.verdict == Verdict::NUL) continue;
    results.push_back(CaseJSON(item, i < sub.testcases.size() ? sub.testcases[i].name : "", i));
  }
  std::string message;
  if (res.verdict == Verdict::CE) message = res.ce_message;
  else if (res.verdict == Verdict::IE) message = res.ie_message;
  return {
    {"submission_id", sub.submission_id},
    {"job_id", sub.submission_internal_id},
    {"verdict", VerdictToAbr(res.verdict)},
    {"message", message},
    {"results", results},
  };
}

Submission::Reporter ServerReporter() {
  return {
    .ReportStartCompiling = [](const Submission& sub, const SubmissionResult&) {
      PushReport({false, sub.submission_id, sub.submission_internal_id, Dump(ProgressJSON(sub, "compiling")), -1});
    },
    .ReportCaseResult = [](const Submission& sub, const SubmissionResult& res, int position) {
      json body = ProgressJSON(sub, "running");
      body["result"] = CaseJSON(res.case_results[position], sub.testcases[position].name, position);
      PushReport({false, sub.submission_id, sub.submission_internal_id, Dump(body), -1});
    },
    .ReportOverallResult = [](const Submission& sub, const SubmissionResult& res) {
      PushFinal(sub.submission_id, sub.submission_internal_id, Dump(ResultJSON(sub, res)));
    },
  };
}

size_t RedeliverPending() {
  return DeliverStored({0, 0ms, 0ms}, nullptr);
}

size_t PendingReportCount() {
  size_t count;
  {
    std::lock_guard lck(report_mtx);
    count = unstored_finals;
  }
  try {
    count += PendingDB().Count();
  } catch (std::system_error& err) {
    spdlog::error("Failed to count stored results: {}", err.what());
  }
  return count;
}

void SetupRoutes(httplib::Server& svr) {
  svr.Post("/judge", WithAuth(HandleJudge));
  svr.Post("/cancel", WithAuth(HandleCancel));
  svr.Get("/status", WithAuth(HandleStatus));
  svr.Post("/drain", WithAuth(HandleDrain));
  svr.Get("/health", HandleHealth);
  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} {} from {}", req.method, req.path, res.status, req.remote_addr);
  });
}

std::unique_ptr<httplib::Server> CreateServer() {
  std::unique_ptr<httplib::Server> svr;
  if (kTlsCert.size()) {
    svr = std::make_unique<httplib::SSLServer>(kTlsCert.c_str(), kTlsKey.c_str(),
        kTlsClientCa.empty() ? nullptr : kTlsClientCa.c_str());
  } else {
    spdlog::warn("No TLS certificate configured; serving plain HTTP");
    svr = std::make_unique<httplib::Server>();
  }
  if (!svr->is_valid()) {
    spdlog::error("Failed to load TLS certificate {} or key {}", kTlsCert, kTlsKey);
    return nullptr;
  }
  SetupRoutes(*svr);
  if (!svr->bind_to_port(kListenHost.c_str(), kListenPort)) {
    spdlog::error("Failed to bind {}:{}", kListenHost, kListenPort);
    return nullptr;
  }
  return svr;
}

void ServerWorkLoop(std::unique_ptr<httplib::Server> svr) {
  std::thread(ReportLoop).detach();
  spdlog::info("Listening on {}:{}", kListenHost, kListenPort);
  while (true) {
    if (!svr->listen_after_bind()) spdlog::error("Server stopped unexpectedly");
    std::this_thread::sleep_for(1s);
  }
}
