#include <mutex>
#include <thread>
#include <gtest/gtest.h>
#include <jrunner/paths.h>
#include <jrunner/utils.h>

#include "database.h"
#include "server_io.h"

namespace {

using nlohmann::json;
using namespace std::chrono_literals;

// serve svr on a free local port in the background
class LocalServer {
  std::thread thread_;
 public:
  httplib::Server svr;
  int port;

  void Start() {
    port = svr.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this]{ svr.listen_after_bind(); });
    while (!svr.is_running()) std::this_thread::sleep_for(1ms);
  }
  ~LocalServer() {
    svr.stop();
    if (thread_.joinable()) thread_.join();
  }
};

const char kRequest[] = R"({
  "submission_id": "http-1",
  "language": "binary",
  "source": "\u007fELF",
  "cases": [{"input": "1\n", "expected": "1\n"}]
})";

class Endpoints : public ::testing::Test {
 protected:
  LocalServer server;

  void SetUp() override {
    kRunnerKey = "runner-secret";
    SetupRoutes(server.svr);
    server.Start();
  }
  void TearDown() override {
    SetDraining(false);
  }

  httplib::Client Client(bool with_key = true) {
    httplib::Client cli("127.0.0.1", server.port);
    if (with_key) cli.set_bearer_token_auth("runner-secret");
    return cli;
  }
};

} // namespace

TEST(ResultJSON, Fields) {
  Submission sub;
  sub.submission_id = "s-9";
  sub.submission_internal_id = 42;
  sub.testcases = {{"a", "", ""}, {"b", "", ""}, {"c", "", ""}};
  SubmissionResult res;
  res.case_results.resize(3);
  res.case_results[0].verdict = Verdict::AC;
  res.case_results[0].time = 1200;
  res.case_results[0].score = 1'000'000;
  res.case_results[0].output = "3\n";
  res.case_results[1].verdict = Verdict::RE;
  res.case_results[1].signal = 11;
  res.case_results[1].error = "oops";
  res.verdict = Verdict::RE;

  json body = ResultJSON(sub, res);
  EXPECT_EQ(body["submission_id"], "s-9");
  EXPECT_EQ(body["job_id"], 42);
  EXPECT_EQ(body["verdict"], "RE");
  EXPECT_EQ(body["message"], "");
  // the skipped third case is not reported
  ASSERT_EQ(body["results"].size(), 2u);
  auto& first = body["results"][0];
  EXPECT_EQ(first["position"], 0);
  EXPECT_EQ(first["name"], "a");
  EXPECT_EQ(first["verdict"], "AC");
  EXPECT_EQ(first["time_us"], 1200);
  EXPECT_EQ(first["score"], "1.000000");
  EXPECT_EQ(first["output"], "3\n");
  auto& second = body["results"][1];
  EXPECT_EQ(second["name"], "b");
  EXPECT_EQ(second["signal"], 11);
  EXPECT_EQ(second["error"], "oops");
}

TEST(ResultJSON, Messages) {
  Submission sub;
  SubmissionResult res;
  res.verdict = Verdict::CE;
  res.ce_message = "error: expected ';'";
  res.ie_message = "unused";
  EXPECT_EQ(ResultJSON(sub, res)["message"], "error: expected ';'");
  res.verdict = Verdict::IE;
  EXPECT_EQ(ResultJSON(sub, res)["message"], "unused");
  res.verdict = Verdict::AB;
  EXPECT_EQ(ResultJSON(sub, res)["message"], "");
}

TEST_F(Endpoints, Health) {
  auto cli = Client(false);
  auto res = cli.Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->body, "accepting");
  SetDraining(true);
  res = cli.Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 503);
  EXPECT_EQ(res->body, "draining");
}

TEST_F(Endpoints, Unauthorized) {
  auto cli = Client(false);
  auto res = cli.Post("/judge", kRequest, "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 401);
  res = cli.Get("/status");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 401);
  cli.set_bearer_token_auth("wrong");
  res = cli.Post("/drain", "", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 401);
  EXPECT_FALSE(IsDraining());
}

TEST_F(Endpoints, BadRequest) {
  auto cli = Client();
  auto res = cli.Post("/judge", "{not json", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  json req = json::parse(kRequest);
  req["limits"] = {{"memory_kib", -1}};
  res = cli.Post("/judge", req.dump(), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_TRUE(json::parse(res->body).contains("error"));
  res = cli.Post("/cancel", "[]", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(CurrentSubmissionQueueSize(), 0u);
}

TEST_F(Endpoints, JudgeStatusCancel) {
  auto cli = Client();
  auto res = cli.Post("/judge", kRequest, "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 202);
  EXPECT_TRUE(json::parse(res->body)["job_id"].is_number());

  res = cli.Get("/status");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json status = json::parse(res->body);
  EXPECT_EQ(status["state"], "accepting");
  EXPECT_EQ(status["queued"], 1);
  EXPECT_EQ(status["submissions"], json::array({"http-1"}));
  EXPECT_TRUE(status["pending_reports"].is_number());

  res = cli.Post("/cancel", R"({"submission_id": "http-1"})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  res = cli.Post("/cancel", R"({"submission_id": "http-1"})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_EQ(CurrentSubmissionQueueSize(), 0u);
}

TEST_F(Endpoints, UnsupportedLanguageAccepted) {
  auto cli = Client();
  json req = json::parse(kRequest);
  req["language"] = "cobol";
  auto res = cli.Post("/judge", req.dump(), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 202);
  // finished right away
  EXPECT_EQ(CurrentSubmissionQueueSize(), 0u);
}

TEST_F(Endpoints, DisabledLanguageAccepted) {
  auto cli = Client();
  json req = json::parse(kRequest);
  req["language"] = "haskell";
  auto res = cli.Post("/judge", req.dump(), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 202);
  EXPECT_EQ(CurrentSubmissionQueueSize(), 0u);
}

TEST_F(Endpoints, Drain) {
  auto cli = Client();
  auto res = cli.Post("/drain", "", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_TRUE(IsDraining());
  res = cli.Post("/judge", kRequest, "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 503);
  EXPECT_EQ(CurrentSubmissionQueueSize(), 0u);
}

TEST(Redelivery, StoredResults) {
  std::mutex mtx;
  std::vector<std::string> bodies;
  std::string auth;
  int status = 500;
  LocalServer orchestrator;
  orchestrator.svr.Post("/runner/result", [&](const httplib::Request& req, httplib::Response& res) {
    std::lock_guard lck(mtx);
    auth = req.get_header_value("Authorization");
    bodies.push_back(req.body);
    res.status = status;
  });
  orchestrator.Start();
  kOrchestratorUrl = "http://127.0.0.1:" + std::to_string(orchestrator.port);
  kOrchestratorKey = "orchestrator-secret";

  Database db(internal::kDataDir / "pending.sqlite");
  for (auto& i : db.Pending(1000)) db.Remove(i.id);
  db.Save({0, "s-1", 1, "{\"submission_id\":\"s-1\"}", 1700000000, 6});

  // not acknowledged: kept for the next round
  EXPECT_EQ(RedeliverPending(), 0u);
  ASSERT_EQ(db.Count(), 1u);
  EXPECT_EQ(db.Pending(1)[0].attempts, 7);

  {
    std::lock_guard lck(mtx);
    status = 200;
  }
  EXPECT_EQ(RedeliverPending(), 1u);
  EXPECT_EQ(db.Count(), 0u);
  std::lock_guard lck(mtx);
  ASSERT_EQ(bodies.size(), 2u);
  EXPECT_EQ(bodies[1], "{\"submission_id\":\"s-1\"}");
  EXPECT_EQ(auth, "Bearer orchestrator-secret");
  kOrchestratorUrl = "";
}

TEST(Redelivery, FinalStoredBeforeDelivery) {
  Database db(internal::kDataDir / "pending.sqlite");
  for (auto& i : db.Pending(1000)) db.Remove(i.id);
  kOrchestratorUrl = "";

  Submission sub;
  sub.submission_id = "stored-1";
  sub.submission_internal_id = GetUniqueSubmissionInternalId();
  SubmissionResult res;
  res.verdict = Verdict::WA;
  ServerReporter().ReportOverallResult(sub, res);

  // on disk before any delivery attempt
  auto rows = db.Pending(10);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].submission_id, "stored-1");
  EXPECT_EQ(rows[0].job_id, sub.submission_internal_id);
  EXPECT_EQ(rows[0].attempts, 0);
  EXPECT_EQ(json::parse(rows[0].payload), ResultJSON(sub, res));
  EXPECT_EQ(PendingReportCount(), 1u);

  LocalServer orchestrator;
  int received = 0;
  orchestrator.svr.Post("/runner/result", [&](const httplib::Request&, httplib::Response& res) {
    received++;
    res.status = 200;
  });
  orchestrator.Start();
  kOrchestratorUrl = "http://127.0.0.1:" + std::to_string(orchestrator.port);
  EXPECT_EQ(RedeliverPending(), 1u);
  EXPECT_EQ(PendingReportCount(), 0u);
  EXPECT_EQ(db.Count(), 0u);
  kOrchestratorUrl = "";
  EXPECT_EQ(received, 1);
}
