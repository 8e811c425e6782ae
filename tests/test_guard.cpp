// ═══════════════════════════════════════════════════════════════════
//  test_guard.cpp — Tests for the body inspection middleware
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <reqguard/guard.h>
#include <reqguard/testing.h>

using namespace reqguard;
using namespace reqguard::guard;
using reqguard::testing::createRequest;

class GuardTest : public ::testing::Test {
protected:
    inspect::BodyInspector inspector;

    void SetUp() override { console::setLevel(console::Level::Silent); }
    void TearDown() override { console::setLevel(console::Level::Info); }
};

TEST_F(GuardTest, AcceptedBodyCallsNext) {
    auto req = createRequest("POST", "/submit", R"({"name": "John Doe"})");
    http::Response res;

    bool nextCalled = false;
    inspectBody(inspector)(req, res, [&]() { nextCalled = true; });

    EXPECT_TRUE(nextCalled);
    EXPECT_FALSE(res.headersSent());
}

TEST_F(GuardTest, RejectedBodyStopsChainWith500) {
    auto req = createRequest("POST", "/submit", "1; DROP TABLE users");
    http::Response res;

    bool nextCalled = false;
    inspectBody(inspector)(req, res, [&]() { nextCalled = true; });

    EXPECT_FALSE(nextCalled);
    EXPECT_EQ(res.getStatusCode(), 500);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body, (nlohmann::json{{"error", "Internal Server Error"}}));
}

TEST_F(GuardTest, FiveHundredBodyDoesNotLeakKind) {
    auto req = createRequest("POST", "/submit", "<b>hi</b>");
    http::Response res;

    inspectBody(inspector)(req, res, []() {});

    EXPECT_EQ(res.getBody().find("xss"), std::string::npos);
}

TEST_F(GuardTest, ConfiguredClientErrorCarriesReason) {
    GuardOptions opts;
    opts.rejectionStatus = 400;

    auto req = createRequest("POST", "/submit", "<img src=x>");
    http::Response res;
    inspectBody(inspector, opts)(req, res, []() {});

    EXPECT_EQ(res.getStatusCode(), 400);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["error"], "Bad Request");
    EXPECT_EQ(body["reason"], "xss_suspected");
}

TEST_F(GuardTest, ReasonReflectsFirstFailingCheck) {
    GuardOptions opts;
    opts.rejectionStatus = 422;

    auto req = createRequest("POST", "/submit", "<script>DELETE</script>");
    http::Response res;
    inspectBody(inspector, opts)(req, res, []() {});

    EXPECT_EQ(res.getStatusCode(), 422);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["error"], "Unprocessable Entity");
    EXPECT_EQ(body["reason"], "sql_injection_suspected");
}

TEST_F(GuardTest, InspectsBodyRegardlessOfMethodOrPath) {
    auto req = createRequest("GET", "/elsewhere", "select");
    http::Response res;

    bool nextCalled = false;
    inspectBody(inspector)(req, res, [&]() { nextCalled = true; });

    EXPECT_FALSE(nextCalled);
    EXPECT_EQ(res.getStatusCode(), 500);
}

TEST(RejectionBodyTest, ShapeDependsOnStatusClass) {
    auto kind = inspect::RejectionKind::InvalidEncoding;
    EXPECT_EQ(rejectionBody(500, kind), (nlohmann::json{{"error", "Internal Server Error"}}));
    EXPECT_EQ(rejectionBody(503, kind), (nlohmann::json{{"error", "Service Unavailable"}}));
    EXPECT_EQ(rejectionBody(400, kind),
              (nlohmann::json{{"error", "Bad Request"}, {"reason", "invalid_encoding"}}));
    EXPECT_EQ(rejectionBody(403, kind),
              (nlohmann::json{{"error", "Forbidden"}, {"reason", "invalid_encoding"}}));
}

TEST(RejectionBodyTest, UnregisteredStatusFallsBackToClassLabel) {
    auto kind = inspect::RejectionKind::XssSuspected;
    EXPECT_EQ(rejectionBody(418, kind)["error"], "Client Error");
    EXPECT_EQ(rejectionBody(555, kind), (nlohmann::json{{"error", "Server Error"}}));
}
