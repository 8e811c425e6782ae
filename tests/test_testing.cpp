// ═══════════════════════════════════════════════════════════════════
//  test_testing.cpp — Tests for TestClient and mock factories
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <reqguard/testing.h>

using namespace reqguard;
using namespace reqguard::testing;

class TestClientTest : public ::testing::Test {
protected:
    http::Server app;

    void SetUp() override {
        app.post("/echo", [](http::Request& req, http::Response& res) {
            res.json({{"body", req.rawBody}, {"type", req.header("content-type")}});
        });

        app.get("/header", [](http::Request& req, http::Response& res) {
            res.send(req.header("x-custom"));
        });

        app.get("/status", [](http::Request&, http::Response& res) {
            res.status(201).json({{"created", true}});
        });
    }
};

TEST_F(TestClientTest, PostPassesBodyVerbatim) {
    TestClient client(app);
    auto result = client.post("/echo").send("a;b <c>").exec();

    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.json()["body"], "a;b <c>");
    EXPECT_EQ(result.json()["type"], "application/json");
}

TEST_F(TestClientTest, SendWithContentType) {
    TestClient client(app);
    auto result = client.post("/echo").send("x", "text/plain").exec();
    EXPECT_EQ(result.json()["type"], "text/plain");
}

TEST_F(TestClientTest, ExpectStatus) {
    TestClient client(app);
    auto result = client.get("/status").expect(201);
    EXPECT_TRUE(result.json()["created"].get<bool>());
}

TEST_F(TestClientTest, ExpectStatusThrowsOnMismatch) {
    TestClient client(app);
    EXPECT_THROW(client.get("/status").expect(200), std::runtime_error);
}

TEST_F(TestClientTest, SetCustomHeaders) {
    TestClient client(app);
    auto result = client.get("/header").set("X-Custom", "value").exec();
    EXPECT_EQ(result.body, "value");
}

TEST(MockFactoryTest, CreateRequestLowercasesHeaders) {
    auto req = createRequest("POST", "/submit", "{\"x\":1}",
                             {{"Content-Type", "application/json"}});

    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/submit");
    EXPECT_EQ(req.rawBody, "{\"x\":1}");
    EXPECT_EQ(req.headers.count("content-type"), 1u);
    EXPECT_EQ(req.ip, "127.0.0.1");
}
