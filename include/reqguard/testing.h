#pragma once
// ═══════════════════════════════════════════════════════════════════
//  reqguard/testing.h — In-process TestClient and mock factories
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    testing::TestClient client(app);
//    auto result = client.post("/submit").send(R"({"name": "x"})").exec();
//    EXPECT_EQ(result.status, 200);
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace reqguard::testing {

// ── Build a request as the transport would ──
inline http::Request createRequest(const std::string& method = "GET",
                                   const std::string& path = "/",
                                   const std::string& body = "",
                                   const http::HeaderMap& headers = {}) {
    http::Request req;
    req.method   = method;
    req.path     = path;
    req.url      = path;
    req.rawBody  = body;
    req.ip       = "127.0.0.1";
    for (auto& [k, v] : headers) {
        std::string lk = k;
        std::transform(lk.begin(), lk.end(), lk.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        req.headers[lk] = v;
    }
    return req;
}

struct TestResult {
    int status = 0;
    std::string body;
    http::HeaderMap headers;

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// ═══════════════════════════════════════════
//  TestClient — drives Server::handleRequest
// ═══════════════════════════════════════════
class TestClient {
public:
    explicit TestClient(http::Server& app) : app_(app) {}

    class RequestBuilder {
    public:
        RequestBuilder(http::Server& app, const std::string& method, const std::string& path)
            : app_(app), method_(method), path_(path) {}

        RequestBuilder& set(const std::string& key, const std::string& value) {
            headers_[key] = value;
            return *this;
        }

        // Body is passed through byte for byte
        RequestBuilder& send(const std::string& body,
                             const std::string& contentType = "application/json") {
            body_ = body;
            headers_["Content-Type"] = contentType;
            return *this;
        }

        TestResult expect(int expectedStatus) {
            auto result = exec();
            if (result.status != expectedStatus) {
                throw std::runtime_error(
                    "Expected status " + std::to_string(expectedStatus) +
                    " but got " + std::to_string(result.status));
            }
            return result;
        }

        TestResult exec() {
            auto req = createRequest(method_, path_, body_, headers_);

            TestResult result;
            http::Response res([&result](int status,
                                         const http::HeaderMap& headers,
                                         const std::string& body) {
                result.status  = status;
                result.body    = body;
                result.headers = headers;
            });

            app_.handleRequest(req, res);
            if (!res.headersSent()) {
                result.status  = res.getStatusCode();
                result.body    = res.getBody();
                result.headers = res.getHeaders();
            }
            return result;
        }

    private:
        http::Server& app_;
        std::string method_;
        std::string path_;
        std::string body_;
        http::HeaderMap headers_;
    };

    RequestBuilder get(const std::string& path)  { return {app_, "GET", path}; }
    RequestBuilder post(const std::string& path) { return {app_, "POST", path}; }

private:
    http::Server& app_;
};

} // namespace reqguard::testing
