#pragma once
// ═══════════════════════════════════════════════════════════════════
//  reqguard/http.h — HTTP Server, Request, and Response
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    http::Server app;
//    app.use(guard::inspectBody(inspector));
//    app.post("/submit", [](auto& req, auto& res) {
//        res.json({{"message", "Data submitted successfully!"}});
//    });
//    app.listen("127.0.0.1", 5000);
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace reqguard::http {

class Request;
class Response;
class Server;

using HeaderMap          = std::unordered_map<std::string, std::string>;
using NextFunction       = std::function<void()>;
using MiddlewareFunction = std::function<void(Request&, Response&, NextFunction)>;
using RouteHandler       = std::function<void(Request&, Response&)>;

// ═══════════════════════════════════════════════════════════════════
//  class Request
//  An incoming HTTP request. The body is kept as the raw bytes the
//  client sent; nothing in the request path parses it.
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    std::string method;
    std::string url;            // Full URL including query string
    std::string path;           // URL path without query string
    std::string rawBody;
    std::string ip;

    HeaderMap headers;          // Lowercase keys
    std::unordered_map<std::string, std::string> params;   // :id -> params["id"]

    // ── Header lookup (case-insensitive) ──
    std::string header(const std::string& name) const {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = headers.find(lower);
        return it != headers.end() ? it->second : "";
    }

    bool is(const std::string& type) const {
        return header("content-type").find(type) != std::string::npos;
    }
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  The HTTP response to send back. A SendCallback decouples it from
//  the transport so the same object serves sockets and tests.
// ═══════════════════════════════════════════════════════════════════
class Response {
public:
    using SendCallback = std::function<void(int statusCode,
                                            const HeaderMap& headers,
                                            const std::string& body)>;

    explicit Response(SendCallback cb)
        : sendCallback_(std::move(cb)) {}

    // Capture-only response
    Response() = default;

    Response& status(int code) {
        statusCode_ = code;
        return *this;
    }

    Response& set(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    // ── Send a string body; later calls are ignored ──
    void send(const std::string& body) {
        if (sent_) return;
        sent_ = true;
        if (headers_.find("Content-Type") == headers_.end()) {
            headers_["Content-Type"] = "text/plain; charset=utf-8";
        }
        body_ = body;
        if (sendCallback_) {
            sendCallback_(statusCode_, headers_, body_);
        }
    }

    void send(const char* body) {
        send(std::string(body));
    }

    void json(const nlohmann::json& data) {
        set("Content-Type", "application/json");
        send(data.dump());
    }

    // Supports: res.json({{"key", "value"}, {"count", 5}})
    void json(nlohmann::json::initializer_list_t init) {
        json(nlohmann::json(init));
    }

    void sendStatus(int code) {
        status(code);
        send(std::to_string(code));
    }

    void end() {
        if (!sent_) {
            send("");
        }
    }

    bool headersSent() const { return sent_; }

    const std::string& getBody() const { return body_; }
    int getStatusCode() const { return statusCode_; }
    const HeaderMap& getHeaders() const { return headers_; }

private:
    int statusCode_ = 200;
    HeaderMap headers_;
    bool sent_ = false;
    SendCallback sendCallback_;
    std::string body_;
};

// Standard reason phrase, e.g. 422 -> "Unprocessable Entity"
std::string statusText(int code);

// ── Transport settings ──
struct ServerOptions {
    std::string host          = "127.0.0.1";
    int         port          = 5000;
    int         threads       = 1;
    std::size_t maxBodyBytes  = 1024 * 1024;   // Larger bodies get 413
    bool        stopOnSignals = true;          // SIGINT / SIGTERM close the server
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  HTTP server with a middleware chain and a route table.
//  Uses pimpl to hide Boost.Beast implementation details.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    Server();
    explicit Server(ServerOptions options);
    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Middleware runs in registration order before route matching
    Server& use(MiddlewareFunction middleware);

    template <typename Handler>
    Server& get(const std::string& path, Handler&& handler) {
        addRoute("GET", path, wrapHandler(std::forward<Handler>(handler)));
        return *this;
    }

    template <typename Handler>
    Server& post(const std::string& path, Handler&& handler) {
        addRoute("POST", path, wrapHandler(std::forward<Handler>(handler)));
        return *this;
    }

    template <typename Handler>
    Server& all(const std::string& path, Handler&& handler) {
        addRoute("*", path, wrapHandler(std::forward<Handler>(handler)));
        return *this;
    }

    const ServerOptions& options() const;

    // Bound port while listening (resolves port 0), else the configured one
    int port() const;

    // ── Bind, accept and block until close() ──
    void listen(std::function<void()> callback = nullptr);
    void listen(const std::string& host, int port, std::function<void()> callback = nullptr);

    void close();

    // ── Run the middleware chain and router for one request ──
    void handleRequest(Request& req, Response& res);

private:
    friend class HttpSession;
    friend class HttpListener;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    void addRoute(const std::string& method, const std::string& pattern, RouteHandler handler);

    template <typename Handler>
    static RouteHandler wrapHandler(Handler&& handler) {
        return [h = std::forward<Handler>(handler)](Request& req, Response& res) mutable {
            h(req, res);
        };
    }
};

} // namespace reqguard::http
