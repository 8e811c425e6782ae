// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Boost.Beast-powered HTTP server implementation
// ═══════════════════════════════════════════════════════════════════

#include "reqguard/http.h"
#include "reqguard/console.h"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <csignal>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace reqguard::http {

namespace beast  = boost::beast;
namespace net    = boost::asio;
namespace bhttp  = beast::http;
using tcp        = net::ip::tcp;

struct CompiledRoute {
    std::string method;
    std::string pattern;
    std::regex  regex;
    std::vector<std::string> paramNames;
    RouteHandler handler;
};

namespace detail {

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Path part of a request target
inline std::string stripQuery(const std::string& url) {
    return url.substr(0, url.find('?'));
}

inline CompiledRoute compileRoute(const std::string& method,
                                  const std::string& pattern,
                                  RouteHandler handler) {
    CompiledRoute route;
    route.method  = method;
    route.pattern = pattern;
    route.handler = std::move(handler);

    std::string regexStr;
    std::size_t pos = 0;

    while (pos < pattern.size()) {
        char c = pattern[pos];
        if (c == ':') {
            pos++;
            std::string paramName;
            while (pos < pattern.size() && pattern[pos] != '/') {
                paramName += pattern[pos++];
            }
            route.paramNames.push_back(paramName);
            regexStr += "([^/]+)";
        } else if (c == '*') {
            regexStr += "(.*)";
            route.paramNames.push_back("*");
            pos++;
        } else {
            if (c == '.' || c == '(' || c == ')' ||
                c == '[' || c == ']' || c == '{' ||
                c == '}' || c == '+' || c == '?' ||
                c == '^' || c == '$' || c == '|' || c == '\\') {
                regexStr += '\\';
            }
            regexStr += c;
            pos++;
        }
    }

    route.regex = std::regex("^" + regexStr + "$");
    return route;
}

inline bool matchPath(const CompiledRoute& route,
                      const std::string& path,
                      std::unordered_map<std::string, std::string>& params) {
    std::smatch match;
    if (!std::regex_match(path, match, route.regex)) return false;
    for (std::size_t i = 0; i < route.paramNames.size(); ++i) {
        params[route.paramNames[i]] = match[i + 1].str();
    }
    return true;
}

inline bool methodMatches(const CompiledRoute& route, const std::string& method) {
    return route.method == method || route.method == "*";
}

} // namespace detail

std::string statusText(int code) {
    auto status = bhttp::int_to_status(static_cast<unsigned>(code));
    if (status == bhttp::status::unknown) {
        return code >= 500 ? "Server Error" : "Client Error";
    }
    auto reason = bhttp::obsolete_reason(status);
    return std::string(reason.data(), reason.size());
}

// ═══════════════════════════════════════════
//  Server::Impl
// ═══════════════════════════════════════════
struct Server::Impl {
    ServerOptions                    options;
    std::vector<MiddlewareFunction>  middlewares;
    std::vector<CompiledRoute>       routes;
    std::unique_ptr<net::io_context> ioc;
    std::atomic<bool>                running{false};
    std::atomic<int>                 boundPort{0};

    void executeMiddlewareChain(Request& req, Response& res,
                                std::size_t index,
                                const std::function<void()>& done) {
        if (res.headersSent()) return;
        if (index >= middlewares.size()) {
            done();
            return;
        }

        middlewares[index](req, res, [this, &req, &res, index, &done]() {
            executeMiddlewareChain(req, res, index + 1, done);
        });
    }

    void route(Request& req, Response& res) {
        if (res.headersSent()) return;

        std::vector<std::string> allowed;
        for (auto& r : routes) {
            std::unordered_map<std::string, std::string> params;
            if (!detail::matchPath(r, req.path, params)) continue;

            if (detail::methodMatches(r, req.method)) {
                req.params = std::move(params);
                r.handler(req, res);
                return;
            }
            if (std::find(allowed.begin(), allowed.end(), r.method) == allowed.end()) {
                allowed.push_back(r.method);
            }
        }

        if (!allowed.empty()) {
            std::string allow;
            for (auto& m : allowed) {
                if (!allow.empty()) allow += ", ";
                allow += m;
            }
            res.status(405).set("Allow", allow).json(nlohmann::json{
                {"error", "Method Not Allowed"},
                {"message", "Cannot " + req.method + " " + req.path}
            });
            return;
        }

        res.status(404).json(nlohmann::json{
            {"error", "Not Found"},
            {"message", "Cannot " + req.method + " " + req.path}
        });
    }

    // ── Middleware chain → route matching; a throw becomes a 500 ──
    void handleRequest(Request& req, Response& res) {
        try {
            executeMiddlewareChain(req, res, 0, [this, &req, &res]() {
                route(req, res);
            });
        } catch (const std::exception& e) {
            console::error("Unhandled error in", req.method, req.path + ":", e.what());
            if (!res.headersSent()) {
                res.status(500).json(nlohmann::json{{"error", "Internal Server Error"}});
            }
        }
    }
};

// ═══════════════════════════════════════════
//  Session — Handles a single HTTP connection
// ═══════════════════════════════════════════
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, Server::Impl& server)
        : socket_(std::move(socket))
        , server_(server)
    {}

    void run() {
        readRequest();
    }

private:
    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
    bhttp::request<bhttp::string_body> beastRequest_;
    Server::Impl& server_;

    void readRequest() {
        parser_.emplace();
        parser_->body_limit(server_.options.maxBodyBytes);

        auto self = shared_from_this();
        bhttp::async_read(
            socket_, buffer_, *parser_,
            [self](beast::error_code ec, std::size_t /*bytes_transferred*/) {
                self->onRead(ec);
            }
        );
    }

    void onRead(beast::error_code ec) {
        if (ec == bhttp::error::body_limit) {
            console::warn("Request body exceeds", server_.options.maxBodyBytes, "bytes");
            beastRequest_ = parser_->release();
            nlohmann::json body{{"error", "Payload Too Large"}};
            write(413, {{"Content-Type", "application/json"}}, body.dump(), false);
            return;
        }
        if (ec) {
            // end_of_stream and resets just drop the session
            if (ec != bhttp::error::end_of_stream) {
                console::debug("Read failed:", ec.message());
            }
            return;
        }
        beastRequest_ = parser_->release();
        processRequest();
    }

    void write(int statusCode, const HeaderMap& headers, const std::string& body,
               bool keepAlive) {
        auto beastRes = std::make_shared<bhttp::response<bhttp::string_body>>();
        beastRes->result(static_cast<bhttp::status>(statusCode));
        beastRes->version(beastRequest_.version() ? beastRequest_.version() : 11);

        for (auto& [key, value] : headers) {
            if (!value.empty()) {
                beastRes->set(key, value);
            }
        }

        beastRes->body() = body;
        beastRes->keep_alive(keepAlive);
        beastRes->prepare_payload();

        auto self = shared_from_this();
        bhttp::async_write(
            socket_, *beastRes,
            [self, beastRes, keepAlive](beast::error_code ec, std::size_t /*bytes*/) {
                if (keepAlive && !ec) {
                    self->beastRequest_ = {};
                    self->readRequest();
                } else {
                    beast::error_code shutdownEc;
                    self->socket_.shutdown(tcp::socket::shutdown_send, shutdownEc);
                }
            }
        );
    }

    void processRequest() {
        Request req;
        req.method = std::string(beastRequest_.method_string());
        req.url    = std::string(beastRequest_.target());

        req.path    = detail::stripQuery(req.url);
        req.rawBody = beastRequest_.body();

        beast::error_code endpointEc;
        auto remote = socket_.remote_endpoint(endpointEc);
        req.ip = endpointEc ? "unknown" : remote.address().to_string();

        for (auto& field : beastRequest_) {
            req.headers[detail::toLower(std::string(field.name_string()))]
                = std::string(field.value());
        }

        auto self = shared_from_this();
        bool keepAlive = beastRequest_.keep_alive();
        Response res([self, keepAlive](int statusCode,
                                       const HeaderMap& headers,
                                       const std::string& body) {
            self->write(statusCode, headers, body, keepAlive);
        });

        server_.handleRequest(req, res);

        if (!res.headersSent()) {
            res.status(500).json(nlohmann::json{
                {"error", "Internal Server Error"},
                {"message", "No response sent by handler"}
            });
        }
    }
};

// ═══════════════════════════════════════════
//  Listener — Accepts incoming TCP connections
// ═══════════════════════════════════════════
class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    HttpListener(net::io_context& ioc, tcp::endpoint endpoint, Server::Impl& server)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , server_(server)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) throw std::runtime_error("Failed to open acceptor: " + ec.message());

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("Failed to set reuse_address: " + ec.message());

        acceptor_.bind(endpoint, ec);
        if (ec) throw std::runtime_error("Failed to bind to port: " + ec.message());

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("Failed to listen: " + ec.message());
    }

    void run() {
        doAccept();
    }

    unsigned short port() const {
        return acceptor_.local_endpoint().port();
    }

private:
    net::io_context& ioc_;
    tcp::acceptor    acceptor_;
    Server::Impl&    server_;

    void doAccept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(&HttpListener::onAccept, shared_from_this())
        );
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) return;
            console::warn("Accept failed:", ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), server_)->run();
        }
        doAccept();
    }
};

// ═══════════════════════════════════════════
//  Server — Public API implementation
// ═══════════════════════════════════════════

Server::Server()
    : Server(ServerOptions{})
{}

Server::Server(ServerOptions options)
    : impl_(std::make_unique<Impl>())
{
    impl_->options = std::move(options);
}

Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

Server& Server::use(MiddlewareFunction middleware) {
    impl_->middlewares.push_back(std::move(middleware));
    return *this;
}

void Server::addRoute(const std::string& method,
                      const std::string& pattern,
                      RouteHandler handler) {
    impl_->routes.push_back(
        detail::compileRoute(method, pattern, std::move(handler))
    );
}

const ServerOptions& Server::options() const {
    return impl_->options;
}

int Server::port() const {
    int bound = impl_->boundPort;
    return bound != 0 ? bound : impl_->options.port;
}

void Server::handleRequest(Request& req, Response& res) {
    impl_->handleRequest(req, res);
}

void Server::listen(const std::string& host, int port, std::function<void()> callback) {
    impl_->options.host = host;
    impl_->options.port = port;
    listen(std::move(callback));
}

void Server::listen(std::function<void()> callback) {
    const auto& opts = impl_->options;
    if (opts.port < 0 || opts.port > 65535) {
        throw std::invalid_argument("Port out of range: " + std::to_string(opts.port));
    }
    int threads = std::max(1, opts.threads);

    impl_->ioc = std::make_unique<net::io_context>(threads);

    beast::error_code ec;
    auto address = net::ip::make_address(opts.host, ec);
    if (ec) throw std::invalid_argument("Invalid listen address: " + opts.host);
    auto endpoint = tcp::endpoint(address, static_cast<unsigned short>(opts.port));

    auto httpListener = std::make_shared<HttpListener>(*impl_->ioc, endpoint, *impl_);
    httpListener->run();
    impl_->boundPort = httpListener->port();

    std::optional<net::signal_set> signals;
    if (opts.stopOnSignals) {
        signals.emplace(*impl_->ioc, SIGINT, SIGTERM);
        signals->async_wait([this](beast::error_code sigEc, int sig) {
            if (sigEc) return;
            console::info("Received signal", sig, "- shutting down");
            close();
        });
    }

    impl_->running = true;

    if (callback) {
        callback();
    }

    std::vector<std::thread> workers;
    workers.reserve(static_cast<std::size_t>(threads - 1));
    for (int i = 1; i < threads; ++i) {
        workers.emplace_back([this] { impl_->ioc->run(); });
    }
    impl_->ioc->run();

    for (auto& t : workers) {
        t.join();
    }
    impl_->running = false;
    impl_->boundPort = 0;
}

void Server::close() {
    if (impl_->ioc && impl_->running.exchange(false)) {
        impl_->ioc->stop();
        console::success("Server stopped");
    }
}

} // namespace reqguard::http
