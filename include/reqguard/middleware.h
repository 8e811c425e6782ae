#pragma once
// ═══════════════════════════════════════════════════════════════════
//  reqguard/middleware.h — Request logging middleware
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace reqguard::middleware {

namespace detail {

inline std::string formatMillis(std::chrono::steady_clock::duration elapsed) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << (us / 1000.0) << "ms";
    return oss.str();
}

} // namespace detail

// ═══════════════════════════════════════════
//  requestLogger — one line per request
// ═══════════════════════════════════════════
//  Register first so that it also reports requests the
//  guard rejects. Latency covers the rest of the chain.
//
inline http::MiddlewareFunction requestLogger() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        auto start = std::chrono::steady_clock::now();
        console::debug(req.method, req.path, "from", req.ip, "-", req.rawBody.size(), "bytes");

        next();

        auto took = detail::formatMillis(std::chrono::steady_clock::now() - start);
        int status = res.getStatusCode();

        if (status >= 500) {
            console::error(req.method, req.path, status, took);
        } else if (status >= 400) {
            console::warn(req.method, req.path, status, took);
        } else {
            console::success(req.method, req.path, status, took);
        }
    };
}

} // namespace reqguard::middleware
