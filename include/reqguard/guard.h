#pragma once
// ═══════════════════════════════════════════════════════════════════
//  reqguard/guard.h — Pre-request body inspection middleware
// ═══════════════════════════════════════════════════════════════════
//
//  Runs a BodyInspector against every request body before routing.
//  A rejected request is answered here and never reaches a handler.
//
//  Rejections answer 500 with an opaque body by default. The "error"
//  label is the reason phrase of the chosen status; a 4xx status also
//  carries the rejection kind as "reason".
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "inspector.h"
#include "console.h"

namespace reqguard::guard {

struct GuardOptions {
    int  rejectionStatus = 500;
    bool logRejections   = true;     // Kind and route only, never the body
};

// ── Body of the answer sent for a rejected request ──
inline nlohmann::json rejectionBody(int status, inspect::RejectionKind kind) {
    nlohmann::json body = {{"error", http::statusText(status)}};
    if (status >= 400 && status < 500) {
        body["reason"] = inspect::toString(kind);
    }
    return body;
}

// The inspector is held by reference and must outlive the server
inline http::MiddlewareFunction inspectBody(const inspect::BodyInspector& inspector,
                                            GuardOptions options = {}) {
    return [&inspector, options](http::Request& req, http::Response& res, http::NextFunction next) {
        auto verdict = inspector.inspect(req.rawBody);
        if (verdict.accepted()) {
            next();
            return;
        }

        if (options.logRejections) {
            console::warn("Rejected", req.method, req.path, "from", req.ip,
                          "-", inspect::toString(verdict.kind()));
        }
        res.status(options.rejectionStatus)
           .json(rejectionBody(options.rejectionStatus, verdict.kind()));
    };
}

} // namespace reqguard::guard
