#pragma once
// ═══════════════════════════════════════════════════════════════════
//  reqguard/app.h — The guarded submission application
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    inspect::BodyInspector inspector;
//    auto app = app::createApp(inspector, config);
//    app.listen();
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "inspector.h"
#include "config.h"

namespace reqguard::app {

inline constexpr const char* kSubmitPath = "/submit";
inline constexpr const char* kSubmitMessage = "Data submitted successfully!";

// POST /submit — acknowledges any body that got past the guard
void submitData(http::Request& req, http::Response& res);

// Wires requestLogger (if enabled), the body guard and /submit.
// The inspector must outlive the returned server.
http::Server createApp(const inspect::BodyInspector& inspector,
                       const config::AppConfig& cfg = {});

} // namespace reqguard::app
