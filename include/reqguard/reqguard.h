#pragma once
// ═══════════════════════════════════════════════════════════════════
//  reqguard/reqguard.h — Umbrella header
// ═══════════════════════════════════════════════════════════════════
//
//  #include "reqguard/reqguard.h"
//  using namespace reqguard;
//
//    • inspect::BodyInspector, Verdict, RejectionKind
//    • guard::inspectBody()
//    • http::Server, Request, Response
//    • middleware::requestLogger()
//    • config::AppConfig, config::load()
//    • app::createApp()
//    • console::log(), info(), warn(), error()
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include "inspector.h"
#include "http.h"
#include "guard.h"
#include "middleware.h"
#include "config.h"
#include "app.h"
