#pragma once
// ═══════════════════════════════════════════════════════════════════
//  reqguard/config.h — Application configuration
// ═══════════════════════════════════════════════════════════════════
//
//  Sources, later ones overriding earlier ones:
//    1. built-in defaults
//    2. a JSON file (--config FILE)
//    3. command-line flags
//
//  JSON file layout (every key optional):
//    {
//      "host": "127.0.0.1", "port": 5000, "threads": 4,
//      "maxBodyBytes": 1048576, "rejectionStatus": 500,
//      "logLevel": "info", "requestLog": true
//    }
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "guard.h"
#include "console.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace reqguard::config {

struct AppConfig {
    http::ServerOptions server;
    guard::GuardOptions guard;
    console::Level      logLevel   = console::Level::Info;
    bool                requestLog = true;
};

// Throws std::invalid_argument on a wrongly typed or out-of-range value
void applyJson(AppConfig& config, const nlohmann::json& j);

// Throws std::runtime_error if the file cannot be read or parsed
void applyFile(AppConfig& config, const std::string& path);

// ── Result of scanning argv ──
struct CommandLine {
    bool showHelp = false;
    std::string configFile;
};

// Flags: --host --port --threads --config --log-level --reject-status --help
// Throws std::invalid_argument on unknown flags or missing values.
CommandLine parseArgs(AppConfig& config, const std::vector<std::string>& args);

// Defaults → --config file → remaining flags
AppConfig load(int argc, char** argv, bool& showHelp);

std::string usage(const std::string& program);

} // namespace reqguard::config
