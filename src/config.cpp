// ═══════════════════════════════════════════════════════════════════
//  src/config.cpp — Defaults, JSON file and command-line flags
// ═══════════════════════════════════════════════════════════════════

#include "reqguard/config.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace reqguard::config {

namespace {

int toInt(const std::string& flag, const std::string& value) {
    std::size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    return parsed;
}

void checkPort(int port) {
    if (port < 0 || port > 65535) {
        throw std::invalid_argument("port must be in 0..65535, got " + std::to_string(port));
    }
}

void checkThreads(int threads) {
    if (threads < 1) {
        throw std::invalid_argument("threads must be at least 1, got " + std::to_string(threads));
    }
}

void checkRejectionStatus(int status) {
    if (status < 400 || status > 599) {
        throw std::invalid_argument("rejectionStatus must be a 4xx or 5xx code, got "
                                    + std::to_string(status));
    }
}

template <typename T>
T read(const nlohmann::json& j, const char* key) {
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("config key '") + key + "': " + e.what());
    }
}

// Integers only; floats and out-of-range values are refused, never narrowed
std::int64_t readInteger(const nlohmann::json& j, const char* key,
                         std::int64_t lo, std::int64_t hi) {
    const auto& value = j.at(key);
    auto outOfRange = [&] {
        return std::invalid_argument(std::string("config key '") + key + "' must be in "
                                     + std::to_string(lo) + ".." + std::to_string(hi)
                                     + ", got " + value.dump());
    };

    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("config key '") + key
                                    + "' must be an integer, got " + value.dump());
    }
    if (value.is_number_unsigned()) {
        auto u = value.get<std::uint64_t>();
        if (hi < 0 || u > static_cast<std::uint64_t>(hi)) throw outOfRange();
        return static_cast<std::int64_t>(u);
    }
    auto s = value.get<std::int64_t>();
    if (s < lo || s > hi) throw outOfRange();
    return s;
}

} // namespace

void applyJson(AppConfig& config, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("config root must be a JSON object");
    }

    if (j.contains("host")) {
        config.server.host = read<std::string>(j, "host");
    }
    if (j.contains("port")) {
        config.server.port = static_cast<int>(readInteger(j, "port", 0, 65535));
    }
    if (j.contains("threads")) {
        config.server.threads = static_cast<int>(
            readInteger(j, "threads", 1, std::numeric_limits<int>::max()));
    }
    if (j.contains("maxBodyBytes")) {
        config.server.maxBodyBytes = static_cast<std::size_t>(
            readInteger(j, "maxBodyBytes", 1, std::numeric_limits<std::int64_t>::max()));
    }
    if (j.contains("rejectionStatus")) {
        config.guard.rejectionStatus = static_cast<int>(
            readInteger(j, "rejectionStatus", 400, 599));
    }
    if (j.contains("logLevel")) {
        config.logLevel = console::parseLevel(read<std::string>(j, "logLevel"));
    }
    if (j.contains("requestLog")) {
        config.requestLog = read<bool>(j, "requestLog");
    }
}

void applyFile(AppConfig& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
    applyJson(config, j);
}

CommandLine parseArgs(AppConfig& config, const std::vector<std::string>& args) {
    CommandLine cmd;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& flag = args[i];
        if (flag == "--help" || flag == "-h") {
            cmd.showHelp = true;
            continue;
        }

        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        const auto& value = args[++i];

        if (flag == "--host") {
            config.server.host = value;
        } else if (flag == "--port") {
            int port = toInt(flag, value);
            checkPort(port);
            config.server.port = port;
        } else if (flag == "--threads") {
            int threads = toInt(flag, value);
            checkThreads(threads);
            config.server.threads = threads;
        } else if (flag == "--config") {
            cmd.configFile = value;
        } else if (flag == "--log-level") {
            config.logLevel = console::parseLevel(value);
        } else if (flag == "--reject-status") {
            int status = toInt(flag, value);
            checkRejectionStatus(status);
            config.guard.rejectionStatus = status;
        } else {
            throw std::invalid_argument("Unknown option: " + flag);
        }
    }
    return cmd;
}

AppConfig load(int argc, char** argv, bool& showHelp) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // First pass only locates --config
    AppConfig scratch;
    auto cmd = parseArgs(scratch, args);
    showHelp = cmd.showHelp;

    AppConfig config;
    if (!cmd.configFile.empty()) {
        applyFile(config, cmd.configFile);
    }
    parseArgs(config, args);
    return config;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --host HOST            listen address (default 127.0.0.1)\n"
           "  --port PORT            listen port (default 5000)\n"
           "  --threads N            event loop threads (default 1)\n"
           "  --config FILE          JSON configuration file\n"
           "  --log-level LEVEL      debug | info | warn | error | silent\n"
           "  --reject-status CODE   status for rejected bodies (default 500)\n"
           "  --help                 show this message\n";
}

} // namespace reqguard::config
