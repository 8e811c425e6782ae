// ═══════════════════════════════════════════════════════════════════
//  main.cpp — reqguard-server entry point
// ═══════════════════════════════════════════════════════════════════

#include "reqguard/reqguard.h"

#include <exception>
#include <iostream>

using namespace reqguard;

int main(int argc, char** argv) {
    config::AppConfig cfg;
    try {
        bool showHelp = false;
        cfg = config::load(argc, argv, showHelp);
        if (showHelp) {
            std::cout << config::usage(argv[0]);
            return 0;
        }
    } catch (const std::exception& e) {
        console::error(e.what());
        std::cerr << config::usage(argv[0]);
        return 1;
    }

    console::setLevel(cfg.logLevel);

    inspect::BodyInspector inspector;
    auto server = app::createApp(inspector, cfg);

    try {
        server.listen([&cfg, &server] {
            console::info("Listening on http://" + cfg.server.host + ":"
                          + std::to_string(server.port()));
            console::info("  POST", app::kSubmitPath, "- rejected bodies answer",
                          cfg.guard.rejectionStatus);
        });
    } catch (const std::exception& e) {
        console::error("Server failed:", e.what());
        return 1;
    }
    return 0;
}
