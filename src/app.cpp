// ═══════════════════════════════════════════════════════════════════
//  src/app.cpp — Route and middleware wiring
// ═══════════════════════════════════════════════════════════════════

#include "reqguard/app.h"
#include "reqguard/guard.h"
#include "reqguard/middleware.h"

namespace reqguard::app {

void submitData(http::Request& /*req*/, http::Response& res) {
    res.status(200).json({{"message", kSubmitMessage}});
}

http::Server createApp(const inspect::BodyInspector& inspector,
                       const config::AppConfig& cfg) {
    http::Server server(cfg.server);

    if (cfg.requestLog) {
        server.use(middleware::requestLogger());
    }
    server.use(guard::inspectBody(inspector, cfg.guard));
    server.post(kSubmitPath, submitData);

    return server;
}

} // namespace reqguard::app
