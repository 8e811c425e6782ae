// ═══════════════════════════════════════════════════════════════════
//  test_transport.cpp — /submit over a real loopback connection
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <reqguard/app.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <future>
#include <string>
#include <thread>
#include <utility>

using namespace reqguard;

namespace beast = boost::beast;
namespace net   = boost::asio;
namespace bhttp = beast::http;
using tcp       = net::ip::tcp;

class TransportTest : public ::testing::Test {
protected:
    inspect::BodyInspector inspector;
    http::Server server;
    std::promise<int> ready;
    std::thread worker;
    int port = 0;

    TransportTest() : server(makeServer()) {}

    http::Server makeServer() {
        console::setLevel(console::Level::Silent);
        config::AppConfig cfg;
        cfg.server.port          = 0;
        cfg.server.maxBodyBytes  = 10;
        cfg.server.stopOnSignals = false;
        cfg.requestLog           = false;
        return app::createApp(inspector, cfg);
    }

    void SetUp() override {
        worker = std::thread([this] {
            try {
                server.listen([this] { ready.set_value(server.port()); });
            } catch (const std::exception&) {
                ready.set_exception(std::current_exception());
            }
        });
        port = ready.get_future().get();
    }

    void TearDown() override {
        server.close();
        if (worker.joinable()) worker.join();
        console::setLevel(console::Level::Info);
    }

    bhttp::response<bhttp::string_body> post(const std::string& target, const std::string& body) {
        net::io_context ioc;
        tcp::socket socket(ioc);
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"),
                                     static_cast<unsigned short>(port)));

        bhttp::request<bhttp::string_body> req{bhttp::verb::post, target, 11};
        req.set(bhttp::field::host, "127.0.0.1");
        req.set(bhttp::field::content_type, "application/json");
        req.keep_alive(false);
        req.body() = body;
        req.prepare_payload();
        bhttp::write(socket, req);

        beast::flat_buffer buffer;
        bhttp::response<bhttp::string_body> res;
        bhttp::read(socket, buffer, res);

        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return res;
    }
};

TEST_F(TransportTest, BindsEphemeralPort) {
    EXPECT_GT(port, 0);
    EXPECT_NE(port, server.options().port);
}

TEST_F(TransportTest, AcceptedBodyAnswers200) {
    auto res = post("/submit", R"({"a":1})");

    EXPECT_EQ(res.result_int(), 200u);
    EXPECT_EQ(res[bhttp::field::content_type], "application/json");
    EXPECT_EQ(nlohmann::json::parse(res.body()),
              (nlohmann::json{{"message", "Data submitted successfully!"}}));
}

TEST_F(TransportTest, QueryStringIsNotPartOfThePath) {
    auto res = post("/submit?src=form", "{}");

    EXPECT_EQ(res.result_int(), 200u);
}

TEST_F(TransportTest, RejectedBodyAnswers500) {
    auto res = post("/submit", "x DROP y");

    EXPECT_EQ(res.result_int(), 500u);
    EXPECT_EQ(nlohmann::json::parse(res.body()),
              (nlohmann::json{{"error", "Internal Server Error"}}));
}

TEST_F(TransportTest, OversizedBodyAnswers413) {
    auto res = post("/submit", std::string(20, 'a'));

    EXPECT_EQ(res.result_int(), 413u);
    EXPECT_EQ(nlohmann::json::parse(res.body()),
              (nlohmann::json{{"error", "Payload Too Large"}}));
}

TEST_F(TransportTest, ServesSequentialConnections) {
    EXPECT_EQ(post("/submit", "{}").result_int(), 200u);
    EXPECT_EQ(post("/submit", "<b>x</b>").result_int(), 500u);
    EXPECT_EQ(post("/submit", "{}").result_int(), 200u);
}
