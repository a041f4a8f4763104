#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <thread>
#include <chrono>

#include "server/http_server.h"
#include "query/local_engine.h"
#include "query/memory_store.h"

using json = nlohmann::json;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string urlEncode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0xF];
        }
    }
    return out;
}

const char* kPushBody = R"({"streams":[
    {"stream":{"app":"x","env":"test"},"values":[
        ["1554375800000000000","hello"],
        ["1554375801000000000","boom happened"]
    ]},
    {"stream":{"app":"y","env":"test"},"values":[
        ["1554375802000000000","other"]
    ]}
]})";

} // namespace

class HttpQueryApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<logq::query::MemoryStore>();
        auto engine = std::make_shared<logq::query::LocalEngine>(store_);

        logq::server::HttpServer::Config scfg;
        scfg.host = "127.0.0.1";
        scfg.port = 0; // ephemeral
        scfg.num_threads = 2;
        scfg.tail_ping_period = std::chrono::milliseconds(50);

        server_ = std::make_unique<logq::server::HttpServer>(scfg, engine, store_, store_, store_);
        server_->start();
        port_ = server_->port();
        ASSERT_NE(port_, 0);

        auto res = send(http::verb::post, "/loki/api/v1/push", kPushBody);
        ASSERT_EQ(res.result_int(), 204u) << res.body();
    }

    void TearDown() override {
        if (server_) server_->stop();
        store_->shutdown();
    }

    http::response<http::string_body> send(http::verb verb, const std::string& target,
                                           const std::string& body = "") {
        net::io_context ioc;
        beast::tcp_stream stream(ioc);
        stream.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_));

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, "127.0.0.1");
        if (!body.empty()) {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return res;
    }

    http::response<http::string_body> get(const std::string& target) {
        return send(http::verb::get, target);
    }

    std::shared_ptr<logq::query::MemoryStore> store_;
    std::unique_ptr<logq::server::HttpServer> server_;
    uint16_t port_ = 0;
};

TEST_F(HttpQueryApiTest, Ready) {
    auto res = get("/ready");
    EXPECT_EQ(res.result_int(), 200u);
    EXPECT_EQ(res.body(), "ready");
    EXPECT_EQ(res[http::field::server], "LogQ/0.1.0");
}

TEST_F(HttpQueryApiTest, RangeQueryReturnsStreams) {
    auto res = get("/loki/api/v1/query_range?query=" + urlEncode("{env=\"test\"}") +
                   "&start=1554375700&end=1554376000&limit=10&direction=forward");
    ASSERT_EQ(res.result_int(), 200u) << res.body();
    EXPECT_EQ(res[http::field::content_type], "application/json");

    auto body = json::parse(res.body());
    EXPECT_EQ(body["status"], "success");
    EXPECT_EQ(body["data"]["resultType"], "streams");
    ASSERT_EQ(body["data"]["result"].size(), 2u);
    const auto& x = body["data"]["result"][0];
    EXPECT_EQ(x["stream"]["app"], "x");
    ASSERT_EQ(x["values"].size(), 2u);
    EXPECT_EQ(x["values"][0][0], "1554375800000000000");
    EXPECT_EQ(x["values"][0][1], "hello");
}

TEST_F(HttpQueryApiTest, RangeQueryMetric) {
    auto res = get("/loki/api/v1/query_range?query=" + urlEncode("count_over_time({app=\"x\"}[1s])") +
                   "&start=1554375800&end=1554375802&step=1");
    ASSERT_EQ(res.result_int(), 200u) << res.body();

    auto body = json::parse(res.body());
    EXPECT_EQ(body["data"]["resultType"], "matrix");
    const auto& values = body["data"]["result"][0]["values"];
    ASSERT_EQ(values.size(), 2u);
    EXPECT_DOUBLE_EQ(values[0][0].get<double>(), 1554375800.0);
    EXPECT_EQ(values[0][1], "1");
}

TEST_F(HttpQueryApiTest, InstantQueryVector) {
    auto res = get("/loki/api/v1/query?query=" + urlEncode("count_over_time({app=\"x\"}[5m])") +
                   "&time=1554375900");
    ASSERT_EQ(res.result_int(), 200u) << res.body();

    auto body = json::parse(res.body());
    EXPECT_EQ(body["data"]["resultType"], "vector");
    ASSERT_EQ(body["data"]["result"].size(), 1u);
    EXPECT_EQ(body["data"]["result"][0]["value"][1], "2");
}

TEST_F(HttpQueryApiTest, LegacyQueryFoldsRegexp) {
    auto res = get("/api/prom/query?query=" + urlEncode("{app=\"x\"}") +
                   "&regexp=boom&start=1554375700&end=1554376000");
    ASSERT_EQ(res.result_int(), 200u) << res.body();

    auto body = json::parse(res.body());
    ASSERT_EQ(body["streams"].size(), 1u);
    const auto& stream = body["streams"][0];
    EXPECT_EQ(stream["labels"], "{app=\"x\", env=\"test\"}");
    ASSERT_EQ(stream["entries"].size(), 1u);
    EXPECT_EQ(stream["entries"][0]["line"], "boom happened");
    EXPECT_EQ(stream["entries"][0]["ts"], "2019-04-04T11:03:21Z");
}

TEST_F(HttpQueryApiTest, Labels) {
    auto names = get("/loki/api/v1/labels?start=1554375700&end=1554376000");
    ASSERT_EQ(names.result_int(), 200u) << names.body();
    EXPECT_EQ(json::parse(names.body())["data"], json::array({"app", "env"}));

    auto values = get("/loki/api/v1/label/app/values?start=1554375700&end=1554376000");
    ASSERT_EQ(values.result_int(), 200u) << values.body();
    EXPECT_EQ(json::parse(values.body())["data"], json::array({"x", "y"}));

    auto legacy = get("/api/prom/label/app/values?start=1554375700&end=1554376000");
    ASSERT_EQ(legacy.result_int(), 200u);
    EXPECT_EQ(json::parse(legacy.body())["values"], json::array({"x", "y"}));

    // Default window is the last six hours
    auto recent = get("/loki/api/v1/labels");
    ASSERT_EQ(recent.result_int(), 200u);
    EXPECT_TRUE(json::parse(recent.body())["data"].empty());
}

TEST_F(HttpQueryApiTest, ParameterErrorsAre400) {
    for (const std::string& target : {
            std::string("/loki/api/v1/query_range?query=%7Bapp%3D%22x%22%7D&limit=abc"),
            std::string("/loki/api/v1/query_range?query=%7Bapp%3D%22x%22%7D&direction=sideways"),
            std::string("/loki/api/v1/query_range?query=%7Bapp%3D%22x%22%7D&start=yesterday"),
            std::string("/loki/api/v1/query?query=%7Bapp%3D"),
            std::string("/api/prom/query?query=%7Bapp%3D%22x%22%7D&regexp=%28")}) {
        auto res = get(target);
        EXPECT_EQ(res.result_int(), 400u) << target;
        auto body = json::parse(res.body());
        EXPECT_EQ(body["error"], true);
        EXPECT_EQ(body["status_code"], 400);
        EXPECT_FALSE(body["message"].get<std::string>().empty());
    }
}

TEST_F(HttpQueryApiTest, UnknownRoutesAndMethods) {
    EXPECT_EQ(get("/nope").result_int(), 404u);
    EXPECT_EQ(send(http::verb::post, "/loki/api/v1/query_range", "{}").result_int(), 405u);
    EXPECT_EQ(get("/loki/api/v1/push").result_int(), 405u);
}

TEST_F(HttpQueryApiTest, PushRejectsBadBodies) {
    EXPECT_EQ(send(http::verb::post, "/loki/api/v1/push", "not json").result_int(), 400u);
    EXPECT_EQ(send(http::verb::post, "/loki/api/v1/push",
        R"({"streams":[{"stream":{},"values":[["1","x"]]}]})").result_int(), 400u);
}

TEST_F(HttpQueryApiTest, TailWithoutUpgrade) {
    auto plain = get("/loki/api/v1/tail?query=" + urlEncode("{app=\"x\"}"));
    EXPECT_EQ(plain.result_int(), 400u);
    EXPECT_EQ(json::parse(plain.body())["message"], "websocket upgrade required");

    auto delayed = get("/loki/api/v1/tail?query=" + urlEncode("{app=\"x\"}") + "&delay_for=6");
    EXPECT_EQ(delayed.result_int(), 400u);
    EXPECT_EQ(json::parse(delayed.body())["message"], "delay_for can't be greater than 5");
}

TEST_F(HttpQueryApiTest, TailStreamsHistoryLiveAndCloses) {
    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_));
    ws.handshake("127.0.0.1", "/loki/api/v1/tail?query=" + urlEncode("{app=\"x\"}") +
                              "&start=1554375700000000000");

    int pings = 0;
    ws.control_callback([&](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::ping) ++pings;
    });

    beast::flat_buffer buffer;
    ws.read(buffer);
    auto history = json::parse(beast::buffers_to_string(buffer.data()));
    ASSERT_EQ(history["streams"].size(), 1u);
    EXPECT_EQ(history["streams"][0]["values"].size(), 2u);
    buffer.consume(buffer.size());

    std::thread pusher([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        store_->push({{"app", "x"}, {"env", "test"}},
                     {{logq::query::now(), "live line"}});
    });
    ws.read(buffer);
    pusher.join();

    auto live = json::parse(beast::buffers_to_string(buffer.data()));
    EXPECT_EQ(live["streams"][0]["values"][0][1], "live line");
    EXPECT_GE(pings, 1);
    EXPECT_EQ(server_->getStats().active_tails, 1u);
    buffer.consume(buffer.size());

    // Server shutdown sends a going-away close frame
    std::thread stopper([this] { server_->stop(); });
    beast::error_code ec;
    while (!ec) {
        ws.read(buffer, ec);
        buffer.consume(buffer.size());
    }
    stopper.join();

    EXPECT_EQ(ec, websocket::error::closed);
    EXPECT_EQ(ws.reason().code, websocket::close_code::going_away);
    EXPECT_EQ(std::string(ws.reason().reason.c_str()), "server shutting down");
}

namespace {

// Engine whose queries outlive any short deadline but still return a result
class SlowEngine : public logq::query::Engine {
public:
    class SlowQuery : public logq::query::Query {
    public:
        logq::query::QueryResult exec(const logq::query::Context&) override {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return logq::query::Streams{};
        }
    };

    std::unique_ptr<logq::query::Query> newRangeQuery(
        const std::string&, logq::query::Timestamp, logq::query::Timestamp,
        std::chrono::nanoseconds, logq::query::Direction, uint32_t) override {
        return std::make_unique<SlowQuery>();
    }

    std::unique_ptr<logq::query::Query> newInstantQuery(
        const std::string&, logq::query::Timestamp, logq::query::Direction, uint32_t) override {
        return std::make_unique<SlowQuery>();
    }
};

} // namespace

class HttpQueryTimeoutTest : public HttpQueryApiTest {
protected:
    void SetUp() override {
        store_ = std::make_shared<logq::query::MemoryStore>();

        logq::server::HttpServer::Config scfg;
        scfg.host = "127.0.0.1";
        scfg.port = 0;
        scfg.num_threads = 2;
        scfg.query_timeout = std::chrono::milliseconds(50);

        server_ = std::make_unique<logq::server::HttpServer>(
            scfg, std::make_shared<SlowEngine>(), store_, store_, store_);
        server_->start();
        port_ = server_->port();
        ASSERT_NE(port_, 0);
    }
};

TEST_F(HttpQueryTimeoutTest, EngineOverrunningDeadlineIs400) {
    for (const std::string& target : {
            "/loki/api/v1/query_range?query=" + urlEncode("{app=\"x\"}"),
            "/loki/api/v1/query?query=" + urlEncode("{app=\"x\"}"),
            "/api/prom/query?query=" + urlEncode("{app=\"x\"}")}) {
        auto res = get(target);
        EXPECT_EQ(res.result_int(), 400u) << target;
        auto body = json::parse(res.body());
        EXPECT_EQ(body["status_code"], 400);
        EXPECT_NE(body["message"].get<std::string>().find("deadline"), std::string::npos) << target;
    }

    // Label lookups are not bound by the query deadline
    EXPECT_EQ(get("/loki/api/v1/labels").result_int(), 200u);
}
