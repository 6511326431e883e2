#include <server/IntegrationServer.hpp>
#include <gtest/gtest.h>
#include <json/json.h>
#include <memory>
#include <string>

namespace numint_test {

namespace http = boost::beast::http;

/**
 * Test fixture for the HTTP routes. Requests are answered in memory; no socket is opened.
 */
class IntegrationServerTest : public ::testing::Test {
protected:
    service::RequestHandler handler;
    config::ServerConfig settings;
    std::unique_ptr<server::IntegrationServer> integrationServer;

    void SetUp() override {
        settings.allowed_origin = "http://localhost:4200";
        integrationServer = std::make_unique<server::IntegrationServer>(settings, handler);
    }

    server::HttpResponse send(http::verb verb, const std::string& target, const std::string& body = "") {
        server::HttpRequest request{verb, target, 11};
        request.set(http::field::host, "localhost");
        request.set(http::field::content_type, "application/json");
        request.body() = body;
        request.prepare_payload();
        return integrationServer->route(request);
    }

    static Json::Value json(const server::HttpResponse& response) {
        Json::CharReaderBuilder builder;
        const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string problems;
        const std::string& body = response.body();
        EXPECT_TRUE(reader->parse(body.data(), body.data() + body.size(), &root, &problems)) << problems;
        return root;
    }
};

TEST_F(IntegrationServerTest, HealthReportsService) {
    auto response = send(http::verb::get, "/health");

    EXPECT_EQ(response.result(), http::status::ok);
    auto body = json(response);
    EXPECT_EQ(body["status"].asString(), "healthy");
    EXPECT_EQ(body["service"].asString(), "numerical-integration");
}

TEST_F(IntegrationServerTest, IntegrateReturnsTheBareResult) {
    auto response = send(http::verb::post, "/integrate",
                         R"({"function": "x", "lower_bound": 0, "upper_bound": 2, "num_points": 10})");

    EXPECT_EQ(response.result(), http::status::ok);
    auto body = json(response);
    EXPECT_FALSE(body.isMember("type"));
    EXPECT_NEAR(body["value"].asDouble(), 2.0, 1e-12);
    EXPECT_EQ(body["method"].asString(), "trapezoidal");
    EXPECT_EQ(body["x_values"].size(), 10u);
}

TEST_F(IntegrationServerTest, RejectedRequestIsBadRequestWithDetail) {
    auto response = send(http::verb::post, "/integrate",
                         R"({"function": "x", "lower_bound": 0, "upper_bound": 1, "num_points": 5})");

    EXPECT_EQ(response.result(), http::status::bad_request);
    EXPECT_EQ(json(response)["detail"].asString(),
              "Invalid request: num_points must be between 10 and 1000, got 5");
}

TEST_F(IntegrationServerTest, UnrecognisedBodyIsUnprocessable) {
    EXPECT_EQ(send(http::verb::post, "/integrate", "not json").result(), http::status::unprocessable_entity);
    EXPECT_EQ(send(http::verb::post, "/integrate", R"({"function": "x"})").result(),
              http::status::unprocessable_entity);
    EXPECT_EQ(send(http::verb::post, "/integrate",
                   R"({"function": "x", "lower_bound": "a", "upper_bound": 1})").result(),
              http::status::unprocessable_entity);
}

TEST_F(IntegrationServerTest, DeeplyNestedBodyIsUnprocessable) {
    const std::string nested = std::string(2000, '[') + std::string(2000, ']');

    server::HttpResponse response;
    EXPECT_NO_THROW(response = send(http::verb::post, "/integrate", nested));
    EXPECT_EQ(response.result(), http::status::unprocessable_entity);
}

TEST_F(IntegrationServerTest, ResponsesCarryTheConfiguredOrigin) {
    auto response = send(http::verb::get, "/health");

    EXPECT_EQ(response[http::field::access_control_allow_origin], "http://localhost:4200");
    EXPECT_EQ(response[http::field::content_type], "application/json");
}

TEST_F(IntegrationServerTest, PreflightIsAnswered) {
    auto response = send(http::verb::options, "/integrate");

    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response[http::field::access_control_allow_methods], "GET, POST, OPTIONS");
    EXPECT_EQ(response[http::field::access_control_allow_origin], "http://localhost:4200");
}

TEST_F(IntegrationServerTest, UnknownRoutesAndMethods) {
    EXPECT_EQ(send(http::verb::get, "/missing").result(), http::status::not_found);
    EXPECT_EQ(send(http::verb::get, "/integrate").result(), http::status::method_not_allowed);
    EXPECT_EQ(send(http::verb::post, "/health").result(), http::status::method_not_allowed);
}

TEST_F(IntegrationServerTest, NoConnectionsBeforeRunning) {
    EXPECT_EQ(integrationServer->connection_count(), 0u);
}

} // namespace numint_test
