#include "server/IntegrationServer.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace server {

namespace {

constexpr const char* kServerName = "numint";

std::string detail(const std::string& message) {
    Json::Value body(Json::objectValue);
    body["detail"] = message;
    return protocol::write_json(body);
}

} // namespace

IntegrationServer::IntegrationServer(config::ServerConfig config, const service::RequestHandler& handler)
    : config_(std::move(config)), adapter_(handler) {}

void IntegrationServer::run() {
    const auto address = net::ip::make_address(config_.address);
    tcp::acceptor acceptor{ioc_, {address, config_.port}};
    std::cout << "Integration server listening on " << config_.address << ":" << config_.port
              << " (WebSocket path " << config_.websocket_path << ")" << std::endl;

    for (;;) {
        tcp::socket socket{ioc_};
        beast::error_code ec;
        acceptor.accept(socket, ec);
        if (ec) {
            std::cerr << "Accept failed: " << ec.message() << std::endl;
            continue;
        }
        std::thread(&IntegrationServer::session, this, std::move(socket)).detach();
    }
}

void IntegrationServer::session(tcp::socket socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    // Runs on a detached thread: nothing may escape, or the whole process terminates.
    try {
        for (;;) {
            HttpRequest request;
            http::read(socket, buffer, request, ec);
            if (ec == http::error::end_of_stream) {
                break;
            }
            if (ec) {
                std::cerr << "HTTP read failed: " << ec.message() << std::endl;
                return;
            }

            if (websocket::is_upgrade(request)) {
                if (request.target() == config_.websocket_path) {
                    serve_websocket(std::move(socket), request);
                    return;
                }
                HttpResponse response = make_response(request, http::status::not_found, detail("Not Found"));
                http::write(socket, response, ec);
                break;
            }

            HttpResponse response = route(request);
            if (config_.verbose) {
                std::cout << request.method_string() << " " << request.target() << " -> "
                          << response.result_int() << std::endl;
            }
            const bool keep_alive = response.keep_alive();
            http::write(socket, response, ec);
            if (ec) {
                std::cerr << "HTTP write failed: " << ec.message() << std::endl;
                return;
            }
            if (!keep_alive) {
                break;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Connection dropped: " << e.what() << std::endl;
        socket.close(ec);
        return;
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

void IntegrationServer::serve_websocket(tcp::socket socket, const HttpRequest& upgrade) {
    websocket::stream<tcp::socket> ws{std::move(socket)};
    ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, kServerName);
    }));

    try {
        ws.accept(upgrade);
    } catch (const beast::system_error& se) {
        std::cerr << "WebSocket handshake failed: " << se.code().message() << std::endl;
        return;
    }

    std::cout << "Client connected. Total connections: " << ++connections_ << std::endl;

    try {
        for (;;) {
            beast::flat_buffer buffer;
            ws.read(buffer);
            if (!ws.got_text()) {
                continue;
            }
            const std::string message = beast::buffers_to_string(buffer.data());
            const std::optional<std::string> reply = adapter_.respond(message);
            if (config_.verbose) {
                std::cout << "WebSocket request " << message << " -> "
                          << (reply ? *reply : std::string("(ignored)")) << std::endl;
            }
            if (reply) {
                ws.text(true);
                ws.write(net::buffer(*reply));
            }
        }
    } catch (const beast::system_error& se) {
        if (se.code() != websocket::error::closed && se.code() != net::error::eof &&
            se.code() != net::error::connection_reset) {
            std::cerr << "WebSocket error: " << se.code().message() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "WebSocket session failed: " << e.what() << std::endl;
        beast::error_code ec;
        ws.next_layer().close(ec);
    }

    std::cout << "Client disconnected. Total connections: " << --connections_ << std::endl;
}

HttpResponse IntegrationServer::route(const HttpRequest& request) const {
    if (request.method() == http::verb::options) {
        HttpResponse response = make_response(request, http::status::ok, "");
        response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        response.set(http::field::access_control_allow_headers, "Content-Type");
        response.prepare_payload();
        return response;
    }

    const beast::string_view target = request.target();
    if (target == "/health" && request.method() == http::verb::get) {
        Json::Value body(Json::objectValue);
        body["status"] = "healthy";
        body["service"] = "numerical-integration";
        return make_response(request, http::status::ok, protocol::write_json(body));
    }
    if (target == "/integrate" && request.method() == http::verb::post) {
        return integrate(request);
    }
    if (target == "/health" || target == "/integrate") {
        return make_response(request, http::status::method_not_allowed, detail("Method Not Allowed"));
    }
    return make_response(request, http::status::not_found, detail("Not Found"));
}

HttpResponse IntegrationServer::integrate(const HttpRequest& request) const {
    std::optional<service::IntegrationRequest> decoded;
    try {
        decoded = protocol::decode_request(request.body());
    } catch (const errors::ValidationError& e) {
        return make_response(request, http::status::unprocessable_entity, detail(e.what()));
    }
    if (!decoded) {
        return make_response(request, http::status::unprocessable_entity,
                             detail("body must be an object with function, lower_bound and upper_bound"));
    }

    const service::Outcome outcome = adapter_.handle(*decoded);
    if (const auto* result = std::get_if<service::IntegrationResult>(&outcome)) {
        return make_response(request, http::status::ok, protocol::write_json(protocol::to_json(*result)));
    }
    const auto& error = std::get<errors::IntegrationError>(outcome);
    return make_response(request, http::status::bad_request, detail(error.describe()));
}

HttpResponse IntegrationServer::make_response(const HttpRequest& request, http::status status,
                                              const std::string& body) const {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, kServerName);
    response.set(http::field::content_type, "application/json");
    response.set(http::field::access_control_allow_origin, config_.allowed_origin);
    response.set(http::field::access_control_allow_credentials, "true");
    response.keep_alive(request.keep_alive());
    response.body() = body;
    response.prepare_payload();
    return response;
}

} // namespace server
