/**
 * @file IntegrationServer.hpp
 * @brief HTTP and WebSocket front end of the integration service.
 *
 * Synchronous Boost.Beast server, one thread per accepted connection. Every connection starts
 * as HTTP; an upgrade request on the configured WebSocket path turns it into a WebSocket
 * session where each text frame is answered through protocol::MessageAdapter.
 *
 * Plain HTTP routes:
 * - GET /health returns `{"status":"healthy","service":"numerical-integration"}`.
 * - POST /integrate takes a request object and returns the bare result object, 400 with
 *   `{"detail": ...}` when the request is rejected, 422 when the body is not a request.
 * - OPTIONS on any path answers a CORS preflight.
 * - Anything else is 404.
 */
#ifndef NUMINT_INTEGRATION_SERVER_HPP
#define NUMINT_INTEGRATION_SERVER_HPP

#include <atomic>
#include <cstddef>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include "../config/ServerConfig.hpp"
#include "../protocol/MessageCodec.hpp"
#include "../service/RequestHandler.hpp"

namespace server {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

class IntegrationServer {
public:
    /**
     * @param config  Listening address, CORS origin and WebSocket path.
     * @param handler Shared by every connection; must outlive the server.
     */
    IntegrationServer(config::ServerConfig config, const service::RequestHandler& handler);

    IntegrationServer(const IntegrationServer&) = delete;
    IntegrationServer& operator=(const IntegrationServer&) = delete;

    /**
     * @brief Binds the listening socket and accepts connections until the process ends.
     * @throws boost::system::system_error if the address cannot be bound.
     */
    void run();

    /**
     * @brief Answers a plain HTTP request. Does not touch any socket.
     */
    HttpResponse route(const HttpRequest& request) const;

    std::size_t connection_count() const noexcept { return connections_.load(); }

private:
    config::ServerConfig config_;
    protocol::MessageAdapter adapter_;
    boost::asio::io_context ioc_;
    std::atomic<std::size_t> connections_{0};

    void session(boost::asio::ip::tcp::socket socket);
    void serve_websocket(boost::asio::ip::tcp::socket socket, const HttpRequest& upgrade);

    HttpResponse integrate(const HttpRequest& request) const;
    HttpResponse make_response(const HttpRequest& request, boost::beast::http::status status,
                               const std::string& body) const;
};

} // namespace server

#endif // NUMINT_INTEGRATION_SERVER_HPP
