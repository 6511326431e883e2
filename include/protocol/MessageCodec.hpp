/**
 * @file MessageCodec.hpp
 * @brief JSON wire format spoken by every transport.
 *
 * Inbound, a request is a JSON object:
 * @code
 * {"function": "x**2", "lower_bound": 0, "upper_bound": 1, "num_points": 100,
 *  "method": "simpson", "seed": 7}
 * @endcode
 * `num_points` defaults to 100, `method` to "trapezoidal", `seed` is optional.
 *
 * Outbound, a success is `{"type": "result", "data": {...IntegrationResult...}}` and a
 * failure is `{"type": "error", "message": "..."}`. `error_estimate` is only present when
 * the method produced one.
 *
 * MessageAdapter is the piece transports call: text in, optional text out. Messages that are
 * not requests at all get no reply.
 */
#ifndef NUMINT_MESSAGE_CODEC_HPP
#define NUMINT_MESSAGE_CODEC_HPP

#include <optional>
#include <string>

#include <json/json.h>

#include "../errors/IntegrationErrors.hpp"
#include "../service/IntegrationTypes.hpp"
#include "../service/RequestHandler.hpp"

namespace protocol {

/**
 * @brief Parses an inbound message.
 * @return The request, or std::nullopt if the text is not JSON, not an object, or lacks
 *         one of "function", "lower_bound", "upper_bound".
 * @throws errors::ValidationError (MalformedRequest) if a recognised field has the wrong type.
 */
std::optional<service::IntegrationRequest> decode_request(const std::string& text);

/**
 * @brief Same as decode_request, starting from an already parsed value.
 */
std::optional<service::IntegrationRequest> request_from_json(const Json::Value& root);

Json::Value to_json(const service::IntegrationResult& result);

std::string encode_result(const service::IntegrationResult& result);

std::string encode_error(const std::string& message);

std::string encode_error(const errors::IntegrationError& error);

/**
 * @brief Compact single-line serialisation used for every outbound message.
 */
std::string write_json(const Json::Value& value);

/**
 * @brief Connects the wire format to a RequestHandler.
 */
class MessageAdapter {
public:
    explicit MessageAdapter(const service::RequestHandler& handler) : handler_(handler) {}

    /**
     * @brief Handles one inbound message.
     * @return The encoded result or error envelope, or std::nullopt when the message is ignored.
     */
    std::optional<std::string> respond(const std::string& text) const;

    /**
     * @brief Runs an already decoded request.
     */
    service::Outcome handle(const service::IntegrationRequest& request) const {
        return handler_.handle(request);
    }

private:
    const service::RequestHandler& handler_;
};

} // namespace protocol

#endif // NUMINT_MESSAGE_CODEC_HPP
