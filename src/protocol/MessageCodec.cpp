#include "protocol/MessageCodec.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <variant>

namespace protocol {

namespace {

[[noreturn]] void malformed(const std::string& field, const std::string& expected) {
    throw errors::ValidationError(errors::ValidationErrorKind::MalformedRequest,
                                  "field '" + field + "' must be " + expected);
}

// Integers beyond int saturate so the handler reports them as an out-of-range point count.
int clamp_to_int(const Json::Value& value) {
    if (value.isInt()) {
        return value.asInt();
    }
    const double number = value.asDouble();
    return number < 0.0 ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();
}

Json::Value to_array(const std::vector<double>& values) {
    Json::Value array(Json::arrayValue);
    for (double value : values) {
        array.append(value);
    }
    return array;
}

} // namespace

std::optional<service::IntegrationRequest> decode_request(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string parse_errors;
    try {
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &parse_errors)) {
            return std::nullopt;
        }
    } catch (const Json::Exception&) {
        // Thrown for input nested deeper than the reader's stack limit.
        return std::nullopt;
    }
    return request_from_json(root);
}

std::optional<service::IntegrationRequest> request_from_json(const Json::Value& root) {
    if (!root.isObject()) {
        return std::nullopt;
    }
    for (const char* required : {"function", "lower_bound", "upper_bound"}) {
        if (!root.isMember(required)) {
            return std::nullopt;
        }
    }

    service::IntegrationRequest request;

    const Json::Value& function = root["function"];
    if (!function.isString()) {
        malformed("function", "a string");
    }
    request.function = function.asString();

    const Json::Value& lower = root["lower_bound"];
    const Json::Value& upper = root["upper_bound"];
    if (!lower.isNumeric()) {
        malformed("lower_bound", "a number");
    }
    if (!upper.isNumeric()) {
        malformed("upper_bound", "a number");
    }
    request.lower_bound = lower.asDouble();
    request.upper_bound = upper.asDouble();

    if (root.isMember("num_points")) {
        const Json::Value& points = root["num_points"];
        if (!points.isNumeric() || std::trunc(points.asDouble()) != points.asDouble()) {
            malformed("num_points", "an integer");
        }
        request.num_points = clamp_to_int(points);
    }

    if (root.isMember("method")) {
        const Json::Value& method = root["method"];
        if (!method.isString()) {
            malformed("method", "a string");
        }
        request.method = method.asString();
    }

    if (root.isMember("seed") && !root["seed"].isNull()) {
        const Json::Value& seed = root["seed"];
        if (!seed.isUInt64()) {
            malformed("seed", "a non-negative integer");
        }
        request.seed = seed.asUInt64();
    }

    return request;
}

Json::Value to_json(const service::IntegrationResult& result) {
    Json::Value data(Json::objectValue);
    data["value"] = result.value;
    data["method"] = result.method;
    data["num_points"] = result.num_points;
    data["x_values"] = to_array(result.x_values);
    data["y_values"] = to_array(result.y_values);
    if (result.error_estimate) {
        data["error_estimate"] = *result.error_estimate;
    }
    return data;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::string encode_result(const service::IntegrationResult& result) {
    Json::Value envelope(Json::objectValue);
    envelope["type"] = "result";
    envelope["data"] = to_json(result);
    return write_json(envelope);
}

std::string encode_error(const std::string& message) {
    Json::Value envelope(Json::objectValue);
    envelope["type"] = "error";
    envelope["message"] = message;
    return write_json(envelope);
}

std::string encode_error(const errors::IntegrationError& error) {
    return encode_error(error.describe());
}

std::optional<std::string> MessageAdapter::respond(const std::string& text) const {
    std::optional<service::IntegrationRequest> request;
    try {
        request = decode_request(text);
    } catch (const errors::ValidationError& e) {
        return encode_error(errors::IntegrationError::from(e));
    }
    if (!request) {
        return std::nullopt;
    }

    const service::Outcome outcome = handler_.handle(*request);
    if (const auto* result = std::get_if<service::IntegrationResult>(&outcome)) {
        return encode_result(*result);
    }
    return encode_error(std::get<errors::IntegrationError>(outcome));
}

} // namespace protocol
