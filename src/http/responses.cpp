#include "chunkshare/http/responses.h"

#include <sstream>

#include <Poco/NumberParser.h>
#include <Poco/URI.h>

namespace chunkshare::http {

namespace beast_http = boost::beast::http;

namespace {

std::string Stringify(const Poco::JSON::Object& object) {
    std::stringstream ss;
    object.stringify(ss);
    return ss.str();
}

std::optional<std::string> FindQueryParam(const std::string& target, const std::string& key) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    auto query = target.substr(pos + 1);
    std::stringstream ss(query);
    std::string item;
    while (std::getline(ss, item, '&')) {
        auto eq = item.find('=');
        const auto name = item.substr(0, eq);
        if (name != key) {
            continue;
        }
        if (eq == std::string::npos) {
            return std::string();
        }
        std::string decoded;
        // Form encoding uses '+' for spaces.
        std::string raw = item.substr(eq + 1);
        for (auto& c : raw) {
            if (c == '+') {
                c = ' ';
            }
        }
        Poco::URI::decode(raw, decoded);
        return decoded;
    }
    return std::nullopt;
}

}  // namespace

HttpResponse JsonOk(int version, const std::string& body, beast_http::status status) {
    HttpResponse response{status, version};
    response.set(beast_http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse JsonOk(int version, const Poco::JSON::Object::Ptr& body, beast_http::status status) {
    return JsonOk(version, Stringify(*body), status);
}

HttpResponse NoContent(int version) {
    HttpResponse response{beast_http::status::no_content, version};
    response.prepare_payload();
    return response;
}

HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, beast_http::status status) {
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object envelope;
    envelope.set("error", error);
    return JsonOk(version, Stringify(envelope), status);
}

HttpResponse ErrorResponse(int version, const core::Error& error, const std::string& request_id) {
    return JsonError(version, core::ErrorCodeName(error.code), error.message, request_id,
                     StatusFor(error.code));
}

beast_http::status StatusFor(core::ErrorCode code) {
    using core::ErrorCode;
    switch (code) {
        case ErrorCode::kOk:
            return beast_http::status::ok;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kInvalidIndex:
        case ErrorCode::kInvalidExpiry:
        case ErrorCode::kInvalidToken:
            return beast_http::status::bad_request;
        case ErrorCode::kUnauthorized:
        case ErrorCode::kPasswordRequired:
        case ErrorCode::kInvalidPassword:
            return beast_http::status::unauthorized;
        case ErrorCode::kForbidden:
        case ErrorCode::kQuotaExceeded:
            return beast_http::status::forbidden;
        case ErrorCode::kNotFound:
        case ErrorCode::kLinkNotFound:
            return beast_http::status::not_found;
        case ErrorCode::kAlreadyExists:
        case ErrorCode::kChecksumConflict:
        case ErrorCode::kIncompleteUpload:
        case ErrorCode::kInvalidState:
        case ErrorCode::kFileNotReady:
            return beast_http::status::conflict;
        case ErrorCode::kLinkDisabled:
        case ErrorCode::kLinkExpired:
        case ErrorCode::kLinkExhausted:
            return beast_http::status::gone;
        case ErrorCode::kPayloadTooLarge:
            return beast_http::status::payload_too_large;
        case ErrorCode::kUnprocessable:
        case ErrorCode::kDigestMismatch:
            return beast_http::status::unprocessable_entity;
        case ErrorCode::kIoError:
        case ErrorCode::kDbError:
        case ErrorCode::kInternal:
        case ErrorCode::kMissingChunk:
            return beast_http::status::internal_server_error;
    }
    return beast_http::status::internal_server_error;
}

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

std::string GetQueryParam(const std::string& target, const std::string& key) {
    return FindQueryParam(target, key).value_or("");
}

bool HasQueryParam(const std::string& target, const std::string& key) {
    return FindQueryParam(target, key).has_value();
}

std::optional<RangeRequest> ParseRange(const std::string& header, std::uint64_t size) {
    // Only a single byte range is supported.
    if (header.rfind("bytes=", 0) != 0 || size == 0) {
        return std::nullopt;
    }
    auto range = header.substr(6);
    if (range.find(',') != std::string::npos) {
        return std::nullopt;
    }
    auto dash = range.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    const std::string start_str = range.substr(0, dash);
    const std::string end_str = range.substr(dash + 1);

    RangeRequest req;
    Poco::UInt64 value = 0;
    if (start_str.empty()) {
        // Suffix form: the last N bytes.
        if (!Poco::NumberParser::tryParseUnsigned64(end_str, value) || value == 0) {
            return std::nullopt;
        }
        req.start = value >= size ? 0 : size - value;
        req.end = size - 1;
        return req;
    }
    if (!Poco::NumberParser::tryParseUnsigned64(start_str, value)) {
        return std::nullopt;
    }
    req.start = value;
    if (end_str.empty()) {
        req.end = size - 1;
    } else {
        if (!Poco::NumberParser::tryParseUnsigned64(end_str, value)) {
            return std::nullopt;
        }
        req.end = value >= size ? size - 1 : value;
    }
    if (req.start > req.end || req.start >= size) {
        return std::nullopt;
    }
    return req;
}

}  // namespace chunkshare::http
