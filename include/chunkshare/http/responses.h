#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <Poco/JSON/Object.h>

#include "chunkshare/core/error.h"
#include "chunkshare/http/router.h"

namespace chunkshare::http {

struct RangeRequest {
    std::uint64_t start{0};
    std::uint64_t end{0};  // inclusive
};

HttpResponse JsonOk(int version, const std::string& body,
                    boost::beast::http::status status = boost::beast::http::status::ok);
HttpResponse JsonOk(int version, const Poco::JSON::Object::Ptr& body,
                    boost::beast::http::status status = boost::beast::http::status::ok);
HttpResponse NoContent(int version);
/// @brief `{"error":{"code","message","request_id"}}` envelope.
HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, boost::beast::http::status status);
/// @brief Envelope for a core error, with the status its code maps to.
HttpResponse ErrorResponse(int version, const core::Error& error, const std::string& request_id);
boost::beast::http::status StatusFor(core::ErrorCode code);

std::string StripQuery(const std::string& target);
/// @brief Percent-decoded query parameter, or empty when absent.
std::string GetQueryParam(const std::string& target, const std::string& key);
bool HasQueryParam(const std::string& target, const std::string& key);
/// @brief Parse a single `bytes=` range against a body of `size` bytes.
std::optional<RangeRequest> ParseRange(const std::string& header, std::uint64_t size);

}  // namespace chunkshare::http
