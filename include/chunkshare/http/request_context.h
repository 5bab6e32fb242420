#pragma once

#include <optional>
#include <string>

#include "chunkshare/metadata/repository.h"

namespace chunkshare::http {

/// @brief Per-request metadata used for logging, ownership checks and error responses.
struct RequestContext {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    // Set for authenticated routes once the bearer token resolved to an active principal.
    std::optional<metadata::Principal> principal;
};

}  // namespace chunkshare::http
