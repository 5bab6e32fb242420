#pragma once

#include <string>

namespace chunkshare::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate an opaque record id (sessions, files, links).
std::string GenerateId();

}  // namespace chunkshare::core
