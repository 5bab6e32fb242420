#pragma once

#include <cstddef>
#include <string>

#include "chunkshare/core/result.h"

namespace chunkshare::links {

constexpr std::size_t kShortCodeLength = 8;

/// @brief Uniformly random `[A-Za-z0-9]` code from the OpenSSL CSPRNG.
core::Result<std::string> GenerateShortCode(std::size_t length = kShortCodeLength);
bool IsValidShortCode(const std::string& code);

}  // namespace chunkshare::links
