#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace chunkshare::auth {

std::string Base64UrlEncode(const unsigned char* data, std::size_t len);
std::string Base64UrlEncode(const std::string& input);
std::vector<unsigned char> Base64UrlDecode(const std::string& input);
std::string Base64UrlDecodeToString(const std::string& input);
std::vector<std::string> Split(const std::string& input, char delimiter);
std::string Trim(const std::string& input);
std::string ToLower(std::string input);
/// @brief Length-checked constant-time comparison for secrets and MACs.
bool ConstantTimeEquals(const std::string& a, const std::string& b);

}  // namespace chunkshare::auth
