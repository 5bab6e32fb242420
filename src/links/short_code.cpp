#include "chunkshare/links/short_code.h"

#include <array>
#include <cctype>

#include <openssl/rand.h>

namespace chunkshare::links {

namespace {
constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
constexpr unsigned kAlphabetSize = sizeof(kAlphabet) - 1;
// Largest multiple of 62 below 256; bytes at or above it are rejected to avoid modulo bias.
constexpr unsigned kRejectFrom = 256 - (256 % kAlphabetSize);
}  // namespace

core::Result<std::string> GenerateShortCode(std::size_t length) {
    std::string code;
    code.reserve(length);
    std::array<unsigned char, 32> random{};
    while (code.size() < length) {
        if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
            return core::Error{core::ErrorCode::kInternal, "random generator failure"};
        }
        for (unsigned char byte : random) {
            if (byte >= kRejectFrom) {
                continue;
            }
            code.push_back(kAlphabet[byte % kAlphabetSize]);
            if (code.size() == length) {
                break;
            }
        }
    }
    return code;
}

bool IsValidShortCode(const std::string& code) {
    if (code.size() != kShortCodeLength) {
        return false;
    }
    for (char c : code) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace chunkshare::links
