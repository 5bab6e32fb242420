#include "chunkshare/auth/jwt_utils.h"

#include <algorithm>
#include <cctype>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace chunkshare::auth {

std::string Base64UrlEncode(const unsigned char* data, std::size_t len) {
    // Convert to base64url without padding.
    std::string b64((len + 2) / 3 * 4, '\0');
    const int out_len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&b64[0]), data,
                                        static_cast<int>(len));
    b64.resize(static_cast<std::size_t>(out_len));
    for (auto& c : b64) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    while (!b64.empty() && b64.back() == '=') {
        b64.pop_back();
    }
    return b64;
}

std::string Base64UrlEncode(const std::string& input) {
    return Base64UrlEncode(reinterpret_cast<const unsigned char*>(input.data()), input.size());
}

std::vector<unsigned char> Base64UrlDecode(const std::string& input) {
    // Normalize base64url to base64 and pad for EVP_DecodeBlock.
    std::string padded = input;
    std::replace(padded.begin(), padded.end(), '-', '+');
    std::replace(padded.begin(), padded.end(), '_', '/');
    while (padded.size() % 4 != 0) {
        padded.push_back('=');
    }

    std::vector<unsigned char> output((padded.size() / 4) * 3);
    const int out_len = EVP_DecodeBlock(output.data(),
                                        reinterpret_cast<const unsigned char*>(padded.data()),
                                        static_cast<int>(padded.size()));
    if (out_len < 0) {
        return {};
    }
    int padding = 0;
    if (!padded.empty() && padded.back() == '=') {
        padding++;
        if (padded.size() > 1 && padded[padded.size() - 2] == '=') {
            padding++;
        }
    }
    output.resize(static_cast<std::size_t>(out_len - padding));
    return output;
}

std::string Base64UrlDecodeToString(const std::string& input) {
    auto decoded = Base64UrlDecode(input);
    return std::string(reinterpret_cast<const char*>(decoded.data()), decoded.size());
}

std::vector<std::string> Split(const std::string& input, char delimiter) {
    // Simple splitter without trimming; callers can Trim() if needed.
    std::vector<std::string> parts;
    std::string current;
    for (char c : input) {
        if (c == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::string Trim(const std::string& input) {
    auto start = input.begin();
    while (start != input.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = input.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string ToLower(std::string input) {
    for (auto& c : input) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return input;
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace chunkshare::auth
