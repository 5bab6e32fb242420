#include "chunkshare/auth/password_hasher.h"

#include <vector>

#include <Poco/DigestEngine.h>
#include <Poco/NumberParser.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include "chunkshare/auth/jwt_utils.h"

namespace chunkshare::auth {

namespace {

constexpr const char* kScheme = "pbkdf2_sha256";
constexpr std::size_t kSaltLength = 16;
constexpr std::size_t kKeyLength = 32;

bool Derive(const std::string& password, const std::vector<unsigned char>& salt, int iterations,
            std::vector<unsigned char>* out) {
    out->assign(kKeyLength, 0);
    return PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt.data(),
                             static_cast<int>(salt.size()), iterations, EVP_sha256(),
                             static_cast<int>(out->size()), out->data()) == 1;
}

}  // namespace

PasswordHasher::PasswordHasher(int iterations) : iterations_(iterations) {}

core::Result<std::string> PasswordHasher::Hash(const std::string& password) const {
    if (password.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "password must not be empty"};
    }
    std::vector<unsigned char> salt(kSaltLength);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        return core::Error{core::ErrorCode::kInternal, "failed to generate salt"};
    }
    std::vector<unsigned char> key;
    if (!Derive(password, salt, iterations_, &key)) {
        return core::Error{core::ErrorCode::kInternal, "PBKDF2 derivation failed"};
    }
    return std::string(kScheme) + "$" + std::to_string(iterations_) + "$" +
           Poco::DigestEngine::digestToHex(salt) + "$" + Poco::DigestEngine::digestToHex(key);
}

bool PasswordHasher::Verify(const std::string& password, const std::string& encoded) const {
    const auto parts = Split(encoded, '$');
    if (parts.size() != 4 || parts[0] != kScheme) {
        return false;
    }
    int iterations = 0;
    if (!Poco::NumberParser::tryParse(parts[1], iterations) || iterations <= 0) {
        return false;
    }
    std::vector<unsigned char> salt;
    try {
        salt = Poco::DigestEngine::digestFromHex(parts[2]);
    } catch (const Poco::Exception&) {
        return false;
    }
    std::vector<unsigned char> key;
    if (!Derive(password, salt, iterations, &key)) {
        return false;
    }
    return ConstantTimeEquals(Poco::DigestEngine::digestToHex(key), ToLower(parts[3]));
}

}  // namespace chunkshare::auth
