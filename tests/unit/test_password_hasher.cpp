#include <string>

#include <gtest/gtest.h>

#include "chunkshare/auth/password_hasher.h"

TEST(PasswordHasher, VerifiesOnlyTheOriginalPassword) {
    chunkshare::auth::PasswordHasher hasher(1000);
    auto hashed = hasher.Hash("correct horse");
    ASSERT_TRUE(hashed.ok());

    EXPECT_EQ(hashed.value().rfind("pbkdf2_sha256$1000$", 0), 0u);
    EXPECT_TRUE(hasher.Verify("correct horse", hashed.value()));
    EXPECT_FALSE(hasher.Verify("correct horse ", hashed.value()));
    EXPECT_FALSE(hasher.Verify("", hashed.value()));
}

TEST(PasswordHasher, SaltsDiffer) {
    chunkshare::auth::PasswordHasher hasher(1000);
    auto first = hasher.Hash("secret");
    auto second = hasher.Hash("secret");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_NE(first.value(), second.value());
}

TEST(PasswordHasher, IterationCountTravelsWithTheHash) {
    chunkshare::auth::PasswordHasher old_hasher(1000);
    auto hashed = old_hasher.Hash("secret");
    ASSERT_TRUE(hashed.ok());

    chunkshare::auth::PasswordHasher new_hasher(5000);
    EXPECT_TRUE(new_hasher.Verify("secret", hashed.value()));
}

TEST(PasswordHasher, MalformedEncodingNeverVerifies) {
    chunkshare::auth::PasswordHasher hasher(1000);
    EXPECT_FALSE(hasher.Verify("secret", ""));
    EXPECT_FALSE(hasher.Verify("secret", "plain-text"));
    EXPECT_FALSE(hasher.Verify("secret", "pbkdf2_sha256$abc$00$00"));
    EXPECT_FALSE(hasher.Verify("secret", "md5$1000$00$00"));
}
