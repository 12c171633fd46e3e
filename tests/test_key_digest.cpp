#include <gtest/gtest.h>
#include "key_digest.hpp"
#include "input_validator.hpp"

using namespace shorten;

TEST(KeyDigestTest, KnownValues) {
    EXPECT_EQ(KeyDigest::compute("12345"), "gnzLDuqKcGxMNKFokfhOew");
    EXPECT_EQ(KeyDigest::compute(""), "1B2M2Y8AsgTpgAmY7PhCfg");
    EXPECT_EQ(KeyDigest::compute("hello"), "XUFAKrxLKna5cZ2REBfFkg");
}

TEST(KeyDigestTest, UrlSafeAlphabet) {
    // Standard base64 of this digest contains '+' twice.
    std::string digest = KeyDigest::compute("https://example.com");
    EXPECT_EQ(digest, "yYTQaq--z2vFVWn5ZBSOow");
    EXPECT_TRUE(InputValidator::is_url_safe_key(digest));
}

TEST(KeyDigestTest, AlwaysTwentyTwoCharacters) {
    for (int i = 0; i < 200; ++i) {
        std::string digest = KeyDigest::compute("value-" + std::to_string(i));
        EXPECT_EQ(digest.size(), KeyDigest::DIGEST_LENGTH);
        EXPECT_EQ(digest.find('='), std::string::npos);
    }
}

TEST(KeyDigestTest, Base64UrlRemapsAndStripsPadding) {
    const unsigned char bytes[] = {0xfb, 0xff};
    EXPECT_EQ(KeyDigest::base64url(bytes, sizeof(bytes)), "-_8");
    EXPECT_EQ(KeyDigest::base64url(bytes, 0), "");
}
