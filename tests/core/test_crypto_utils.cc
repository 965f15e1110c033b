#include <gtest/gtest.h>

#include <set>

#include "relay/core/crypto_utils.h"

using namespace relay::crypto;

TEST(CryptoUtilsTest, RandomHexLengthAndAlphabet) {
  std::string id = randomHex(16);
  EXPECT_EQ(id.size(), 32u);
  EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(CryptoUtilsTest, RandomHexDoesNotRepeat) {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    EXPECT_TRUE(seen.insert(randomHex(16)).second);
  }
}

TEST(CryptoUtilsTest, Sha256KnownVectors) {
  EXPECT_EQ(sha256Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(sha256Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoUtilsTest, ConstantTimeEquals) {
  EXPECT_TRUE(constantTimeEquals("secret-token", "secret-token"));
  EXPECT_FALSE(constantTimeEquals("secret-token", "secret-tokem"));
  EXPECT_FALSE(constantTimeEquals("secret", "secret-token"));
  EXPECT_TRUE(constantTimeEquals("", ""));
}
