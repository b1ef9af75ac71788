#include "crypto/Alphabet.hpp"
#include "crypto/Cipher.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace sten;

namespace {
CipherError::Kind rejectionOf(const char *key) {
  try {
    Hill cipher(key);
  } catch (const CipherError &e) {
    return e.kind();
  }
  ADD_FAILURE() << "accepted key " << key;
  return CipherError::Kind::InvalidKey;
}
} // namespace

TEST(HillTest, SingleCharacterKeyMultiplies) {
  const Hill cipher("b"); // [11]
  EXPECT_EQ(cipher.order(), 1);
  EXPECT_EQ(cipher.determinant(), 11);
  EXPECT_EQ(cipher.encrypt("1"), "b");
  EXPECT_EQ(cipher.decrypt("b"), "1");
}

TEST(HillTest, PadsShortKeyWithCounter) {
  const Hill cipher("12"); // [[1 2] [0 1]]
  ASSERT_EQ(cipher.order(), 2);
  const cv::Mat1d &key = cipher.keyMatrix();
  EXPECT_EQ(key(0, 0), 1.0);
  EXPECT_EQ(key(0, 1), 2.0);
  EXPECT_EQ(key(1, 0), 0.0);
  EXPECT_EQ(key(1, 1), 1.0);
  EXPECT_EQ(cipher.determinant(), 1);
}

TEST(HillTest, EncryptsColumnVectors) {
  // [[1 2] [3 5]] * [10 11] = [32 85]
  const Hill cipher("1235");
  EXPECT_EQ(cipher.determinant(), -1);
  EXPECT_EQ(cipher.encrypt("ab"), "w\\");
  EXPECT_EQ(cipher.decrypt("w\\"), "ab");
}

TEST(HillTest, ThreeByThreeKeyRoundTrips) {
  const Hill cipher("GYBNQKURP");
  EXPECT_EQ(cipher.order(), 3);
  EXPECT_EQ(cipher.determinant(), 1953);

  const std::string text = "attack at dawn!";
  ASSERT_EQ(text.size() % 3, 0u);
  const std::string encrypted = cipher.encrypt(text);
  EXPECT_NE(encrypted, text);
  EXPECT_EQ(cipher.decrypt(encrypted), text);
}

TEST(HillTest, PartialBlockIsPaddedAndKeptOnDecrypt) {
  const Hill cipher("1235");
  const std::string encrypted = cipher.encrypt("abc");
  EXPECT_EQ(encrypted.size(), 4u);
  // Fill characters start at index 0 of the alphabet
  EXPECT_EQ(cipher.decrypt(encrypted), "abc0");
}

TEST(HillTest, DecryptKeepsPlaintextPrefixForAnyLength) {
  const Hill cipher("GYBNQKURP");
  const std::string text = "Pack my box with five dozen liquor jugs.";
  for (std::size_t length = 1; length <= text.size(); ++length) {
    const std::string plain = text.substr(0, length);
    const std::string encrypted = cipher.encrypt(plain);
    EXPECT_EQ(encrypted.size() % 3, 0u);
    EXPECT_TRUE(cipher.decrypt(encrypted).starts_with(plain)) << plain;
  }
}

TEST(HillTest, EmptyTextStaysEmpty) {
  const Hill cipher("1235");
  EXPECT_EQ(cipher.encrypt(""), "");
  EXPECT_EQ(cipher.decrypt(""), "");
}

TEST(HillTest, RejectsSingularKeys) {
  EXPECT_EQ(rejectionOf("0"), CipherError::Kind::NonInvertibleKey);
  EXPECT_EQ(rejectionOf("aaaa"), CipherError::Kind::NonInvertibleKey);
}

TEST(HillTest, RejectsDeterminantSharingFactorsWithAlphabet) {
  EXPECT_EQ(rejectionOf("a"), CipherError::Kind::KeyAlphabetNotCoprime);    // 10
  EXPECT_EQ(rejectionOf("abcd"), CipherError::Kind::KeyAlphabetNotCoprime); // -2
  EXPECT_EQ(rejectionOf("hello"), CipherError::Kind::KeyAlphabetNotCoprime);
}

TEST(HillTest, RejectsEmptyOrForeignKeys) {
  EXPECT_EQ(rejectionOf(""), CipherError::Kind::InvalidKey);
  EXPECT_EQ(rejectionOf("ab\x01"), CipherError::Kind::InvalidKey);
}

TEST(HillTest, FactoryPropagatesKeyErrors) {
  EXPECT_THROW(Cipher::create("Hill", "aaaa"), CipherError);
  EXPECT_TRUE(Cipher::acceptsKey("Hill", "aaaa"));
}
