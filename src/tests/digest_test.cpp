#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "volume/digest.hpp"
#include "volume/hash.hpp"

using namespace wallace::volume;

TEST(DigestTest, Sha256IncrementalMatchesOneShot) {
  const std::string text = "Hello, world!";
  Sha256Digest digest;

  digest.update(reinterpret_cast<const std::uint8_t*>(text.data()), 5);
  digest.update(reinterpret_cast<const std::uint8_t*>(text.data()) + 5, text.size() - 5);
  const Hash incremental(digest.finalize());

  EXPECT_EQ(incremental, Hash::compute(text));
}

TEST(DigestTest, FinalizeResetsForReuse) {
  Sha256Digest digest;
  const std::string text = "abc";

  digest.update(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
  const DigestBytes first = digest.finalize();
  digest.update(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
  const DigestBytes second = digest.finalize();

  EXPECT_EQ(first, second);
}

TEST(DigestTest, ResetDiscardsFedBytes) {
  Sha256Digest digest;
  const std::string junk = "junk";
  digest.update(reinterpret_cast<const std::uint8_t*>(junk.data()), junk.size());
  digest.reset();

  EXPECT_EQ(Hash(digest.finalize()).to_string(),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(DigestTest, DefaultFactoryProducesSha256) {
  auto digest = default_digest_factory()();
  ASSERT_NE(digest, nullptr);

  std::istringstream input("Hello, world!");
  EXPECT_EQ(Hash::compute(input, *digest).to_string(),
            "315f5bdb76d078c43b8ac0064e4a0164612b1fce77c869345bfc94c75894edd3");
}
