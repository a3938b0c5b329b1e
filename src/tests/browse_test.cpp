#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>
#include "browse/parsed_path.hpp"

using namespace wallace::browse;
using wallace::volume::Hash;

namespace {

const std::string kHex = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";

} // namespace

TEST(ParsedPathTest, RootForms) {
  for (std::string_view text : {"", "/", "//", "///"}) {
    auto parsed = ParsedPath::parse(text);
    ASSERT_TRUE(parsed.has_value()) << "'" << text << "'";
    EXPECT_EQ(*parsed, ParsedPath::root());
  }
}

TEST(ParsedPathTest, ObjectsForms) {
  for (std::string_view text : {"objects", "/objects", "/objects/", "//objects//"}) {
    auto parsed = ParsedPath::parse(text);
    ASSERT_TRUE(parsed.has_value()) << "'" << text << "'";
    EXPECT_EQ(*parsed, ParsedPath::objects());
  }
}

TEST(ParsedPathTest, ObjectPath) {
  auto parsed = ParsedPath::parse("/objects/" + kHex);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->kind, ParsedPath::Kind::ObjectsObject);
  ASSERT_TRUE(parsed->hash.has_value());
  EXPECT_EQ(parsed->hash->to_string(), kHex);
  EXPECT_EQ(parsed->to_string(), "/objects/" + kHex);
}

TEST(ParsedPathTest, RejectsUnknownPaths) {
  const std::vector<std::string> invalid = {
    "/other",
    "/Objects",
    "/objects/nothex",
    "/objects/" + kHex.substr(1),
    "/objects/" + std::string(64, 'A'),
    "/objects/" + kHex + "/extra",
    "/" + kHex,
  };
  for (const auto& text : invalid) {
    EXPECT_FALSE(ParsedPath::parse(text).has_value()) << text;
    EXPECT_THROW(ParsedPath::from_string(text), InvalidPath) << text;
  }
}

TEST(ParsedPathTest, FromComponentsIgnoresEmptyOnes) {
  auto parsed = ParsedPath::from_components({"", "objects", "", kHex, ""});
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, ParsedPath::object(Hash::from_string(kHex)));
  EXPECT_EQ(ParsedPath::from_components({}), ParsedPath::root());
}

TEST(ParsedPathTest, ToStringParsesBack) {
  const std::vector<ParsedPath> paths = {
    ParsedPath::root(),
    ParsedPath::objects(),
    ParsedPath::object(Hash::from_string(kHex)),
  };
  for (const auto& path : paths) {
    EXPECT_EQ(ParsedPath::from_string(path.to_string()), path);
  }
  EXPECT_EQ(ParsedPath::root().to_string(), "/");
  EXPECT_EQ(ParsedPath::objects().to_string(), "/objects");
}

TEST(ParsedPathTest, InvalidPathMessageNamesPath) {
  try {
    ParsedPath::from_string("/nope");
    FAIL() << "Expected InvalidPath";
  } catch (const InvalidPath& e) {
    EXPECT_NE(std::string(e.what()).find("/nope"), std::string::npos);
  }
}
