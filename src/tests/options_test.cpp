#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "config/options.hpp"

using namespace wallace::config;

namespace {

ProgramOptions parse(std::vector<const char*> args, std::ostream& err) {
  args.insert(args.begin(), "wallace");
  return parse_command_line(static_cast<int>(args.size()), args.data(), err);
}

} // namespace

TEST(OptionsTest, Defaults) {
  std::ostringstream err;
  auto options = parse({"-v", "/srv/a"}, err);

  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.volumes, std::vector<std::string>{"/srv/a"});
  EXPECT_FALSE(options.create);
  EXPECT_EQ(options.log_file, "wallace.log");
  EXPECT_EQ(options.log_level, boost::log::trivial::info);
  EXPECT_TRUE(err.str().empty());
}

TEST(OptionsTest, VolumesKeepCommandLineOrder) {
  std::ostringstream err;
  auto options = parse({"--volume", "/b", "-v", "/a", "--create",
                        "--log-file", "/tmp/w.log", "--log-level", "debug"}, err);

  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.volumes, (std::vector<std::string>{"/b", "/a"}));
  EXPECT_TRUE(options.create);
  EXPECT_EQ(options.log_file, "/tmp/w.log");
  EXPECT_EQ(options.log_level, boost::log::trivial::debug);
}

TEST(OptionsTest, RequiresVolume) {
  std::ostringstream err;
  auto options = parse({"--create"}, err);

  EXPECT_FALSE(options.valid);
  EXPECT_NE(err.str().find("At least one volume"), std::string::npos);
  EXPECT_NE(err.str().find("Usage:"), std::string::npos);
}

TEST(OptionsTest, RejectsUnknownFlag) {
  std::ostringstream err;
  EXPECT_FALSE(parse({"-v", "/a", "--port", "3000"}, err).valid);
  EXPECT_NE(err.str().find("Unknown argument: --port"), std::string::npos);
}

TEST(OptionsTest, RejectsMissingValue) {
  std::ostringstream err;
  EXPECT_FALSE(parse({"-v"}, err).valid);
  EXPECT_NE(err.str().find("Missing value for -v"), std::string::npos);
}

TEST(OptionsTest, RejectsBadLogLevel) {
  std::ostringstream err;
  EXPECT_FALSE(parse({"-v", "/a", "--log-level", "loud"}, err).valid);
  EXPECT_NE(err.str().find("Invalid log level: loud"), std::string::npos);
}
