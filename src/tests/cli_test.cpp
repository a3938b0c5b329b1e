#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "cli/cli.hpp"
#include "test_utils.hpp"

using namespace wallace;

class CLITest : public VolumeTestBase {
protected:
  std::vector<volume::Volume> volumes;

  void SetUp() override {
    VolumeTestBase::SetUp();
    volumes.push_back(volume::Volume::open(volume1_path));
    volumes.push_back(volume::Volume::open(volume2_path));
  }

  std::string run_commands(const std::string& commands) {
    std::istringstream input(commands);
    std::ostringstream output;
    cli::CLI shell(volumes, input, output);
    shell.run();
    return output.str();
  }

  static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
  }
};

TEST_F(CLITest, RequiresAVolume) {
  std::vector<volume::Volume> none;
  std::istringstream input;
  std::ostringstream output;
  EXPECT_THROW({ cli::CLI shell(none, input, output); }, std::invalid_argument);
}

TEST_F(CLITest, HelpListsCommands) {
  const std::string output = run_commands("help\nquit\n");
  EXPECT_TRUE(contains(output, "Available commands:"));
  EXPECT_TRUE(contains(output, "insert <path>"));
  EXPECT_TRUE(contains(output, "verify <hash>"));
}

TEST_F(CLITest, InsertGoesToFirstVolume) {
  const std::string output = run_commands("insert " + regular1_path.string() + "\n");

  EXPECT_TRUE(contains(output, regular1_hash.to_string()));
  EXPECT_TRUE(volumes[0].contains(regular1_hash));
  EXPECT_FALSE(volumes[1].contains(regular1_hash));
}

TEST_F(CLITest, CatAndStatSearchAllVolumes) {
  volumes[1].insert_from_path(regular2_path);

  const std::string output = run_commands(
    "cat " + regular2_hash.to_string() + "\n" +
    "stat " + regular2_hash.to_string() + "\n");

  EXPECT_TRUE(contains(output, regular2_contents));
  EXPECT_TRUE(contains(output, regular2_hash.to_string() + " size 6 volume 1"));
}

TEST_F(CLITest, LsListsEveryVolume) {
  volumes[0].insert_from_path(regular1_path);
  volumes[1].insert_from_path(regular2_path);

  const std::string output = run_commands("ls\n");
  const auto first = output.find(regular1_hash.to_string());
  const auto second = output.find(regular2_hash.to_string());
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
}

TEST_F(CLITest, LsReportsBrokenVolumeAndContinues) {
  volumes[1].insert_from_path(regular2_path);
  std::filesystem::remove_all(volume1_path / "objects");

  const std::string output = run_commands("ls\n");
  EXPECT_TRUE(contains(output, "Error listing volume"));
  EXPECT_TRUE(contains(output, regular2_hash.to_string()));
}

TEST_F(CLITest, VerifyReportsResult) {
  volumes[0].insert_from_path(regular1_path);

  const std::string output = run_commands(
    "verify " + regular1_hash.to_string() + "\n" +
    "verify " + regular2_hash.to_string() + "\n");

  EXPECT_TRUE(contains(output, "OK " + regular1_hash.to_string()));
  EXPECT_TRUE(contains(output, "Object not found: " + regular2_hash.to_string()));
}

TEST_F(CLITest, ReportsErrors) {
  const std::string output = run_commands(
    "cat xyz\n"
    "insert " + fifo1_path.string() + "\n" +
    "frobnicate now\n"
    "cat\n");

  EXPECT_TRUE(contains(output, "Error reading object: Invalid hash: 'xyz'"));
  EXPECT_TRUE(contains(output, "Error inserting file: Not a regular file"));
  EXPECT_TRUE(contains(output, "Unknown command or invalid arguments, type 'help'"));
  EXPECT_TRUE(contains(output, "Invalid input. Usage: <command> [argument]"));
}

TEST_F(CLITest, QuitStopsReading) {
  const std::string output = run_commands("quit\ninsert " + regular1_path.string() + "\n");
  EXPECT_FALSE(volumes[0].contains(regular1_hash));
  EXPECT_EQ(output, "wallace> ");
}
