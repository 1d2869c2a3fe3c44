#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include "chunker/cli/cli.hpp"
#include "chunker/manifest/manifest.hpp"
#include "test_utils.hpp"

using namespace chunker::cli;

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::ostringstream out;
  std::ostringstream err;

  void SetUp() override {
    test_dir = make_test_dir("cli_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
  }

  void TearDown() override {
    boost::log::core::get()->remove_all_sinks();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  int run(const std::vector<std::string>& args) {
    out.str("");
    err.str("");
    CLI cli(out, err);
    return cli.run(args);
  }

  std::string path(const std::string& name) const {
    return (test_dir / name).string();
  }

  // Chunks a three-chunk text file into test_dir/chunks and returns the folder
  std::string chunk_sample() {
    write_bytes(test_dir / "sample.txt", compressible_bytes(2500));
    EXPECT_EQ(run({"chunk", path("sample.txt"), "--out", path("chunks"), "--chunk", "1024"}), EXIT_OK)
      << err.str();
    return path("chunks");
  }
};

TEST_F(CLITest, HelpPrintsUsage) {
  EXPECT_EQ(run({"--help"}), EXIT_OK);
  EXPECT_NE(out.str().find("Usage:"), std::string::npos);
  EXPECT_NE(out.str().find("rebuild <folder>"), std::string::npos);

  EXPECT_EQ(run({"verify", "-h"}), EXIT_OK);
}

TEST_F(CLITest, UsageErrorsExitWithOne) {
  const std::vector<std::vector<std::string>> bad_invocations = {
    {},
    {"explode", "file"},
    {"chunk"},
    {"chunk", "a", "b"},
    {"chunk", "file", "--level"},
    {"chunk", "file", "--level", "12"},
    {"chunk", "file", "--level", "six"},
    {"chunk", "file", "--chunk", "0"},
    {"chunk", "file", "--chunk", "-5"},
    {"chunk", "file", "--chunk", "10k"},
    {"chunk", "file", "--min-gain", "1.0"},
    {"chunk", "file", "--min-gain", "-0.1"},
    {"chunk", "file", "--bogus", "1"},
    {"rebuild", "folder"},
    {"verify", "folder", "--chunk", "1024"},
    {"stats", "folder", "--out", "x"},
    {"verify", "folder", "--log-level", "loud"}
  };

  for (const auto& args : bad_invocations) {
    std::string joined;
    for (const auto& arg : args) {
      joined += arg + " ";
    }
    EXPECT_EQ(run(args), EXIT_ERROR) << "Arguments: " << joined;
    EXPECT_EQ(err.str().rfind("ERROR: ", 0), 0u) << "Arguments: " << joined;
    EXPECT_NE(err.str().find("Usage:"), std::string::npos) << "Arguments: " << joined;
  }
}

TEST_F(CLITest, ParseCommandLineOptions) {
  CommandLine parsed = parse_command_line({
    "--log-level", "debug", "chunk", "input.bin", "--chunk=4096", "--level", "9",
    "--min-gain", "0.25", "--out", "dest"
  });

  EXPECT_EQ(parsed.command, "chunk");
  ASSERT_EQ(parsed.positional.size(), 1u);
  EXPECT_EQ(parsed.positional[0], "input.bin");
  EXPECT_EQ(parsed.chunk_options.chunk_size, 4096u);
  EXPECT_EQ(parsed.chunk_options.compression_level, 9);
  EXPECT_EQ(parsed.chunk_options.min_gain_ratio, 0.25);
  ASSERT_TRUE(parsed.chunk_options.out_dir.has_value());
  EXPECT_EQ(*parsed.chunk_options.out_dir, std::filesystem::path("dest"));
  EXPECT_EQ(parsed.log_config.min_level, boost::log::trivial::debug);
}

TEST_F(CLITest, ParseCommandLineDefaults) {
  CommandLine parsed = parse_command_line({"chunk", "input.bin"});
  EXPECT_FALSE(parsed.chunk_options.out_dir.has_value());
  EXPECT_EQ(parsed.chunk_options.chunk_size, chunker::engine::DEFAULT_CHUNK_SIZE);
  EXPECT_EQ(parsed.chunk_options.compression_level, chunker::engine::DEFAULT_COMPRESSION_LEVEL);
  EXPECT_EQ(parsed.chunk_options.min_gain_ratio, chunker::engine::DEFAULT_MIN_GAIN_RATIO);
  EXPECT_EQ(parsed.log_config.min_level, boost::log::trivial::warning);
  EXPECT_TRUE(parsed.log_config.log_file.empty());
}

TEST_F(CLITest, ChunkVerifyRebuildStats) {
  std::string folder = chunk_sample();
  EXPECT_NE(out.str().find("OK: chunks in " + folder), std::string::npos);
  EXPECT_NE(out.str().find("OK: manifest at "), std::string::npos);
  EXPECT_TRUE(std::filesystem::exists(chunker::manifest::manifest_path(folder)));

  EXPECT_EQ(run({"verify", folder}), EXIT_OK) << err.str();
  EXPECT_EQ(out.str().rfind("OK: intact | chunks=3 | ratio=0.", 0), 0u) << out.str();
  EXPECT_NE(out.str().find(" | min_gain=0.02\n"), std::string::npos) << out.str();

  EXPECT_EQ(run({"rebuild", folder, "--out", path("restored.txt")}), EXIT_OK) << err.str();
  EXPECT_EQ(out.str(), "OK: rebuilt at " + path("restored.txt") + "\n");
  EXPECT_EQ(read_bytes(test_dir / "restored.txt"), read_bytes(test_dir / "sample.txt"));

  EXPECT_EQ(run({"stats", folder}), EXIT_OK) << err.str();
  EXPECT_EQ(out.str().rfind("STATS: chunks_total=3 raw=", 0), 0u) << out.str();
  EXPECT_NE(out.str().find(" chunk_size=1024 size_raw=2500 "), std::string::npos) << out.str();
  EXPECT_EQ(out.str().find("missing="), std::string::npos);
}

TEST_F(CLITest, VerifyFailureExitsWithTwo) {
  std::string folder = chunk_sample();
  std::filesystem::path first_chunk = std::filesystem::path(folder) / "sample.part000000.gz";
  ASSERT_TRUE(std::filesystem::exists(first_chunk));

  chunker::Bytes data = read_bytes(first_chunk);
  data[data.size() / 2] ^= 0x01;
  write_bytes(first_chunk, data);

  EXPECT_EQ(run({"verify", folder}), EXIT_VERIFY_FAILED);
  EXPECT_EQ(out.str(), "FAIL: chunk 0: stored hash mismatch\n");

  // rebuild reports the same problem as a hard error
  EXPECT_EQ(run({"rebuild", folder, "--out", path("bad.txt")}), EXIT_ERROR);
  EXPECT_NE(err.str().find("ERROR: Integrity error: chunk 0: stored hash mismatch"), std::string::npos)
    << err.str();
  EXPECT_FALSE(std::filesystem::exists(test_dir / "bad.txt"));
}

TEST_F(CLITest, StatsShowsMissingChunks) {
  std::string folder = chunk_sample();
  std::filesystem::remove(std::filesystem::path(folder) / "sample.part000001.gz");

  EXPECT_EQ(run({"stats", folder}), EXIT_OK);
  EXPECT_NE(out.str().find(" missing=1\n"), std::string::npos) << out.str();
}

TEST_F(CLITest, EngineErrorsExitWithOne) {
  EXPECT_EQ(run({"chunk", path("absent.bin")}), EXIT_ERROR);
  EXPECT_NE(err.str().find("ERROR: File not found: "), std::string::npos) << err.str();

  EXPECT_EQ(run({"verify", test_dir.string()}), EXIT_ERROR);
  EXPECT_NE(err.str().find("ERROR: Manifest missing: "), std::string::npos) << err.str();
  EXPECT_TRUE(out.str().empty());
}
