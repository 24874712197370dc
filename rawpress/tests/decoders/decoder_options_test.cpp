#include "decoders/decoder_options.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace rawpress {
namespace {
class DecoderOptionsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("rawpress_options_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
            "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  auto Write(const std::string& name, const std::string& content) -> std::filesystem::path {
    const auto path = dir_ / name;
    std::ofstream(path) << content;
    return path;
  }

  std::filesystem::path dir_;
};

TEST_F(DecoderOptionsTest, Defaults) {
  DecoderOptions options;
  EXPECT_TRUE(options.use_rawspeed);
  EXPECT_EQ(options.max_raw_memory_mb, 1024u);
  EXPECT_NO_THROW(options.Validate());
}

TEST_F(DecoderOptionsTest, MissingKeysKeepDefaults) {
  DecoderOptions options;
  options.FromJson(nlohmann::json{{"use_rawspeed", false}});
  EXPECT_FALSE(options.use_rawspeed);
  EXPECT_EQ(options.max_raw_memory_mb, 1024u);

  DecoderOptions restored;
  restored.FromJson(options.ToJson());
  EXPECT_EQ(restored, options);
}

TEST_F(DecoderOptionsTest, ZeroMemoryLimitIsRejected) {
  DecoderOptions options;
  EXPECT_THROW(options.FromJson(nlohmann::json{{"max_raw_memory_mb", 0}}), std::invalid_argument);
}

TEST_F(DecoderOptionsTest, LoadFromFile) {
  const auto path    = Write("options.json", R"({"use_rawspeed": false, "max_raw_memory_mb": 512})");
  const auto options = DecoderOptions::LoadFromFile(path);
  EXPECT_FALSE(options.use_rawspeed);
  EXPECT_EQ(options.max_raw_memory_mb, 512u);
}

TEST_F(DecoderOptionsTest, UnreadableOrMalformedFilesThrow) {
  EXPECT_THROW(DecoderOptions::LoadFromFile(dir_ / "missing.json"), std::runtime_error);
  const auto path = Write("broken.json", "{\"use_rawspeed\": ");
  EXPECT_THROW(DecoderOptions::LoadFromFile(path), std::runtime_error);
}
}  // namespace
}  // namespace rawpress
