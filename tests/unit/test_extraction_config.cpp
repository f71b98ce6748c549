/**
 * @file test_extraction_config.cpp
 * @brief Unit tests for environment overrides of ExtractionConfig
 */

#include <gtest/gtest.h>
#include <pipeline/extraction_config.hpp>
#include <cstdlib>

using namespace YangKeys;

class ExtractionConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        unsetenv("YANGKEYS_EXTENSION");
        unsetenv("YANGKEYS_SEPARATOR");
        unsetenv("YANGKEYS_SAMPLE_BYTES");
        unsetenv("YANGKEYS_TMPDIR");
    }
};

TEST_F(ExtractionConfigTest, Defaults) {
    ExtractionConfig config = ExtractionConfig::load_from_env();
    EXPECT_EQ(config.extension, ".yang");
    EXPECT_EQ(config.separator, '-');
    EXPECT_EQ(config.sample_bytes, 500u);
    EXPECT_TRUE(config.scratch_parent.empty());
}

TEST_F(ExtractionConfigTest, Overrides) {
    setenv("YANGKEYS_EXTENSION", ".yin", 1);
    setenv("YANGKEYS_SEPARATOR", "_", 1);
    setenv("YANGKEYS_SAMPLE_BYTES", "64", 1);
    setenv("YANGKEYS_TMPDIR", "/var/tmp", 1);

    ExtractionConfig config = ExtractionConfig::load_from_env();
    EXPECT_EQ(config.extension, ".yin");
    EXPECT_EQ(config.separator, '_');
    EXPECT_EQ(config.sample_bytes, 64u);
    EXPECT_EQ(config.scratch_parent, std::filesystem::path("/var/tmp"));
}

TEST_F(ExtractionConfigTest, EmptyTmpdirMeansSystemDefault) {
    setenv("YANGKEYS_TMPDIR", "", 1);
    EXPECT_TRUE(ExtractionConfig::load_from_env().scratch_parent.empty());
}

TEST_F(ExtractionConfigTest, RejectsMalformedValues) {
    setenv("YANGKEYS_EXTENSION", "", 1);
    EXPECT_THROW(ExtractionConfig::load_from_env(), std::runtime_error);
    unsetenv("YANGKEYS_EXTENSION");

    setenv("YANGKEYS_SEPARATOR", "--", 1);
    EXPECT_THROW(ExtractionConfig::load_from_env(), std::runtime_error);
    setenv("YANGKEYS_SEPARATOR", "/", 1);
    EXPECT_THROW(ExtractionConfig::load_from_env(), std::runtime_error);
    unsetenv("YANGKEYS_SEPARATOR");

    for (const char* bad : {"", "abc", "12kb", "-5"}) {
        setenv("YANGKEYS_SAMPLE_BYTES", bad, 1);
        EXPECT_THROW(ExtractionConfig::load_from_env(), std::runtime_error) << bad;
    }
}
