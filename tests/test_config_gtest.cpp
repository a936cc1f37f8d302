// ==============================================================================
// test_config_gtest.cpp - Тесты загрузки конфигурации (GoogleTest)
// ==============================================================================
//
// config::load: создание по умолчанию, JSON/YAML, приведение типов, ошибки
//
// ==============================================================================

#include "dirscan/config.hpp"
#include "dirscan/output.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace dirscan::config::test {

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("dirscan_config_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path write_config(const std::string& name, const std::string& content) {
        std::filesystem::path path = test_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

// ==============================================================================
// Отсутствующий файл
// ==============================================================================

TEST_F(ConfigTest, Load_MissingFile_CreatesDefault) {
    // Arrange
    std::filesystem::path path = test_dir_ / "config" / "config.json";

    // Act
    ConfigResult result = load(path);

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.config.target_folder, "data");
    EXPECT_EQ(result.config.large_file_threshold_mb, 10);
    EXPECT_EQ(result.config.log_level, output::LogLevel::Debug);

    ASSERT_TRUE(std::filesystem::exists(path));
    rapidjson::Document doc;
    doc.Parse(read_file(path).c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["target_folder"].GetString(), "data");
    EXPECT_EQ(doc["large_file_threshold_mb"].GetInt64(), 10);
    EXPECT_STREQ(doc["log_level"].GetString(), "DEBUG");
}

TEST_F(ConfigTest, Load_MissingFile_SecondLoadReadsCreatedFile) {
    std::filesystem::path path = test_dir_ / "config.json";

    ConfigResult first = load(path);
    ConfigResult second = load(path);

    ASSERT_TRUE(first.ok);
    ASSERT_TRUE(second.ok);
    EXPECT_EQ(second.config.target_folder, first.config.target_folder);
    EXPECT_EQ(second.config.large_file_threshold_mb, first.config.large_file_threshold_mb);
    EXPECT_EQ(second.config.log_level, first.config.log_level);
}

// ==============================================================================
// JSON
// ==============================================================================

TEST_F(ConfigTest, Load_ValidJson_ReadsAllFields) {
    auto path = write_config("c.json", R"({
  "target_folder": "downloads",
  "large_file_threshold_mb": 50,
  "log_level": "warning"
})");

    ConfigResult result = load(path);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.config.target_folder, "downloads");
    EXPECT_EQ(result.config.large_file_threshold_mb, 50);
    EXPECT_EQ(result.config.log_level, output::LogLevel::Warning);
}

TEST_F(ConfigTest, Load_MissingThreshold_DefaultsToTen) {
    auto path = write_config("c.json", R"({"target_folder": "data", "log_level": "INFO"})");

    ConfigResult result = load(path);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.config.large_file_threshold_mb, 10);
}

TEST_F(ConfigTest, Load_ThresholdAsString_Coerced) {
    auto path = write_config(
        "c.json", R"({"target_folder": "data", "large_file_threshold_mb": " 25 ", "log_level": "INFO"})");

    ConfigResult result = load(path);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.config.large_file_threshold_mb, 25);
}

TEST_F(ConfigTest, Load_ThresholdAsFloat_Truncated) {
    auto path = write_config(
        "c.json", R"({"target_folder": "data", "large_file_threshold_mb": 7.9, "log_level": "INFO"})");

    ConfigResult result = load(path);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.config.large_file_threshold_mb, 7);
}

TEST_F(ConfigTest, Load_ThresholdNotNumeric_TypeError) {
    auto path = write_config(
        "c.json", R"({"target_folder": "data", "large_file_threshold_mb": "ten", "log_level": "INFO"})");

    ConfigResult result = load(path);

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ConfigErrorKind::TypeError);
    EXPECT_NE(result.error.message.find("large_file_threshold_mb"), std::string::npos);
}

TEST_F(ConfigTest, Load_ThresholdBool_TypeError) {
    auto path = write_config(
        "c.json", R"({"target_folder": "data", "large_file_threshold_mb": true, "log_level": "INFO"})");

    ConfigResult result = load(path);

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ConfigErrorKind::TypeError);
}

TEST_F(ConfigTest, Load_NegativeThreshold_TypeError) {
    auto path = write_config(
        "c.json", R"({"target_folder": "data", "large_file_threshold_mb": -1, "log_level": "INFO"})");

    ConfigResult result = load(path);

    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("must not be negative"), std::string::npos);
}

TEST_F(ConfigTest, Load_MissingTargetFolder_TypeError) {
    auto path = write_config("c.json", R"({"log_level": "INFO"})");

    ConfigResult result = load(path);

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ConfigErrorKind::TypeError);
    EXPECT_NE(result.error.message.find("target_folder"), std::string::npos);
}

TEST_F(ConfigTest, Load_MissingLogLevel_TypeError) {
    auto path = write_config("c.json", R"({"target_folder": "data"})");

    ConfigResult result = load(path);

    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("log_level"), std::string::npos);
}

TEST_F(ConfigTest, Load_RootNotObject_TypeError) {
    auto path = write_config("c.json", "[1, 2, 3]");

    ConfigResult result = load(path);

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ConfigErrorKind::TypeError);
}

TEST_F(ConfigTest, Load_InvalidJson_ParseError) {
    auto path = write_config("c.json", R"({"target_folder": "data",)");

    ConfigResult result = load(path);

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ConfigErrorKind::ParseError);
    EXPECT_NE(result.error.message.find("not valid JSON"), std::string::npos);
    EXPECT_NE(result.error.format().find("failed to load config '"), std::string::npos);
}

TEST_F(ConfigTest, Load_UnsupportedLogLevel_FallsBackToInfoWithWarning) {
    auto path = write_config(
        "c.json", R"({"target_folder": "data", "large_file_threshold_mb": 1, "log_level": "verbose"})");
    std::filesystem::path log_path = test_dir_ / "app.log";
    output::OutputConfig out_cfg;
    out_cfg.quiet = true;
    output::Writer writer(out_cfg);
    writer.open_log_file(log_path);

    ConfigResult result = load(path, &writer);
    writer.close_log_file();

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.config.log_level, output::LogLevel::Info);
    EXPECT_NE(read_file(log_path).find("Unsupported log_level 'VERBOSE'. Falling back to 'INFO'."),
              std::string::npos);
}

// ==============================================================================
// YAML
// ==============================================================================

TEST_F(ConfigTest, Load_Yaml_ReadsAllFields) {
    auto path = write_config("c.yaml",
                             "target_folder: incoming\n"
                             "large_file_threshold_mb: 3\n"
                             "log_level: error\n");

    ConfigResult result = load(path);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.config.target_folder, "incoming");
    EXPECT_EQ(result.config.large_file_threshold_mb, 3);
    EXPECT_EQ(result.config.log_level, output::LogLevel::Error);
}

TEST_F(ConfigTest, Load_YamlQuotedNumber_StaysStringAndIsCoerced) {
    auto path = write_config("c.yml",
                             "target_folder: '123'\n"
                             "large_file_threshold_mb: \"15\"\n"
                             "log_level: DEBUG\n");

    ConfigResult result = load(path);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.config.target_folder, "123");
    EXPECT_EQ(result.config.large_file_threshold_mb, 15);
}

TEST_F(ConfigTest, Load_InvalidYaml_ParseError) {
    auto path = write_config("c.yaml", "target_folder: [unclosed\n");

    ConfigResult result = load(path);

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ConfigErrorKind::ParseError);
}

// ==============================================================================
// to_json
// ==============================================================================

TEST(ConfigJsonTest, ToJson_PrettyWithTwoSpaceIndent) {
    Config cfg;
    cfg.target_folder = "data";
    cfg.large_file_threshold_mb = 10;
    cfg.log_level = output::LogLevel::Debug;

    std::string json = to_json(cfg);

    EXPECT_EQ(json,
              "{\n"
              "  \"target_folder\": \"data\",\n"
              "  \"large_file_threshold_mb\": 10,\n"
              "  \"log_level\": \"DEBUG\"\n"
              "}");
}

}  // namespace dirscan::config::test
