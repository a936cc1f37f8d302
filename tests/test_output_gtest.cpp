// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// output::Writer: префиксы, уровни, quiet, лог-файл, JSON
//
// ==============================================================================

#include "dirscan/output.hpp"
#include "dirscan/platform.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace dirscan::output::test {

// ==============================================================================
// Базовый вывод
// ==============================================================================

TEST(OutputTest, Writer_DefaultConfig_CreatesSuccessfully) {
    OutputConfig config;
    EXPECT_NO_THROW({ Writer writer(config); });
}

TEST(OutputTest, Writer_Write_DoesNotThrow) {
    OutputConfig config;
    Writer writer(config);
    EXPECT_NO_THROW({ writer.write(Stream::Stdout, "Raw output"); });
    EXPECT_NO_THROW({ writer.write_line(Stream::Stdout, "Line output"); });
}

// ==============================================================================
// Форматирование префиксов
// ==============================================================================

TEST(OutputTest, Log_ConsolePrefixesPerLevel) {
    // Arrange: stderr перехвачен, поэтому не TTY и без ANSI кодов
    OutputConfig config;
    config.level = LogLevel::Debug;
    Writer writer(config);

    // Act
    ::testing::internal::CaptureStderr();
    writer.info("info message");
    writer.warn("warning message");
    writer.error("error message");
    writer.critical("critical message");
    writer.debug("debug message");
    writer.flush();
    std::string captured = ::testing::internal::GetCapturedStderr();

    // Assert
    EXPECT_EQ(captured,
              "[+] info message\n"
              "[!] warning message\n"
              "[x] error message\n"
              "[#] critical message\n"
              "[*] debug message\n");
}

TEST(OutputTest, Log_QuietKeepsOnlyErrorsOnConsole) {
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);

    ::testing::internal::CaptureStderr();
    writer.info("hidden info");
    writer.warn("hidden warning");
    writer.error("shown error");
    writer.flush();
    std::string captured = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(captured, "[x] shown error\n");
}

TEST(OutputTest, FormatLogLine_TimestampLevelMessage) {
    EXPECT_EQ(format_log_line("2024-01-02 03:04:05,006", LogLevel::Warning, "careful"),
              "2024-01-02 03:04:05,006 - WARNING - careful");
}

// ==============================================================================
// Уровни
// ==============================================================================

TEST(OutputTest, LogLevelName_AllLevels) {
    EXPECT_STREQ(log_level_name(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(log_level_name(LogLevel::Info), "INFO");
    EXPECT_STREQ(log_level_name(LogLevel::Warning), "WARNING");
    EXPECT_STREQ(log_level_name(LogLevel::Error), "ERROR");
    EXPECT_STREQ(log_level_name(LogLevel::Critical), "CRITICAL");
}

TEST(OutputTest, ParseLogLevel_CaseAndWhitespaceInsensitive) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("  Info "), LogLevel::Info);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("Critical"), LogLevel::Critical);
}

TEST(OutputTest, ParseLogLevel_Unsupported_Nullopt) {
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
    EXPECT_FALSE(parse_log_level("   ").has_value());
}

TEST(OutputTest, Enabled_FiltersBelowLevel) {
    OutputConfig config;
    config.level = LogLevel::Warning;
    Writer writer(config);

    EXPECT_FALSE(writer.enabled(LogLevel::Debug));
    EXPECT_FALSE(writer.enabled(LogLevel::Info));
    EXPECT_TRUE(writer.enabled(LogLevel::Warning));
    EXPECT_TRUE(writer.enabled(LogLevel::Critical));

    writer.set_level(LogLevel::Debug);
    EXPECT_TRUE(writer.enabled(LogLevel::Debug));
}

// ==============================================================================
// Лог-файл
// ==============================================================================

class OutputLogFileTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("dirscan_output_") + test_info->name() + "_" +
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
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(OutputLogFileTest, OpenLogFile_CreatesParentDirectory) {
    // Arrange
    std::filesystem::path log_path = test_dir_ / "logs" / "app.log";
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);

    // Act
    bool opened = writer.open_log_file(log_path);

    // Assert
    EXPECT_TRUE(opened);
    EXPECT_TRUE(std::filesystem::exists(log_path));
}

TEST_F(OutputLogFileTest, Log_QuietStillWritesLogFile) {
    std::filesystem::path log_path = test_dir_ / "app.log";
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);
    ASSERT_TRUE(writer.open_log_file(log_path));

    writer.info("hello info");
    writer.warn("hello warning");
    writer.close_log_file();

    std::string content = read_file(log_path);
    EXPECT_NE(content.find(" - INFO - hello info\n"), std::string::npos);
    EXPECT_NE(content.find(" - WARNING - hello warning\n"), std::string::npos);
}

TEST_F(OutputLogFileTest, Log_BelowLevelNotWritten) {
    std::filesystem::path log_path = test_dir_ / "app.log";
    OutputConfig config;
    config.quiet = true;
    config.level = LogLevel::Info;
    Writer writer(config);
    ASSERT_TRUE(writer.open_log_file(log_path));

    writer.debug("hidden debug");
    writer.info("visible info");
    writer.close_log_file();

    std::string content = read_file(log_path);
    EXPECT_EQ(content.find("hidden debug"), std::string::npos);
    EXPECT_NE(content.find("visible info"), std::string::npos);
}

TEST_F(OutputLogFileTest, OpenLogFile_AppendsAcrossWriters) {
    std::filesystem::path log_path = test_dir_ / "app.log";
    OutputConfig config;
    config.quiet = true;

    {
        Writer first(config);
        ASSERT_TRUE(first.open_log_file(log_path));
        first.info("first run");
    }
    {
        Writer second(config);
        ASSERT_TRUE(second.open_log_file(log_path));
        second.info("second run");
    }

    std::string content = read_file(log_path);
    auto first_pos = content.find("first run");
    auto second_pos = content.find("second run");
    ASSERT_NE(first_pos, std::string::npos);
    ASSERT_NE(second_pos, std::string::npos);
    EXPECT_LT(first_pos, second_pos);
}

TEST_F(OutputLogFileTest, OpenOutputFile_StdoutRedirected) {
    std::filesystem::path out_path = test_dir_ / "summary.json";
    std::filesystem::create_directories(test_dir_);
    OutputConfig config;
    Writer writer(config);
    ASSERT_TRUE(writer.open_output_file(out_path));

    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("total", 3, doc.GetAllocator());
    writer.write_json_pretty(doc);
    writer.close_output_file();

    EXPECT_EQ(read_file(out_path), "{\n  \"total\": 3\n}\n");
}

TEST(OutputTest, LogFileTimestamp_Format) {
    // "YYYY-MM-DD HH:MM:SS,mmm"
    std::string ts = platform::now_log_timestamp();
    ASSERT_EQ(ts.size(), 23u);
    EXPECT_EQ(ts[19], ',');
}

// ==============================================================================
// JSON
// ==============================================================================

TEST(OutputTest, WriteJsonPretty_DoesNotThrow) {
    OutputConfig config;
    Writer writer(config);

    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("pretty", true, doc.GetAllocator());

    EXPECT_NO_THROW({ writer.write_json_pretty(doc); });
}

// Одинаковые входы дают одинаковые выходы
TEST(OutputTest, Json_Deterministic) {
    rapidjson::Document doc1;
    doc1.SetObject();
    doc1.AddMember("a", 1, doc1.GetAllocator());
    doc1.AddMember("b", 2, doc1.GetAllocator());

    rapidjson::Document doc2;
    doc2.SetObject();
    doc2.AddMember("a", 1, doc2.GetAllocator());
    doc2.AddMember("b", 2, doc2.GetAllocator());

    rapidjson::StringBuffer buf1, buf2;
    rapidjson::Writer<rapidjson::StringBuffer> w1(buf1), w2(buf2);
    doc1.Accept(w1);
    doc2.Accept(w2);

    EXPECT_EQ(std::string(buf1.GetString()), std::string(buf2.GetString()));
}

// ==============================================================================
// Цвета
// ==============================================================================

TEST(OutputTest, AnsiColorCode_PerColor) {
    EXPECT_EQ(ansi_color_code(Color::Red), "\x1b[31m");
    EXPECT_EQ(ansi_color_code(Color::Yellow), "\x1b[33m");
    EXPECT_TRUE(ansi_color_code(Color::Default).empty());
}

}  // namespace dirscan::output::test
