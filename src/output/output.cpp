// ==============================================================================
// output.cpp - Пользовательский вывод и диагностика
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr и в лог-файл.
// Байты первичны: std::endl не используется, буферы сбрасываются явно.
//
// ==============================================================================

#include "dirscan/output.hpp"

#include "dirscan/platform.hpp"

#include <cctype>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <system_error>

namespace dirscan::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

struct LevelStyle {
    const char* prefix;
    Color color;
};

LevelStyle level_style(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return {"[*] ", Color::Cyan};
    case LogLevel::Info:
        return {"[+] ", Color::Green};
    case LogLevel::Warning:
        return {"[!] ", Color::Yellow};
    case LogLevel::Error:
        return {"[x] ", Color::Red};
    case LogLevel::Critical:
        return {"[#] ", Color::Magenta};
    }
    return {"[+] ", Color::Default};
}

}  // namespace

// ----------------------------------------------------------------------------
// LogLevel
// ----------------------------------------------------------------------------

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Critical:
        return "CRITICAL";
    }
    return "INFO";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    auto start = name.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return std::nullopt;
    }
    auto end = name.find_last_not_of(" \t\r\n");
    name = name.substr(start, end - start + 1);

    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "DEBUG") {
        return LogLevel::Debug;
    }
    if (upper == "INFO") {
        return LogLevel::Info;
    }
    if (upper == "WARNING") {
        return LogLevel::Warning;
    }
    if (upper == "ERROR") {
        return LogLevel::Error;
    }
    if (upper == "CRITICAL") {
        return LogLevel::Critical;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file(*config_.output_path);
    }
    if (config_.log_path.has_value()) {
        open_log_file(*config_.log_path);
    }
}

Writer::~Writer() {
    close_output_file();
    close_log_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    // stdout с output_file: пишем в файл
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

bool Writer::enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(config_.level);
}

void Writer::log(LogLevel level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    // Лог-файл получает всё, что прошло фильтр уровня, независимо от quiet
    append_log_file(level, message);

    // Ошибки печатаются всегда, остальное подавляется при --quiet
    bool always = level == LogLevel::Error || level == LogLevel::Critical;
    if (config_.quiet && !always) {
        return;
    }

    LevelStyle style = level_style(level);
    write_prefix(style.prefix, style.color);
    write_line(Stream::Stderr, message);
}

void Writer::write_prefix(std::string_view prefix, Color color) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
}

void Writer::append_log_file(LogLevel level, std::string_view message) {
    if (log_file_ == nullptr) {
        return;
    }
    std::string line = format_log_line(platform::now_log_timestamp(), level, message);
    line += '\n';
    std::fwrite(line.data(), 1, line.size(), log_file_);
    std::fflush(log_file_);
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
    }
}

bool Writer::open_output_file(const std::filesystem::path& path) {
    close_output_file();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif
    if (output_file_ != nullptr) {
        config_.output_path = path;
    }

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

bool Writer::open_log_file(const std::filesystem::path& path) {
    close_log_file();

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

#ifdef _WIN32
    log_file_ = _wfopen(path.c_str(), L"ab");
#else
    log_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "ab");
#endif
    if (log_file_ != nullptr) {
        config_.log_path = path;
    }
    return log_file_ != nullptr;
}

void Writer::close_log_file() {
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
        std::fclose(log_file_);
        log_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_log_line(std::string_view timestamp, LogLevel level, std::string_view message) {
    std::string line(timestamp);
    line += " - ";
    line += log_level_name(level);
    line += " - ";
    line.append(message);
    return line;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace dirscan::output
