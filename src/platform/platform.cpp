// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Платформенная специфика изолирована здесь: остальной код не использует
// #ifdef _WIN32 напрямую.
//
// ==============================================================================

#include "dirscan/platform.hpp"

#include <chrono>
#include <cstdio>
#include <stdexcept>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace dirscan::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: конвертируем UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

namespace {

/// localtime без гонок: localtime_s на Windows, localtime_r на Unix
bool to_local_tm(std::time_t t, std::tm& out) {
#ifdef _WIN32
    return localtime_s(&out, &t) == 0;
#else
    return localtime_r(&t, &out) != nullptr;
#endif
}

}  // namespace

std::time_t file_time_to_time_t(std::filesystem::file_time_type ft) {
    // В C++17 у file_clock нет переносимого to_sys(): переносим смещение
    // относительно текущего момента обоих часов
    auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ft - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::system_clock::to_time_t(sys);
}

std::string format_local_time(std::time_t t) {
    std::tm tm{};
    if (!to_local_tm(t, tm)) {
        throw std::runtime_error("timestamp is out of range for the local time zone");
    }
    char buf[32];
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    if (n == 0) {
        throw std::runtime_error("failed to format timestamp");
    }
    return std::string(buf, n);
}

std::string now_log_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::string result = format_local_time(std::chrono::system_clock::to_time_t(now));
    char frac[8];
    std::snprintf(frac, sizeof(frac), ",%03d", static_cast<int>(ms.count()));
    result += frac;
    return result;
}

}  // namespace dirscan::platform
