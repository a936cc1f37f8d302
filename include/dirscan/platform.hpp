// ==============================================================================
// dirscan/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Время модификации файлов и форматирование локального времени
//
// Вся платформенная специфика (#ifdef _WIN32) изолирована в platform.cpp.
//
// ==============================================================================

#ifndef DIRSCAN_PLATFORM_HPP
#define DIRSCAN_PLATFORM_HPP

#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>

namespace dirscan::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить путь из строки UTF-8 (argv, конфигурация)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути (для логов и отчётов)
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// Перевести время файловой системы в time_t (секундная точность)
std::time_t file_time_to_time_t(std::filesystem::file_time_type ft);

/// Форматировать локальное время: "YYYY-MM-DD HH:MM:SS"
/// @throws std::runtime_error если время не представимо в локальной зоне
std::string format_local_time(std::time_t t);

/// Текущее локальное время для лог-файла: "YYYY-MM-DD HH:MM:SS,mmm"
std::string now_log_timestamp();

}  // namespace dirscan::platform

#endif  // DIRSCAN_PLATFORM_HPP
