// ==============================================================================
// dirscan/paths.hpp - Разрешение и проверка путей
// ==============================================================================
//
// Назначение:
// - Разрешение относительного пути цели относительно базовой директории
// - Проверка существования пути ожидаемого типа (файл / директория)
// - Создание отсутствующей директории по запросу
//
// Ошибки пути фатальны для запуска: сканирование не начинается.
//
// ==============================================================================

#ifndef DIRSCAN_PATHS_HPP
#define DIRSCAN_PATHS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace dirscan::io {

// ----------------------------------------------------------------------------
// Ожидаемый тип пути
// ----------------------------------------------------------------------------

enum class ExpectedType { File, Directory };

// ----------------------------------------------------------------------------
// PathError - ошибки проверки путей
// ----------------------------------------------------------------------------

enum class PathErrorKind {
    NotADirectory,        // ожидалась директория
    FileNotFound,         // ожидался файл
    InvalidExpectedType,  // тип не "file" и не "dir"
    IoError               // ошибка файловой системы (создание, stat)
};

class PathError : public std::runtime_error {
public:
    PathError(PathErrorKind kind, const std::string& message, std::string path = {})
        : std::runtime_error(message), kind_(kind), path_(std::move(path)) {}

    PathErrorKind kind() const { return kind_; }
    const std::string& path() const { return path_; }

private:
    PathErrorKind kind_;
    std::string path_;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Разрешить relative относительно base
///
/// Результат абсолютный, символические ссылки существующей части пути
/// разрешены, остаток нормализован ("a/../b" -> "b").
/// Абсолютный relative имеет приоритет над base.
/// @throws PathError(IoError)
std::filesystem::path resolve_path(const std::filesystem::path& base,
                                   const std::filesystem::path& relative);

/// Разобрать строковый тип: "file" или "dir"
/// @throws PathError(InvalidExpectedType)
ExpectedType expected_type_from_string(std::string_view type);

/// Проверить, что path существует и имеет ожидаемый тип
///
/// - Directory: при отсутствии и create_if_missing=true создаётся (с родителями),
///   иначе PathError(NotADirectory)
/// - File: PathError(FileNotFound) если не обычный файл
///
/// @return true при успехе
bool ensure_exists(const std::filesystem::path& path, ExpectedType expected,
                   bool create_if_missing = false);

}  // namespace dirscan::io

#endif  // DIRSCAN_PATHS_HPP
