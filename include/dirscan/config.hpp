// ==============================================================================
// dirscan/config.hpp - Загрузка и валидация конфигурации
// ==============================================================================
//
// Назначение:
// - Значения по умолчанию (чистая функция, каждый вызов - новая копия)
// - Загрузка JSON (RapidJSON) или YAML (yaml-cpp) файла настроек
// - Создание файла со значениями по умолчанию, если он отсутствует
// - Валидация и приведение типов полей
//
// Формат файла:
//   {
//     "target_folder": "data",
//     "large_file_threshold_mb": 10,
//     "log_level": "DEBUG"
//   }
//
// ==============================================================================

#ifndef DIRSCAN_CONFIG_HPP
#define DIRSCAN_CONFIG_HPP

#include <dirscan/output.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace dirscan::config {

// ----------------------------------------------------------------------------
// Config - настройки запуска
// ----------------------------------------------------------------------------

struct Config {
    /// Директория сканирования (относительно базовой директории проекта)
    std::string target_folder;

    /// Порог "большого" файла в мегабайтах (строго больше)
    std::int64_t large_file_threshold_mb = 0;

    /// Уровень диагностики
    output::LogLevel log_level = output::LogLevel::Info;
};

/// Значения по умолчанию: target_folder="data", порог 10 MB, уровень DEBUG
Config default_config();

// ----------------------------------------------------------------------------
// ConfigError - ошибки загрузки
// ----------------------------------------------------------------------------

enum class ConfigErrorKind {
    IoError,     // не удалось прочитать/создать файл
    ParseError,  // файл не является валидным JSON/YAML
    TypeError    // поле отсутствует или имеет неверный тип
};

struct ConfigError {
    ConfigErrorKind kind = ConfigErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to load config '<path>' - <message>"
    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Загрузить конфигурацию
///
/// - Родительская директория создаётся при необходимости
/// - Отсутствующий файл создаётся со значениями по умолчанию (JSON)
/// - .yaml/.yml читаются через yaml-cpp, остальное - как JSON
/// - Неподдерживаемый log_level -> INFO с предупреждением в writer
///
/// @param writer Получатель диагностики (может быть nullptr)
ConfigResult load(const std::filesystem::path& path, output::Writer* writer = nullptr);

/// Сериализовать конфигурацию в pretty JSON (отступ 2 пробела)
std::string to_json(const Config& cfg);

}  // namespace dirscan::config

#endif  // DIRSCAN_CONFIG_HPP
