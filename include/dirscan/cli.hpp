// ==============================================================================
// dirscan/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef DIRSCAN_CLI_HPP
#define DIRSCAN_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace dirscan::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// scan - сканирование директории и отчёт
struct ScanCommand {
    std::optional<std::filesystem::path> folder;  // --folder (иначе из конфигурации)
    std::optional<std::uint64_t> threshold_mb;    // --threshold-mb (иначе из конфигурации)
    std::string report = "scan_report.md";        // --report
    std::optional<std::filesystem::path> config;  // --config
    std::optional<std::filesystem::path> base;    // --base (иначе текущая директория)
    std::optional<std::string> log_level;         // --log-level (уже проверен)
    bool json = false;                            // -j, --json
    std::optional<std::filesystem::path> output;  // -o, --output (stdout -> файл)
    bool no_log_file = false;                     // --no-log-file
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<ScanCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Scan a directory tree and report file statistics";

}  // namespace dirscan::cli

#endif  // DIRSCAN_CLI_HPP
