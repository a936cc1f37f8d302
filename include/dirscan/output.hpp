// ==============================================================================
// dirscan/output.hpp - Пользовательский вывод и диагностика
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностические сообщения с уровнями (CRITICAL..DEBUG)
// - Дублирование диагностики в лог-файл с отметкой времени
// - Цветной вывод (ANSI escape codes) при TTY
// - JSON вывод через RapidJSON, перенаправление stdout в файл (--output)
//
// ==============================================================================

#ifndef DIRSCAN_OUTPUT_HPP
#define DIRSCAN_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace dirscan::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Уровни диагностики (по возрастанию важности)
// ----------------------------------------------------------------------------

enum class LogLevel { Debug, Info, Warning, Error, Critical };

/// Имя уровня в верхнем регистре: "DEBUG", "INFO", ...
const char* log_level_name(LogLevel level);

/// Разобрать имя уровня (регистр и пробелы по краям не важны)
/// @return nullopt для неподдерживаемого имени
std::optional<LogLevel> parse_log_level(std::string_view name);

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Критические ошибки
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;                // -q: подавить info/warning/debug в консоли
    bool no_banner = false;            // --no-banner
    LogLevel level = LogLevel::Info;  // минимальный уровень диагностики

    // Путь для основного вывода (stdout -> файл)
    std::optional<std::filesystem::path> output_path;

    // Лог-файл: диагностика дописывается с отметкой времени
    std::optional<std::filesystem::path> log_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Диагностика
    // -------------------------------------------------------------------------

    /// Записать сообщение заданного уровня (консоль + лог-файл)
    void log(LogLevel level, std::string_view message);

    /// "[+] <message>"
    void info(std::string_view message) { log(LogLevel::Info, message); }

    /// "[!] <message>"
    void warn(std::string_view message) { log(LogLevel::Warning, message); }

    /// "[x] <message>", печатается и при quiet
    void error(std::string_view message) { log(LogLevel::Error, message); }

    /// "[#] <message>", печатается и при quiet
    void critical(std::string_view message) { log(LogLevel::Critical, message); }

    /// "[*] <message>"
    void debug(std::string_view message) { log(LogLevel::Debug, message); }

    /// Проходит ли сообщение уровня level через фильтр
    bool enabled(LogLevel level) const;

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (2 пробела) + newline в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    const OutputConfig& config() const { return config_; }

    /// Сменить уровень после загрузки конфигурации
    void set_level(LogLevel level) { config_.level = level; }

    /// Перенаправить основной вывод (stdout) в файл
    /// @return false если файл открыть не удалось
    bool open_output_file(const std::filesystem::path& path);
    void close_output_file();

    /// Открыть лог-файл на дозапись; родительская директория создаётся
    /// @return false если файл открыть не удалось
    bool open_log_file(const std::filesystem::path& path);
    void close_log_file();

private:
    void write_impl(Stream s, std::string_view bytes);
    void write_prefix(std::string_view prefix, Color color);
    void append_log_file(LogLevel level, std::string_view message);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
    FILE* log_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Строка лог-файла: "<timestamp> - <LEVEL> - <message>"
std::string format_log_line(std::string_view timestamp, LogLevel level, std::string_view message);

std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace dirscan::output

#endif  // DIRSCAN_OUTPUT_HPP
