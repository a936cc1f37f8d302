// ==============================================================================
// dirscan/scanner.hpp - Сканирование директорий и агрегация метаданных
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход дерева директорий (depth-first, сортированный порядок)
// - Извлечение метаданных каждого файла с изоляцией ошибок по файлам
// - Счётчики discovered/processed/failed и проверка их целостности
// - Агрегаты: расширения, большие файлы, одинаковые имена файлов
//
// Инвариант: discovered == processed + failed после каждого обхода и перед
// выдачей сводки. Нарушение - внутренняя ошибка (IntegrityError).
//
// Обход однопоточный и синхронный. Прервать обход из callback нельзя.
//
// ==============================================================================

#ifndef DIRSCAN_SCANNER_HPP
#define DIRSCAN_SCANNER_HPP

#include <dirscan/output.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dirscan::scan {

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Расширение файла без точки в имени
constexpr const char* NO_EXTENSION = "<no-ext>";

/// Подстрока имени файла, вызывающая искусственную ошибку извлечения
constexpr const char* SIMULATED_FAILURE_MARKER = "fail";

constexpr std::uint64_t BYTES_PER_MB = 1024ULL * 1024ULL;

// ----------------------------------------------------------------------------
// Результаты по файлам
// ----------------------------------------------------------------------------

/// Метаданные успешно обработанного файла
struct FileRecord {
    std::string path;        // полный путь (UTF-8)
    std::uint64_t size = 0;  // размер в байтах
    std::string extension;   // ".txt" или NO_EXTENSION
    std::string modified;    // "YYYY-MM-DD HH:MM:SS", локальное время

    bool operator==(const FileRecord& other) const {
        return path == other.path && size == other.size && extension == other.extension &&
               modified == other.modified;
    }
};

/// Файл найден, но метаданные извлечь не удалось
struct ScanFailure {
    std::string path;
    std::string cause;
};

/// Результат обработки одного файла
using ScanEntry = std::variant<FileRecord, ScanFailure>;

/// Вызывается для каждого найденного файла во время обхода
using EntryCallback = std::function<void(const ScanEntry&)>;

// ----------------------------------------------------------------------------
// Агрегаты
// ----------------------------------------------------------------------------

struct ScanCounters {
    std::uint64_t discovered = 0;
    std::uint64_t processed = 0;
    std::uint64_t failed = 0;

    bool operator==(const ScanCounters& other) const {
        return discovered == other.discovered && processed == other.processed &&
               failed == other.failed;
    }
};

/// Расширение -> количество файлов
using ExtensionIndex = std::map<std::string, std::uint64_t>;

/// Пути больших файлов в порядке обнаружения
using LargeFileList = std::vector<std::string>;

/// Имя файла -> все полные пути с этим именем (включая единичные)
using DuplicateIndex = std::map<std::string, std::vector<std::string>>;

/// Снимок состояния сканера (глубокая копия)
struct ScanSummary {
    ScanCounters counters;
    ExtensionIndex extensions;
    LargeFileList large_files;
    DuplicateIndex duplicates;

    bool operator==(const ScanSummary& other) const {
        return counters == other.counters && extensions == other.extensions &&
               large_files == other.large_files && duplicates == other.duplicates;
    }
};

// ----------------------------------------------------------------------------
// IntegrityError - нарушение инварианта счётчиков
// ----------------------------------------------------------------------------

class IntegrityError : public std::logic_error {
public:
    explicit IntegrityError(const ScanCounters& counters);

    const ScanCounters& counters() const { return counters_; }

private:
    ScanCounters counters_;
};

// ----------------------------------------------------------------------------
// Свободные функции
// ----------------------------------------------------------------------------

/// Проверить discovered == processed + failed
/// @throws IntegrityError при нарушении
void verify_counters(const ScanCounters& counters);

/// Только имена, встречающиеся более одного раза
DuplicateIndex duplicate_groups(const DuplicateIndex& index);

/// Расширение по последней точке имени файла (с точкой) или NO_EXTENSION
std::string extension_of(const std::filesystem::path& file);

/// Имя содержит "fail" без учёта регистра
bool is_simulated_failure(std::string_view filename);

/// Перевести мегабайты в байты
/// @throws std::invalid_argument при переполнении
std::uint64_t megabytes_to_bytes(std::uint64_t megabytes);

// ----------------------------------------------------------------------------
// FileScanner
// ----------------------------------------------------------------------------

/// Сканер одного корня. Повторные обходы того же экземпляра накапливают
/// агрегаты; обычно один экземпляр используется для одного обхода.
///
/// Использование:
/// @code
///   FileScanner scanner(root, 10, writer);
///   ScanSummary summary = scanner.scan([&](const ScanEntry& e) { ... });
///   scanner.report_duplicates();
///   scanner.report_summary();
/// @endcode
class FileScanner {
public:
    /// @param root Корневая директория
    /// @param large_file_threshold_mb Порог большого файла в MB
    /// @param writer Получатель диагностики; должен жить дольше сканера
    FileScanner(std::filesystem::path root, std::uint64_t large_file_threshold_mb,
                output::Writer& writer);

    /// Обойти дерево, вызывая on_entry для каждого файла, затем проверить счётчики
    /// @throws IntegrityError
    void walk(const EntryCallback& on_entry = {});

    /// walk() + summary()
    ScanSummary scan(const EntryCallback& on_entry = {});

    /// Проверить счётчики и вернуть копию агрегатов
    /// @throws IntegrityError
    ScanSummary summary() const;

    /// Извлечь метаданные одного файла и обновить агрегаты
    ///
    /// Агрегаты меняются только после успешного чтения всех метаданных.
    /// @throws std::exception при любой ошибке (в т.ч. искусственной)
    FileRecord extract(const std::filesystem::path& file);

    /// По строке на счётчик, на пару расширение/количество и число больших файлов
    void report_summary() const;

    /// По строке на каждую группу одинаковых имён (более одного пути)
    void report_duplicates() const;

    const std::filesystem::path& root() const { return root_; }
    std::uint64_t threshold_bytes() const { return threshold_bytes_; }
    const ScanCounters& counters() const { return counters_; }

private:
    void walk_directory(const std::filesystem::path& dir, const EntryCallback& on_entry);
    void visit_file(const std::filesystem::path& file, const EntryCallback& on_entry);

    std::filesystem::path root_;
    std::uint64_t threshold_mb_;
    std::uint64_t threshold_bytes_;
    output::Writer& writer_;

    ScanCounters counters_;
    ExtensionIndex extensions_;
    LargeFileList large_files_;
    DuplicateIndex duplicates_;
};

}  // namespace dirscan::scan

#endif  // DIRSCAN_SCANNER_HPP
