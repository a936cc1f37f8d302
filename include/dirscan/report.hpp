// ==============================================================================
// dirscan/report.hpp - Отчёт по результатам сканирования
// ==============================================================================
//
// Назначение:
// - Markdown отчёт (счётчики, расширения, большие файлы, одинаковые имена)
// - JSON представление сводки (RapidJSON)
//
// Модуль - чистый сериализатор ScanSummary: в stdout/stderr не пишет.
//
// ==============================================================================

#ifndef DIRSCAN_REPORT_HPP
#define DIRSCAN_REPORT_HPP

#include <dirscan/scanner.hpp>

#include <filesystem>
#include <rapidjson/document.h>
#include <string>

namespace dirscan::report {

/// Имя файла отчёта по умолчанию
constexpr const char* DEFAULT_REPORT_NAME = "scan_report.md";

/// Отрендерить Markdown отчёт
///
/// Расширения сортируются по убыванию количества (при равенстве - по имени),
/// в разделе дубликатов только имена с более чем одним путём.
std::string render_markdown(const scan::ScanSummary& summary);

/// Записать Markdown отчёт в output_dir/filename
///
/// output_dir создаётся при необходимости.
/// @return Абсолютный путь к отчёту
/// @throws std::runtime_error при ошибке ввода-вывода
std::filesystem::path write_report(const scan::ScanSummary& summary,
                                   const std::filesystem::path& output_dir,
                                   const std::string& filename = DEFAULT_REPORT_NAME);

/// Заполнить doc объектом сводки:
/// total_discovered, total_processed, total_failed, extension_count,
/// large_files, duplicates
void to_rapidjson(const scan::ScanSummary& summary, rapidjson::Document& doc);

/// Pretty JSON сводки (отступ 2 пробела)
std::string render_json(const scan::ScanSummary& summary);

}  // namespace dirscan::report

#endif  // DIRSCAN_REPORT_HPP
