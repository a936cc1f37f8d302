// ==============================================================================
// scanner.cpp - Сканирование директорий и агрегация метаданных
// ==============================================================================

#include "dirscan/scanner.hpp"

#include "dirscan/platform.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <limits>
#include <optional>
#include <system_error>

namespace dirscan::scan {

namespace {

std::string counters_message(const ScanCounters& c) {
    return "Counter mismatch: discovered=" + std::to_string(c.discovered) +
           ", processed=" + std::to_string(c.processed) + ", failed=" + std::to_string(c.failed);
}

std::string join_paths(const std::vector<std::string>& paths) {
    std::string result = "[";
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += "'" + paths[i] + "'";
    }
    result += "]";
    return result;
}

/// Специальные файлы (FIFO, сокеты, устройства) не сканируются
bool is_special(const std::filesystem::file_status& st) {
    return std::filesystem::is_fifo(st) || std::filesystem::is_socket(st) ||
           std::filesystem::is_block_file(st) || std::filesystem::is_character_file(st);
}

}  // namespace

// ----------------------------------------------------------------------------
// IntegrityError
// ----------------------------------------------------------------------------

IntegrityError::IntegrityError(const ScanCounters& counters)
    : std::logic_error(counters_message(counters)), counters_(counters) {}

// ----------------------------------------------------------------------------
// Свободные функции
// ----------------------------------------------------------------------------

void verify_counters(const ScanCounters& counters) {
    if (counters.discovered != counters.processed + counters.failed) {
        throw IntegrityError(counters);
    }
}

DuplicateIndex duplicate_groups(const DuplicateIndex& index) {
    DuplicateIndex groups;
    for (const auto& [name, paths] : index) {
        if (paths.size() > 1) {
            groups.emplace(name, paths);
        }
    }
    return groups;
}

std::string extension_of(const std::filesystem::path& file) {
    // Ведущие точки не отделяют расширение: ".bashrc", "..x" -> без расширения,
    // "archive.tar.gz" -> ".gz", "name." -> "."
    std::string name = platform::path_to_utf8(file.filename());
    std::string::size_type start = name.find_first_not_of('.');
    if (start == std::string::npos) {
        return NO_EXTENSION;
    }
    std::string::size_type dot = name.rfind('.');
    if (dot == std::string::npos || dot < start) {
        return NO_EXTENSION;
    }
    return name.substr(dot);
}

bool is_simulated_failure(std::string_view filename) {
    std::string lower;
    lower.reserve(filename.size());
    for (char c : filename) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower.find(SIMULATED_FAILURE_MARKER) != std::string::npos;
}

std::uint64_t megabytes_to_bytes(std::uint64_t megabytes) {
    if (megabytes > std::numeric_limits<std::uint64_t>::max() / BYTES_PER_MB) {
        throw std::invalid_argument("large file threshold is too large: " +
                                    std::to_string(megabytes) + " MB");
    }
    return megabytes * BYTES_PER_MB;
}

// ----------------------------------------------------------------------------
// FileScanner
// ----------------------------------------------------------------------------

FileScanner::FileScanner(std::filesystem::path root, std::uint64_t large_file_threshold_mb,
                         output::Writer& writer)
    : root_(std::move(root)),
      threshold_mb_(large_file_threshold_mb),
      threshold_bytes_(megabytes_to_bytes(large_file_threshold_mb)),
      writer_(writer) {}

void FileScanner::walk(const EntryCallback& on_entry) {
    walk_directory(root_, on_entry);
    verify_counters(counters_);
}

ScanSummary FileScanner::scan(const EntryCallback& on_entry) {
    walk(on_entry);
    return summary();
}

ScanSummary FileScanner::summary() const {
    verify_counters(counters_);

    ScanSummary result;
    result.counters = counters_;
    result.extensions = extensions_;
    result.large_files = large_files_;
    result.duplicates = duplicates_;
    return result;
}

void FileScanner::walk_directory(const std::filesystem::path& dir, const EntryCallback& on_entry) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        writer_.warn("failed to read directory '" + platform::path_to_utf8(dir) + "' - " +
                     ec.message());
        return;
    }

    // Сначала собираем и сортируем: порядок обхода не зависит от ОС
    std::vector<std::filesystem::directory_entry> entries;
    for (auto end = std::filesystem::directory_iterator(); it != end;) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            writer_.warn("failed to list directory '" + platform::path_to_utf8(dir) + "' - " +
                         ec.message());
            break;
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path() < b.path(); });

    for (const auto& entry : entries) {
        const std::filesystem::path& path = entry.path();

        std::error_code st_ec;
        std::filesystem::file_status link_status = entry.symlink_status(st_ec);
        if (st_ec) {
            writer_.warn("failed to get metadata for '" + platform::path_to_utf8(path) + "' - " +
                         st_ec.message());
            continue;
        }

        // Директории обходятся рекурсивно, символические ссылки на них - нет
        if (std::filesystem::is_directory(link_status)) {
            walk_directory(path, on_entry);
            continue;
        }

        std::filesystem::file_status target_status = link_status;
        if (std::filesystem::is_symlink(link_status)) {
            target_status = entry.status(st_ec);
            if (std::filesystem::is_directory(target_status)) {
                writer_.debug("skipping symlinked directory: " + platform::path_to_utf8(path));
                continue;
            }
        }

        if (is_special(target_status)) {
            writer_.debug("skipping special file: " + platform::path_to_utf8(path));
            continue;
        }

        // Обычный файл или битая ссылка: ошибка последней учтётся как failed
        visit_file(path, on_entry);
    }
}

void FileScanner::visit_file(const std::filesystem::path& file, const EntryCallback& on_entry) {
    ++counters_.discovered;

    std::optional<ScanEntry> entry;
    try {
        FileRecord record = extract(file);
        ++counters_.processed;
        entry.emplace(std::move(record));
    } catch (const std::exception& e) {
        ++counters_.failed;
        std::string path_str = platform::path_to_utf8(file);
        writer_.error("[FAILED] " + path_str + " - " + e.what());
        entry.emplace(ScanFailure{path_str, e.what()});
    }

    // callback вне try: его исключения не считаются ошибкой файла
    if (on_entry) {
        on_entry(*entry);
    }
}

FileRecord FileScanner::extract(const std::filesystem::path& file) {
    std::string path_str = platform::path_to_utf8(file);
    std::string name = platform::path_to_utf8(file.filename());

    if (is_simulated_failure(name)) {
        throw std::runtime_error("Simulated failure - filename contains 'fail'");
    }

    FileRecord record;
    record.path = path_str;
    record.size = static_cast<std::uint64_t>(std::filesystem::file_size(file));
    record.extension = extension_of(file);
    record.modified = platform::format_local_time(
        platform::file_time_to_time_t(std::filesystem::last_write_time(file)));

    ++extensions_[record.extension];

    if (record.size == 0) {
        writer_.warn("Zero-byte file detected: " + path_str);
    }
    if (record.size > threshold_bytes_) {
        writer_.warn("Large file (>" + std::to_string(threshold_mb_) + " MB): " + path_str + " (" +
                     std::to_string(record.size) + " bytes)");
        large_files_.push_back(path_str);
    }

    duplicates_[name].push_back(path_str);

    return record;
}

void FileScanner::report_summary() const {
    writer_.info("Discovered : " + std::to_string(counters_.discovered));
    writer_.info("Processed  : " + std::to_string(counters_.processed));
    writer_.info("Failed     : " + std::to_string(counters_.failed));
    for (const auto& [ext, count] : extensions_) {
        writer_.info("  " + ext + " -> " + std::to_string(count) + " file(s)");
    }
    writer_.info("Large files: " + std::to_string(large_files_.size()));
}

void FileScanner::report_duplicates() const {
    for (const auto& [name, paths] : duplicate_groups(duplicates_)) {
        writer_.info("Duplicate -> " + name + ": " + join_paths(paths));
    }
}

}  // namespace dirscan::scan
