// ==============================================================================
// report.cpp - Отчёт по результатам сканирования
// ==============================================================================

#include "dirscan/report.hpp"

#include "dirscan/platform.hpp"

#include <algorithm>
#include <fstream>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace dirscan::report {

namespace {

rapidjson::Value make_string(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

rapidjson::Value make_string_array(const std::vector<std::string>& items,
                                   rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto& item : items) {
        arr.PushBack(make_string(item, alloc), alloc);
    }
    return arr;
}

}  // namespace

// ----------------------------------------------------------------------------
// Markdown
// ----------------------------------------------------------------------------

std::string render_markdown(const scan::ScanSummary& summary) {
    std::string out;
    out += "# File System Scan Report\n\n";

    // Scan Counters
    out += "## Scan Counters\n\n";
    out += "- **Total Discovered**: " + std::to_string(summary.counters.discovered) + "\n";
    out += "- **Total Processed**:  " + std::to_string(summary.counters.processed) + "\n";
    out += "- **Total Failed**:     " + std::to_string(summary.counters.failed) + "\n\n";

    // File Extensions Count
    out += "## File Extensions Count\n\n";
    if (summary.extensions.empty()) {
        out += "_None found._\n";
    } else {
        std::vector<std::pair<std::string, std::uint64_t>> sorted(summary.extensions.begin(),
                                                                  summary.extensions.end());
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        for (const auto& [ext, count] : sorted) {
            out += "- **" + ext + "**: " + std::to_string(count) + "\n";
        }
    }
    out += "\n";

    // Large Files
    out += "## Large Files\n\n";
    if (summary.large_files.empty()) {
        out += "_None detected._\n";
    } else {
        for (const auto& path : summary.large_files) {
            out += "- `" + path + "`\n";
        }
    }
    out += "\n";

    // Duplicate File Names
    out += "## Duplicate File Names\n\n";
    scan::DuplicateIndex groups = scan::duplicate_groups(summary.duplicates);
    if (groups.empty()) {
        out += "_No duplicates found._\n";
    } else {
        for (const auto& [name, paths] : groups) {
            out += "### `" + name + "`\n";
            for (const auto& path : paths) {
                out += "- `" + path + "`\n";
            }
            out += "\n";
        }
    }

    return out;
}

std::filesystem::path write_report(const scan::ScanSummary& summary,
                                   const std::filesystem::path& output_dir,
                                   const std::string& filename) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        throw std::runtime_error("failed to create report directory '" +
                                 platform::path_to_utf8(output_dir) + "' - " + ec.message());
    }

    std::filesystem::path report_path = output_dir / platform::path_from_utf8(filename);
    std::filesystem::path absolute = std::filesystem::absolute(report_path, ec);
    if (!ec) {
        report_path = absolute;
    }

    std::ofstream file(report_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("failed to open report file '" +
                                 platform::path_to_utf8(report_path) + "'");
    }
    file << render_markdown(summary);
    file.close();
    if (!file) {
        throw std::runtime_error("failed to write report file '" +
                                 platform::path_to_utf8(report_path) + "'");
    }

    return report_path;
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

void to_rapidjson(const scan::ScanSummary& summary, rapidjson::Document& doc) {
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    doc.AddMember("total_discovered", summary.counters.discovered, alloc);
    doc.AddMember("total_processed", summary.counters.processed, alloc);
    doc.AddMember("total_failed", summary.counters.failed, alloc);

    rapidjson::Value extensions(rapidjson::kObjectType);
    for (const auto& [ext, count] : summary.extensions) {
        extensions.AddMember(make_string(ext, alloc), rapidjson::Value(count), alloc);
    }
    doc.AddMember("extension_count", extensions, alloc);

    doc.AddMember("large_files", make_string_array(summary.large_files, alloc), alloc);

    rapidjson::Value duplicates(rapidjson::kObjectType);
    for (const auto& [name, paths] : summary.duplicates) {
        duplicates.AddMember(make_string(name, alloc), make_string_array(paths, alloc), alloc);
    }
    doc.AddMember("duplicates", duplicates, alloc);
}

std::string render_json(const scan::ScanSummary& summary) {
    rapidjson::Document doc;
    to_rapidjson(summary, doc);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace dirscan::report
