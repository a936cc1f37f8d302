// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code: 0 успех, 1 ошибка выполнения, 2 ошибка CLI,
//    3 внутренняя ошибка (нарушение целостности счётчиков)
//
// Исключения перехватываются только здесь, на границе приложения.
//
// ==============================================================================

#include "dirscan/cli.hpp"
#include "dirscan/config.hpp"
#include "dirscan/output.hpp"
#include "dirscan/paths.hpp"
#include "dirscan/platform.hpp"
#include "dirscan/report.hpp"
#include "dirscan/scanner.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <rapidjson/document.h>
#include <string>
#include <system_error>
#include <variant>

namespace {

constexpr int EXIT_RUNTIME_ERROR = 1;
constexpr int EXIT_INTERNAL_ERROR = 3;

// ----------------------------------------------------------------------------
// ASCII Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
     _ _
  __| (_)_ __ ___  ___ __ _ _ __
 / _` | | '__/ __|/ __/ _` | '_ \
| (_| | | |  \__ \ (_| (_| | | | |
 \__,_|_|_|  |___/\___\__,_|_| |_|
)";

void print_banner(dirscan::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(dirscan::output::Stream::Stderr, BANNER);
    writer.write_line(dirscan::output::Stream::Stderr, "");
}

std::string format_record(const dirscan::scan::FileRecord& record) {
    return record.path + " | " + std::to_string(record.size) + " bytes | " + record.extension +
           " | " + record.modified;
}

// ----------------------------------------------------------------------------
// scan
// ----------------------------------------------------------------------------

int run_scan(const dirscan::cli::ScanCommand& cmd, const dirscan::cli::GlobalOptions& global,
             dirscan::output::Writer& writer) {
    using namespace dirscan;

    // Базовая директория проекта: config/, logs/, reports/ и цель сканирования
    std::filesystem::path cwd = std::filesystem::current_path();
    std::filesystem::path base = cmd.base.has_value() ? io::resolve_path(cwd, *cmd.base) : cwd;
    io::ensure_exists(base, io::ExpectedType::Directory, false);

    std::filesystem::path config_path = cmd.config.has_value()
                                            ? io::resolve_path(base, *cmd.config)
                                            : base / "config" / "config.json";

    auto loaded = config::load(config_path, &writer);
    if (!loaded) {
        writer.error(loaded.error.format());
        return EXIT_RUNTIME_ERROR;
    }
    const config::Config& cfg = loaded.config;

    // Уровень диагностики: --log-level > -v > конфигурация
    output::LogLevel level = cfg.log_level;
    if (cmd.log_level.has_value()) {
        level = output::parse_log_level(*cmd.log_level).value_or(output::LogLevel::Info);
    } else if (global.verbose > 0) {
        level = output::LogLevel::Debug;
    }
    writer.set_level(level);

    if (!cmd.no_log_file) {
        std::filesystem::path log_path = base / "logs" / "app.log";
        if (!writer.open_log_file(log_path)) {
            writer.warn("failed to open log file '" + platform::path_to_utf8(log_path) + "'");
        }
    }

    if (cmd.output.has_value()) {
        std::filesystem::path output_path = io::resolve_path(cwd, *cmd.output);
        if (!writer.open_output_file(output_path)) {
            writer.error("failed to open output file '" + platform::path_to_utf8(output_path) +
                         "'");
            return EXIT_RUNTIME_ERROR;
        }
    }

    writer.debug("Project root : " + platform::path_to_utf8(base));
    writer.debug("CWD          : " + platform::path_to_utf8(cwd));

    // Опции CLI перекрывают конфигурацию
    std::filesystem::path folder = cmd.folder.has_value()
                                       ? *cmd.folder
                                       : platform::path_from_utf8(cfg.target_folder);
    std::uint64_t threshold_mb = cmd.threshold_mb.has_value()
                                     ? *cmd.threshold_mb
                                     : static_cast<std::uint64_t>(cfg.large_file_threshold_mb);

    std::filesystem::path target = io::resolve_path(base, folder);
    writer.debug("Target folder: " + platform::path_to_utf8(target));
    io::ensure_exists(target, io::ExpectedType::Directory, true);

    scan::FileScanner scanner(target, threshold_mb, writer);
    scan::ScanSummary summary = scanner.scan([&writer](const scan::ScanEntry& entry) {
        // Ошибки уже залогированы сканером
        if (const auto* record = std::get_if<scan::FileRecord>(&entry)) {
            writer.info(format_record(*record));
        }
    });

    scanner.report_duplicates();
    scanner.report_summary();

    std::filesystem::path report_path = report::write_report(summary, base / "reports", cmd.report);
    writer.info("Report saved : " + platform::path_to_utf8(report_path));

    if (cmd.json) {
        rapidjson::Document doc;
        report::to_rapidjson(summary, doc);
        writer.write_json_pretty(doc);
    }
    writer.close_output_file();

    return 0;
}

}  // namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    using namespace dirscan;

    cli::ParseResult parsed = cli::parse(argc, argv);

    if (!parsed.ok) {
        output::OutputConfig err_cfg;
        output::Writer err_writer(err_cfg);
        err_writer.write(output::Stream::Stderr, parsed.diagnostic.stderr_message);
        err_writer.flush();
        return parsed.diagnostic.exit_code;
    }

    output::OutputConfig out_cfg;
    out_cfg.quiet = parsed.global.quiet;
    out_cfg.no_banner = parsed.global.no_banner;
    output::Writer writer(out_cfg);

    if (const auto* help = std::get_if<cli::HelpCommand>(&parsed.command)) {
        writer.write(output::Stream::Stdout, cli::render_help(help->command));
        writer.flush();
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parsed.command)) {
        writer.write(output::Stream::Stdout, cli::render_version());
        writer.flush();
        return 0;
    }

    print_banner(writer, parsed.global.no_banner, parsed.global.quiet);

    int exit_code = 0;
    try {
        const auto& scan_cmd = std::get<cli::ScanCommand>(parsed.command);
        exit_code = run_scan(scan_cmd, parsed.global, writer);
    } catch (const scan::IntegrityError& e) {
        writer.critical(std::string("internal error: ") + e.what());
        exit_code = EXIT_INTERNAL_ERROR;
    } catch (const io::PathError& e) {
        writer.error(e.what());
        exit_code = EXIT_RUNTIME_ERROR;
    } catch (const std::exception& e) {
        writer.error(e.what());
        exit_code = EXIT_RUNTIME_ERROR;
    }

    writer.flush();
    return exit_code;
}
