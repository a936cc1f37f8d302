// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: help и ошибки оформлены в стиле clap
// ("error: ...", "Usage: ...", "For more information, try '--help'.").
//
// ==============================================================================

#include "dirscan/cli.hpp"

#include "dirscan/output.hpp"
#include "dirscan/platform.hpp"

#include <charconv>
#include <cstring>
#include <string_view>

namespace dirscan::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* SCAN_USAGE = "Usage: dirscan scan [OPTIONS]";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

std::string render_scan_error(const std::string& error_msg) {
    return error_msg + "\n\n" + SCAN_USAGE + "\n\nFor more information, try '--help'.\n";
}

/// Неотрицательное целое без знака и пробелов
std::optional<std::uint64_t> parse_megabytes(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Значение опции: следующий аргумент. nullptr если аргументов больше нет.
const char* take_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        return nullptr;
    }
    ++i;
    return argv[i];
}

std::string missing_value_error(const char* option, const char* value_name) {
    return render_scan_error(std::string("error: a value is required for '") + option + " <" +
                             value_name + ">' but none was supplied");
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("dirscan ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: dirscan [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  scan  Scan a directory and write a Markdown report\n"
               "  help  Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide dirscan's banner\n"
               "  -v...            Print verbose output\n"
               "  -q               Suppress informational output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Scan the folder configured in config/config.json:\n"
               "        ./dirscan scan\n"
               "\n"
               "    Scan ./downloads, flag files over 50 MB, print JSON summary:\n"
               "        ./dirscan scan --folder downloads --threshold-mb 50 --json\n";
    } else if (*command == "scan") {
        return "Scan a directory and write a Markdown report\n"
               "\n"
               "Usage: dirscan scan [OPTIONS]\n"
               "\n"
               "Options:\n"
               "      --folder <FOLDER>          Override target folder from config\n"
               "      --threshold-mb <MB>        Override large-file threshold (MB)\n"
               "      --report <REPORT>          Output report filename [default: "
               "scan_report.md]\n"
               "      --config <CONFIG>          Config file [default: <BASE>/config/config.json]\n"
               "      --base <BASE>              Project directory [default: current directory]\n"
               "      --log-level <LEVEL>        Override log level: CRITICAL, ERROR, WARNING, "
               "INFO, DEBUG\n"
               "      --no-log-file              Do not write <BASE>/logs/app.log\n"
               "  -j, --json                     Print the scan summary as JSON\n"
               "  -o, --output <FILE>            Write standard output to a file\n"
               "  -h, --help                     Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

// ----------------------------------------------------------------------------
// render_usage_error - сообщение об ошибке парсинга в стиле clap
// ----------------------------------------------------------------------------

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n"
                       "Usage: dirscan [OPTIONS] <COMMAND>\n\n"
                       "For more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                render_usage_error(std::string("error: unexpected argument '") + arg + "' found");
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "scan")) {
        ScanCommand scan_cmd;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"scan"};
                return result;
            } else if (str_eq(arg, "--folder")) {
                const char* value = take_value(argc, argv, i);
                if (value == nullptr) {
                    result.diagnostic.exit_code = 2;
                    result.diagnostic.stderr_message = missing_value_error(arg, "FOLDER");
                    return result;
                }
                scan_cmd.folder = platform::path_from_utf8(value);
            } else if (str_eq(arg, "--threshold-mb") || str_eq(arg, "--threshold_mb")) {
                const char* value = take_value(argc, argv, i);
                if (value == nullptr) {
                    result.diagnostic.exit_code = 2;
                    result.diagnostic.stderr_message = missing_value_error(arg, "MB");
                    return result;
                }
                auto mb = parse_megabytes(value);
                if (!mb.has_value()) {
                    result.diagnostic.exit_code = 2;
                    result.diagnostic.stderr_message = render_scan_error(
                        std::string("error: invalid value '") + value + "' for '" + arg +
                        " <MB>': must be a non-negative integer");
                    return result;
                }
                scan_cmd.threshold_mb = *mb;
            } else if (str_eq(arg, "--report")) {
                const char* value = take_value(argc, argv, i);
                if (value == nullptr || value[0] == '\0') {
                    result.diagnostic.exit_code = 2;
                    result.diagnostic.stderr_message = missing_value_error(arg, "REPORT");
                    return result;
                }
                scan_cmd.report = value;
            } else if (str_eq(arg, "--config")) {
                const char* value = take_value(argc, argv, i);
                if (value == nullptr) {
                    result.diagnostic.exit_code = 2;
                    result.diagnostic.stderr_message = missing_value_error(arg, "CONFIG");
                    return result;
                }
                scan_cmd.config = platform::path_from_utf8(value);
            } else if (str_eq(arg, "--base")) {
                const char* value = take_value(argc, argv, i);
                if (value == nullptr) {
                    result.diagnostic.exit_code = 2;
                    result.diagnostic.stderr_message = missing_value_error(arg, "BASE");
                    return result;
                }
                scan_cmd.base = platform::path_from_utf8(value);
            } else if (str_eq(arg, "--log-level")) {
                const char* value = take_value(argc, argv, i);
                if (value == nullptr) {
                    result.diagnostic.exit_code = 2;
                    result.diagnostic.stderr_message = missing_value_error(arg, "LEVEL");
                    return result;
                }
                if (!output::parse_log_level(value).has_value()) {
                    result.diagnostic.exit_code = 2;
                    result.diagnostic.stderr_message = render_scan_error(
                        std::string("error: invalid value '") + value +
                        "' for '--log-level <LEVEL>': must be one of CRITICAL, ERROR, WARNING, "
                        "INFO, DEBUG");
                    return result;
                }
                scan_cmd.log_level = value;
            } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
                const char* value = take_value(argc, argv, i);
                if (value == nullptr) {
                    result.diagnostic.exit_code = 2;
                    result.diagnostic.stderr_message = missing_value_error(arg, "FILE");
                    return result;
                }
                scan_cmd.output = platform::path_from_utf8(value);
            } else if (str_eq(arg, "--no-log-file")) {
                scan_cmd.no_log_file = true;
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                scan_cmd.json = true;
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (str_eq(arg, "-v")) {
                result.global.verbose++;
            } else {
                result.diagnostic.exit_code = 2;
                result.diagnostic.stderr_message =
                    render_scan_error(std::string("error: unexpected argument '") + arg + "' found");
                return result;
            }
        }

        result.ok = true;
        result.command = scan_cmd;
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{argv[cmd_idx + 1]};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        // Неизвестная команда - exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            render_usage_error(std::string("error: unrecognized subcommand '") + cmd + "'");
        return result;
    }

    return result;
}

}  // namespace dirscan::cli
