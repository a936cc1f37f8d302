// ==============================================================================
// config.cpp - Загрузка и валидация конфигурации
// ==============================================================================
//
// JSON разбирается RapidJSON, YAML - yaml-cpp. YAML-дерево переводится в
// rapidjson::Value, поэтому валидация полей одна для обоих форматов.
//
// ==============================================================================

#include "dirscan/config.hpp"

#include "dirscan/platform.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <optional>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <sstream>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace dirscan::config {

namespace {

constexpr const char* DEFAULT_TARGET_FOLDER = "data";
constexpr std::int64_t DEFAULT_THRESHOLD_MB = 10;

ConfigResult fail(ConfigErrorKind kind, std::string message, const std::string& path) {
    ConfigResult result;
    result.ok = false;
    result.error = ConfigError{kind, std::move(message), path};
    return result;
}

std::string lower_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ----------------------------------------------------------------------------
// YAML -> rapidjson::Value
// ----------------------------------------------------------------------------

void yaml_to_value(const YAML::Node& node, rapidjson::Value& out,
                   rapidjson::Document::AllocatorType& alloc) {
    switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        out.SetNull();
        return;

    case YAML::NodeType::Scalar: {
        const std::string& text = node.Scalar();
        // Тег "!" у скаляра в кавычках: это всегда строка
        if (node.Tag() != "!") {
            long long i = 0;
            double d = 0.0;
            bool b = false;
            if (YAML::convert<long long>::decode(node, i)) {
                out.SetInt64(static_cast<std::int64_t>(i));
                return;
            }
            if (YAML::convert<double>::decode(node, d)) {
                out.SetDouble(d);
                return;
            }
            if (YAML::convert<bool>::decode(node, b)) {
                out.SetBool(b);
                return;
            }
        }
        out.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), alloc);
        return;
    }

    case YAML::NodeType::Sequence:
        out.SetArray();
        for (const auto& child : node) {
            rapidjson::Value item;
            yaml_to_value(child, item, alloc);
            out.PushBack(item, alloc);
        }
        return;

    case YAML::NodeType::Map:
        out.SetObject();
        for (const auto& kv : node) {
            std::string key_str = kv.first.as<std::string>();
            rapidjson::Value key(key_str.c_str(), static_cast<rapidjson::SizeType>(key_str.size()),
                                 alloc);
            rapidjson::Value item;
            yaml_to_value(kv.second, item, alloc);
            out.AddMember(key, item, alloc);
        }
        return;
    }
    out.SetNull();
}

// ----------------------------------------------------------------------------
// Чтение файла в rapidjson::Document
// ----------------------------------------------------------------------------

std::optional<ConfigError> parse_json_file(const std::filesystem::path& path,
                                           rapidjson::Document& doc) {
    std::string path_str = platform::path_to_utf8(path);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return ConfigError{ConfigErrorKind::IoError, "could not open file", path_str};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    doc.Parse(content.c_str());
    if (doc.HasParseError()) {
        return ConfigError{ConfigErrorKind::ParseError,
                           std::string("Config file is not valid JSON: ") +
                               rapidjson::GetParseError_En(doc.GetParseError()) + " at offset " +
                               std::to_string(doc.GetErrorOffset()),
                           path_str};
    }
    return std::nullopt;
}

std::optional<ConfigError> parse_yaml_file(const std::filesystem::path& path,
                                           rapidjson::Document& doc) {
    std::string path_str = platform::path_to_utf8(path);

    try {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return ConfigError{ConfigErrorKind::IoError, "could not open file", path_str};
        }
        YAML::Node root = YAML::Load(file);
        yaml_to_value(root, doc, doc.GetAllocator());
    } catch (const YAML::ParserException& e) {
        return ConfigError{ConfigErrorKind::ParseError,
                           std::string("Config file is not valid YAML: ") + e.what(), path_str};
    } catch (const YAML::Exception& e) {
        return ConfigError{ConfigErrorKind::ParseError,
                           std::string("YAML error: ") + e.what(), path_str};
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Приведение типов
// ----------------------------------------------------------------------------

/// Целое из числа, дробного числа (отбрасывание дробной части) или строки
std::optional<std::int64_t> coerce_integer(const rapidjson::Value& v) {
    if (v.IsInt64()) {
        return v.GetInt64();
    }
    if (v.IsDouble()) {
        double d = std::trunc(v.GetDouble());
        if (!std::isfinite(d) || d < -9.2e18 || d > 9.2e18) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(d);
    }
    if (v.IsString()) {
        std::string_view text = trim(std::string_view(v.GetString(), v.GetStringLength()));
        if (!text.empty() && text.front() == '+') {
            text.remove_prefix(1);
        }
        if (text.empty()) {
            return std::nullopt;
        }
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }
    // bool, null, массивы и объекты не приводятся
    return std::nullopt;
}

ConfigResult validate(const rapidjson::Value& root, const std::string& path_str,
                      output::Writer* writer) {
    if (!root.IsObject()) {
        return fail(ConfigErrorKind::TypeError, "config root must be an object", path_str);
    }

    ConfigResult result;
    result.ok = false;

    // target_folder
    auto it = root.FindMember("target_folder");
    if (it == root.MemberEnd() || !it->value.IsString()) {
        return fail(ConfigErrorKind::TypeError, "config['target_folder'] must be a string",
                    path_str);
    }
    result.config.target_folder.assign(it->value.GetString(), it->value.GetStringLength());

    // large_file_threshold_mb
    it = root.FindMember("large_file_threshold_mb");
    if (it == root.MemberEnd()) {
        result.config.large_file_threshold_mb = DEFAULT_THRESHOLD_MB;
    } else {
        auto threshold = coerce_integer(it->value);
        if (!threshold.has_value()) {
            return fail(ConfigErrorKind::TypeError,
                        "config['large_file_threshold_mb'] must be an integer", path_str);
        }
        if (*threshold < 0) {
            return fail(ConfigErrorKind::TypeError,
                        "config['large_file_threshold_mb'] must not be negative", path_str);
        }
        result.config.large_file_threshold_mb = *threshold;
    }

    // log_level
    it = root.FindMember("log_level");
    if (it == root.MemberEnd() || !it->value.IsString()) {
        return fail(ConfigErrorKind::TypeError, "config['log_level'] must be a string", path_str);
    }
    std::string_view level_str(it->value.GetString(), it->value.GetStringLength());
    auto level = output::parse_log_level(level_str);
    if (level.has_value()) {
        result.config.log_level = *level;
    } else {
        std::string shown(trim(level_str));
        for (char& c : shown) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (writer != nullptr) {
            writer->warn("Unsupported log_level '" + shown + "'. Falling back to 'INFO'.");
        }
        result.config.log_level = output::LogLevel::Info;
    }

    result.ok = true;
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

Config default_config() {
    Config cfg;
    cfg.target_folder = DEFAULT_TARGET_FOLDER;
    cfg.large_file_threshold_mb = DEFAULT_THRESHOLD_MB;
    cfg.log_level = output::LogLevel::Debug;
    return cfg;
}

std::string ConfigError::format() const {
    return "failed to load config '" + path + "' - " + message;
}

std::string to_json(const Config& cfg) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    rapidjson::Value folder(cfg.target_folder.c_str(),
                            static_cast<rapidjson::SizeType>(cfg.target_folder.size()), alloc);
    doc.AddMember("target_folder", folder, alloc);
    doc.AddMember("large_file_threshold_mb", static_cast<std::int64_t>(cfg.large_file_threshold_mb),
                  alloc);
    rapidjson::Value level(output::log_level_name(cfg.log_level), alloc);
    doc.AddMember("log_level", level, alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

ConfigResult load(const std::filesystem::path& path, output::Writer* writer) {
    std::string path_str = platform::path_to_utf8(path);

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return fail(ConfigErrorKind::IoError,
                        "failed to create config directory - " + ec.message(), path_str);
        }
    }

    // Отсутствующий файл создаётся со значениями по умолчанию
    if (!std::filesystem::exists(path, ec)) {
        Config defaults = default_config();

        std::ofstream out(path, std::ios::binary);
        if (!out.is_open()) {
            return fail(ConfigErrorKind::IoError, "could not create default config file",
                        path_str);
        }
        out << to_json(defaults) << '\n';
        out.close();
        if (!out) {
            return fail(ConfigErrorKind::IoError, "failed to write default config file",
                        path_str);
        }

        if (writer != nullptr) {
            writer->info("Config not found - created default at: " + path_str);
        }

        ConfigResult result;
        result.ok = true;
        result.config = defaults;
        return result;
    }

    rapidjson::Document doc;
    std::string ext = lower_extension(path);
    std::optional<ConfigError> parse_error;
    if (ext == ".yaml" || ext == ".yml") {
        parse_error = parse_yaml_file(path, doc);
    } else {
        parse_error = parse_json_file(path, doc);
    }
    if (parse_error.has_value()) {
        ConfigResult result;
        result.ok = false;
        result.error = std::move(*parse_error);
        return result;
    }

    return validate(doc, path_str, writer);
}

}  // namespace dirscan::config
