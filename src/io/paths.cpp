// ==============================================================================
// paths.cpp - Разрешение и проверка путей
// ==============================================================================

#include "dirscan/paths.hpp"

#include "dirscan/platform.hpp"

#include <system_error>

namespace dirscan::io {

std::filesystem::path resolve_path(const std::filesystem::path& base,
                                   const std::filesystem::path& relative) {
    // operator/ с абсолютным правым операндом возвращает его же
    std::filesystem::path joined = base / relative;

    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(joined, ec);
    if (ec) {
        throw PathError(PathErrorKind::IoError,
                        "failed to resolve path - " + ec.message(),
                        platform::path_to_utf8(joined));
    }

    // Символические ссылки в существующей части пути разрешаются,
    // несуществующий хвост нормализуется лексически
    std::filesystem::path resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        throw PathError(PathErrorKind::IoError,
                        "failed to resolve path - " + ec.message(),
                        platform::path_to_utf8(absolute));
    }
    return resolved;
}

ExpectedType expected_type_from_string(std::string_view type) {
    if (type == "file") {
        return ExpectedType::File;
    }
    if (type == "dir") {
        return ExpectedType::Directory;
    }
    throw PathError(PathErrorKind::InvalidExpectedType, "expected_type must be 'file' or 'dir'");
}

bool ensure_exists(const std::filesystem::path& path, ExpectedType expected,
                   bool create_if_missing) {
    std::string path_str = platform::path_to_utf8(path);
    std::error_code ec;

    if (expected == ExpectedType::Directory) {
        if (std::filesystem::is_directory(path, ec)) {
            return true;
        }
        if (!create_if_missing) {
            throw PathError(PathErrorKind::NotADirectory, "Directory not found: " + path_str,
                            path_str);
        }

        // Существующий файл на месте директории: create_directories вернёт ошибку
        ec.clear();
        std::filesystem::create_directories(path, ec);
        if (ec) {
            throw PathError(PathErrorKind::IoError,
                            "failed to create directory " + path_str + " - " + ec.message(),
                            path_str);
        }
        if (!std::filesystem::is_directory(path, ec)) {
            throw PathError(PathErrorKind::NotADirectory, "Directory not found: " + path_str,
                            path_str);
        }
        return true;
    }

    if (!std::filesystem::is_regular_file(path, ec)) {
        throw PathError(PathErrorKind::FileNotFound, "File not found: " + path_str, path_str);
    }
    return true;
}

}  // namespace dirscan::io
