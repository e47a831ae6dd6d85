#include "path_resolver.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <system_error>

bool has_trailing_separator(std::string_view path) {
    return !path.empty() && (path.back() == '/' || path.back() == fs::path::preferred_separator);
}

fs::path named_directory_path(const std::string& dir) {
    fs::path p = fs::path(dir.empty() ? "." : dir).lexically_normal();
    if (!p.has_filename()) p = p.parent_path();
    if (p.empty() || p.filename() == "." || p.filename() == "..") {
        p = fs::absolute(p.empty() ? fs::path(".") : p).lexically_normal();
        if (!p.has_filename()) p = p.parent_path();
    }
    return p;
}

SourceSpec resolve_source(const std::string& source) {
    SourceSpec spec;
    spec.root = source.empty() ? fs::path(".") : fs::path(source);
    spec.contents_only = has_trailing_separator(source);
    if (!spec.contents_only) {
        spec.root_name = named_directory_path(source).filename().string();
        // The filesystem root has no name to archive it under
        if (spec.root_name.empty()) spec.contents_only = true;
    }
    return spec;
}

void require_directory(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        throw LtarException(ErrorKind::NotADirectory, string_format("error.not_a_directory", path.string()));
    }
}

void require_archive_file(const fs::path& path) {
    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (fs::is_directory(st)) {
        throw LtarException(ErrorKind::IsADirectory, string_format("error.is_a_directory", path.string()));
    }
    if (!fs::is_regular_file(st)) {
        throw LtarException(ErrorKind::NotAFile, string_format("error.not_a_file", path.string()));
    }
}

fs::path in_place_source_directory(const std::string& path) {
    fs::path dir = named_directory_path(path);
    if (dir.has_extension()) {
        throw LtarException(ErrorKind::UnexpectedExtension,
            string_format("error.unexpected_extension_create", path, dir.extension().string()));
    }
    if (!dir.has_filename()) {
        throw LtarException(ErrorKind::NotADirectory, string_format("error.not_a_directory", path));
    }
    return dir;
}

fs::path in_place_destination_directory(const std::string& path) {
    fs::path archive(path);
    if (archive.extension() != TAR_EXTENSION) {
        throw LtarException(ErrorKind::UnexpectedExtension,
            string_format("error.unexpected_extension_extract", path, TAR_EXTENSION));
    }
    return archive.replace_extension();
}
