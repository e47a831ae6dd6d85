#include "in_place.hpp"
#include "archiver.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "extractor.hpp"
#include "localization.hpp"
#include "path_resolver.hpp"
#include "utils.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

void create_in_place(const std::string& path) {
    fs::path dir = in_place_source_directory(path);
    // Removing a link would leave the archived directory behind
    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(dir, ec))) {
        throw LtarException(ErrorKind::NotADirectory, string_format("error.in_place_symlink", path));
    }
    require_directory(dir);

    fs::path archive_path = dir;
    archive_path += TAR_EXTENSION;

    // Contents at the top level, so extract_in_place() restores dir exactly
    create_archive(archive_path, dir.string() + "/");

    fs::remove_all(dir);
    log_info(string_format("info.removed_source", dir.string()));
}

void extract_in_place(const std::string& path) {
    fs::path dir = in_place_destination_directory(path);

    extract_archive(dir, path);

    fs::remove(path);
    log_info(string_format("info.removed_source", path));
}
