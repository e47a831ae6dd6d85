#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// What the archiver walks and how it names it. With contents_only set the
// children of root are archived at top level and root itself is not an entry;
// otherwise root is archived as root_name/.
struct SourceSpec {
    fs::path root;
    bool contents_only = false;
    std::string root_name;
};

bool has_trailing_separator(std::string_view path);

// Lexically normal form of dir ending in a real file name ("parent/" and
// "parent/." give "parent", "." gives the absolute working directory).
// Returns the filesystem root unchanged.
fs::path named_directory_path(const std::string& dir);

// Decides the root semantics from the literal source string. Does no I/O.
SourceSpec resolve_source(const std::string& source);

// Throws LtarException(NotADirectory) unless path is a directory. A symlink
// to a directory is accepted.
void require_directory(const fs::path& path);

// Throws LtarException(IsADirectory) for a directory and
// LtarException(NotAFile) for anything else that is not a regular file.
void require_archive_file(const fs::path& path);

// In-place creation: the directory to archive. Throws
// LtarException(UnexpectedExtension) if the path carries an extension.
fs::path in_place_source_directory(const std::string& path);

// In-place extraction: the directory to extract into, path minus ".tar".
// Throws LtarException(UnexpectedExtension) for any other extension.
fs::path in_place_destination_directory(const std::string& path);
