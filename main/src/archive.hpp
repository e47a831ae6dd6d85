#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

struct archive;
struct archive_entry;

enum class EntryKind {
    RegularFile,
    Directory,
    Symlink
};

// One archive member as seen by ltar. Regular file content is streamed
// separately and never held here; link_target is only set for symlinks.
struct ArchiveEntry {
    std::string path;           // '/'-separated, relative, no trailing slash
    EntryKind kind = EntryKind::RegularFile;
    unsigned int mode = 0;      // permission bits
    std::int64_t mtime = 0;
    std::int64_t size = 0;      // regular files only
    std::int64_t uid = 0;
    std::int64_t gid = 0;
    std::string link_target;    // symlinks only, literal
};

// Custom deleters for libarchive handles
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const;
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const;
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const;
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveEntryHandle = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

const char* entry_kind_name(EntryKind kind);

// Opens a tar archive for sequential reading. Throws LtarException(ArchiveFailure).
ArchiveReadHandle open_archive_for_reading(const std::filesystem::path& archive_path);

// Opens a new uncompressed pax-restricted tar for writing at archive_path.
ArchiveWriteHandle open_archive_for_writing(const std::filesystem::path& archive_path);

// Builds the libarchive header for entry.
ArchiveEntryHandle to_libarchive_entry(const ArchiveEntry& entry);

// Reads a libarchive header back. Returns nullopt for kinds ltar does not model
// (FIFOs, devices) and for entries without a path.
std::optional<ArchiveEntry> from_libarchive_entry(struct archive_entry* entry);

// archive_error_string() with a localized fallback when libarchive has none.
std::string archive_error(struct archive* a, const std::string& fallback_key);
