#include "archive.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <sys/types.h>

namespace fs = std::filesystem;

void ArchiveReadDeleter::operator()(struct archive* a) const {
    if (a) {
        archive_read_close(a);
        archive_read_free(a);
    }
}

void ArchiveWriteDeleter::operator()(struct archive* a) const {
    if (a) {
        archive_write_close(a);
        archive_write_free(a);
    }
}

void ArchiveEntryDeleter::operator()(struct archive_entry* e) const {
    if (e) {
        archive_entry_free(e);
    }
}

const char* entry_kind_name(EntryKind kind) {
    switch (kind) {
        case EntryKind::RegularFile: return "file";
        case EntryKind::Directory: return "directory";
        case EntryKind::Symlink: return "symlink";
    }
    return "unknown";
}

std::string archive_error(struct archive* a, const std::string& fallback_key) {
    const char* err = archive_error_string(a);
    return err ? std::string(err) : get_string(fallback_key);
}

ArchiveReadHandle open_archive_for_reading(const fs::path& archive_path) {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        throw LtarException(ErrorKind::ArchiveFailure, get_string("error.archive_alloc_failed"));
    }
    archive_read_support_filter_none(a.get());
    archive_read_support_format_tar(a.get());

    if (archive_read_open_filename(a.get(), archive_path.c_str(), ARCHIVE_READ_BLOCK_SIZE) != ARCHIVE_OK) {
        throw LtarException(ErrorKind::ArchiveFailure,
            string_format("error.open_archive_failed", archive_path.string()) + ": " + archive_error(a.get(), "error.unknown"));
    }
    return a;
}

ArchiveWriteHandle open_archive_for_writing(const fs::path& archive_path) {
    ArchiveWriteHandle a(archive_write_new());
    if (!a) {
        throw LtarException(ErrorKind::ArchiveFailure, get_string("error.archive_alloc_failed"));
    }
    archive_write_add_filter_none(a.get());
    archive_write_set_format_pax_restricted(a.get());

    if (archive_write_open_filename(a.get(), archive_path.c_str()) != ARCHIVE_OK) {
        throw LtarException(ErrorKind::ArchiveFailure,
            string_format("error.create_archive_failed", archive_path.string()) + ": " + archive_error(a.get(), "error.unknown"));
    }
    return a;
}

ArchiveEntryHandle to_libarchive_entry(const ArchiveEntry& entry) {
    ArchiveEntryHandle e(archive_entry_new());
    if (!e) {
        throw LtarException(ErrorKind::ArchiveFailure, get_string("error.archive_alloc_failed"));
    }

    archive_entry_set_pathname(e.get(), entry.path.c_str());
    archive_entry_set_perm(e.get(), static_cast<mode_t>(entry.mode));
    archive_entry_set_mtime(e.get(), static_cast<time_t>(entry.mtime), 0);
    archive_entry_set_uid(e.get(), entry.uid);
    archive_entry_set_gid(e.get(), entry.gid);

    switch (entry.kind) {
        case EntryKind::RegularFile:
            archive_entry_set_filetype(e.get(), AE_IFREG);
            archive_entry_set_size(e.get(), entry.size);
            break;
        case EntryKind::Directory:
            archive_entry_set_filetype(e.get(), AE_IFDIR);
            archive_entry_set_size(e.get(), 0);
            break;
        case EntryKind::Symlink:
            archive_entry_set_filetype(e.get(), AE_IFLNK);
            archive_entry_set_symlink(e.get(), entry.link_target.c_str());
            archive_entry_set_size(e.get(), 0);
            break;
    }
    return e;
}

std::optional<ArchiveEntry> from_libarchive_entry(struct archive_entry* e) {
    const char* pathname = archive_entry_pathname(e);
    if (!pathname) return std::nullopt;

    ArchiveEntry entry;
    entry.path = normalize_entry_path(pathname);
    entry.mode = archive_entry_perm(e);
    entry.mtime = archive_entry_mtime(e);
    entry.uid = archive_entry_uid(e);
    entry.gid = archive_entry_gid(e);

    switch (archive_entry_filetype(e)) {
        case AE_IFREG:
            entry.kind = EntryKind::RegularFile;
            entry.size = archive_entry_size(e);
            break;
        case AE_IFDIR:
            entry.kind = EntryKind::Directory;
            break;
        case AE_IFLNK: {
            entry.kind = EntryKind::Symlink;
            const char* target = archive_entry_symlink(e);
            entry.link_target = target ? target : "";
            break;
        }
        default:
            return std::nullopt;
    }
    return entry;
}
