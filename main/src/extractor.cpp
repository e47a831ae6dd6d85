#include "extractor.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "path_resolver.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <optional>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {
    // A symlink already on disk in the middle of an entry path would redirect
    // the write outside output_dir.
    void reject_symlinked_parents(const fs::path& output_dir, const fs::path& relative) {
        fs::path current = output_dir;
        fs::path parent = relative.parent_path();
        for (const auto& component : parent) {
            if (component.empty() || component == ".") continue;
            current /= component;
            std::error_code ec;
            if (fs::is_symlink(fs::symlink_status(current, ec))) {
                throw LtarException(ErrorKind::InvalidEntryPath,
                    string_format("error.entry_path_through_symlink", relative.string(), current.string()));
            }
        }
    }

    [[noreturn]] void throw_extract_failed(const fs::path& archive_path, struct archive* a, const std::string& fallback_key) {
        throw LtarException(ErrorKind::ArchiveFailure,
            string_format("error.extract_failed", archive_path.string()) + ": " + archive_error(a, fallback_key));
    }
}

void extract_archive(const fs::path& output_dir, const fs::path& archive_path) {
    require_archive_file(archive_path);
    ensure_dir_exists(output_dir);
    // Resolved so that the symlink checks below never trip over the caller's own path
    const fs::path root = fs::canonical(output_dir);

    ArchiveReadHandle a = open_archive_for_reading(archive_path);

    ArchiveWriteHandle ext(archive_write_disk_new());
    if (!ext) {
        throw LtarException(ErrorKind::ArchiveFailure, get_string("error.archive_alloc_failed"));
    }
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
        ARCHIVE_EXTRACT_UNLINK
    );

    struct archive_entry* entry;
    int r = ARCHIVE_OK;
    long long count = 0;
    while (true) {
        r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw_extract_failed(archive_path, a.get(), "error.fatal_read");
            }
            log_warning(archive_error(a.get(), "error.unknown"));
        }

        const char* current_path = archive_entry_pathname(entry);
        std::string relative = current_path ? normalize_entry_path(current_path) : "";
        if (relative.empty()) {
            if (archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
                throw_extract_failed(archive_path, a.get(), "error.data_block_read");
            }
            continue;
        }

        // Path traversal mitigation: every entry must stay under output_dir
        fs::path dest_path = validate_path(relative, root);
        reject_symlinked_parents(root, fs::path(relative).lexically_normal());
        ensure_dir_exists(dest_path.parent_path());
        archive_entry_set_pathname(entry, dest_path.c_str());

        // Hard links from foreign archives point at another member; remap it too.
        // Symlink targets are deliberately left as stored.
        const char* hardlink = archive_entry_hardlink(entry);
        if (hardlink) {
            fs::path link_dest = validate_path(normalize_entry_path(hardlink), root);
            archive_entry_set_hardlink(entry, link_dest.c_str());
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw_extract_failed(archive_path, ext.get(), "error.fatal_write");
            }
            log_warning(archive_error(ext.get(), "error.unknown"));
        }

        if (archive_entry_size(entry) > 0) {
            const void* buff;
            size_t size;
            la_int64_t offset;
            while (true) {
                r = archive_read_data_block(a.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r < ARCHIVE_OK) {
                    if (r < ARCHIVE_WARN) {
                        throw_extract_failed(archive_path, a.get(), "error.data_block_read");
                    }
                    log_warning(archive_error(a.get(), "error.unknown"));
                    break;
                }

                if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                    throw_extract_failed(archive_path, ext.get(), "error.data_block_write");
                }
            }
        }

        r = archive_write_finish_entry(ext.get());
        if (r < ARCHIVE_WARN) {
            throw_extract_failed(archive_path, ext.get(), "error.fatal_write");
        }

        log_verbose(relative);
        ++count;
    }

    // Deferred directory permissions and times are applied on close
    if (archive_write_close(ext.get()) != ARCHIVE_OK) {
        throw_extract_failed(archive_path, ext.get(), "error.fatal_write");
    }

    log_info(string_format("info.extract_complete", count, output_dir.string()));
}

std::vector<ArchiveEntry> list_archive(const fs::path& archive_path) {
    require_archive_file(archive_path);
    ArchiveReadHandle a = open_archive_for_reading(archive_path);

    std::vector<ArchiveEntry> entries;
    struct archive_entry* entry;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw LtarException(ErrorKind::ArchiveFailure,
                    string_format("error.list_failed", archive_path.string()) + ": " + archive_error(a.get(), "error.fatal_read"));
            }
            log_warning(archive_error(a.get(), "error.unknown"));
        }

        std::optional<ArchiveEntry> described = from_libarchive_entry(entry);
        if (described && !described->path.empty()) {
            entries.push_back(std::move(*described));
        } else if (!described) {
            const char* name = archive_entry_pathname(entry);
            log_warning(string_format("warning.unsupported_entry", name ? name : "?"));
        }
        if (archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
            throw LtarException(ErrorKind::ArchiveFailure,
                string_format("error.list_failed", archive_path.string()) + ": " + archive_error(a.get(), "error.data_block_read"));
        }
    }
    return entries;
}
