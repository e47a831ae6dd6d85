#include "archiver.hpp"
#include "archive.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "path_resolver.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {
    // Removes the staging file unless commit() renamed it over the destination.
    class StagingFile {
    public:
        StagingFile(fs::path staging, fs::path destination)
            : staging_(std::move(staging)), destination_(std::move(destination)) {}

        ~StagingFile() {
            if (!committed_) {
                std::error_code ec;
                fs::remove(staging_, ec);
            }
        }

        StagingFile(const StagingFile&) = delete;
        StagingFile& operator=(const StagingFile&) = delete;

        const fs::path& path() const { return staging_; }

        void commit() {
            fs::rename(staging_, destination_);
            committed_ = true;
        }

    private:
        fs::path staging_;
        fs::path destination_;
        bool committed_ = false;
    };

    struct WalkState {
        struct archive* a;
        dev_t staging_dev = 0;
        ino_t staging_ino = 0;
        long long count = 0;
    };

    struct stat stat_or_throw(const fs::path& path, bool follow) {
        struct stat st;
        int rc = follow ? stat(path.c_str(), &st) : lstat(path.c_str(), &st);
        if (rc != 0) {
            throw fs::filesystem_error(string_format("error.stat_failed", path.string()), path,
                std::error_code(errno, std::generic_category()));
        }
        return st;
    }

    std::optional<ArchiveEntry> describe(const fs::path& path, const struct stat& st, const std::string& entry_name) {
        ArchiveEntry entry;
        entry.path = entry_name;
        entry.mode = st.st_mode & 07777;
        entry.mtime = st.st_mtime;
        entry.uid = st.st_uid;
        entry.gid = st.st_gid;

        if (S_ISDIR(st.st_mode)) {
            entry.kind = EntryKind::Directory;
        } else if (S_ISREG(st.st_mode)) {
            entry.kind = EntryKind::RegularFile;
            entry.size = st.st_size;
        } else if (S_ISLNK(st.st_mode)) {
            entry.kind = EntryKind::Symlink;
            entry.link_target = fs::read_symlink(path).string();
        } else {
            return std::nullopt;
        }
        return entry;
    }

    void write_content(struct archive* a, const fs::path& path) {
        std::ifstream f(path, std::ios::binary);
        if (!f) {
            throw LtarException(ErrorKind::IoFailure,
                string_format("error.open_file_failed", path.string()) + ": " + strerror(errno));
        }
        char buffer[COPY_BUFFER_SIZE];
        while (f.read(buffer, sizeof(buffer)) || f.gcount() > 0) {
            if (archive_write_data(a, buffer, static_cast<size_t>(f.gcount())) < 0) {
                throw LtarException(ErrorKind::ArchiveFailure,
                    string_format("error.write_data_failed", path.string()) + ": " + archive_error(a, "error.unknown"));
            }
        }
        if (f.bad()) {
            throw LtarException(ErrorKind::IoFailure, string_format("error.read_file_failed", path.string()));
        }
    }

    // Writes one filesystem object. Returns its kind, or nullopt if skipped.
    std::optional<EntryKind> add_to_archive(WalkState& state, const fs::path& path, const std::string& entry_name, bool follow) {
        struct stat st = stat_or_throw(path, follow);

        if (S_ISREG(st.st_mode) && st.st_dev == state.staging_dev && st.st_ino == state.staging_ino) {
            return std::nullopt;
        }

        std::optional<ArchiveEntry> entry = describe(path, st, entry_name);
        if (!entry) {
            log_warning(string_format("warning.unsupported_file_type", path.string()));
            return std::nullopt;
        }

        ArchiveEntryHandle header = to_libarchive_entry(*entry);
        int r = archive_write_header(state.a, header.get());
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw LtarException(ErrorKind::ArchiveFailure,
                    string_format("error.write_header_failed", entry_name) + ": " + archive_error(state.a, "error.unknown"));
            }
            log_warning(archive_error(state.a, "error.unknown"));
        }

        if (entry->kind == EntryKind::RegularFile && entry->size > 0) {
            write_content(state.a, path);
        }

        log_verbose(entry_name);
        ++state.count;
        return entry->kind;
    }

    void add_directory_contents(WalkState& state, const fs::path& dir, const std::string& prefix) {
        std::vector<fs::path> children;
        for (const auto& child : fs::directory_iterator(dir)) {
            children.push_back(child.path());
        }
        std::sort(children.begin(), children.end(), [](const fs::path& lhs, const fs::path& rhs) {
            return lhs.filename().string() < rhs.filename().string();
        });

        for (const auto& child : children) {
            std::string name = to_archive_path(child.filename());
            if (!prefix.empty()) name = prefix + "/" + name;
            if (add_to_archive(state, child, name, false) == EntryKind::Directory) {
                add_directory_contents(state, child, name);
            }
        }
    }
}

void create_archive(const fs::path& archive_path, const std::string& source) {
    SourceSpec spec = resolve_source(source);
    require_directory(spec.root);

    fs::path staging_path = archive_path;
    staging_path += STAGING_SUFFIX;
    // Never clobber a file the guard below did not create
    std::error_code ec;
    if (fs::exists(fs::symlink_status(staging_path, ec))) {
        throw LtarException(ErrorKind::IoFailure, string_format("error.staging_exists", staging_path.string()));
    }
    StagingFile staging(staging_path, archive_path);

    long long count = 0;
    {
        ArchiveWriteHandle a = open_archive_for_writing(staging.path());

        WalkState state{a.get()};
        struct stat staging_st = stat_or_throw(staging.path(), true);
        state.staging_dev = staging_st.st_dev;
        state.staging_ino = staging_st.st_ino;

        std::string prefix;
        if (!spec.contents_only) {
            prefix = spec.root_name;
            add_to_archive(state, spec.root, prefix, true);
        }
        add_directory_contents(state, spec.root, prefix);

        if (archive_write_close(a.get()) != ARCHIVE_OK) {
            throw LtarException(ErrorKind::ArchiveFailure,
                string_format("error.create_archive_failed", archive_path.string()) + ": " + archive_error(a.get(), "error.unknown"));
        }
        count = state.count;
    }

    staging.commit();
    log_info(string_format("info.create_complete", count, archive_path.string()));
}
