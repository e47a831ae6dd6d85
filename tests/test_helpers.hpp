#pragma once

#include <gtest/gtest.h>
#include "../main/src/archive.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/hash.hpp"
#include "../main/src/localization.hpp"
#include "../main/src/utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Runs fn and reports which ErrorKind it threw. Fails the test if it throws
// nothing or something other than LtarException.
template <typename Fn>
ErrorKind thrown_kind(Fn&& fn) {
    try {
        fn();
    } catch (const LtarException& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected an LtarException";
    return ErrorKind::UsageError;
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    f << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Writes a tar by hand, bypassing the archiver, so tests can feed the
// extractor entries it would never produce itself.
inline void write_raw_archive(const fs::path& path, const std::vector<ArchiveEntry>& entries,
                              const std::map<std::string, std::string>& contents = {}) {
    ArchiveWriteHandle a = open_archive_for_writing(path);
    for (ArchiveEntry entry : entries) {
        auto it = contents.find(entry.path);
        if (it != contents.end()) entry.size = static_cast<std::int64_t>(it->second.size());
        ArchiveEntryHandle header = to_libarchive_entry(entry);
        ASSERT_EQ(archive_write_header(a.get(), header.get()), ARCHIVE_OK);
        if (it != contents.end()) {
            ASSERT_EQ(archive_write_data(a.get(), it->second.data(), it->second.size()),
                      static_cast<la_ssize_t>(it->second.size()));
        }
    }
    ASSERT_EQ(archive_write_close(a.get()), ARCHIVE_OK);
}

inline ArchiveEntry make_entry(const std::string& path, EntryKind kind, const std::string& link_target = "") {
    ArchiveEntry entry;
    entry.path = path;
    entry.kind = kind;
    entry.mode = kind == EntryKind::Directory ? 0755 : 0644;
    entry.mtime = 1700000000;
    entry.link_target = link_target;
    return entry;
}

// Scratch directory holding the sample tree:
//
//   parent/bar.txt
//   parent/broken-symlink -> void
//   parent/foodir/bardir/baz.txt -> ../../bar.txt
//   parent/foodir/some-content.txt
//   parent/symlink-dir -> foodir
//   parent/symlink-file -> bar.txt
//   parent/void -> /void
class ArchiveTreeTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;
    fs::path parent_dir;
    std::string bar_sha256;
    std::string some_content_sha256;

    virtual std::string suite_name() const = 0;

    void SetUp() override {
        init_localization();
        set_quiet_mode(true);

        suite_work_dir = fs::absolute("tmp_" + suite_name() + "_" + std::to_string(getpid()));
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        parent_dir = suite_work_dir / "parent";

        write_file(parent_dir / "bar.txt", "bar\nfile used as a symlink destination\n");
        write_file(parent_dir / "foodir/some-content.txt", std::string(20000, 'x') + "\nend of some content\n");
        fs::create_directories(parent_dir / "foodir/bardir");
        fs::create_symlink("../../bar.txt", parent_dir / "foodir/bardir/baz.txt");
        fs::create_directory_symlink("foodir", parent_dir / "symlink-dir");
        fs::create_symlink("bar.txt", parent_dir / "symlink-file");
        fs::create_symlink("void", parent_dir / "broken-symlink");
        fs::create_symlink("/void", parent_dir / "void");

        bar_sha256 = calculate_sha256(parent_dir / "bar.txt");
        some_content_sha256 = calculate_sha256(parent_dir / "foodir/some-content.txt");
    }

    void TearDown() override {
        set_quiet_mode(false);
        set_verbose_mode(false);
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }

    // Checks that root holds a faithful copy of the sample tree.
    void expect_sample_tree(const fs::path& root) {
        ASSERT_TRUE(fs::is_directory(fs::symlink_status(root)));
        EXPECT_TRUE(fs::is_directory(fs::symlink_status(root / "foodir")));
        EXPECT_TRUE(fs::is_directory(fs::symlink_status(root / "foodir/bardir")));

        EXPECT_EQ(calculate_sha256(root / "bar.txt"), bar_sha256);
        EXPECT_EQ(calculate_sha256(root / "foodir/some-content.txt"), some_content_sha256);

        EXPECT_TRUE(fs::is_symlink(root / "foodir/bardir/baz.txt"));
        EXPECT_EQ(fs::read_symlink(root / "foodir/bardir/baz.txt"), "../../bar.txt");
        EXPECT_TRUE(fs::equivalent(root / "foodir/bardir/baz.txt", root / "bar.txt"));

        EXPECT_TRUE(fs::is_symlink(root / "symlink-dir"));
        EXPECT_EQ(fs::read_symlink(root / "symlink-dir"), "foodir");
        EXPECT_TRUE(fs::equivalent(root / "symlink-dir", root / "foodir"));

        EXPECT_TRUE(fs::is_symlink(root / "symlink-file"));
        EXPECT_EQ(fs::read_symlink(root / "symlink-file"), "bar.txt");

        EXPECT_TRUE(fs::is_symlink(root / "broken-symlink"));
        EXPECT_EQ(fs::read_symlink(root / "broken-symlink"), "void");

        EXPECT_TRUE(fs::is_symlink(root / "void"));
        EXPECT_EQ(fs::read_symlink(root / "void"), "/void");
    }
};
