#include "test_helpers.hpp"
#include "../main/src/path_resolver.hpp"

class PathResolverTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;

    void SetUp() override {
        init_localization();
        suite_work_dir = fs::absolute("tmp_path_resolver_test_" + std::to_string(getpid()));
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(suite_work_dir / "parent");
        write_file(suite_work_dir / "file.txt", "file");
    }

    void TearDown() override {
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }
};

TEST_F(PathResolverTest, NoTrailingSlashKeepsDirectoryAsRoot) {
    SourceSpec spec = resolve_source("testdata/parent");
    EXPECT_FALSE(spec.contents_only);
    EXPECT_EQ(spec.root_name, "parent");
    EXPECT_EQ(spec.root, fs::path("testdata/parent"));
}

TEST_F(PathResolverTest, TrailingSlashSelectsContents) {
    SourceSpec spec = resolve_source("testdata/parent/");
    EXPECT_TRUE(spec.contents_only);
    EXPECT_TRUE(spec.root_name.empty());
}

TEST_F(PathResolverTest, DotSegmentsNameTheDirectoryTheyDenote) {
    EXPECT_EQ(resolve_source("./testdata/parent").root_name, "parent");
    EXPECT_EQ(resolve_source("testdata/parent/.").root_name, "parent");
    EXPECT_EQ(resolve_source("testdata/parent/sub/..").root_name, "parent");
    EXPECT_EQ(resolve_source(".").root_name, fs::current_path().filename().string());
}

TEST_F(PathResolverTest, FilesystemRootHasNoName) {
    SourceSpec spec = resolve_source("/");
    EXPECT_TRUE(spec.contents_only);
}

TEST_F(PathResolverTest, TrailingSeparatorDetection) {
    EXPECT_TRUE(has_trailing_separator("a/"));
    EXPECT_TRUE(has_trailing_separator("/"));
    EXPECT_FALSE(has_trailing_separator("a"));
    EXPECT_FALSE(has_trailing_separator("a/."));
    EXPECT_FALSE(has_trailing_separator(""));
}

TEST_F(PathResolverTest, RequireDirectory) {
    EXPECT_NO_THROW(require_directory(suite_work_dir / "parent"));
    EXPECT_EQ(thrown_kind([&] { require_directory(suite_work_dir / "file.txt"); }), ErrorKind::NotADirectory);
    EXPECT_EQ(thrown_kind([&] { require_directory(suite_work_dir / "missing"); }), ErrorKind::NotADirectory);

    fs::create_directory_symlink(suite_work_dir / "parent", suite_work_dir / "link");
    EXPECT_NO_THROW(require_directory(suite_work_dir / "link"));
}

TEST_F(PathResolverTest, RequireArchiveFile) {
    EXPECT_NO_THROW(require_archive_file(suite_work_dir / "file.txt"));
    EXPECT_EQ(thrown_kind([&] { require_archive_file(suite_work_dir / "parent"); }), ErrorKind::IsADirectory);
    EXPECT_EQ(thrown_kind([&] { require_archive_file(suite_work_dir / "missing"); }), ErrorKind::NotAFile);
}

TEST_F(PathResolverTest, InPlaceSourceMustHaveNoExtension) {
    EXPECT_EQ(in_place_source_directory("parent"), fs::path("parent"));
    EXPECT_EQ(in_place_source_directory("dir/parent/"), fs::path("dir/parent"));
    EXPECT_EQ(in_place_source_directory(".hidden"), fs::path(".hidden"));

    EXPECT_EQ(thrown_kind([] { in_place_source_directory("parent.tar"); }), ErrorKind::UnexpectedExtension);
    EXPECT_EQ(thrown_kind([] { in_place_source_directory("parent.tar/"); }), ErrorKind::UnexpectedExtension);
    EXPECT_EQ(thrown_kind([] { in_place_source_directory("foo.io"); }), ErrorKind::UnexpectedExtension);
}

TEST_F(PathResolverTest, InPlaceDestinationStripsTarExtension) {
    EXPECT_EQ(in_place_destination_directory("parent.tar"), fs::path("parent"));
    EXPECT_EQ(in_place_destination_directory("dir/foo.io.tar"), fs::path("dir/foo.io"));

    EXPECT_EQ(thrown_kind([] { in_place_destination_directory("archive"); }), ErrorKind::UnexpectedExtension);
    EXPECT_EQ(thrown_kind([] { in_place_destination_directory("archive.tgz"); }), ErrorKind::UnexpectedExtension);
    EXPECT_EQ(thrown_kind([] { in_place_destination_directory("dir/.tar"); }), ErrorKind::UnexpectedExtension);
    EXPECT_EQ(thrown_kind([] { in_place_destination_directory("parent.tar/"); }), ErrorKind::UnexpectedExtension);
}
