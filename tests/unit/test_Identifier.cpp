#include <gtest/gtest.h>
#include "pcloud/errors/Errors.hpp"
#include "pcloud/types/Identifier.hpp"
#include "pcloud/types/Metadata.hpp"

#include <stdexcept>
#include <type_traits>

using namespace pcloud::types;

TEST(IdentifierTest, PathIsCarriedAsIs) {
    const Identifier id("/test-folder/test.txt");
    EXPECT_TRUE(id.isPath());
    EXPECT_FALSE(id.isId());
    EXPECT_EQ(id.path(), "/test-folder/test.txt");
    EXPECT_THROW((void)id.id(), std::logic_error);
}

TEST(IdentifierTest, NumericIdFromAnyIntegral) {
    const Identifier a(42);
    const Identifier b(std::uint64_t{42});
    EXPECT_TRUE(a.isId());
    EXPECT_EQ(a.id(), 42u);
    EXPECT_EQ(a, b);
    EXPECT_THROW((void)a.path(), std::logic_error);
}

TEST(IdentifierTest, RootStaysAPath) {
    const Identifier root("/");
    EXPECT_TRUE(root.isPath());
    EXPECT_TRUE(root.isValid());
    EXPECT_EQ(root.param(EntityKind::Folder), QueryPair("path", "/"));
    EXPECT_NE(root, Identifier(0));
}

TEST(IdentifierTest, RelativeAndEmptyPathsAreInvalid) {
    EXPECT_FALSE(Identifier("docs/report.txt").isValid());
    EXPECT_FALSE(Identifier("").isValid());
    EXPECT_TRUE(Identifier(0).isValid());
}

TEST(IdentifierTest, ParamDependsOnEntityKind) {
    const Identifier id(1234);
    EXPECT_EQ(id.param(EntityKind::Folder), QueryPair("folderid", "1234"));
    EXPECT_EQ(id.param(EntityKind::File), QueryPair("fileid", "1234"));
    EXPECT_EQ(Identifier("/a/b").param(EntityKind::File), QueryPair("path", "/a/b"));
}

TEST(IdentifierTest, TargetParam) {
    EXPECT_EQ(Identifier("/dest").targetParam(), QueryPair("topath", "/dest"));
    EXPECT_EQ(Identifier(7).targetParam(), QueryPair("tofolderid", "7"));
}

TEST(IdentifierTest, ToString) {
    EXPECT_EQ(Identifier("/x").toString(), "/x");
    EXPECT_EQ(Identifier(99).toString(), "#99");
}

TEST(IdentifierTest, NegativeIdsAreRejected) {
    EXPECT_THROW((void)Identifier(-1), pcloud::errors::ConfigurationError);
    EXPECT_THROW((void)Identifier(std::int64_t{-42}), pcloud::errors::ConfigurationError);
    EXPECT_EQ(Identifier(std::int64_t{5}).id(), 5u);
    static_assert(!std::is_constructible_v<Identifier, bool>);
}

TEST(IdentifierTest, FromFolderMetadata) {
    Metadata m;
    m.name = "docs";
    m.isfolder = true;
    m.folderid = 12;

    const auto id = Identifier::fromMetadata(m, EntityKind::Folder);
    EXPECT_TRUE(id.isId());
    EXPECT_EQ(id.param(EntityKind::Folder), QueryPair("folderid", "12"));
    EXPECT_THROW((void)Identifier::fromMetadata(m, EntityKind::File), pcloud::errors::ConfigurationError);
}

TEST(IdentifierTest, FromFileStat) {
    FileOrFolderStat stat;
    stat.metadata = Metadata{};
    stat.metadata->name = "a.txt";
    stat.metadata->fileid = 1001;

    EXPECT_EQ(Identifier::fromMetadata(stat, EntityKind::File), Identifier(1001));
    EXPECT_THROW((void)Identifier::fromMetadata(stat, EntityKind::Folder), pcloud::errors::ConfigurationError);

    stat.metadata->fileid.reset();
    EXPECT_THROW((void)Identifier::fromMetadata(stat, EntityKind::File), pcloud::errors::ConfigurationError);
    EXPECT_THROW((void)Identifier::fromMetadata(FileOrFolderStat{}, EntityKind::File), pcloud::errors::ConfigurationError);
}
