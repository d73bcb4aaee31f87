#include <gtest/gtest.h>
#include "transport/mlsd.hpp"
#include "types/Device.hpp"

#include <stdexcept>

using namespace rs::transport::mlsd;
using rs::types::Device;
using namespace std::chrono;

TEST(MlsdTest, ParsesFileEntry) {
    const auto e = parseLine("type=file;size=4;modify=20170113063314.000;UNIX.mode=0600; readme.txt");
    EXPECT_EQ(e.type, EntryType::File);
    EXPECT_EQ(e.name, "readme.txt");
    ASSERT_TRUE(e.modified.has_value());
    EXPECT_EQ(*e.modified, sys_seconds{seconds{1484289194}});
}

TEST(MlsdTest, KeepsSpacesInNames) {
    const auto e = parseLine("type=file;modify=20240101000000; Pokemon - Emerald Version (USA).srm");
    EXPECT_EQ(e.name, "Pokemon - Emerald Version (USA).srm");
}

TEST(MlsdTest, FactNamesAreCaseInsensitive) {
    const auto e = parseLine("Type=File;Modify=20240101000000;Size=8; game.sav");
    EXPECT_EQ(e.type, EntryType::File);
    EXPECT_TRUE(e.modified.has_value());
}

TEST(MlsdTest, RecognizesDirectories) {
    EXPECT_EQ(parseLine("type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755; .").type, EntryType::CurrentDir);
    EXPECT_EQ(parseLine("type=pdir;modify=20170116230740; ..").type, EntryType::ParentDir);
    EXPECT_EQ(parseLine("type=dir;modify=20170116230740; states").type, EntryType::Dir);
    EXPECT_EQ(parseLine("type=OS.unix=slink:/target;modify=20170116230740; link").type, EntryType::Other);
}

TEST(MlsdTest, MissingTypeFactMeansFile) {
    const auto e = parseLine("modify=20240101000000;size=8; untyped.srm");
    EXPECT_EQ(e.type, EntryType::File);
    EXPECT_EQ(e.name, "untyped.srm");
}

TEST(MlsdTest, LeadingBlankIsTolerated) {
    EXPECT_EQ(parseLine(" type=file;modify=20240101000000; a.srm").name, "a.srm");
}

TEST(MlsdTest, MissingModifyFactLeavesTimeEmpty) {
    const auto e = parseLine("type=file;size=10; nodate.srm");
    EXPECT_EQ(e.type, EntryType::File);
    EXPECT_FALSE(e.modified.has_value());
}

TEST(MlsdTest, LineWithoutNameThrows) {
    EXPECT_THROW(parseLine("type=file;size=4;"), std::invalid_argument);
    EXPECT_THROW(parseLine("type=file;size=4; "), std::invalid_argument);
}

TEST(MlsdTest, SplitLinesDropsCarriageReturnsAndBlanks) {
    const auto lines = splitLines("type=cdir; .\r\ntype=file;modify=20240101000000; a.srm\r\n\r\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "type=cdir; .");
    EXPECT_EQ(lines[1], "type=file;modify=20240101000000; a.srm");
}

class ListingTest : public ::testing::Test {
protected:
    Device sw{"Switch", "192.168.0.54", 5000, "/retroarch/cores/savefiles"};
};

TEST_F(ListingTest, KeepsOnlyDatedFilesSortedByName) {
    const auto files = parseListing(
        "type=cdir;sizd=4096;modify=20240101000000;UNIX.mode=0755; .\r\n"
        "type=pdir;modify=20240101000000; ..\r\n"
        "type=dir;modify=20240101000000; states\r\n"
        "type=file;size=8;modify=20240102030405.000; zelda.srm\r\n"
        "type=file;size=8;modify=20240101000000; metroid.srm\r\n",
        sw);

    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].name, "metroid.srm");
    EXPECT_EQ(files[1].name, "zelda.srm");
    // 2024-01-02T03:04:05Z, fraction dropped
    EXPECT_EQ(files[1].modified, sys_seconds{seconds{1704164645}});
}

TEST_F(ListingTest, DropsTheListedDirectoryPseudoEntry) {
    const auto files = parseListing(
        "type=file;modify=20240101000000; /retroarch/cores/savefiles\r\n"
        "type=file;modify=20240101000000; Pokemon Emerald.srm\r\n",
        sw);

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, "Pokemon Emerald.srm");
}

TEST_F(ListingTest, SkipsUndatedAndUnreadableLines) {
    const auto files = parseListing(
        "type=file;size=10; nodate.srm\r\n"
        "type=file;modify=garbage; baddate.srm\r\n"
        "type=file;size=4;\r\n"
        "type=file;modify=20240101000000; good.srm\r\n",
        sw);

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, "good.srm");
}

TEST_F(ListingTest, UntypedEntriesAreDownloaded) {
    const auto files = parseListing("modify=20240101000000;size=3; bare.srm\n", sw);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, "bare.srm");
}

TEST_F(ListingTest, EmptyReplyIsEmpty) {
    EXPECT_TRUE(parseListing("", sw).empty());
    EXPECT_TRUE(parseListing("\r\n", sw).empty());
}
