/**
 * @file disc_image_tests.cpp
 * @brief DiscImage facade: file reads and writes, views, backing files
 */

#include "test_helpers.hpp"
#include "disc_image.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

using namespace gcdisc;

class DiscImageTest : public ::testing::Test {
protected:
    DiscImage image{Reference::image()};
};

// ============================================================================
// Opening
// ============================================================================

TEST_F(DiscImageTest, Open_DecodesHeaderAndRegistry) {
    EXPECT_EQ(image.layout().gameCode, "GALE");
    EXPECT_EQ(image.layout().fstOffset, Reference::FST_OFFSET);
    EXPECT_EQ(image.files().numFstEntries(), 24u);
    EXPECT_EQ(image.backing().size(), Reference::DISC_SIZE);
}

TEST_F(DiscImageTest, Extents) {
    EXPECT_EQ(image.fileOffset("TyPokeD.dat"), 0x3acf0000u);
    EXPECT_EQ(image.fileSize("TyPokeD.dat"), 0x327e2u);
    EXPECT_EQ(image.fileOffset(layout::EXECUTABLE_FILE), Reference::DOL_OFFSET);
    EXPECT_THROW(image.fileOffset("nope.dat"), NotFoundError);
}

TEST(DiscImageTests, TruncatedImage_FailsToOpen) {
    auto container = std::make_unique<MemoryContainer>(std::vector<uint8_t>(0x100, 0));
    EXPECT_THROW(DiscImage{std::move(container)}, FormatError);
}

// ============================================================================
// Reading
// ============================================================================

TEST_F(DiscImageTest, ReadFile_Slice) {
    const auto expected = patternBytes(Reference::PLSS_SIZE, 0x5A);
    expectBytes(image.readFile("PlSs.dat", 0x1000, 0x42),
                std::vector<uint8_t>(expected.begin() + 0x1000, expected.begin() + 0x1042));
}

TEST_F(DiscImageTest, ReadFile_WholeFile) {
    const auto data = image.readFile("PlSs.dat");
    EXPECT_EQ(data.size(), Reference::PLSS_SIZE);
    expectBytes(data, patternBytes(Reference::PLSS_SIZE, 0x5A));
}

TEST_F(DiscImageTest, ReadFile_ToEndFromOffset) {
    const auto data = image.readFile("PlSs.dat", Reference::PLSS_SIZE - 3);
    EXPECT_EQ(data.size(), 3u);
}

TEST_F(DiscImageTest, ReadFile_PrivilegedRegions) {
    expectBytes(image.readFile(layout::BOOT_FILE, 0, 4), toBytes("GALE"));
    EXPECT_EQ(image.readFile(layout::FST_FILE).size(), Reference::FST_SIZE);
    EXPECT_EQ(image.readFile(layout::DISC_INFO_FILE).size(), layout::DISC_INFO_SIZE);
}

TEST_F(DiscImageTest, ReadFile_Bounds) {
    EXPECT_THROW(image.readFile("PlSs.dat", Reference::PLSS_SIZE), OutOfRangeError);
    EXPECT_THROW(image.readFile("PlSs.dat", -1), OutOfRangeError);
    EXPECT_THROW(image.readFile("PlSs.dat", 0, Reference::PLSS_SIZE + 1), RangeExceededError);
    EXPECT_THROW(image.readFile("PlSs.dat", 0x10, Reference::PLSS_SIZE - 0xF), RangeExceededError);
    EXPECT_THROW(image.readFile("audio"), NotFoundError) << "directories are not files";
    EXPECT_THROW(image.readFile("plss.dat"), NotFoundError) << "paths are case sensitive";
}

TEST_F(DiscImageTest, View_SeekTellSequence) {
    const auto expected = patternBytes(Reference::PLSS_SIZE, 0x5A);
    auto view = image.open("PlSs.dat");
    EXPECT_EQ(view.size(), Reference::PLSS_SIZE);
    EXPECT_EQ(view.baseOffset(), image.fileOffset("PlSs.dat"));

    view.seek(0x1000);
    expectBytes(view.read(0x30), std::vector<uint8_t>(expected.begin() + 0x1000, expected.begin() + 0x1030));
    EXPECT_EQ(view.tell(), 0x1030);

    EXPECT_EQ(view.seek(0x10, SeekWhence::Current), 0x1040);
    EXPECT_EQ(view.seek(-0x20, SeekWhence::End), static_cast<int64_t>(Reference::PLSS_SIZE) - 0x20);

    expectBytes(view.read(), std::vector<uint8_t>(expected.end() - 0x20, expected.end()));
    EXPECT_EQ(view.tell(), static_cast<int64_t>(Reference::PLSS_SIZE));

    const int64_t pastEnd = view.seek(0x20, SeekWhence::Current);
    EXPECT_EQ(pastEnd, static_cast<int64_t>(Reference::PLSS_SIZE) + 0x20);
    EXPECT_THROW(view.read(1), OutOfRangeError);
    EXPECT_EQ(view.tell(), pastEnd);
}

// ============================================================================
// Writing
// ============================================================================

TEST_F(DiscImageTest, WriteFile_RoundTrip) {
    EXPECT_EQ(image.writeFile("Vi0801.dat", 0x10, toBytes("patched")), 7u);
    expectBytes(image.readFile("Vi0801.dat", 0x10, 7), toBytes("patched"));
    expectBytes(image.readFile("Vi0801.dat", 0, 0x10), std::vector<uint8_t>(0x10, 0));
    expectBytes(image.readFile("Vi1101.dat"), std::vector<uint8_t>(0x100, 0), "neighbour untouched");
}

TEST_F(DiscImageTest, WriteFile_ThroughView) {
    auto view = image.open("Vi1202.dat");
    view.seek(-4, SeekWhence::End);
    EXPECT_EQ(view.write(toBytes("tail")), 4u);
    EXPECT_EQ(view.tell(), 0x100);
    expectBytes(image.readFile("Vi1202.dat", 0xFC), toBytes("tail"));
}

TEST_F(DiscImageTest, WriteFile_CannotGrowFile) {
    const auto before = image.backing().read(image.fileOffset("Vi0801.dat"), 0x200);

    EXPECT_THROW(image.writeFile("Vi0801.dat", 0xFC, toBytes("12345")), RangeExceededError);
    EXPECT_THROW(image.writeFile("Vi0801.dat", 0x100, toBytes("1")), OutOfRangeError);
    EXPECT_THROW(image.writeFile("missing.dat", 0, toBytes("1")), NotFoundError);

    expectBytes(image.backing().read(image.fileOffset("Vi0801.dat"), 0x200), before, "nothing written");
}

// ============================================================================
// Executable
// ============================================================================

TEST_F(DiscImageTest, ExecutableLayout_MainDol) {
    const auto dol = image.executableLayout();
    EXPECT_EQ(dol.sections(), ExecutableLayout::parse(Reference::dolHeader()).sections());
    EXPECT_EQ(dol.entryPoint, Reference::ENTRY_POINT);
    EXPECT_EQ(dol.sections().size(), 10u);
}

TEST(DiscImageTests, ExecutableLayout_EmptyFileIsFormatError) {
    auto builder = DiscImageBuilder{};
    builder.executable(0x3000, makeDolHeader({{0x100, 0x80003100, 0x20}}, {}, 0, 0, 0x80003100))
        .file("empty.dol", 0x10000, 0);
    DiscImage image{builder.buildInMemory()};

    EXPECT_EQ(image.executableLayout().sections().size(), 1u);
    EXPECT_THROW(image.executableLayout("empty.dol"), FormatError);
    EXPECT_THROW(image.executableLayout("missing.dol"), NotFoundError);
}

// ============================================================================
// File backed images
// ============================================================================

class FileBackedImageTest : public ::testing::Test {
protected:
    TempFile iso{"image.iso"};

    void SetUp() override {
        auto builder = DiscImageBuilder{};
        builder.header("GTST", "01", 0, 1, "File Backed")
            .file("sys/readme.txt", toBytes("hello from the disc"))
            .file("data.bin", patternBytes(0x300, 7));
        iso.write(builder.buildInMemory()->data());
    }
};

TEST_F(FileBackedImageTest, ReadsFromDisk) {
    DiscImage image(iso.path(), true);
    EXPECT_EQ(image.layout().gameName, "File Backed");
    expectBytes(image.readFile("sys/readme.txt"), toBytes("hello from the disc"));
    const auto content = patternBytes(0x300, 7);
    expectBytes(image.readFile("data.bin", 0x100, 0x10),
                std::vector<uint8_t>(content.begin() + 0x100, content.begin() + 0x110));
}

TEST_F(FileBackedImageTest, WritesPersist) {
    {
        DiscImage image(iso.path());
        EXPECT_EQ(image.writeFile("sys/readme.txt", 6, toBytes("FROM")), 4u);
    }
    DiscImage reopened(iso.path(), true);
    expectBytes(reopened.readFile("sys/readme.txt"), toBytes("hello FROM the disc"));
}

TEST_F(FileBackedImageTest, ReadOnlyRejectsWrites) {
    DiscImage image(iso.path(), true);
    EXPECT_THROW(image.writeFile("data.bin", 0, toBytes("x")), IoError);
    expectBytes(image.readFile("data.bin", 0, 1), std::vector<uint8_t>(1, patternBytes(1, 7)[0]));
}

TEST(DiscImageTests, MissingFile_IsIoError) {
    TempFile missing("missing.iso");
    EXPECT_THROW(DiscImage{missing.path()}, IoError);
}

TEST(DiscImageTests, FileContainer_Basics) {
    TempFile file("container.bin");
    file.write(patternBytes(0x40));

    FileContainer container(file.path());
    EXPECT_EQ(container.size(), 0x40u);
    EXPECT_TRUE(container.isWritable());
    EXPECT_EQ(container.filename(), file.path());

    container.write(0x3C, toBytes("tail"));
    expectBytes(container.read(0x3C, 4), toBytes("tail"));
    EXPECT_TRUE(container.read(0x40, 0).empty());
    EXPECT_THROW(container.read(0x41, 0), OutOfRangeError);
    EXPECT_THROW(container.read(0x3C, 5), RangeExceededError);
    EXPECT_THROW(container.write(0x3D, toBytes("tail")), RangeExceededError);
}
