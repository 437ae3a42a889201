#include <gtest/gtest.h>

#include <memory>

#include "entry_renderer.h"
#include "test_support.h"

namespace rls {
namespace {

using test::At;

Palette Plain() {
    Palette palette;
    palette.enabled = false;
    return palette;
}

TEST(QuoteNameTest, OrdinaryNamesAreUntouched) {
    EXPECT_EQ(QuoteName("plain.txt"), "plain.txt");
    EXPECT_EQ(QuoteName("with inner space"), "with inner space");
    EXPECT_EQ(QuoteName("it's"), "it's");
    EXPECT_EQ(QuoteName("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(QuoteNameTest, LeadingOrTrailingBlanksAndQuotesAreQuoted) {
    EXPECT_EQ(QuoteName(" lead"), "' lead'");
    EXPECT_EQ(QuoteName("trail "), "'trail '");
    EXPECT_EQ(QuoteName("\"quoted\""), "'\"quoted\"'");
}

TEST(QuoteNameTest, DoubleQuotesWhenNameHasSingleQuote) {
    EXPECT_EQ(QuoteName("it's "), "\"it's \"");
    EXPECT_EQ(QuoteName("'x"), "\"'x\"");
}

TEST(QuoteNameTest, BackslashesAndQuoteCharacterAreEscaped) {
    EXPECT_EQ(QuoteName(" a\\b"), "' a\\\\b'");
    EXPECT_EQ(QuoteName("say \"hi\" it's "), "\"say \\\"hi\\\" it's \"");
}

TEST(QuoteNameTest, ControlCharactersBecomeEscapes) {
    EXPECT_EQ(QuoteName("a\tb"), "'a\\tb'");
    EXPECT_EQ(QuoteName("line\nbreak"), "'line\\nbreak'");
    EXPECT_EQ(QuoteName("cr\r"), "'cr\\r'");
    EXPECT_EQ(QuoteName(std::string("nul\0x", 5)), "'nul\\x00x'");
    EXPECT_EQ(QuoteName("bell\x07"), "'bell\\x07'");
    EXPECT_EQ(QuoteName("del\x7f"), "'del\\x7f'");
    EXPECT_EQ(QuoteName("c1\xc2\x85"), "'c1\\x85'");
}

TEST(PaletteTest, PaintsWith256ColourCodes) {
    Palette palette;
    EXPECT_EQ(palette.Paint(80, "x"), "\x1b[38;5;80mx\x1b[0m");
    palette.enabled = false;
    EXPECT_EQ(palette.Paint(80, "x"), "x");
}

TEST(NameColumnTest, DirectoriesGetSlashAndDirectoryColour) {
    test::FakeEnumerator tree;
    const Entry dir = Entry::Directory("src", "src", At(0), At(0), tree);
    const Palette palette;
    EXPECT_EQ(NameColumn(true, palette).Render(dir), palette.Paint(palette.directory, "src/"));
}

TEST(NameColumnTest, ExtensionIsHighlightedOnRequest) {
    const Palette palette;
    const Entry file = Entry::File("notes.txt", 1, At(0), At(0));
    EXPECT_EQ(NameColumn(false, palette).Render(file), palette.Paint(palette.file, "notes.txt"));
    EXPECT_EQ(NameColumn(true, palette).Render(file),
              palette.Paint(palette.file, "notes") + palette.Paint(palette.extension, ".txt"));
}

TEST(NameColumnTest, ClosingQuoteStaysOutOfExtensionColour) {
    const Palette palette;
    const Entry file = Entry::File(" notes.txt", 1, At(0), At(0));
    EXPECT_EQ(NameColumn(true, palette).Render(file),
              palette.Paint(palette.file, "' notes") + palette.Paint(palette.extension, ".txt") +
                  palette.Paint(palette.file, "'"));
}

TEST(NameColumnTest, DotlessNamesAreSingleColour) {
    const Palette palette;
    const Entry file = Entry::File("Makefile", 1, At(0), At(0));
    EXPECT_EQ(NameColumn(true, palette).Render(file), palette.Paint(palette.file, "Makefile"));
}

TEST(CountColumnTest, FilesGetBlanksOfTheSameWidth) {
    test::FakeEnumerator tree;
    tree.AddDirectory("d");
    tree.AddFile("d", "f", 1);
    const Entry dir = Entry::Directory("d", "d", At(0), At(0), tree);
    const Entry file = Entry::File("f", 1, At(0), At(0));

    const CountColumn short_count(CountColumn::Field::Subfiles, false, Plain());
    EXPECT_EQ(short_count.Render(dir), "   1");
    EXPECT_EQ(short_count.Render(file), "    ");

    const CountColumn long_count(CountColumn::Field::Subdirs, true, Plain());
    EXPECT_EQ(long_count.Render(dir), "    0  ");
    EXPECT_EQ(long_count.Render(file), std::string(7, ' '));
}

TEST(CountColumnTest, UnreadableDirectoryShowsPlaceholder) {
    test::FakeEnumerator tree;
    const Entry dir = Entry::Directory("locked", "locked", At(0), At(0), tree);
    EXPECT_EQ(CountColumn(CountColumn::Field::Subfiles, false, Plain()).Render(dir), " ???");
}

TEST(SizeColumnTest, RendersBytes) {
    const Entry file = Entry::File("f", 2048, At(0), At(0));
    EXPECT_EQ(SizeColumn(false, Plain()).Render(file), "  2k");
    EXPECT_EQ(SizeColumn(true, Plain()).Render(file), "    2 kB");
}

TEST(TimeColumnTest, PicksRequestedTimestamp) {
    TimeFormatter::Options options;
    options.now = At(100);
    const TimeFormatter formatter(options);
    const Entry file = Entry::File("f", 0, At(40), At(90));
    EXPECT_EQ(TimeColumn(TimeColumn::Field::Creation, formatter, Plain()).Render(file), " 60s ago");
    EXPECT_EQ(TimeColumn(TimeColumn::Field::Modification, formatter, Plain()).Render(file), " 10s ago");
}

TEST(EntryRendererTest, NameOnlyRowHasNoIndent) {
    EntryRenderer renderer;
    renderer.Add(std::make_unique<NameColumn>(false, Plain()));
    EXPECT_EQ(renderer.Render(Entry::File("a", 5, At(0), At(0))), "a");
}

TEST(EntryRendererTest, AttributeColumnsAreIndentedAndJoined) {
    TimeFormatter::Options options;
    options.now = At(100);

    EntryRenderer renderer;
    renderer.Add(std::make_unique<TimeColumn>(TimeColumn::Field::Modification, TimeFormatter(options), Plain()));
    renderer.Add(std::make_unique<SizeColumn>(false, Plain()));
    renderer.Add(std::make_unique<NameColumn>(false, Plain()));
    EXPECT_EQ(renderer.column_count(), 3u);
    EXPECT_EQ(renderer.Render(Entry::File("a", 5, At(0), At(70))), "  30s ago    5B  a");
}

}  // namespace
}  // namespace rls
