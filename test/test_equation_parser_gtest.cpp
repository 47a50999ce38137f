// test_equation_parser_gtest.cpp
// CSV and Markdown equation listings

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "core/equation_parser.h"
#include "test_support.hpp"

using namespace eqrender::core;

namespace {

std::vector<Equation> csv(const std::string& text) {
    std::istringstream in(text);
    return parse_csv(in);
}

} // namespace

// ---------------------------------------------------------------- CSV

TEST(CsvParserTest, ParsesRowsAfterHeader) {
    const auto eqs = csv("active,body,name\nyes,x = y + z,example_equation\nno,E = mc^2,\n");
    ASSERT_EQ(eqs.size(), 2U);

    EXPECT_TRUE(eqs[0].active);
    EXPECT_EQ(eqs[0].name, "example_equation");
    EXPECT_EQ(eqs[0].body, "x = y + z");

    EXPECT_FALSE(eqs[1].active);
    EXPECT_EQ(eqs[1].name, "default_equation");
    EXPECT_EQ(eqs[1].body, "E = mc^2");
}

TEST(CsvParserTest, FirstRowIsAlwaysDiscarded) {
    const auto eqs = csv("yes,a,first\nyes,b,second\n");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].name, "second");
}

TEST(CsvParserTest, HeaderOnlyYieldsNothing) {
    EXPECT_TRUE(csv("active,body,name\n").empty());
    EXPECT_TRUE(csv("").empty());
}

TEST(CsvParserTest, RowsWithFewerThanThreeFieldsAreSkipped) {
    const auto eqs = csv("h\nyes,a,one\nyes,b\n\nno\nyes,c,three\n");
    ASSERT_EQ(eqs.size(), 2U);
    EXPECT_EQ(eqs[0].name, "one");
    EXPECT_EQ(eqs[1].name, "three");
}

TEST(CsvParserTest, ActiveIsCaseInsensitiveYes) {
    const auto eqs = csv("h\nYES,a,a\n yEs ,b,b\ny,c,c\ntrue,d,d\n,e,e\n");
    ASSERT_EQ(eqs.size(), 5U);
    EXPECT_TRUE(eqs[0].active);
    EXPECT_TRUE(eqs[1].active);
    EXPECT_FALSE(eqs[2].active);
    EXPECT_FALSE(eqs[3].active);
    EXPECT_FALSE(eqs[4].active);
}

TEST(CsvParserTest, FieldsAreTrimmedAndNamesSanitized) {
    const auto eqs = csv("h\nyes,   \\frac{a}{b}  ,  my eq  \n");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].body, "\\frac{a}{b}");
    EXPECT_EQ(eqs[0].name, "my_eq");
}

TEST(CsvParserTest, WindowsLineEndings) {
    const auto eqs = csv("active,body,name\r\nyes,a+b,sum\r\n");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].name, "sum");
    EXPECT_EQ(eqs[0].body, "a+b");
}

TEST(CsvParserTest, DuplicateNamesGetNumericSuffixes) {
    const auto eqs = csv("h\nyes,a,foo\nyes,b,foo\nno,c,foo\nyes,d,bar\n");
    ASSERT_EQ(eqs.size(), 4U);
    EXPECT_EQ(eqs[0].name, "foo");
    EXPECT_EQ(eqs[1].name, "foo_1");
    EXPECT_EQ(eqs[2].name, "foo_2");
    EXPECT_EQ(eqs[3].name, "bar");
}

TEST(CsvParserTest, DuplicateCountingUsesNameBeforeSanitizing) {
    const auto eqs = csv("h\nyes,a,\nyes,b,\nyes,c,default_equation\n");
    ASSERT_EQ(eqs.size(), 3U);
    EXPECT_EQ(eqs[0].name, "default_equation");
    EXPECT_EQ(eqs[1].name, "_1");
    EXPECT_EQ(eqs[2].name, "default_equation");
}

TEST(CsvParserTest, CommaInBodyShiftsFields) {
    const auto eqs = csv("h\nyes,f(x, y),name\n");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].body, "f(x");
    EXPECT_EQ(eqs[0].name, "y_");
}

TEST(CsvParserTest, InvalidUtf8RowsAreDropped) {
    const auto eqs = csv("h\nyes,\xC3\x28,bad\nyes,\xCE\xB1 + 1,good\n");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].name, "good");
    EXPECT_EQ(eqs[0].body, "\xCE\xB1 + 1");
}

TEST(CsvParserTest, RecordCountMatchesQualifyingRows) {
    std::string text = "active,body,name\n";
    size_t qualifying = 0;
    for (int i = 0; i < 25; ++i) {
        if (i % 4 == 0) {
            text += "yes,only two\n";
        } else {
            text += "no,x_" + std::to_string(i) + ",n" + std::to_string(i) + "\n";
            ++qualifying;
        }
    }
    EXPECT_EQ(csv(text).size(), qualifying);
}

TEST(Utf8Test, ValidatesSequences) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("\xE2\x88\x91"));
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));         // overlong
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));     // surrogate
    EXPECT_FALSE(is_valid_utf8("\xE2\x88"));         // truncated
    EXPECT_FALSE(is_valid_utf8("\x80"));
}

class CsvFileTest : public eqrender::test::ScratchDirTest {};

TEST_F(CsvFileTest, ReadsFromDisk) {
    const auto path = write_file("sample.csv", "active,body,name\nyes,x = y + z,example_equation\nno,E = mc^2,\n");
    std::vector<Equation> eqs;
    std::string error;
    ASSERT_TRUE(parse_csv_file(path, eqs, error)) << error;
    ASSERT_EQ(eqs.size(), 2U);
    EXPECT_EQ(eqs[0].name, "example_equation");
    EXPECT_EQ(eqs[1].name, "default_equation");
}

TEST_F(CsvFileTest, MissingFileIsAnError) {
    std::vector<Equation> eqs;
    std::string error;
    EXPECT_FALSE(parse_csv_file(dir / "missing.csv", eqs, error));
    EXPECT_NE(error.find("Failed to open file"), std::string::npos);
}

// ---------------------------------------------------------------- Markdown

TEST(MarkdownParserTest, ParsesDirectivesAroundBlock) {
    const auto eqs = parse_markdown("%%yes%%\n$$x = y + z$$\n%%example_equation%%\n");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_TRUE(eqs[0].active);
    EXPECT_EQ(eqs[0].name, "example_equation");
    EXPECT_EQ(eqs[0].body, "x = y + z");
}

TEST(MarkdownParserTest, NoDirectiveMeansActiveWithDefaultName) {
    const auto eqs = parse_markdown("Some prose.\n\n$$a^2 + b^2 = c^2$$\n\nMore prose.");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_TRUE(eqs[0].active);
    EXPECT_EQ(eqs[0].name, "default_equation");
    EXPECT_EQ(eqs[0].body, "a^2 + b^2 = c^2");
}

TEST(MarkdownParserTest, NoDirectiveDeactivates) {
    const auto eqs = parse_markdown("%%no%%\n$$E = mc^2$$\n%%energy%%");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_FALSE(eqs[0].active);
    EXPECT_EQ(eqs[0].name, "energy");
}

TEST(MarkdownParserTest, EmptyOpeningDirectiveIsActive) {
    const auto eqs = parse_markdown("%%%%$$x$$");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_TRUE(eqs[0].active);
}

TEST(MarkdownParserTest, DirectiveMustTouchBlock) {
    const auto eqs = parse_markdown("%%no%% $$x$$");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_TRUE(eqs[0].active);
}

TEST(MarkdownParserTest, MultiLineBodyIsTrimmed) {
    const auto eqs = parse_markdown("$$\n\\begin{aligned}\na &= b \\\\\nc &= d\n\\end{aligned}\n$$\n%%system%%");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].body, "\\begin{aligned}\na &= b \\\\\nc &= d\n\\end{aligned}");
    EXPECT_EQ(eqs[0].name, "system");
}

TEST(MarkdownParserTest, FirstClosingDelimiterEndsBlock) {
    const auto eqs = parse_markdown("$$a$$ and $$b$$");
    ASSERT_EQ(eqs.size(), 2U);
    EXPECT_EQ(eqs[0].body, "a");
    EXPECT_EQ(eqs[1].body, "b");
    EXPECT_EQ(eqs[0].name, "default_equation");
    EXPECT_EQ(eqs[1].name, "default_equation_1");
}

TEST(MarkdownParserTest, DuplicateNamesAcrossDocument) {
    const auto eqs = parse_markdown(
        "$$1$$\n%%foo%%\n\n$$2$$\n%%foo%%\n\n$$3$$\n%%foo%%\n\n$$4$$\n%%bar%%\n");
    ASSERT_EQ(eqs.size(), 4U);
    EXPECT_EQ(eqs[0].name, "foo");
    EXPECT_EQ(eqs[1].name, "foo_1");
    EXPECT_EQ(eqs[2].name, "foo_2");
    EXPECT_EQ(eqs[3].name, "bar");
}

TEST(MarkdownParserTest, NameDirectiveIsSanitized) {
    const auto eqs = parse_markdown("$$x$$\n%%Newton's law%%");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].name, "Newton_s_law");
}

TEST(MarkdownParserTest, EmptyNameDirectiveFallsBack) {
    const auto eqs = parse_markdown("$$x$$%%%%");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].name, "default_equation");
}

TEST(MarkdownParserTest, TrailingDirectiveTakesNextOpeningDirective) {
    // The name directive is whatever %%...%% follows the block, so a %%no%%
    // meant for the next block names this one instead.
    const auto eqs = parse_markdown("$$a$$\n%%no%%\n$$b$$\n");
    ASSERT_EQ(eqs.size(), 2U);
    EXPECT_EQ(eqs[0].name, "no");
    EXPECT_TRUE(eqs[0].active);
    EXPECT_EQ(eqs[1].name, "default_equation");
    EXPECT_TRUE(eqs[1].active);
}

TEST(MarkdownParserTest, NoBlocksYieldsNothing) {
    EXPECT_TRUE(parse_markdown("").empty());
    EXPECT_TRUE(parse_markdown("just text with a $ sign").empty());
    EXPECT_TRUE(parse_markdown("%%yes%%\n%%name%%\n").empty());
}

TEST(MarkdownParserTest, UnterminatedBlockYieldsNothing) {
    const auto eqs = parse_markdown("$$ok$$\n$$never closed");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].body, "ok");
}

TEST(MarkdownParserTest, EmptyBodyIsKept) {
    const auto eqs = parse_markdown("$$\n$$");
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].body, "");
}

TEST(MarkdownParserTest, CountsAreNotSharedBetweenCalls) {
    EXPECT_EQ(parse_markdown("$$a$$")[0].name, "default_equation");
    EXPECT_EQ(parse_markdown("$$a$$")[0].name, "default_equation");
}

// ---------------------------------------------------------------- loading

class LoadEquationsTest : public eqrender::test::ScratchDirTest {};

TEST_F(LoadEquationsTest, DispatchesOnExtension) {
    std::vector<Equation> eqs;
    std::string error;

    ASSERT_TRUE(load_equations(write_file("list.csv", "h\nyes,a,from_csv\n"), eqs, error)) << error;
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].name, "from_csv");

    ASSERT_TRUE(load_equations(write_file("list.md", "$$b$$\n%%from_md%%"), eqs, error)) << error;
    ASSERT_EQ(eqs.size(), 1U);
    EXPECT_EQ(eqs[0].name, "from_md");

    ASSERT_TRUE(load_equations(write_file("list.markdown", "$$c$$"), eqs, error)) << error;
    ASSERT_EQ(eqs.size(), 1U);
}

TEST_F(LoadEquationsTest, UnsupportedExtensionIsAnError) {
    std::vector<Equation> eqs;
    std::string error;
    EXPECT_FALSE(load_equations(write_file("list.txt", "$$a$$"), eqs, error));
    EXPECT_NE(error.find("Unsupported file type"), std::string::npos);
    EXPECT_TRUE(eqs.empty());
}

TEST_F(LoadEquationsTest, MissingMarkdownFileIsAnError) {
    std::vector<Equation> eqs;
    std::string error;
    EXPECT_FALSE(load_equations(dir / "absent.md", eqs, error));
    EXPECT_NE(error.find("Failed to open file"), std::string::npos);
}

TEST_F(LoadEquationsTest, MarkdownWithInvalidUtf8IsAnError) {
    std::vector<Equation> eqs;
    std::string error;
    EXPECT_FALSE(load_equations(write_file("bad.md", "$$a$$\n%%n\xff%%"), eqs, error));
    EXPECT_NE(error.find("invalid UTF-8"), std::string::npos) << error;
    EXPECT_TRUE(eqs.empty());
}
