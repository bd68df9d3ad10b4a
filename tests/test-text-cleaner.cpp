#include <gtest/gtest.h>

#include "text-cleaner.h"

#include <string>

using namespace edge_tts;

TEST(TextCleanerTest, RemovesUrlsAndCollapsesWhitespace) {
    cleaning_options opts;
    EXPECT_EQ(clean_text("see https://example.com/a?b=c now", opts), "see now");
    EXPECT_EQ(clean_text("  line one\n\nline   two  ", opts), "line one line two");
}

TEST(TextCleanerTest, StripsMarkdownKeepingText) {
    cleaning_options opts;
    const std::string in = "## Heading\n**bold** and *em* and [link](page.html) `code` ![img](a.png)";
    EXPECT_EQ(clean_text(in, opts), "Heading bold and em and link code");
}

TEST(TextCleanerTest, StripsEmoji) {
    cleaning_options opts;
    EXPECT_EQ(clean_text("hi \xF0\x9F\x98\x80 there \xE2\x9C\x85", opts), "hi there");
    EXPECT_EQ(strip_emoji("a\xF0\x9F\x91\x8D\xF0\x9F\x8F\xBD" "b"), "ab");
    EXPECT_EQ(strip_emoji("你好"), "你好");
}

TEST(TextCleanerTest, RemovesCitationNumbers) {
    cleaning_options opts;
    EXPECT_EQ(clean_text("as shown 12. Next", opts), "as shown. Next");
    EXPECT_EQ(clean_text("result 3", opts), "result");
    EXPECT_EQ(clean_text("in 2024 we", opts), "in 2024 we");
}

TEST(TextCleanerTest, RemovesCustomKeywordsLiterally) {
    cleaning_options opts;
    opts.custom_keywords = "foo, a.b ,";
    EXPECT_EQ(clean_text("foo text a.b axb", opts), "text axb");
    EXPECT_EQ(remove_keywords("unchanged", ""), "unchanged");
}

TEST(TextCleanerTest, DisabledStagesLeaveTextAlone) {
    const cleaning_options none = cleaning_options::none();
    EXPECT_EQ(clean_text("  **x** https://a.b\nnext 1.  ", none), "**x** https://a.b\nnext 1.");

    cleaning_options keep_breaks;
    keep_breaks.remove_line_breaks = false;
    EXPECT_EQ(clean_text("a\nb", keep_breaks), "a\nb");
}

TEST(TextCleanerTest, LongWhitespaceRunCollapses) {
    cleaning_options opts;
    const std::string in = "a" + std::string(200000, ' ') + "\n\t" + std::string(1000, '\n') + "b";
    EXPECT_EQ(clean_text(in, opts), "a b");
    EXPECT_EQ(collapse_whitespace("x\xC2\xA0\xE3\x80\x80y"), "x y");
}

TEST(TextCleanerTest, UnclosedMarkupInLongInputIsKept) {
    cleaning_options opts;
    opts.remove_line_breaks = false;

    const std::string image = "![" + std::string(200000, 'x');
    EXPECT_EQ(clean_text(image, opts), image);

    const std::string link = "[" + std::string(200000, 'x') + "](";
    EXPECT_EQ(clean_text(link, opts), link);

    const std::string em = "*" + std::string(200000, 'y');
    EXPECT_EQ(strip_markdown(em), em);
    EXPECT_EQ(strip_markdown("__" + std::string(200000, 'y')), std::string(200000, 'y'));

    // a lone backtick is kept, a run of two with no closer is dropped
    EXPECT_EQ(strip_markdown("`" + std::string(200000, 'z')), "`" + std::string(200000, 'z'));
    EXPECT_EQ(strip_markdown("``" + std::string(10, 'z')), std::string(10, 'z'));
}

TEST(TextCleanerTest, MarkupDoesNotSpanLines) {
    EXPECT_EQ(strip_markdown("[a\n](b)"), "[a\n](b)");
    EXPECT_EQ(strip_markdown("*a\nb*"), "*a\nb*");
    EXPECT_EQ(strip_markdown("[a](b) and [c](d)"), "a and c");
    EXPECT_EQ(strip_markdown("*a* *b*"), "a b");
    EXPECT_EQ(strip_markdown("``code`` x"), "code x");
}

TEST(TextCleanerTest, LongUrlIsStripped) {
    cleaning_options opts;
    const std::string url = "https://example.com/" + std::string(200000, 'p');
    EXPECT_EQ(clean_text("before " + url + " after", opts), "before after");
    EXPECT_EQ(strip_urls("http:// x"), "http:// x");
    EXPECT_EQ(strip_urls("a https://b.c\xE3\x80\x80" "d"), "a \xE3\x80\x80" "d");
}
