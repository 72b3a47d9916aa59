// =============================================================================
// page_text_test.cpp
// =============================================================================
// Unit tests for htmlToText() and extractSection(), the helpers that turn a
// server-rendered page into the text the normalizer sees.
// =============================================================================

#include "posmon/source/page_text.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Markup, scripts, styles and comments vanish; visible text survives and
//    block tags become line breaks.
// -----------------------------------------------------------------------------
TEST(PageTextTest, HtmlToTextKeepsVisibleText) {
  const std::string html =
      "<html><head><style>.x{color:red}</style>"
      "<script>var a = '<div>ETH</div>';</script></head>"
      "<body><h2>Active Positions (2)</h2>"
      "<div>ETH SHORT</div>"
      "<table><tr><td>P&amp;L</td><td>-$1.00</td></tr></table>"
      "<!-- hidden BTC --></body></html>";

  std::string text = posmon::htmlToText(html);

  EXPECT_TRUE(contains(text, "Active Positions (2)"));
  EXPECT_TRUE(contains(text, "\nETH SHORT\n"));
  EXPECT_TRUE(contains(text, "P&L"));
  EXPECT_TRUE(contains(text, "-$1.00"));

  EXPECT_FALSE(contains(text, "var a"));
  EXPECT_FALSE(contains(text, "color:red"));
  EXPECT_FALSE(contains(text, "hidden"));
  EXPECT_FALSE(contains(text, "<"));
}

// -----------------------------------------------------------------------------
// 2. Known entities are decoded; unknown ones are left as written.
// -----------------------------------------------------------------------------
TEST(PageTextTest, HtmlToTextDecodesEntities) {
  EXPECT_EQ(posmon::htmlToText("a&lt;b&gt; &#65;&#x42; &bogus; &nbsp;x"),
            "a<b> AB &bogus;  x");
  EXPECT_EQ(posmon::htmlToText("&quot;q&quot; &#39;s&apos;"), "\"q\" 's'");
  EXPECT_EQ(posmon::htmlToText("AT&T"), "AT&T");
}

TEST(PageTextTest, HtmlToTextToleratesUnterminatedTag) {
  EXPECT_EQ(posmon::htmlToText("ETH <div class="), "ETH ");
}

// -----------------------------------------------------------------------------
// 3. extractSection() returns what follows the marker's line.
// -----------------------------------------------------------------------------
TEST(PageTextTest, ExtractSectionSkipsMarkerLine) {
  const std::string text =
      "Leaderboard\nACTIVE POSITIONS (3)\n  ETH short 2.4 (pnl 10.0)\n";

  EXPECT_EQ(posmon::extractSection(text, "active positions"),
            "ETH short 2.4 (pnl 10.0)");
}

// -----------------------------------------------------------------------------
// 4. Without the marker the whole text comes back trimmed, so the normalizer
//    still gets a chance.
// -----------------------------------------------------------------------------
TEST(PageTextTest, ExtractSectionFallsBackToWholeText) {
  EXPECT_EQ(posmon::extractSection("  ETH long \n", "ACTIVE POSITIONS"),
            "ETH long");
  EXPECT_EQ(posmon::extractSection("\tBTC\n", ""), "BTC");
}

TEST(PageTextTest, ExtractSectionMarkerOnLastLine) {
  EXPECT_EQ(posmon::extractSection("Header ACTIVE POSITIONS tail",
                                   "ACTIVE POSITIONS"),
            "tail");
}
