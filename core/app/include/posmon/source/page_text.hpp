#pragma once

#include <string>

namespace posmon {

// -----------------------------------------------------------------------------
// Page text helpers
// -----------------------------------------------------------------------------
// Used by HttpPageSource to approximate what a browser's innerText would give
// for a server-rendered page. The renderer adapter does not need them: the
// renderer already returns innerText of the located section.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// htmlToText
// -------------------------------------------------------------------------
// @brief  Strips markup from an HTML document.
//
// @details
// - <script>, <style>, <noscript> and <!-- comments --> are dropped with
//   their contents.
// - Block-level tags (div, p, br, li, tr, h1-h6, section, article, table,
//   header, footer) become a newline; table cells become a space; every
//   other tag disappears.
// - &amp; &lt; &gt; &quot; &#39; &nbsp; and decimal/hex character references
//   in the ASCII range are decoded. Anything else is left verbatim.
//
// Never throws on malformed markup; an unterminated tag swallows the rest of
// the input, which is what a lenient browser does too.
// -------------------------------------------------------------------------
std::string htmlToText(const std::string& html);

// -------------------------------------------------------------------------
// extractSection
// -------------------------------------------------------------------------
// @brief  Returns the text following the first line that contains `marker`
//         (case-insensitive), trimmed.
//
// @return The whole input, trimmed, when the marker is absent or empty, so
//         the normalizer still gets a chance to find position blocks.
// -------------------------------------------------------------------------
std::string extractSection(const std::string& text, const std::string& marker);

}  // namespace posmon
