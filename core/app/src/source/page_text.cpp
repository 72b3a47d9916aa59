#include "posmon/source/page_text.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>

namespace posmon {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n\f\v";
  auto first = s.find_first_not_of(ws);
  if (first == std::string::npos) {
    return {};
  }
  auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

// Tags whose contents are never visible text.
constexpr std::array<const char*, 3> kSkippedElements = {"script", "style",
                                                          "noscript"};

constexpr std::array<const char*, 18> kBlockTags = {
    "div", "p",  "br", "li", "tr", "h1",      "h2",     "h3",      "h4",
    "h5",  "h6", "ul", "ol", "table", "section", "article", "header", "footer"};

bool isBlockTag(const std::string& name) {
  return std::find(kBlockTags.begin(), kBlockTags.end(), name) !=
         kBlockTags.end();
}

bool isSkippedElement(const std::string& name) {
  return std::find(kSkippedElements.begin(), kSkippedElements.end(), name) !=
         kSkippedElements.end();
}

// Extracts the lower-cased element name from the inside of a tag, e.g.
// "/DIV class=x" → "div".
std::string tagName(const std::string& inner) {
  std::size_t i = 0;
  if (i < inner.size() && inner[i] == '/') {
    ++i;
  }
  std::size_t start = i;
  while (i < inner.size() &&
         std::isalnum(static_cast<unsigned char>(inner[i]))) {
    ++i;
  }
  return toLower(inner.substr(start, i - start));
}

// Decodes one entity starting at html[pos] == '&'. On success appends the
// decoded character(s) to out and returns the index after ';'. Otherwise
// appends '&' and returns pos + 1.
std::size_t decodeEntity(const std::string& html, std::size_t pos,
                         std::string& out) {
  auto semi = html.find(';', pos);
  if (semi == std::string::npos || semi - pos > 10) {
    out += '&';
    return pos + 1;
  }
  std::string name = html.substr(pos + 1, semi - pos - 1);

  if (name == "amp") {
    out += '&';
  } else if (name == "lt") {
    out += '<';
  } else if (name == "gt") {
    out += '>';
  } else if (name == "quot") {
    out += '"';
  } else if (name == "apos" || name == "#39") {
    out += '\'';
  } else if (name == "nbsp") {
    out += ' ';
  } else if (name.size() > 1 && name[0] == '#') {
    bool hex = name[1] == 'x' || name[1] == 'X';
    const char* digits = name.c_str() + (hex ? 2 : 1);
    char* end = nullptr;
    long code = std::strtol(digits, &end, hex ? 16 : 10);
    if (end == digits || *end != '\0' || code <= 0 || code > 0x7f) {
      out += '&';
      return pos + 1;
    }
    out += static_cast<char>(code);
  } else {
    out += '&';
    return pos + 1;
  }
  return semi + 1;
}

}  // namespace

// -----------------------------------------------------------------------------
// htmlToText()
// -----------------------------------------------------------------------------
std::string htmlToText(const std::string& html) {
  std::string out;
  out.reserve(html.size() / 2);

  const std::string lower = toLower(html);
  std::size_t i = 0;

  while (i < html.size()) {
    char c = html[i];

    if (c == '&') {
      i = decodeEntity(html, i, out);
      continue;
    }

    if (c != '<') {
      out += c;
      ++i;
      continue;
    }

    // Comment: skip to "-->".
    if (lower.compare(i, 4, "<!--") == 0) {
      auto end = lower.find("-->", i + 4);
      i = (end == std::string::npos) ? html.size() : end + 3;
      continue;
    }

    auto close = html.find('>', i + 1);
    if (close == std::string::npos) {
      break;
    }
    std::string inner = html.substr(i + 1, close - i - 1);
    std::string name = tagName(inner);
    bool closing = !inner.empty() && inner[0] == '/';
    i = close + 1;

    if (!closing && isSkippedElement(name)) {
      auto end = lower.find("</" + name, i);
      if (end == std::string::npos) {
        break;
      }
      auto end_close = html.find('>', end);
      i = (end_close == std::string::npos) ? html.size() : end_close + 1;
      continue;
    }

    if (isBlockTag(name)) {
      out += '\n';
    } else if (name == "td" || name == "th") {
      out += ' ';
    }
  }

  return out;
}

// -----------------------------------------------------------------------------
// extractSection()
// -----------------------------------------------------------------------------
std::string extractSection(const std::string& text, const std::string& marker) {
  if (marker.empty()) {
    return trim(text);
  }

  auto pos = toLower(text).find(toLower(marker));
  if (pos == std::string::npos) {
    return trim(text);
  }

  // Skip the rest of the marker's own line (e.g. a "(3)" count badge).
  auto line_end = text.find('\n', pos + marker.size());
  if (line_end == std::string::npos) {
    return trim(text.substr(pos + marker.size()));
  }
  return trim(text.substr(line_end + 1));
}

}  // namespace posmon
