#include <cstddef>
#include <string>
#include <vector>

#include <lpakx/glob.hpp>

namespace lpakx {

namespace {

struct SetToken {
  unsigned char c;
  bool rangeOp; // Hyphen joining two chunks
};

// Split a bracket body on range hyphens the way Python's fnmatch does:
// a hyphen right after the opening (or after '!') is literal, a trailing one
// is literal, and ranges whose bounds are reversed are folded away
std::vector<std::string> splitChunks(std::string_view body) {
  std::vector<std::string> chunks;
  if (body.find('-') == std::string_view::npos) {
    chunks.emplace_back(body);
    return chunks;
  }

  size_t start = 0;
  size_t k = (!body.empty() && body[0] == '!') ? 2 : 1;
  while ((k = body.find('-', k)) != std::string_view::npos) {
    chunks.emplace_back(body.substr(start, k - start));
    start = k + 1;
    k += 3;
  }
  std::string_view last = body.substr(start);
  if (!last.empty()) {
    chunks.emplace_back(last);
  } else {
    chunks.back() += '-';
  }

  for (size_t m = chunks.size() - 1; m > 0; --m) {
    std::string &prev = chunks[m - 1];
    const std::string &cur = chunks[m];
    if (!prev.empty() && !cur.empty() &&
        static_cast<unsigned char>(prev.back()) > static_cast<unsigned char>(cur.front())) {
      prev.pop_back();
      prev += cur.substr(1);
      chunks.erase(chunks.begin() + static_cast<std::ptrdiff_t>(m));
    }
  }
  return chunks;
}

// Match one character against the bracket expression starting at pattern[pos] == '['
// On return, next is the index just past the closing ']', or npos if unterminated
bool matchSet(std::string_view pattern, size_t pos, unsigned char c, size_t &next) {
  const size_t n = pattern.size();
  size_t i = pos + 1;
  size_t j = i;
  if (j < n && pattern[j] == '!') {
    ++j;
  }
  if (j < n && pattern[j] == ']') {
    ++j;
  }
  while (j < n && pattern[j] != ']') {
    ++j;
  }
  if (j >= n) {
    next = std::string_view::npos;
    return false;
  }
  next = j + 1;

  std::vector<SetToken> tokens;
  const auto chunks = splitChunks(pattern.substr(i, j - i));
  for (size_t m = 0; m < chunks.size(); ++m) {
    if (m > 0) {
      tokens.push_back({'-', true});
    }
    for (char ch : chunks[m]) {
      tokens.push_back({static_cast<unsigned char>(ch), false});
    }
  }

  // Empty set never matches
  if (tokens.empty()) {
    return false;
  }

  bool negate = false;
  size_t p = 0;
  if (tokens[0].c == '!' && !tokens[0].rangeOp) {
    // "[!]"-like set: any character
    if (tokens.size() == 1) {
      return true;
    }
    negate = true;
    p = 1;
  }

  bool matched = false;
  while (p < tokens.size()) {
    unsigned char lo = tokens[p++].c;
    if (p + 1 < tokens.size() && tokens[p].rangeOp) {
      unsigned char hi = tokens[p + 1].c;
      p += 2;
      if (lo <= c && c <= hi) {
        matched = true;
      }
    } else if (lo == c) {
      matched = true;
    }
  }
  return matched != negate;
}

} // namespace

bool globMatch(std::string_view pattern, std::string_view text) {
  size_t p = 0;
  size_t t = 0;

  // Backtracking point for the most recent '*'
  size_t starP = std::string_view::npos;
  size_t starT = 0;

  while (t < text.size()) {
    if (p < pattern.size()) {
      char pc = pattern[p];
      if (pc == '*') {
        starP = p++;
        starT = t;
        continue;
      }
      if (pc == '?') {
        ++p;
        ++t;
        continue;
      }
      if (pc == '[') {
        size_t next = 0;
        bool matched = matchSet(pattern, p, static_cast<unsigned char>(text[t]), next);
        if (next == std::string_view::npos) {
          // Unterminated bracket is a literal '['
          if (text[t] == '[') {
            ++p;
            ++t;
            continue;
          }
        } else if (matched) {
          p = next;
          ++t;
          continue;
        }
      } else if (pc == text[t]) {
        ++p;
        ++t;
        continue;
      }
    }

    if (starP == std::string_view::npos) {
      return false;
    }
    p = starP + 1;
    t = ++starT;
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

} // namespace lpakx
