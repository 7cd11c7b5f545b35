#include "syntax/Source.hpp"
#include "llvm/Support/ConvertUTF.h"
#include <algorithm>
#include <cctype>

namespace kwl {
namespace syntax {

LineTable::LineTable(llvm::StringRef text) {
  starts_.push_back(0);
  for (unsigned i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') starts_.push_back(i + 1);
  }
}

Position LineTable::position(unsigned offset) const {
  if (starts_.empty()) return Position{1, offset + 1};
  auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
  unsigned line = (unsigned)(it - starts_.begin());
  return Position{line, offset - starts_[line - 1] + 1};
}

unsigned LineTable::lineStart(unsigned line) const {
  if (line == 0 || line > starts_.size()) return 0;
  return starts_[line - 1];
}

llvm::Error syntaxError(llvm::StringRef path, Position pos, const llvm::Twine& message) {
  return llvm::createStringError(std::errc::invalid_argument, "%s:%u:%u: %s",
                                 path.str().c_str(), pos.line, pos.column,
                                 message.str().c_str());
}

static int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static void appendCodePoint(std::string& out, unsigned long cp) {
  char buf[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
  char* ptr = buf;
  if (llvm::ConvertCodePointToUTF8((unsigned)cp, ptr)) out.append(buf, ptr);
}

std::string unquote(llvm::StringRef literal) {
  if (literal.size() < 2) return literal.str();
  char quote = literal.front();
  llvm::StringRef body = literal.drop_front().drop_back();

  std::string out;
  out.reserve(body.size());
  if (quote == '`') {
    for (char c : body) if (c != '\r') out.push_back(c);
    return out;
  }

  for (size_t i = 0; i < body.size(); ++i) {
    char c = body[i];
    if (c != '\\' || i + 1 >= body.size()) { out.push_back(c); continue; }
    char e = body[++i];
    switch (e) {
    case 'a': out.push_back('\a'); break;
    case 'b': out.push_back('\b'); break;
    case 'f': out.push_back('\f'); break;
    case 'n': out.push_back('\n'); break;
    case 'r': out.push_back('\r'); break;
    case 't': out.push_back('\t'); break;
    case 'v': out.push_back('\v'); break;
    case '\\': out.push_back('\\'); break;
    case '\'': out.push_back('\''); break;
    case '"': out.push_back('"'); break;
    case 'x': {
      int value = 0, n = 0;
      while (n < 2 && i + 1 < body.size() && hexValue(body[i + 1]) >= 0) {
        value = value * 16 + hexValue(body[++i]);
        ++n;
      }
      out.push_back((char)value);
      break;
    }
    case 'u':
    case 'U': {
      int want = e == 'u' ? 4 : 8, n = 0;
      unsigned long cp = 0;
      while (n < want && i + 1 < body.size() && hexValue(body[i + 1]) >= 0) {
        cp = cp * 16 + (unsigned long)hexValue(body[++i]);
        ++n;
      }
      appendCodePoint(out, cp);
      break;
    }
    default:
      if (e >= '0' && e <= '7') {
        int value = e - '0', n = 1;
        while (n < 3 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7') {
          value = value * 8 + (body[++i] - '0');
          ++n;
        }
        out.push_back((char)value);
      } else {
        out.push_back('\\');
        out.push_back(e);
      }
      break;
    }
  }
  return out;
}

} // namespace syntax
} // namespace kwl
