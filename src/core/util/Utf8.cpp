#include "Utf8.hpp"

namespace rsb {

std::string to_valid_utf8(std::string_view in) {
  static const char kReplacement[] = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(in.size());

  size_t i = 0;
  while (i < in.size()) {
    const auto c = static_cast<unsigned char>(in[i]);
    size_t len = 0;
    unsigned cp = 0;
    if (c < 0x80) { out.push_back(static_cast<char>(c)); ++i; continue; }
    else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else { out += kReplacement; ++i; continue; }

    size_t j = 1;
    for (; j < len && i + j < in.size(); ++j) {
      const auto cc = static_cast<unsigned char>(in[i + j]);
      if ((cc & 0xC0) != 0x80) break;
      cp = (cp << 6) | (cc & 0x3F);
    }
    const bool overlong = (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000);
    const bool invalid = cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF);
    if (j != len || overlong || invalid) {
      out += kReplacement;
      i += j; // resume at the first byte that did not fit
      continue;
    }
    out.append(in.substr(i, len));
    i += len;
  }
  return out;
}

} // namespace rsb
