#include "image_host.h"
#include <algorithm>
#include <cctype>

static std::string to_lower(const std::string &s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return (char)std::tolower(c); });
  return out;
}

bool image_is_vector(const image_element &img) {
  std::string s = to_lower(img.effective_src());
  if (s.rfind("data:image/svg+xml", 0) == 0) return true;

  // ".svg" followed by end of string, query or fragment
  size_t pos = 0;
  while ((pos = s.find(".svg", pos)) != std::string::npos) {
    size_t after = pos + 4;
    if (after == s.size() || s[after] == '?' || s[after] == '#') return true;
    pos = after;
  }
  return false;
}

bool image_srcset_mismatch(const image_element &img) {
  bool blank = std::all_of(img.srcset.begin(), img.srcset.end(),
                           [](unsigned char c) { return std::isspace(c) != 0; });
  if (blank) return false;
  return !img.current_src.empty() && img.current_src != img.src;
}
