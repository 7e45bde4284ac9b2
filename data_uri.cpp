#include "data_uri.h"
#include "jpeg_codec.h"
#include <cstring>

static const char kB64[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int b64_value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+' || c == '-') return 62;
  if (c == '/' || c == '_') return 63;
  return -1;
}

std::string base64_encode(const uint8_t *data, size_t len) {
  std::string out;
  out.reserve(((len + 2) / 3) * 4);
  size_t i = 0;
  for (; i + 2 < len; i += 3) {
    uint32_t v = ((uint32_t)data[i] << 16) | ((uint32_t)data[i+1] << 8) | data[i+2];
    out.push_back(kB64[(v >> 18) & 63]);
    out.push_back(kB64[(v >> 12) & 63]);
    out.push_back(kB64[(v >> 6) & 63]);
    out.push_back(kB64[v & 63]);
  }
  if (i < len) {
    uint32_t v = (uint32_t)data[i] << 16;
    if (i + 1 < len) v |= (uint32_t)data[i+1] << 8;
    out.push_back(kB64[(v >> 18) & 63]);
    out.push_back(kB64[(v >> 12) & 63]);
    out.push_back(i + 1 < len ? kB64[(v >> 6) & 63] : '=');
    out.push_back('=');
  }
  return out;
}

bool base64_decode(const std::string &in, std::vector<uint8_t> &out) {
  out.clear();
  out.reserve(in.size() * 3 / 4);
  uint32_t acc = 0;
  int bits = 0;
  bool padding = false;
  for (char c : in) {
    if (c == '=') { padding = true; continue; }
    if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
    if (padding) return false; // data after padding
    int v = b64_value(c);
    if (v < 0) return false;
    acc = (acc << 6) | (uint32_t)v;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back((uint8_t)((acc >> bits) & 0xFF));
    }
  }
  return true;
}

std::string data_uri_build(const std::string &mime, const std::vector<uint8_t> &bytes) {
  return "data:" + mime + ";base64," + base64_encode(bytes.data(), bytes.size());
}

bool data_uri_parse(const std::string &uri, std::string &out_mime, std::vector<uint8_t> &out_bytes) {
  if (uri.compare(0, 5, "data:") != 0) return false;
  size_t comma = uri.find(',');
  if (comma == std::string::npos) return false;

  std::string meta = uri.substr(5, comma - 5);
  const std::string b64tag = ";base64";
  if (meta.size() < b64tag.size() || meta.compare(meta.size() - b64tag.size(), b64tag.size(), b64tag) != 0) {
    return false;
  }
  out_mime = meta.substr(0, meta.size() - b64tag.size());
  return base64_decode(uri.substr(comma + 1), out_bytes);
}

std::string image_sniff_mime(const std::vector<uint8_t> &b) {
  const size_t n = b.size();
  if (n >= 3 && b[0] == 0xFF && b[1] == 0xD8 && b[2] == 0xFF) {
    return jpeg_read_header(b.data(), n, nullptr, nullptr) ? "image/jpeg" : "";
  }
  static const uint8_t png_sig[8] = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };
  if (n >= 8 && memcmp(b.data(), png_sig, 8) == 0) return "image/png";
  if (n >= 6 && (memcmp(b.data(), "GIF87a", 6) == 0 || memcmp(b.data(), "GIF89a", 6) == 0)) return "image/gif";
  if (n >= 12 && memcmp(b.data(), "RIFF", 4) == 0 && memcmp(b.data() + 8, "WEBP", 4) == 0) return "image/webp";
  if (n >= 2 && b[0] == 'B' && b[1] == 'M') return "image/bmp";
  return "";
}
