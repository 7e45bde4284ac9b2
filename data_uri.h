#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::string base64_encode(const uint8_t *data, size_t len);
bool base64_decode(const std::string &in, std::vector<uint8_t> &out);

// "data:<mime>;base64,<payload>"
std::string data_uri_build(const std::string &mime, const std::vector<uint8_t> &bytes);

// Accepts base64 payloads only. out_mime may be empty when the URI names none.
bool data_uri_parse(const std::string &uri, std::string &out_mime, std::vector<uint8_t> &out_bytes);

// Recognises raster image payloads by signature; JPEG headers are validated with
// the codec. Returns the mime type or "" when the bytes are not a usable image.
std::string image_sniff_mime(const std::vector<uint8_t> &bytes);
