#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// libturbojpeg 3.x helpers. All return false on any codec error.
bool jpeg_read_header(const uint8_t *data, size_t len, int *out_w, int *out_h);
bool jpeg_decode_rgba(const uint8_t *data, size_t len, std::vector<uint8_t> &out_rgba, uint32_t &out_w, uint32_t &out_h);
bool encode_rgba_to_jpeg(const uint8_t *rgba, int w, int h, int quality, std::vector<uint8_t> &out_jpeg);
