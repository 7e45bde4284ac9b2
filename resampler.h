#pragma once
#include <cstdint>
#include <vector>
#include "sinc_types.h"

// Rectangle-to-rectangle resampling back end used by the kernel program.
// src is sw*sh RGBA8 (row 0 = top); on success out holds dw*dh RGBA8 in the same order.
class Resampler {
public:
  virtual ~Resampler() = default;

  virtual ErrorKind resample(const uint8_t *src, int sw, int sh, int dw, int dh,
                             bool downsample, std::vector<uint8_t> &out) = 0;

  // Label of the path the last successful call took, e.g. "GLES3+floatFBO".
  virtual const char* backend_name() const = 0;
};
