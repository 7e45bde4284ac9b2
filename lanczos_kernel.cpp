#include "lanczos_kernel.h"
#include <algorithm>
#include <cmath>

static const float kPi = 3.14159265359f;

float sinc(float x) {
  if (x == 0.0f) return 1.0f;
  float pix = kPi * x;
  return std::sin(pix) / pix;
}

float lanczos3(float t) {
  t = std::fabs(t);
  if (t >= (float)kLanczosRadius) return 0.0f;
  return sinc(t) * sinc(t / (float)kLanczosRadius);
}

float gamma_decode(float c) {
  return std::pow(std::max(c, 0.0f), kDisplayGamma);
}

float gamma_encode(float c) {
  return std::pow(std::max(c, 0.0f), 1.0f / kDisplayGamma);
}

void lanczos_resample_reference(const uint8_t *src, int sw, int sh,
                                int dw, int dh, bool linear_light,
                                std::vector<uint8_t> &out) {
  out.assign((size_t)dw * (size_t)dh * 4, 0);
  if (!src || sw <= 0 || sh <= 0 || dw <= 0 || dh <= 0) return;

  const float sx = (float)sw / (float)dw;
  const float sy = (float)sh / (float)dh;

  for (int y = 0; y < dh; y++) {
    float cy = ((float)y + 0.5f) * sy - 0.5f;
    float by = std::floor(cy);
    float fy = cy - by;

    for (int x = 0; x < dw; x++) {
      float cx = ((float)x + 0.5f) * sx - 0.5f;
      float bx = std::floor(cx);
      float fx = cx - bx;

      float acc[4] = {0, 0, 0, 0};
      float total = 0.0f;
      for (int dy = -kLanczosRadius; dy <= kLanczosRadius; dy++) {
        float wy = lanczos3((float)dy - fy);
        int ty = std::clamp((int)by + dy, 0, sh - 1);
        for (int dx = -kLanczosRadius; dx <= kLanczosRadius; dx++) {
          float w = lanczos3((float)dx - fx) * wy;
          int tx = std::clamp((int)bx + dx, 0, sw - 1);
          const uint8_t *p = src + ((size_t)ty * (size_t)sw + (size_t)tx) * 4;
          for (int c = 0; c < 4; c++) {
            float v = (float)p[c] / 255.0f;
            if (linear_light && c < 3) v = gamma_decode(v);
            acc[c] += v * w;
          }
          total += w;
        }
      }

      uint8_t *o = out.data() + ((size_t)y * (size_t)dw + (size_t)x) * 4;
      for (int c = 0; c < 4; c++) {
        float v = acc[c] / total;
        if (linear_light && c < 3) v = gamma_encode(v);
        v = std::clamp(v, 0.0f, 1.0f);
        o[c] = (uint8_t)std::lround(v * 255.0f);
      }
    }
  }
}
