#pragma once
#include <cstdint>
#include <vector>

// Lanczos-3: L(t) = sinc(t) * sinc(t/3) for |t| < 3, else 0.
static constexpr int kLanczosRadius = 3;
static constexpr float kDisplayGamma = 2.2f;

float sinc(float x);
float lanczos3(float t);

float gamma_decode(float c);   // display-encoded -> linear light
float gamma_encode(float c);   // linear light -> display-encoded (negatives clamp to 0)

// True when both axes shrink; selects the linear-light workflow.
static inline bool scale_is_downsample(double scale_x, double scale_y) {
  return scale_x < 1.0 && scale_y < 1.0;
}

// CPU rendition of the shader: 7x7 jointly weighted window around the mapped
// source position, clamp-to-edge, normalized by the weight sum. Used to check
// the GPU output. src is sw*sh RGBA8, out becomes dw*dh RGBA8.
void lanczos_resample_reference(const uint8_t *src, int sw, int sh,
                                int dw, int dh, bool linear_light,
                                std::vector<uint8_t> &out);
