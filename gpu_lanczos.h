#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "resampler.h"

// Capability tiers, negotiated best first.
enum class GpuTier {
    NONE = 0,
    GLES2 = 1,          // baseline context, direct RGBA8 target
    GLES3 = 2,          // ES3 context without a renderable float format
    GLES3_FLOAT = 3,    // ES3 + EXT_color_buffer_float: RGBA16F pass then copy pass
};

// Surfaceless EGL/GLES Lanczos-3 resampler. The context is negotiated lazily on
// the first call and kept; every per-call GL object is released before returning.
struct GpuLanczos : public Resampler {
    // GL/EGL opaque handles (kept in cpp)
    void* dpy = nullptr;
    void* ctx = nullptr;

    GpuTier tier = GpuTier::NONE;
    bool negotiated = false;    // init() ran (successfully or not)
    bool allowFloat = true;

    // Replaces the Lanczos fragment shader body when non-empty (diagnostics/tests).
    std::string fragmentOverride;

    bool init();
    void reset();

    ErrorKind resample(const uint8_t* src, int sw, int sh, int dw, int dh,
                       bool downsample, std::vector<uint8_t>& out) override;
    const char* backend_name() const override;

    // Live GL objects created by resample() and not yet released (0 between calls).
    int liveObjects() const { return live; }

    ~GpuLanczos() override;

private:
    int live = 0;
    bool lastUsedFloat = false;
};
