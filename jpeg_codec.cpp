#include "jpeg_codec.h"
#include <turbojpeg.h>

bool jpeg_read_header(const uint8_t *data, size_t len, int *out_w, int *out_h) {
    if (!data || len < 4) return false;

    tjhandle d = tj3Init(TJINIT_DECOMPRESS);
    if (!d) return false;

    bool ok = tj3DecompressHeader(d, data, len) == 0;
    int w = ok ? tj3Get(d, TJPARAM_JPEGWIDTH) : 0;
    int h = ok ? tj3Get(d, TJPARAM_JPEGHEIGHT) : 0;
    tj3Destroy(d);

    if (!ok || w <= 0 || h <= 0) return false;
    if (out_w) *out_w = w;
    if (out_h) *out_h = h;
    return true;
}

bool jpeg_decode_rgba(const uint8_t *data, size_t len, std::vector<uint8_t> &out_rgba, uint32_t &out_w, uint32_t &out_h) {
    if (!data || len < 4) return false;

    tjhandle d = tj3Init(TJINIT_DECOMPRESS);
    if (!d) return false;

    if (tj3DecompressHeader(d, data, len) != 0) {
        tj3Destroy(d);
        return false;
    }
    int w = tj3Get(d, TJPARAM_JPEGWIDTH);
    int h = tj3Get(d, TJPARAM_JPEGHEIGHT);
    if (w <= 0 || h <= 0) {
        tj3Destroy(d);
        return false;
    }

    std::vector<uint8_t> px((size_t)w * (size_t)h * 4);
    int status = tj3Decompress8(d, data, len, px.data(), w * 4, TJPF_RGBA);
    tj3Destroy(d);
    if (status != 0) return false;

    out_rgba.swap(px);
    out_w = (uint32_t)w;
    out_h = (uint32_t)h;
    return true;
}

bool encode_rgba_to_jpeg(const uint8_t *rgba, int w, int h, int quality, std::vector<uint8_t> &out_jpeg) {
    if (!rgba || w <= 0 || h <= 0) return false;

    tjhandle compressor = tj3Init(TJINIT_COMPRESS);
    if (!compressor) return false;

    tj3Set(compressor, TJPARAM_QUALITY, quality);
    // Resampled output: keep full chroma resolution.
    tj3Set(compressor, TJPARAM_SUBSAMP, TJSAMP_444);

    unsigned char* dest_buf = nullptr;
    size_t dest_size = 0;

    int status = tj3Compress8(
        compressor,
        rgba,
        w, w * 4, h,
        TJPF_RGBA,
        &dest_buf, &dest_size
    );

    if (status == 0) {
        out_jpeg.assign(dest_buf, dest_buf + dest_size);
    }

    tj3Free(dest_buf);
    tj3Destroy(compressor);
    return (status == 0);
}
