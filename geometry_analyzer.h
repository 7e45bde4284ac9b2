#pragma once
#include "image_host.h"
#include "sinc_types.h"

// Content-box size and per-axis display/natural scale of an image.
// Read-only. valid=false when the natural size is still 0 (not decoded).
scale_info geometry_analyze(const image_element &img);

// "upscaling" | "downscaling" | "non-uniform scaling"
const char* geometry_scale_type(double scale_x, double scale_y);
