#include "geometry_analyzer.h"
#include <cmath>

scale_info geometry_analyze(const image_element &img) {
  scale_info si{};
  const box_metrics &b = img.box;

  double w = b.width > 0.0 ? b.width : b.layout_w;
  double h = b.height > 0.0 ? b.height : b.layout_h;
  if (b.border_box) {
    w -= (b.border_l + b.border_r + b.pad_l + b.pad_r);
    h -= (b.border_t + b.border_b + b.pad_t + b.pad_b);
  }
  if (w < 0.0) w = 0.0;
  if (h < 0.0) h = 0.0;
  si.content_w = w;
  si.content_h = h;

  long tw = std::lround(w);
  long th = std::lround(h);
  si.target_w = (uint32_t)(tw < 1 ? 1 : tw);
  si.target_h = (uint32_t)(th < 1 ? 1 : th);

  if (img.natural_w == 0 || img.natural_h == 0) return si;

  si.valid = true;
  si.scale_x = w / (double)img.natural_w;
  si.scale_y = h / (double)img.natural_h;
  si.needs_resampling = std::fabs(si.scale_x - 1.0) > kScaleTolerance ||
                        std::fabs(si.scale_y - 1.0) > kScaleTolerance;
  return si;
}

const char* geometry_scale_type(double scale_x, double scale_y) {
  if (scale_x > 1.0 && scale_y > 1.0) return "upscaling";
  if (scale_x < 1.0 && scale_y < 1.0) return "downscaling";
  return "non-uniform scaling";
}
