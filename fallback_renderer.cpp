#include "fallback_renderer.h"
#include "sinc_types.h"

#include <cmath>
#include <cstdio>

static const char* kHintProp = "image-rendering";
static const char* kHintValue = "pixelated";

void RenderHintCache::save(const image_element &img) {
  if (saved_.count(&img)) return;
  entry e;
  e.present = style_get(img.inline_style, kHintProp, e.value);
  saved_[&img] = e;
}

bool RenderHintCache::restore(image_element &img) {
  auto it = saved_.find(&img);
  if (it == saved_.end()) return false;
  if (it->second.present) img.inline_style[kHintProp] = it->second.value;
  else img.inline_style.erase(kHintProp);
  saved_.erase(it);
  fprintf(stderr, "[fallback] restored original rendering for %s\n", img.effective_src().c_str());
  return true;
}

static bool near_integer(double v) {
  return std::fabs(std::round(v) - v) <= kScaleTolerance;
}

bool scale_is_uniform_integer_upscale(double scale_x, double scale_y) {
  if (!near_integer(scale_x) || !near_integer(scale_y)) return false;
  if (std::fabs(scale_x - scale_y) > kScaleTolerance) return false;
  return std::round(scale_x) >= 2.0;
}

bool fallback_apply_integer_hint(image_element &img, double scale_x, double scale_y, RenderHintCache &cache) {
  const char *why = nullptr;
  if (image_is_vector(img)) why = "vector image";
  else if (image_srcset_mismatch(img)) why = "srcset mismatch";
  else if (!scale_is_uniform_integer_upscale(scale_x, scale_y)) why = "not a uniform integer upscale";

  if (why) {
    cache.restore(img);
    fprintf(stderr, "[fallback] skipped (%s): %s scale=%.4f,%.4f\n", why, img.effective_src().c_str(), scale_x, scale_y);
    return false;
  }

  cache.save(img);
  img.inline_style[kHintProp] = kHintValue;
  fprintf(stderr, "[fallback] nearest-neighbour hint applied: %s x%.0f\n", img.effective_src().c_str(), std::round(scale_x));
  return true;
}

bool fallback_restore(image_element &img, RenderHintCache &cache) {
  return cache.restore(img);
}
