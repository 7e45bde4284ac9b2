#pragma once
#include <map>
#include <string>
#include "image_host.h"

// Side table of original inline image-rendering values, keyed by element identity.
// Entries are dropped on restore or when the host reports the element detached,
// so detached elements are never kept reachable through it.
class RenderHintCache {
public:
  // Records the current value unless one is already recorded.
  void save(const image_element &img);

  // Writes the recorded value back exactly (erasing the property when it was
  // absent) and forgets it. False when nothing was recorded.
  bool restore(image_element &img);

  void forget(const image_element &img) { saved_.erase(&img); }
  bool has(const image_element &img) const { return saved_.count(&img) != 0; }
  size_t size() const { return saved_.size(); }

private:
  struct entry {
    bool present = false;
    std::string value;
  };
  std::map<const image_element*, entry> saved_;
};

// True when the scale is one uniform integer factor >= 2 (within tolerance).
bool scale_is_uniform_integer_upscale(double scale_x, double scale_y);

// Nearest-neighbour style hint for exact integer magnification. Saves the original
// hint once before writing. When the image does not qualify, any earlier hint is
// restored and false is returned.
bool fallback_apply_integer_hint(image_element &img, double scale_x, double scale_y, RenderHintCache &cache);

// Puts back the original hint, if one was saved, and forgets it.
bool fallback_restore(image_element &img, RenderHintCache &cache);
