#pragma once
#include <stdint.h>
#include <string>
#include <vector>

// User options consumed by the controller and scheduler. These only gate whether an
// image is evaluated; they carry no weight inside the kernel.
struct sinc_options {
  bool enabled = true;
  bool global = true;            // false => only images flagged opt-in
  bool observe = true;           // false => ignore mutation notifications after the first pass
  double zoom_threshold = 0.0;   // > 0 => skip eligible images whose larger scale is below it
  int throttle_ms = 100;
  int min_natural_size = 8;      // natural w/h <= this => placeholder, skipped
  std::vector<std::string> exclude_classes{"modal", "overlay", "zoomable-img"};
  bool gpu = true;
};

// Normalizes options in-place:
// - clamps throttle_ms to 0..10000 and min_natural_size to 0..4096
// - negative zoom_threshold => 0 (disabled)
// - drops empty / duplicate exclude classes
void options_normalize(sinc_options &o);

// JSON serialization / parsing (camelCase keys; unknown keys ignored)
std::string options_to_json(const sinc_options &o_in);
bool options_from_json_text(const std::string &text, sinc_options &o);
