#pragma once
#include <string>
#include "image_host.h"
#include "resampler.h"
#include "sinc_types.h"

// Inline "display" of an image before it was hidden (absent and empty differ).
struct display_state {
  bool present = false;
  std::string value;
};

struct resample_result {
  ErrorKind error = ErrorKind::NONE;
  render_surface *surface = nullptr;   // owned by the document
  display_state prior_display{};
  std::string backend;

  bool ok() const { return error == ErrorKind::NONE && surface != nullptr; }
};

// Replaces img with a target-sized surface resampled by r. The image is hidden,
// not removed. Any failure rolls the document back: the surface is removed and
// the image's inline display is restored exactly.
resample_result kernel_resample(document_host &doc, image_element &img,
                                uint32_t target_w, uint32_t target_h,
                                double scale_x, double scale_y, Resampler &r);

// Removes a surface produced by kernel_resample and shows img again.
void kernel_teardown(document_host &doc, image_element &img, render_surface *surface,
                     const display_state &prior);

// Presentation copied onto generated surfaces so cropped/rounded images keep their shape.
void copy_shape_styles(const image_element &from, render_surface &to);
