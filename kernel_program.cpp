#include "kernel_program.h"
#include "geometry_analyzer.h"
#include "lanczos_kernel.h"

#include <cstdio>

static const char* kShapeProps[] = {
  "border-radius", "object-fit", "object-position", "background", "box-shadow", "border",
};

void copy_shape_styles(const image_element &from, render_surface &to) {
  // layout box first, then shape
  for (const char *k : { "display", "width", "height" }) {
    std::string v;
    if (style_get(from.computed, k, v)) to.style[k] = v;
  }
  for (const char *k : kShapeProps) {
    std::string v;
    if (style_get(from.computed, k, v)) to.style[k] = v;
  }
  to.class_name = from.class_name;
}

static display_state save_display(const image_element &img) {
  display_state st;
  st.present = style_get(img.inline_style, "display", st.value);
  return st;
}

static void restore_display(image_element &img, const display_state &st) {
  if (st.present) img.inline_style["display"] = st.value;
  else img.inline_style.erase("display");
}

void kernel_teardown(document_host &doc, image_element &img, render_surface *surface,
                     const display_state &prior) {
  if (surface) doc.remove_surface(surface);
  restore_display(img, prior);
}

resample_result kernel_resample(document_host &doc, image_element &img,
                                uint32_t target_w, uint32_t target_h,
                                double scale_x, double scale_y, Resampler &r) {
  resample_result res;
  const size_t need = (size_t)img.natural_w * (size_t)img.natural_h * 4;
  if (img.natural_w == 0 || img.natural_h == 0 || img.rgba.size() < need) {
    fprintf(stderr, "[kernel] %s: no decoded pixels\n", img.effective_src().c_str());
    res.error = ErrorKind::DRAW_FAILURE;
    return res;
  }

  render_surface s;
  s.w = target_w;
  s.h = target_h;
  s.replaces = &img;
  copy_shape_styles(img, s);

  res.prior_display = save_display(img);
  render_surface *placed = doc.insert_surface_before(img, std::move(s));
  if (!placed) {
    fprintf(stderr, "[kernel] %s: surface insertion refused\n", img.effective_src().c_str());
    res.error = ErrorKind::DRAW_FAILURE;
    return res;
  }
  img.inline_style["display"] = "none";

  const bool down = scale_is_downsample(scale_x, scale_y);
  ErrorKind e = r.resample(img.rgba.data(), (int)img.natural_w, (int)img.natural_h,
                           (int)target_w, (int)target_h, down, placed->rgba);
  if (e != ErrorKind::NONE) {
    fprintf(stderr, "[kernel] %s: %s, rolling back\n", img.effective_src().c_str(), error_kind_to_string(e));
    kernel_teardown(doc, img, placed, res.prior_display);
    res.error = e;
    return res;
  }

  res.surface = placed;
  res.backend = r.backend_name();
  fprintf(stderr, "[kernel] resampled (%s) %s %ux%u -> %ux%u [%s]\n",
          geometry_scale_type(scale_x, scale_y), img.effective_src().c_str(),
          img.natural_w, img.natural_h, target_w, target_h, res.backend.c_str());
  return res;
}
