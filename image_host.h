#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Computed box geometry of an image element, in CSS pixels.
struct box_metrics {
  double width = 0.0;            // computed width (0 => unknown, use layout_w)
  double height = 0.0;
  double layout_w = 0.0;         // laid-out width/height fallback
  double layout_h = 0.0;
  bool border_box = false;       // box-sizing: border-box
  double border_t = 0.0, border_r = 0.0, border_b = 0.0, border_l = 0.0;
  double pad_t = 0.0, pad_r = 0.0, pad_b = 0.0, pad_l = 0.0;
};

// An image element as seen by the resampling core. Owned by the document host;
// the core only keeps its address as identity and never frees it.
struct image_element {
  std::string id;
  std::string src;
  std::string current_src;       // selected candidate (srcset), empty => src
  std::string srcset;
  std::string cross_origin;      // "", "anonymous", "use-credentials"

  bool complete = false;         // decoded
  uint32_t natural_w = 0;
  uint32_t natural_h = 0;
  std::vector<uint8_t> rgba;     // natural_w * natural_h * 4, row 0 = top

  box_metrics box{};
  std::map<std::string, std::string> computed;      // presentation properties (read-only)
  std::map<std::string, std::string> inline_style;  // writable style ("display", "image-rendering")

  std::string class_name;
  std::vector<std::string> ancestor_classes;
  bool opt_in = false;           // flagged for processing when not in global scope

  const std::string& effective_src() const { return current_src.empty() ? src : current_src; }
};

// Generated replacement raster, inserted before the image it replaces.
struct render_surface {
  uint32_t w = 0, h = 0;
  std::vector<uint8_t> rgba;
  std::map<std::string, std::string> style;
  std::string class_name;
  image_element *replaces = nullptr;
};

// Layout/document collaborator. All calls happen on the one UI thread.
class document_host {
public:
  virtual ~document_host() = default;

  // scheme://host[:port] of the hosting document.
  virtual std::string origin() const = 0;

  // Image elements in document order.
  virtual std::vector<image_element*> images() = 0;

  // Takes ownership of the surface; returns the stored instance.
  virtual render_surface* insert_surface_before(image_element &img, render_surface s) = 0;
  virtual void remove_surface(render_surface *s) = 0;
  virtual size_t surface_count() const = 0;

  // Swaps the element source. A load notification for it follows later.
  virtual void set_source(image_element &img, const std::string &url) = 0;
};

// Inline style helpers. An absent key and an empty value are different states.
static inline bool style_get(const std::map<std::string, std::string> &st, const char *k, std::string &out) {
  auto it = st.find(k);
  if (it == st.end()) return false;
  out = it->second;
  return true;
}

static inline std::string style_value(const std::map<std::string, std::string> &st, const char *k) {
  auto it = st.find(k);
  return it == st.end() ? std::string() : it->second;
}

bool image_is_vector(const image_element &img);
bool image_srcset_mismatch(const image_element &img);
