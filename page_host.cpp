#include "page_host.h"
#include "data_uri.h"
#include "jpeg_codec.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

using nlohmann::json;

static bool slurp_binary(const std::string &path, std::vector<uint8_t> &out) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) return false;
  out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  return true;
}

static std::string slurp_file(const std::string &path) {
  std::ifstream f(path);
  if (!f.is_open()) return {};
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// Manifest fields are optional; a present field of the wrong type rejects the manifest.
static bool read_edges(const json &j, const char *key, double &t, double &r, double &b, double &l) {
  if (!j.contains(key)) return true;
  const json &a = j[key];
  if (!a.is_array() || a.size() != 4) return false;
  for (const auto &v : a) if (!v.is_number()) return false;
  t = a[0].get<double>();
  r = a[1].get<double>();
  b = a[2].get<double>();
  l = a[3].get<double>();
  return true;
}

static bool read_string_map(const json &j, const char *key, std::map<std::string, std::string> &out) {
  if (!j.contains(key)) return true;
  if (!j[key].is_object()) return false;
  for (auto it = j[key].begin(); it != j[key].end(); ++it) {
    if (!it.value().is_string()) return false;
    out[it.key()] = it.value().get<std::string>();
  }
  return true;
}

bool PageHost::load_manifest_file(const std::string &path) {
  std::string text = slurp_file(path);
  if (text.empty()) {
    fprintf(stderr, "[page] cannot read manifest %s\n", path.c_str());
    return false;
  }
  size_t slash = path.find_last_of('/');
  return load_manifest_text(text, slash == std::string::npos ? std::string(".") : path.substr(0, slash));
}

bool PageHost::load_manifest_text(const std::string &text, const std::string &base_dir) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    fprintf(stderr, "[page] manifest is not a JSON object\n");
    return false;
  }
  std::string origin = "file://";
  if (j.contains("origin")) {
    if (!j["origin"].is_string()) {
      fprintf(stderr, "[page] manifest field 'origin' must be a string\n");
      return false;
    }
    origin = j["origin"].get<std::string>();
  }

  if (!j.contains("images") || !j["images"].is_array()) {
    fprintf(stderr, "[page] manifest has no images[]\n");
    return false;
  }

  std::vector<std::unique_ptr<image_element>> parsed;
  std::map<const image_element*, declared_size> declared;
  int n = 0;
  for (const auto &ji : j["images"]) {
    if (!ji.is_object()) {
      fprintf(stderr, "[page] images[%d] is not an object\n", n);
      return false;
    }
    const char *bad = nullptr;
    auto get_str = [&](const char *k, std::string &out) {
      if (!ji.contains(k)) return;
      if (ji[k].is_string()) out = ji[k].get<std::string>();
      else bad = k;
    };
    auto get_num = [&](const char *k, double &out) {
      if (!ji.contains(k)) return;
      if (ji[k].is_number()) out = ji[k].get<double>();
      else bad = k;
    };
    auto get_bool = [&](const char *k, bool &out) {
      if (!ji.contains(k)) return;
      if (ji[k].is_boolean()) out = ji[k].get<bool>();
      else bad = k;
    };
    auto get_size = [&](const char *k, uint32_t &out) {
      if (!ji.contains(k)) return;
      if (ji[k].is_number_integer() && ji[k].get<int64_t>() >= 0) out = (uint32_t)ji[k].get<int64_t>();
      else bad = k;
    };

    auto img = std::make_unique<image_element>();
    img->id = "img" + std::to_string(n);
    get_str("id", img->id);
    get_str("src", img->src);
    get_str("srcset", img->srcset);
    get_str("currentSrc", img->current_src);
    get_str("crossOrigin", img->cross_origin);
    get_str("class", img->class_name);
    get_bool("optIn", img->opt_in);
    if (ji.contains("ancestorClasses")) {
      if (!ji["ancestorClasses"].is_array()) bad = "ancestorClasses";
      else {
        for (const auto &c : ji["ancestorClasses"]) {
          if (c.is_string()) img->ancestor_classes.push_back(c.get<std::string>());
          else bad = "ancestorClasses";
        }
      }
    }

    box_metrics &b = img->box;
    get_num("width", b.width);
    get_num("height", b.height);
    b.layout_w = b.width;
    b.layout_h = b.height;
    get_num("layoutWidth", b.layout_w);
    get_num("layoutHeight", b.layout_h);
    std::string sizing;
    get_str("boxSizing", sizing);
    b.border_box = sizing == "border-box";
    if (!read_edges(ji, "border", b.border_t, b.border_r, b.border_b, b.border_l)) bad = "border";
    if (!read_edges(ji, "padding", b.pad_t, b.pad_r, b.pad_b, b.pad_l)) bad = "padding";
    if (!read_string_map(ji, "style", img->computed)) bad = "style";
    if (!read_string_map(ji, "inlineStyle", img->inline_style)) bad = "inlineStyle";

    declared_size d;
    get_size("naturalWidth", d.w);
    get_size("naturalHeight", d.h);

    if (bad) {
      fprintf(stderr, "[page] images[%d]: field '%s' has the wrong type\n", n, bad);
      return false;
    }
    declared[img.get()] = d;
    parsed.push_back(std::move(img));
    n++;
  }

  base_dir_ = base_dir;
  origin_ = origin;
  for (auto &img : parsed) {
    declared_[img.get()] = declared[img.get()];
    load_queue_.push_back(img.get());
    images_.push_back(std::move(img));
  }
  fprintf(stderr, "[page] %d images, origin %s\n", n, origin_.c_str());
  return true;
}

std::vector<image_element*> PageHost::images() {
  std::vector<image_element*> v;
  v.reserve(images_.size());
  for (auto &p : images_) v.push_back(p.get());
  return v;
}

image_element* PageHost::find(const std::string &id) {
  for (auto &p : images_) {
    if (p->id == id) return p.get();
  }
  return nullptr;
}

render_surface* PageHost::insert_surface_before(image_element &img, render_surface s) {
  s.replaces = &img;
  surfaces_.push_back(std::make_unique<render_surface>(std::move(s)));
  return surfaces_.back().get();
}

void PageHost::remove_surface(render_surface *s) {
  auto it = std::find_if(surfaces_.begin(), surfaces_.end(),
                         [s](const std::unique_ptr<render_surface> &p) { return p.get() == s; });
  if (it != surfaces_.end()) surfaces_.erase(it);
}

bool PageHost::remove_image(const std::string &id) {
  auto it = std::find_if(images_.begin(), images_.end(),
                         [&id](const std::unique_ptr<image_element> &p) { return p->id == id; });
  if (it == images_.end()) return false;
  image_element *img = it->get();
  surfaces_.erase(std::remove_if(surfaces_.begin(), surfaces_.end(),
                                 [img](const std::unique_ptr<render_surface> &p) { return p->replaces == img; }),
                  surfaces_.end());
  load_queue_.erase(std::remove(load_queue_.begin(), load_queue_.end(), img), load_queue_.end());
  ready_.erase(std::remove(ready_.begin(), ready_.end(), img), ready_.end());
  declared_.erase(img);
  images_.erase(it);
  return true;
}

void PageHost::set_source(image_element &img, const std::string &url) {
  img.src = url;
  img.current_src.clear();
  img.complete = false;
  img.natural_w = img.natural_h = 0;
  img.rgba.clear();
  load_queue_.push_back(&img);
}

std::string PageHost::resolve_path(const std::string &src) const {
  std::string p = src;
  size_t cut = p.find_first_of("?#");
  if (cut != std::string::npos) p.resize(cut);
  if (!p.empty() && p[0] == '/') return p;
  return base_dir_ + "/" + p;
}

void PageHost::start_load(image_element &img) {
  const std::string url = img.effective_src();
  if (url.empty()) return;

  if (image_is_vector(img)) {
    const declared_size &d = declared_[&img];
    img.natural_w = d.w;
    img.natural_h = d.h;
    img.complete = true;
    ready_.push_back(&img);
    return;
  }

  if (url.compare(0, 5, "data:") == 0) {
    std::string mime;
    std::vector<uint8_t> bytes;
    if (!data_uri_parse(url, mime, bytes)) {
      fprintf(stderr, "[page] %s: bad data URI\n", img.id.c_str());
      return;
    }
    finish_load(img, url, bytes);
    return;
  }

  if (url.compare(0, 7, "http://") == 0 || url.compare(0, 8, "https://") == 0) {
    if (!net_) {
      fprintf(stderr, "[page] %s: no network client\n", img.id.c_str());
      return;
    }
    in_flight_++;
    image_element *el = &img;
    net_->fetch(url, [this, el, url](const fetch_result &r) {
      in_flight_--;
      if (std::none_of(images_.begin(), images_.end(),
                       [el](const std::unique_ptr<image_element> &p) { return p.get() == el; })) return;
      if (!r.ok) {
        fprintf(stderr, "[page] %s: fetch failed (%d %s)\n", el->id.c_str(), r.status, r.err.c_str());
        return;
      }
      finish_load(*el, url, std::vector<uint8_t>(r.body.begin(), r.body.end()));
    });
    return;
  }

  std::vector<uint8_t> bytes;
  const std::string path = resolve_path(url);
  if (!slurp_binary(path, bytes)) {
    fprintf(stderr, "[page] %s: cannot read %s\n", img.id.c_str(), path.c_str());
    return;
  }
  finish_load(img, url, bytes);
}

void PageHost::finish_load(image_element &img, const std::string &url, const std::vector<uint8_t> &bytes) {
  if (img.effective_src() != url) return;   // source changed meanwhile

  const std::string mime = image_sniff_mime(bytes);
  if (mime != "image/jpeg") {
    fprintf(stderr, "[page] %s: unsupported image format '%s'\n", img.id.c_str(), mime.c_str());
    return;
  }
  uint32_t w = 0, h = 0;
  if (!jpeg_decode_rgba(bytes.data(), bytes.size(), img.rgba, w, h)) {
    fprintf(stderr, "[page] %s: decode failed\n", img.id.c_str());
    return;
  }
  img.natural_w = w;
  img.natural_h = h;
  img.complete = true;
  ready_.push_back(&img);
}

size_t PageHost::pump_loads(const load_listener_fn &listener) {
  std::deque<image_element*> q;
  q.swap(load_queue_);
  for (image_element *img : q) start_load(*img);

  size_t n = 0;
  while (!ready_.empty()) {
    image_element *img = ready_.front();
    ready_.pop_front();
    if (listener) listener(*img);
    n++;
  }
  return n;
}
