#pragma once
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "http_fetch.h"
#include "image_host.h"

// document_host backed by a JSON page manifest. Sources are decoded into RGBA8:
//   data:<mime>;base64,...   payload decoded in place
//   http(s)://...            fetched through the FetchClient
//   anything else            file path relative to the manifest (same origin)
// Only JPEG rasters are decoded; vector sources take their declared natural size.
class PageHost : public document_host {
public:
  using load_listener_fn = std::function<void(image_element &img)>;

  explicit PageHost(FetchClient *net) : net_(net) {}

  bool load_manifest_file(const std::string &path);
  bool load_manifest_text(const std::string &text, const std::string &base_dir);

  std::string origin() const override { return origin_; }
  std::vector<image_element*> images() override;
  render_surface* insert_surface_before(image_element &img, render_surface s) override;
  void remove_surface(render_surface *s) override;
  size_t surface_count() const override { return surfaces_.size(); }
  void set_source(image_element &img, const std::string &url) override;

  // Starts every queued load, then reports each decoded image. Returns how many loaded.
  size_t pump_loads(const load_listener_fn &listener);
  bool loads_pending() const { return !load_queue_.empty() || !ready_.empty() || in_flight_ > 0; }

  image_element* find(const std::string &id);
  // Removes an image (and any surface replacing it); the caller notifies the core first.
  bool remove_image(const std::string &id);
  const std::vector<std::unique_ptr<render_surface>>& surfaces() const { return surfaces_; }

private:
  struct declared_size {
    uint32_t w = 0, h = 0;
  };

  void start_load(image_element &img);
  void finish_load(image_element &img, const std::string &url, const std::vector<uint8_t> &bytes);
  std::string resolve_path(const std::string &src) const;

  FetchClient *net_;
  std::string origin_;
  std::string base_dir_;
  std::vector<std::unique_ptr<image_element>> images_;
  std::map<const image_element*, declared_size> declared_;   // vector sources
  std::vector<std::unique_ptr<render_surface>> surfaces_;
  std::deque<image_element*> load_queue_;
  std::deque<image_element*> ready_;
  int in_flight_ = 0;
};
