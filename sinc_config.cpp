#include "sinc_config.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using nlohmann::json;

static void uniq_push(std::vector<std::string> &out, const std::string &s) {
  if (s.empty()) return;
  if (std::find(out.begin(), out.end(), s) == out.end()) out.push_back(s);
}

void options_normalize(sinc_options &o) {
  if (o.throttle_ms < 0) o.throttle_ms = 0;
  if (o.throttle_ms > 10000) o.throttle_ms = 10000;

  if (o.min_natural_size < 0) o.min_natural_size = 0;
  if (o.min_natural_size > 4096) o.min_natural_size = 4096;

  if (!(o.zoom_threshold > 0.0)) o.zoom_threshold = 0.0; // also catches NaN

  std::vector<std::string> ex;
  for (auto &c : o.exclude_classes) uniq_push(ex, c);
  o.exclude_classes = ex;
}

std::string options_to_json(const sinc_options &o_in) {
  sinc_options o = o_in;
  options_normalize(o);

  json j;
  j["enabled"] = o.enabled;
  j["global"] = o.global;
  j["observe"] = o.observe;
  j["zoomThreshold"] = o.zoom_threshold;
  j["throttleMs"] = o.throttle_ms;
  j["minNaturalSize"] = o.min_natural_size;
  j["excludeClasses"] = o.exclude_classes;
  j["gpu"] = o.gpu;
  return j.dump();
}

bool options_from_json_text(const std::string &text, sinc_options &o) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return false;

  auto get_bool = [&](const char *k, bool &out) {
    if (j.contains(k) && j[k].is_boolean()) out = j[k].get<bool>();
  };
  auto get_int = [&](const char *k, int &out) {
    if (j.contains(k) && j[k].is_number_integer()) out = j[k].get<int>();
  };

  get_bool("enabled", o.enabled);
  get_bool("global", o.global);
  get_bool("observe", o.observe);
  get_bool("gpu", o.gpu);
  get_int("throttleMs", o.throttle_ms);
  get_int("minNaturalSize", o.min_natural_size);

  if (j.contains("zoomThreshold") && j["zoomThreshold"].is_number()) {
    o.zoom_threshold = j["zoomThreshold"].get<double>();
  }

  if (j.contains("excludeClasses") && j["excludeClasses"].is_array()) {
    o.exclude_classes.clear();
    for (const auto &x : j["excludeClasses"]) if (x.is_string()) o.exclude_classes.push_back(x.get<std::string>());
  }

  options_normalize(o);
  return true;
}
