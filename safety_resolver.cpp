#include "safety_resolver.h"
#include "data_uri.h"

#include <algorithm>
#include <cstdio>

bool source_is_readable(const image_element &img, const std::string &doc_origin) {
  const std::string &src = img.effective_src();
  if (src.compare(0, 5, "data:") == 0 || src.compare(0, 5, "blob:") == 0) return true;

  std::string o = url_origin(src);
  if (o.empty()) return true; // relative => document origin
  if (!doc_origin.empty() && o == url_origin(doc_origin)) return true;

  return img.cross_origin == "anonymous" || img.cross_origin == "use-credentials";
}

SafetyResolver::SafetyResolver(const document_host &doc, FetchClient *fetcher)
  : doc_(doc), fetcher_(fetcher) {}

SafetyDecision SafetyResolver::resolve(const image_element &img, bool refetch_failed) const {
  if (source_is_readable(img, doc_.origin())) return SafetyDecision::SAFE;
  if (refetch_failed || !fetcher_) return SafetyDecision::UNSAFE_PERMANENT;
  if (url_failed(img.effective_src())) return SafetyDecision::UNSAFE_PERMANENT;
  return SafetyDecision::UNSAFE_REFETCHABLE;
}

bool SafetyResolver::cached_representation(const std::string &url, std::string *out) const {
  auto it = cache_.find(url);
  if (it == cache_.end()) return false;
  if (out) *out = it->second;
  return true;
}

void SafetyResolver::refetch(const std::string &url, refetch_done_fn done, const void *owner) {
  std::string uri;
  if (cached_representation(url, &uri)) {
    done(true, uri);
    return;
  }
  if (url_failed(url) || !fetcher_) {
    done(false, "");
    return;
  }

  auto it = pending_.find(url);
  if (it != pending_.end()) {
    it->second.push_back({owner, std::move(done)});
    return;
  }
  pending_[url].push_back({owner, std::move(done)});

  attempts_++;
  fprintf(stderr, "[safety] refetching %s\n", url.c_str());
  fetcher_->fetch(url, [this, url](const fetch_result &r) { complete(url, r); });
}

void SafetyResolver::complete(const std::string &url, const fetch_result &r) {
  std::string uri;
  if (!r.ok) {
    fprintf(stderr, "[safety] refetch failed for %s: %s\n", url.c_str(), r.err.c_str());
  } else if (r.body.empty()) {
    fprintf(stderr, "[safety] refetch of %s returned an empty body\n", url.c_str());
  } else {
    std::vector<uint8_t> bytes(r.body.begin(), r.body.end());
    std::string mime = image_sniff_mime(bytes);
    if (mime.empty()) {
      fprintf(stderr, "[safety] refetch of %s is not a decodable image (%s)\n", url.c_str(), r.content_type.c_str());
    } else {
      uri = data_uri_build(mime, bytes);
    }
  }

  if (uri.empty()) failed_.insert(url);
  else cache_[url] = uri;

  std::vector<waiter> waiters;
  auto it = pending_.find(url);
  if (it != pending_.end()) {
    waiters.swap(it->second);
    pending_.erase(it);
  }
  for (auto &w : waiters) w.done(!uri.empty(), uri);
}

void SafetyResolver::cancel(const void *owner) {
  if (!owner) return;
  for (auto &kv : pending_) {
    auto &v = kv.second;
    v.erase(std::remove_if(v.begin(), v.end(), [owner](const waiter &w) { return w.owner == owner; }), v.end());
  }
}

size_t SafetyResolver::waiter_count(const std::string &url) const {
  auto it = pending_.find(url);
  return it == pending_.end() ? 0 : it->second.size();
}
