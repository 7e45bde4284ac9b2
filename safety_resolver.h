#pragma once
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "http_fetch.h"
#include "image_host.h"
#include "sinc_types.h"

// Decides whether an image's pixels may be read back by the GPU, and re-hosts
// cross-origin sources as data URIs when they may not.
//
// Caches live for the process: URL -> data URI on success, URL on failure.
// Concurrent refetches of one URL share a single network request.
class SafetyResolver {
public:
  using refetch_done_fn = std::function<void(bool ok, const std::string &data_uri)>;

  SafetyResolver(const document_host &doc, FetchClient *fetcher);

  SafetyDecision resolve(const image_element &img, bool refetch_failed) const;

  // done(true, uri) with a same-origin-equivalent data URI, or done(false, "").
  // May complete before returning. owner tags the waiter for cancel().
  void refetch(const std::string &url, refetch_done_fn done, const void *owner = nullptr);

  // Drops every waiter registered by owner. The flight itself still completes and
  // fills the caches.
  void cancel(const void *owner);
  size_t waiter_count(const std::string &url) const;

  bool cached_representation(const std::string &url, std::string *out) const;
  bool url_failed(const std::string &url) const { return failed_.count(url) != 0; }
  bool in_flight(const std::string &url) const { return pending_.count(url) != 0; }

  // Network requests issued so far (cache hits and joined flights excluded).
  size_t fetch_attempts() const { return attempts_; }

private:
  void complete(const std::string &url, const fetch_result &r);

  const document_host &doc_;
  FetchClient *fetcher_;
  std::map<std::string, std::string> cache_;
  std::set<std::string> failed_;
  struct waiter {
    const void *owner;
    refetch_done_fn done;
  };
  std::map<std::string, std::vector<waiter>> pending_;
  size_t attempts_ = 0;
};

// data:, blob:, same origin (relative URLs included) or a granted crossOrigin mode.
bool source_is_readable(const image_element &img, const std::string &doc_origin);
