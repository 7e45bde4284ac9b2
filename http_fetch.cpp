#include "http_fetch.h"
#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <cstdio>

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
  return s;
}

bool url_split(const std::string &url, std::string &scheme_host_port, std::string &path) {
  size_t sep = url.find("://");
  if (sep == std::string::npos) return false;
  std::string scheme = lower(url.substr(0, sep));
  if (scheme != "http" && scheme != "https") return false;

  size_t host_start = sep + 3;
  size_t path_start = url.find_first_of("/?#", host_start);
  if (path_start == std::string::npos) {
    scheme_host_port = url;
    path = "/";
  } else {
    scheme_host_port = url.substr(0, path_start);
    path = url.substr(path_start);
    size_t hash = path.find('#');
    if (hash != std::string::npos) path.resize(hash);
    if (path.empty() || path[0] != '/') path = "/" + path;
  }
  return scheme_host_port.size() > host_start;
}

std::string url_origin(const std::string &url) {
  size_t sep = url.find("://");
  if (sep == std::string::npos) return "";
  std::string scheme = lower(url.substr(0, sep));

  size_t host_start = sep + 3;
  size_t host_end = url.find_first_of("/?#", host_start);
  std::string authority = lower(url.substr(host_start, host_end == std::string::npos ? std::string::npos : host_end - host_start));

  // strip userinfo
  size_t at = authority.rfind('@');
  if (at != std::string::npos) authority = authority.substr(at + 1);

  // drop default ports
  size_t colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    std::string port = authority.substr(colon + 1);
    if ((scheme == "http" && port == "80") || (scheme == "https" && port == "443")) authority.resize(colon);
  }
  return scheme + "://" + authority;
}

void HttpFetchClient::fetch(const std::string &url, fetch_done_fn done) {
  fetch_result r;
  std::string base, path;
  if (!url_split(url, base, path)) {
    r.err = "unsupported url";
    done(r);
    return;
  }

  httplib::Client cli(base);
  if (!cli.is_valid()) {
    r.err = "client unavailable for " + base;
    fprintf(stderr, "[fetch] %s\n", r.err.c_str());
    done(r);
    return;
  }
  cli.set_follow_location(true);
  cli.set_connection_timeout(timeout_sec_, 0);
  cli.set_read_timeout(timeout_sec_, 0);

  httplib::Headers headers = { {"Accept", "image/*"} };
  auto res = cli.Get(path, headers);
  if (!res) {
    r.err = httplib::to_string(res.error());
    fprintf(stderr, "[fetch] GET %s failed: %s\n", url.c_str(), r.err.c_str());
    done(r);
    return;
  }

  r.status = res->status;
  r.content_type = res->get_header_value("Content-Type");
  r.body = std::move(res->body);
  r.ok = (r.status >= 200 && r.status < 300);
  if (!r.ok) r.err = "http status " + std::to_string(r.status);
  done(r);
}
