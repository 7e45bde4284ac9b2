#pragma once
#include <functional>
#include <string>

struct fetch_result {
  bool ok = false;               // transport succeeded and status is 2xx
  int status = 0;
  std::string content_type;
  std::string body;
  std::string err;
};

using fetch_done_fn = std::function<void(const fetch_result &r)>;

// Network collaborator. done() may run before fetch() returns (blocking clients)
// or later from the host's event loop; it always runs on the UI thread.
class FetchClient {
public:
  virtual ~FetchClient() = default;
  virtual void fetch(const std::string &url, fetch_done_fn done) = 0;
};

// Blocking cpp-httplib client. https needs httplib built with OpenSSL support;
// without it such requests fail and the caller keeps the image untouched.
class HttpFetchClient : public FetchClient {
public:
  explicit HttpFetchClient(int timeout_sec = 10) : timeout_sec_(timeout_sec) {}
  void fetch(const std::string &url, fetch_done_fn done) override;

private:
  int timeout_sec_;
};

// "http://a.b:8080/x/y?z" -> "http://a.b:8080" + "/x/y?z". False if not absolute http(s).
bool url_split(const std::string &url, std::string &scheme_host_port, std::string &path);

// Lower-cased scheme://host[:port] with default ports removed; "" for relative URLs.
std::string url_origin(const std::string &url);
