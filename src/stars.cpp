#include "stars.hpp"
#include "log.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace hubrep {

namespace {

std::shared_ptr<spdlog::logger> stars_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("stars");
  }();
  return logger;
}

const std::vector<std::string> &default_headers() {
  static const std::vector<std::string> headers = {
      "Accept: application/vnd.github+json"};
  return headers;
}

bool is_success(long status) { return status >= 200 && status < 300; }

/// Build an ApiError, decoding the body when it is a JSON error document.
ApiError api_error(const char *action, const std::string &url,
                   const HttpResponse &resp) {
  std::optional<ClientError> error;
  std::string detail;
  if (!resp.body.empty()) {
    auto parsed = nlohmann::json::parse(resp.body, nullptr, false);
    if (!parsed.is_discarded()) {
      try {
        error = decode_record<ClientError>(parsed);
        detail = ": " + error->message;
      } catch (const DecodeError &e) {
        stars_log()->debug("Unrecognised error body from {}: {}", url,
                           e.what());
      }
    }
  }
  stars_log()->error("{} {} failed with HTTP {}{}", action, url,
                     resp.status_code, detail);
  return ApiError(resp.status_code, std::move(error),
                  std::string(action) + " " + url + " failed with HTTP " +
                      std::to_string(resp.status_code) + detail);
}

} // namespace

ApiError::ApiError(long status_code, std::optional<ClientError> error,
                   const std::string &message)
    : std::runtime_error(message), status_code_(status_code),
      error_(std::move(error)) {}

Stars::Stars(std::shared_ptr<HttpClient> http, std::string api_base)
    : http_(std::move(http)), api_base_(std::move(api_base)) {
  if (!http_) {
    throw std::invalid_argument("Stars requires an HTTP client");
  }
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

std::string Stars::starred_url(const std::string &owner,
                               const std::string &repo) const {
  return api_base_ + "/user/starred/" + owner + "/" + repo;
}

bool Stars::is_starred(const std::string &owner, const std::string &repo) {
  const std::string url = starred_url(owner, repo);
  HttpResponse resp = http_->get(url, default_headers());
  if (is_success(resp.status_code)) {
    stars_log()->debug("{}/{} is starred", owner, repo);
    return true;
  }
  if (resp.status_code == 404) {
    stars_log()->debug("{}/{} is not starred", owner, repo);
    return false;
  }
  throw api_error("GET", url, resp);
}

void Stars::star(const std::string &owner, const std::string &repo) {
  const std::string url = starred_url(owner, repo);
  // An empty PUT must still announce its length.
  std::vector<std::string> headers = default_headers();
  headers.push_back("Content-Length: 0");
  HttpResponse resp = http_->put(url, "", headers);
  if (!is_success(resp.status_code)) {
    throw api_error("PUT", url, resp);
  }
  stars_log()->info("Starred {}/{}", owner, repo);
}

void Stars::unstar(const std::string &owner, const std::string &repo) {
  const std::string url = starred_url(owner, repo);
  HttpResponse resp = http_->del(url, default_headers());
  if (!is_success(resp.status_code)) {
    throw api_error("DELETE", url, resp);
  }
  stars_log()->info("Unstarred {}/{}", owner, repo);
}

} // namespace hubrep
