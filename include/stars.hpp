/**
 * @file stars.hpp
 * @brief Starring and unstarring repositories for the authenticated user.
 *
 * The transport is supplied by the caller through the HttpClient interface;
 * authentication headers are expected to be added by that implementation.
 */

#ifndef HUBREP_STARS_HPP
#define HUBREP_STARS_HPP

#include "records.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hubrep {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response including the status code; non-2xx statuses are not
   *         treated as transport failures.
   * @throws std::runtime_error On transport failures.
   */
  virtual HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers) = 0;

  /// Perform a HTTP PUT request with @p data as the body.
  virtual HttpResponse put(const std::string &url, const std::string &data,
                           const std::vector<std::string> &headers) = 0;

  /// Perform a HTTP DELETE request.
  virtual HttpResponse del(const std::string &url,
                           const std::vector<std::string> &headers) = 0;
};

/**
 * Raised when the API answers with an unexpected status.
 */
class ApiError : public std::runtime_error {
public:
  ApiError(long status_code, std::optional<ClientError> error,
           const std::string &message);

  long status_code() const noexcept { return status_code_; }

  /// Decoded error body, when the response carried one.
  const std::optional<ClientError> &client_error() const noexcept {
    return error_;
  }

private:
  long status_code_;
  std::optional<ClientError> error_;
};

/**
 * Star-related endpoints of the REST API.
 */
class Stars {
public:
  /**
   * @param http Transport used for all requests; must not be null.
   * @param api_base Base URL for the GitHub API endpoints.
   * @throws std::invalid_argument When @p http is null.
   */
  explicit Stars(std::shared_ptr<HttpClient> http,
                 std::string api_base = "https://api.github.com");

  /**
   * Check whether the authenticated user has starred a repository.
   *
   * @return `true` for a 2xx answer, `false` for 404.
   * @throws ApiError For any other status.
   */
  bool is_starred(const std::string &owner, const std::string &repo);

  /// Star a repository. @throws ApiError Unless the API answers 2xx.
  void star(const std::string &owner, const std::string &repo);

  /// Remove a star. @throws ApiError Unless the API answers 2xx.
  void unstar(const std::string &owner, const std::string &repo);

private:
  std::string starred_url(const std::string &owner,
                          const std::string &repo) const;

  std::shared_ptr<HttpClient> http_;
  std::string api_base_;
};

} // namespace hubrep

#endif // HUBREP_STARS_HPP
