/**
 * @file records.hpp
 * @brief Typed views of GitHub REST API responses.
 *
 * Only the fields needed by callers are modelled. Every date/time field is a
 * Timestamp so that both string and epoch encodings are accepted.
 */

#ifndef HUBREP_RECORDS_HPP
#define HUBREP_RECORDS_HPP

#include "datetime.hpp"
#include "decode.hpp"
#include "requests.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hubrep {

/// Account that owns or acted on a resource.
struct User {
  std::string login;
  std::uint64_t id{0};
  std::string avatar_url;
  std::string gravatar_id;
  std::string url;
  std::string html_url;
  std::string followers_url;
  std::string repos_url;
  bool site_admin{false};
};

struct Permissions {
  bool admin{false};
  bool push{false};
  bool pull{false};
};

/// Repository summary.
struct Repo {
  std::uint64_t id{0};
  User owner;
  std::string name;
  std::string full_name;
  std::optional<std::string> description;
  bool fork{false};
  std::string url;
  std::string html_url;
  std::string clone_url;
  std::optional<std::string> homepage;
  std::optional<std::string> language;
  std::uint64_t forks_count{0};
  std::uint64_t stargazers_count{0};
  std::uint64_t watchers_count{0};
  std::uint64_t open_issues_count{0};
  std::string default_branch;
  std::optional<Permissions> permissions;
  std::optional<Timestamp> pushed_at;
  Timestamp created_at;
  Timestamp updated_at;
};

/// Branch reference of a pull request (`head` or `base`).
struct Commit {
  std::string label;
  std::string commit_ref; ///< Received as `ref`
  std::string sha;
  User user;
  std::optional<Repo> repo;
};

struct Label {
  std::string url;
  std::string name;
  std::string color;
};

struct Deployment {
  std::string url;
  std::uint64_t id{0};
  std::string sha;
  std::string commit_ref; ///< Received as `ref`
  std::string task;
  std::string environment;
  std::optional<std::string> description;
  User creator;
  Timestamp created_at;
  Timestamp updated_at;
  std::string statuses_url;
  std::string repository_url;
};

struct DeploymentStatus {
  std::string url;
  std::uint64_t id{0};
  State state{State::Pending};
  std::optional<std::string> target_url;
  std::optional<std::string> description;
  User creator;
  Timestamp created_at;
  Timestamp updated_at;
  std::string deployment_url;
  std::string repository_url;
};

/// Commit status as reported by the statuses API.
struct Status {
  std::uint64_t id{0};
  std::string url;
  State state{State::Pending};
  std::optional<std::string> target_url;
  std::optional<std::string> description;
  std::string context;
  User creator;
  Timestamp created_at;
  Timestamp updated_at;
};

/// Release asset.
struct Asset {
  std::string url;
  std::string browser_download_url;
  std::uint64_t id{0};
  std::string name;
  std::optional<std::string> label;
  std::string state;
  std::string content_type;
  std::uint64_t size{0};
  std::uint64_t download_count{0};
  Timestamp created_at;
  Timestamp updated_at;
  User uploader;
};

struct Release {
  std::string url;
  std::string html_url;
  std::string assets_url;
  std::string upload_url;
  std::optional<std::string> tarball_url;
  std::optional<std::string> zipball_url;
  std::uint64_t id{0};
  std::string tag_name;
  std::string target_commitish;
  std::optional<std::string> name;
  std::optional<std::string> body;
  bool draft{false};
  bool prerelease{false};
  Timestamp created_at;
  std::optional<Timestamp> published_at; ///< Null for drafts
  User author;
  std::vector<Asset> assets;
};

struct Issue {
  std::uint64_t id{0};
  std::string url;
  std::string html_url;
  std::uint64_t number{0};
  std::string state;
  std::string title;
  std::optional<std::string> body;
  User user;
  std::vector<Label> labels;
  std::optional<User> assignee;
  bool locked{false};
  std::uint64_t comments{0};
  std::optional<Timestamp> closed_at;
  Timestamp created_at;
  Timestamp updated_at;
};

struct Pull {
  std::uint64_t id{0};
  std::string url;
  std::string html_url;
  std::string diff_url;
  std::string patch_url;
  std::uint64_t number{0};
  std::string state;
  std::string title;
  std::optional<std::string> body;
  User user;
  std::optional<Commit> head;
  std::optional<Commit> base;
  Timestamp created_at;
  Timestamp updated_at;
  std::optional<Timestamp> closed_at;
  std::optional<Timestamp> merged_at;
  std::optional<std::uint64_t> changed_files;
};

/// Public key registered on an account.
struct Key {
  std::uint64_t id{0};
  std::string key;
  std::string title;
  bool verified{false};
  bool read_only{false};
  Timestamp created_at;
};

struct GistFile {
  std::uint64_t size{0};
  std::string raw_url;
  std::optional<std::string> type; ///< MIME type
  std::optional<std::string> language;
};

struct Gist {
  std::string url;
  std::string forks_url;
  std::string commits_url;
  std::string id;
  std::optional<std::string> description;
  bool is_public{false}; ///< Received as `public`
  std::optional<User> owner;
  std::map<std::string, GistFile> files;
  std::uint64_t comments{0};
  std::string comments_url;
  std::string html_url;
  std::string git_pull_url;
  std::string git_push_url;
  Timestamp created_at;
  Timestamp updated_at;
};

struct GistFork {
  User user;
  std::string url;
  std::string id;
  Timestamp created_at;
  Timestamp updated_at;
};

/// One entry of a validation failure body.
struct FieldErr {
  std::string resource;
  std::string field;
  std::string code;
};

/// Error body returned with 4xx responses.
struct ClientError {
  std::string message;
  std::optional<std::vector<FieldErr>> errors;
  std::optional<std::string> documentation_url;
};

void read_record(const FieldReader &in, User &out);
void read_record(const FieldReader &in, Permissions &out);
void read_record(const FieldReader &in, Repo &out);
void read_record(const FieldReader &in, Commit &out);
void read_record(const FieldReader &in, Label &out);
void read_record(const FieldReader &in, Deployment &out);
void read_record(const FieldReader &in, DeploymentStatus &out);
void read_record(const FieldReader &in, Status &out);
void read_record(const FieldReader &in, Asset &out);
void read_record(const FieldReader &in, Release &out);
void read_record(const FieldReader &in, Issue &out);
void read_record(const FieldReader &in, Pull &out);
void read_record(const FieldReader &in, Key &out);
void read_record(const FieldReader &in, GistFile &out);
void read_record(const FieldReader &in, Gist &out);
void read_record(const FieldReader &in, GistFork &out);
void read_record(const FieldReader &in, FieldErr &out);
void read_record(const FieldReader &in, ClientError &out);

// Enable `json.get<T>()` for JSON text documents.
void from_json(const nlohmann::json &j, User &out);
void from_json(const nlohmann::json &j, Repo &out);
void from_json(const nlohmann::json &j, Deployment &out);
void from_json(const nlohmann::json &j, DeploymentStatus &out);
void from_json(const nlohmann::json &j, Status &out);
void from_json(const nlohmann::json &j, Release &out);
void from_json(const nlohmann::json &j, Issue &out);
void from_json(const nlohmann::json &j, Pull &out);
void from_json(const nlohmann::json &j, Key &out);
void from_json(const nlohmann::json &j, Gist &out);
void from_json(const nlohmann::json &j, ClientError &out);

} // namespace hubrep

#endif // HUBREP_RECORDS_HPP
