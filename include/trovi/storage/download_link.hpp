#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace trovi {

/// A plain HTTP download. exp is a Unix timestamp.
struct HttpDownloadLink {
    std::string url;
    int64_t exp = 0;
    std::map<std::string, std::string> headers;
    std::string method = "GET";
};

/// A git remote to clone, checked out at ref
struct GitDownloadLink {
    std::string remote;
    std::string ref = "HEAD";
    int64_t exp = 0;
    std::map<std::string, std::string> env;
};

using DownloadLink = std::variant<HttpDownloadLink, GitDownloadLink>;

const char* link_protocol(const DownloadLink& link);

// {protocol: "http", url, exp, headers, method}
void to_json(nlohmann::json& j, const HttpDownloadLink& link);
// {protocol: "git", remote, ref, exp, env}
void to_json(nlohmann::json& j, const GitDownloadLink& link);

nlohmann::json link_to_json(const DownloadLink& link);
nlohmann::json links_to_json(const std::vector<DownloadLink>& links);

}  // namespace trovi
