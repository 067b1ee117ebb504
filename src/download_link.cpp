#include "trovi/storage/download_link.hpp"

namespace trovi {

const char* link_protocol(const DownloadLink& link) {
    return std::holds_alternative<HttpDownloadLink>(link) ? "http" : "git";
}

void to_json(nlohmann::json& j, const HttpDownloadLink& link) {
    j = nlohmann::json{
        {"protocol", "http"},
        {"url", link.url},
        {"exp", link.exp},
        {"headers", link.headers},
        {"method", link.method},
    };
}

void to_json(nlohmann::json& j, const GitDownloadLink& link) {
    j = nlohmann::json{
        {"protocol", "git"},
        {"remote", link.remote},
        {"ref", link.ref},
        {"exp", link.exp},
        {"env", link.env},
    };
}

nlohmann::json link_to_json(const DownloadLink& link) {
    return std::visit([](const auto& l) { return nlohmann::json(l); }, link);
}

nlohmann::json links_to_json(const std::vector<DownloadLink>& links) {
    auto out = nlohmann::json::array();
    for (const auto& link : links) {
        out.push_back(link_to_json(link));
    }
    return out;
}

}  // namespace trovi
