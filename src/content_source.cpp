#include "content_source.hpp"
#include "codec.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdio>
#include <utility>

using json = nlohmann::json;

namespace {

std::string url_encode_path(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

}

GithubContentSource::GithubContentSource(std::string api_url) : api_url_(std::move(api_url)) {
    while (!api_url_.empty() && api_url_.back() == '/') api_url_.pop_back();
}

std::string GithubContentSource::content_root(const RepositoryRef& repo) const {
    return api_url_ + "/repos/" + url_encode_path(repo.owner) + "/" + url_encode_path(repo.repository) + "/contents/";
}

ContentResponse GithubContentSource::fetch(const RepositoryRef& repo, const std::string& path) {
    HttpResponse http = http_get(content_root(repo) + url_encode_path(path), "application/vnd.github+json");

    ContentResponse response;
    response.status = http.status;
    if (http.status != 200) {
        response.error = http.error;
        return response;
    }

    json doc = json::parse(http.body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("content") || !doc["content"].is_string()) {
        throw HotpackException(string_format("error.content_malformed", path));
    }
    const std::string encoding = doc.value("encoding", std::string("base64"));
    if (encoding != "base64") {
        throw HotpackException(string_format("error.content_encoding_unsupported", path, encoding));
    }
    response.content = base64_decode(doc["content"].get<std::string>());
    return response;
}
