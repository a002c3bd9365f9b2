#pragma once

#include <string>

struct RepositoryRef {
    std::string owner;
    std::string repository;

    bool operator==(const RepositoryRef&) const = default;
};

struct ContentResponse {
    long status = 0;      // HTTP status, 0 when no response was received
    std::string content;  // decoded file body, only meaningful when ok()
    std::string error;

    bool ok() const { return status == 200; }
};

// Remote content API: GET /repos/{owner}/{repo}/contents/{path}.
// Implementations must be callable from several threads at once.
class ContentSource {
public:
    virtual ~ContentSource() = default;
    virtual ContentResponse fetch(const RepositoryRef& repo, const std::string& path) = 0;
    virtual std::string content_root(const RepositoryRef& repo) const = 0;
};

class GithubContentSource : public ContentSource {
public:
    explicit GithubContentSource(std::string api_url);

    ContentResponse fetch(const RepositoryRef& repo, const std::string& path) override;
    std::string content_root(const RepositoryRef& repo) const override;

private:
    std::string api_url_;
};
