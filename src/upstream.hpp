#pragma once
#include <string>
#include <vector>

struct UpstreamFile {
    std::string path;
    std::string content;
};

// Upstream-provided order is significant.
using UpstreamContents = std::vector<UpstreamFile>;

class UpstreamProvider {
public:
    virtual ~UpstreamProvider() = default;
    virtual std::string latest_version() = 0;
    virtual bool version_exists(const std::string& version) = 0;
    virtual UpstreamContents fetch(const std::string& version) = 0;
};

// Releases laid out as <root>/<version>/<files...>.
class DirectoryUpstream : public UpstreamProvider {
public:
    explicit DirectoryUpstream(const std::string& root);

    std::string latest_version() override;
    bool version_exists(const std::string& version) override;
    UpstreamContents fetch(const std::string& version) override;

private:
    std::string root_;
};

// Dotted numeric comparison; non-numeric parts compare as strings.
int compare_versions(const std::string& a, const std::string& b);
