#include "upstream.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_version(const std::string& v) {
    std::vector<std::string> parts;
    std::stringstream ss(v.size() > 1 && (v[0] == 'v' || v[0] == 'V') ? v.substr(1) : v);
    std::string item;
    while (std::getline(ss, item, '.'))
        parts.push_back(item);
    return parts;
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

}  // namespace

int compare_versions(const std::string& a, const std::string& b) {
    auto pa = split_version(a);
    auto pb = split_version(b);
    for (size_t i = 0; i < std::max(pa.size(), pb.size()); ++i) {
        std::string x = i < pa.size() ? pa[i] : "0";
        std::string y = i < pb.size() ? pb[i] : "0";
        if (all_digits(x) && all_digits(y)) {
            x.erase(0, std::min(x.find_first_not_of('0'), x.size()));
            y.erase(0, std::min(y.find_first_not_of('0'), y.size()));
            if (x.size() != y.size())
                return x.size() < y.size() ? -1 : 1;
        }
        if (x != y)
            return x < y ? -1 : 1;
    }
    return 0;
}

DirectoryUpstream::DirectoryUpstream(const std::string& root)
    : root_(root)
{}

std::string DirectoryUpstream::latest_version() {
    std::error_code ec;
    if (!fs::is_directory(root_, ec))
        throw UpstreamError("upstream directory not found: " + root_);
    std::string latest;
    for (auto& entry : fs::directory_iterator(root_)) {
        if (!entry.is_directory())
            continue;
        std::string name = entry.path().filename().string();
        if (latest.empty() || compare_versions(name, latest) > 0)
            latest = name;
    }
    if (latest.empty())
        throw UpstreamError("no releases under " + root_);
    return latest;
}

bool DirectoryUpstream::version_exists(const std::string& version) {
    if (version.empty() || version.find('/') != std::string::npos || version == "." || version == "..")
        return false;
    std::error_code ec;
    return fs::is_directory(fs::path(root_) / version, ec);
}

UpstreamContents DirectoryUpstream::fetch(const std::string& version) {
    if (!version_exists(version))
        throw UpstreamError("unknown version '" + version + "' in " + root_);
    fs::path base = fs::path(root_) / version;
    UpstreamContents contents;
    for (auto& p : fs::recursive_directory_iterator(base)) {
        if (!p.is_regular_file())
            continue;
        std::ifstream in(p.path(), std::ios::binary);
        if (!in)
            throw UpstreamError("cannot read " + p.path().string());
        std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        contents.push_back({fs::relative(p.path(), base).generic_string(), std::move(data)});
    }
    std::sort(contents.begin(), contents.end(),
              [](const UpstreamFile& a, const UpstreamFile& b) { return a.path < b.path; });
    spdlog::debug("fetched {} files for version {}", contents.size(), version);
    return contents;
}
