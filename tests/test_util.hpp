#pragma once
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
class TempProject {
public:
    TempProject();
    ~TempProject();
    TempProject(const TempProject&) = delete;
    TempProject& operator=(const TempProject&) = delete;

    const std::string& root() const { return root_; }
    fs::path path(const std::string& rel) const { return fs::path(root_) / rel; }

    void write(const std::string& rel, const std::string& content) const;
    std::string read(const std::string& rel) const;
    bool exists(const std::string& rel) const;

private:
    std::string root_;
};
