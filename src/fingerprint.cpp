#include "fingerprint.hpp"
#include "errors.hpp"
#include <openssl/sha.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

std::vector<unsigned char> sha256(const std::string& data) {
    std::vector<unsigned char> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());
    return hash;
}

std::string hex_encode(const std::vector<unsigned char>& data) {
    std::ostringstream oss;
    for (auto byte : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
    }
    return oss.str();
}

namespace {

bool is_trailing_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

std::string normalize_content(const std::string& content) {
    std::string text;
    text.reserve(content.size());
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n')
            continue;
        text += content[i];
    }

    static const std::string bom = "\xEF\xBB\xBF";
    if (text.compare(0, bom.size(), bom) == 0)
        text.erase(0, bom.size());

    std::string out;
    out.reserve(text.size());
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = nl == std::string::npos ? text.size() : nl;
        size_t last = end;
        while (last > start && is_trailing_space(text[last - 1]))
            --last;
        out.append(text, start, last - start);
        if (nl == std::string::npos)
            break;
        out += '\n';
        start = nl + 1;
    }
    return out;
}

std::string normalized_hash(const std::string& content) {
    return "sha256:" + hex_encode(sha256(normalize_content(content)));
}

Hash hash_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return std::nullopt;
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw SyncError("cannot read " + path);
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        throw SyncError("read error on " + path);
    return normalized_hash(data);
}

bool hash_equal(const Hash& a, const Hash& b) {
    if (!a || !b)
        return false;
    return *a == *b;
}
