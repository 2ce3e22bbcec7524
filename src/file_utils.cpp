#include "file_utils.h"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unistd.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace fs = std::filesystem;

namespace kiln {

const std::map<std::string, std::string> FileUtils::mime_type_map_ = {
    // Data
    {".csv", "text/csv"},
    {".tsv", "text/tab-separated-values"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".yaml", "application/yaml"},
    {".yml", "application/yaml"},

    // Text
    {".txt", "text/plain"},
    {".md", "text/markdown"},
    {".log", "text/plain"},
    {".in", "text/plain"},
    {".out", "text/plain"},

    // Archives
    {".zip", "application/zip"},
    {".tar", "application/x-tar"},
    {".gz", "application/gzip"},

    // Code
    {".py", "text/x-python"},
    {".js", "application/javascript"},
    {".cpp", "text/x-c++"},
    {".hpp", "text/x-c++"},
    {".c", "text/x-c"},
    {".h", "text/x-c"},
    {".java", "text/x-java"},
    {".go", "text/x-go"},
    {".rs", "text/x-rust"},
    {".sh", "application/x-sh"},

    // Images
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},

    // Documents
    {".pdf", "application/pdf"},
};

std::string FileUtils::get_mime_type(const std::string& filename) {
    // Get extension (lowercase)
    std::string ext;
    size_t dot_pos = filename.rfind('.');
    if (dot_pos != std::string::npos) {
        ext = filename.substr(dot_pos);
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    }

    auto it = mime_type_map_.find(ext);
    if (it != mime_type_map_.end()) {
        return it->second;
    }

    return "application/octet-stream";
}

std::string FileUtils::format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    return oss.str();
}

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);  // RFC 4122 variant

    std::string hex = bytes_to_hex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

void FileUtils::write_file_atomic(const fs::path& path, const std::string& content) {
    static std::atomic<unsigned long> counter{0};

    fs::path tmp = path;
    tmp += ".tmp." + std::to_string(getpid()) + "." + std::to_string(++counter);

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error("open " + tmp.string() + ": " + std::strerror(errno));
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw std::runtime_error("write " + tmp.string() + ": " + std::strerror(err));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw std::runtime_error("flush " + tmp.string() + ": " + std::strerror(err));
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw std::runtime_error("rename " + path.string() + ": " + std::strerror(err));
    }
}

std::string FileUtils::read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

size_t FileUtils::directory_size(const fs::path& path) {
    size_t size = 0;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return 0;
    }
    for (const auto& entry : fs::recursive_directory_iterator(path, ec)) {
        if (entry.is_regular_file(ec)) {
            size += entry.file_size(ec);
        }
    }
    return size;
}

bool FileUtils::is_within(const fs::path& root, const fs::path& path) {
    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(root, ec);
    if (ec) return false;
    fs::path canonical_path = fs::weakly_canonical(path, ec);
    if (ec) return false;

    fs::path rel = canonical_path.lexically_relative(canonical_root);
    if (rel.empty()) {
        return false;
    }
    return *rel.begin() != "..";
}

} // namespace kiln
