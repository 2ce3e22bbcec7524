#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace kiln {

class FileUtils {
public:
    // Get MIME type for file, "application/octet-stream" when unknown
    static std::string get_mime_type(const std::string& filename);

    // Format file size as human-readable string
    static std::string format_file_size(size_t bytes);

    // Hash utilities
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Random version 4 UUID
    static std::string generate_uuid();

    // Write to a sibling temp file, fsync and rename over `path`.
    // Readers never observe a partially written file.
    static void write_file_atomic(const std::filesystem::path& path, const std::string& content);

    // Whole-file read; throws std::runtime_error if the file can't be opened
    static std::string read_file(const std::filesystem::path& path);

    // Sum of regular file sizes below `path` (0 if missing)
    static size_t directory_size(const std::filesystem::path& path);

    // True if `path` resolves to `root` or something below it
    static bool is_within(const std::filesystem::path& root, const std::filesystem::path& path);

private:
    static const std::map<std::string, std::string> mime_type_map_;
};

} // namespace kiln
