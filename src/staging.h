#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "records.h"

namespace kiln {

class StagedFiles;

// Per-submission directories of uploaded files, one under the root per
// job id. Nothing outside the root is ever resolved or removed.
class StagingArea {
public:
    explicit StagingArea(const std::string& root);

    // Creates <root>/<job_id> and returns its path
    std::filesystem::path create(const std::string& job_id);

    // Write one uploaded file into the submission's directory.
    // Throws std::invalid_argument for unsafe names or oversized totals.
    UploadedFile stage_file(const std::string& job_id, const std::string& filename,
                            const std::string& content);

    bool exists(const std::string& path) const;

    // Canonical path, or nullopt if `path` is not inside the root
    std::optional<std::filesystem::path> resolve(const std::string& path) const;

    // Recursive delete. Returns false if the path was outside the root
    // or could not be removed; a missing path counts as removed.
    bool remove(const std::string& path);

    // Validate and take ownership of a staged directory for one attempt.
    // Throws std::runtime_error if it is missing or outside the root.
    StagedFiles acquire(const std::string& path);

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

// Scoped handle to a staged file set. The directory is deleted by
// release() or, failing that, when the handle goes out of scope.
class StagedFiles {
public:
    StagedFiles() = default;
    StagedFiles(StagingArea* area, std::filesystem::path path);
    ~StagedFiles();

    StagedFiles(StagedFiles&& other) noexcept;
    StagedFiles& operator=(StagedFiles&& other) noexcept;
    StagedFiles(const StagedFiles&) = delete;
    StagedFiles& operator=(const StagedFiles&) = delete;

    bool empty() const { return area_ == nullptr; }
    const std::filesystem::path& path() const { return path_; }

    void release();

private:
    StagingArea* area_ = nullptr;
    std::filesystem::path path_;
};

} // namespace kiln
