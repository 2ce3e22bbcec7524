#include "staging.h"
#include "constants.h"
#include "file_utils.h"
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace kiln {

namespace {

void check_filename(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == ".." ||
        filename.find('/') != std::string::npos ||
        filename.find('\\') != std::string::npos ||
        filename.find('\0') != std::string::npos) {
        throw std::invalid_argument("Invalid filename: " + filename);
    }
}

} // namespace

StagingArea::StagingArea(const std::string& root) : root_(root) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create staging root " + root + ": " + ec.message());
    }
    root_ = fs::canonical(root_);
}

fs::path StagingArea::create(const std::string& job_id) {
    check_filename(job_id);
    fs::path dir = root_ / job_id;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create staging directory " + dir.string() + ": " + ec.message());
    }
    return dir;
}

UploadedFile StagingArea::stage_file(const std::string& job_id, const std::string& filename,
                                     const std::string& content) {
    check_filename(filename);
    fs::path dir = create(job_id);

    if (FileUtils::directory_size(dir) + content.size() > MAX_JOB_FILES_SIZE) {
        throw std::invalid_argument("Uploaded files exceed " + FileUtils::format_file_size(MAX_JOB_FILES_SIZE));
    }

    FileUtils::write_file_atomic(dir / filename, content);

    UploadedFile file;
    file.filename = filename;
    file.size = content.size();
    file.mime_type = FileUtils::get_mime_type(filename);
    return file;
}

bool StagingArea::exists(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::optional<fs::path> StagingArea::resolve(const std::string& path) const {
    if (path.empty() || !FileUtils::is_within(root_, path)) {
        return std::nullopt;
    }
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec || resolved == root_) {
        return std::nullopt;  // Never hand out the root itself
    }
    return resolved;
}

bool StagingArea::remove(const std::string& path) {
    auto resolved = resolve(path);
    if (!resolved) {
        std::cerr << "[Staging] Refusing to remove path outside staging root: " << path << std::endl;
        return false;
    }
    std::error_code ec;
    fs::remove_all(*resolved, ec);
    if (ec) {
        std::cerr << "[Staging] Failed to remove " << resolved->string() << ": "
                  << ec.message() << std::endl;
        return false;
    }
    return true;
}

StagedFiles StagingArea::acquire(const std::string& path) {
    auto resolved = resolve(path);
    if (!resolved) {
        throw std::runtime_error("staged files path is outside the staging root");
    }
    if (!exists(resolved->string())) {
        throw std::runtime_error("staged files are missing");
    }
    return StagedFiles(this, *resolved);
}

// StagedFiles

StagedFiles::StagedFiles(StagingArea* area, fs::path path)
    : area_(area), path_(std::move(path)) {}

StagedFiles::~StagedFiles() {
    release();
}

StagedFiles::StagedFiles(StagedFiles&& other) noexcept
    : area_(other.area_), path_(std::move(other.path_)) {
    other.area_ = nullptr;
}

StagedFiles& StagedFiles::operator=(StagedFiles&& other) noexcept {
    if (this != &other) {
        release();
        area_ = other.area_;
        path_ = std::move(other.path_);
        other.area_ = nullptr;
    }
    return *this;
}

void StagedFiles::release() {
    if (area_) {
        area_->remove(path_.string());
        area_ = nullptr;
    }
}

} // namespace kiln
