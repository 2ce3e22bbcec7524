#include "file_state_store.h"
#include "errors.h"
#include "file_utils.h"
#include "record_codec.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace kiln {

namespace {

// Keys become file names: no separators, no dot-files
void check_key(const std::string& key) {
    if (key.empty() || key.size() > 200 || key[0] == '.') {
        throw StoreError("invalid key '" + key + "'");
    }
    for (char c : key) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) {
            throw StoreError("invalid key '" + key + "'");
        }
    }
}

} // namespace

class FileStateStore::ExclusiveLock {
public:
    explicit ExclusiveLock(const fs::path& path) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw StoreError("open lock " + path.string() + ": " + std::strerror(errno));
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                int err = errno;
                ::close(fd_);
                throw StoreError("flock " + path.string() + ": " + std::strerror(err));
            }
        }
    }

    ~ExclusiveLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    ExclusiveLock(const ExclusiveLock&) = delete;
    ExclusiveLock& operator=(const ExclusiveLock&) = delete;

private:
    int fd_ = -1;
};

FileStateStore::FileStateStore(const std::string& root)
    : root_(root),
      compilers_dir_(root_ / "compilers"),
      submissions_dir_(root_ / "submissions"),
      lock_path_(root_ / ".lock") {
    std::error_code ec;
    fs::create_directories(compilers_dir_, ec);
    if (!ec) fs::create_directories(submissions_dir_, ec);
    if (ec) {
        throw StoreError("cannot create " + root_.string() + ": " + ec.message());
    }
}

fs::path FileStateStore::record_path(const fs::path& dir, const std::string& key) const {
    check_key(key);
    return dir / (key + ".json");
}

std::optional<Json::Value> FileStateStore::read_record(const fs::path& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    try {
        return parse_json(FileUtils::read_file(path));
    } catch (const std::runtime_error& e) {
        // Removed between exists() and open() counts as missing
        if (!fs::exists(path, ec)) {
            return std::nullopt;
        }
        throw StoreError(path.string() + ": " + e.what());
    }
}

void FileStateStore::write_record(const fs::path& path, const Json::Value& json) {
    try {
        FileUtils::write_file_atomic(path, write_json(json, true));
    } catch (const std::runtime_error& e) {
        throw StoreError(e.what());
    }
}

std::vector<Json::Value> FileStateStore::read_all(const fs::path& dir) const {
    std::vector<Json::Value> records;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const fs::path& path = entry.path();
        if (path.extension() != ".json") {
            continue;  // temp files from in-flight writes
        }
        try {
            auto json = read_record(path);
            if (json) {
                records.push_back(*json);
            }
        } catch (const StoreError& e) {
            std::cerr << "[StateStore] Skipping unreadable record: " << e.what() << std::endl;
        }
    }
    if (ec) {
        throw StoreError("list " + dir.string() + ": " + ec.message());
    }
    return records;
}

// Compilers

std::optional<Compiler> FileStateStore::get_compiler(const std::string& id) const {
    auto json = read_record(record_path(compilers_dir_, id));
    if (!json) {
        return std::nullopt;
    }
    try {
        return compiler_from_json(*json);
    } catch (const std::exception& e) {
        throw StoreError("compiler '" + id + "': " + e.what());
    }
}

void FileStateStore::put_compiler(const Compiler& compiler) {
    fs::path path = record_path(compilers_dir_, compiler.id);
    ExclusiveLock lock(lock_path_);

    Compiler copy = compiler;
    auto now = std::chrono::system_clock::now();
    if (copy.created_at == Timestamp{}) {
        copy.created_at = now;
    }
    copy.updated_at = now;
    write_record(path, to_json(copy));
}

bool FileStateStore::update_compiler(const std::string& id, const CompilerMutation& mutate) {
    fs::path path = record_path(compilers_dir_, id);
    ExclusiveLock lock(lock_path_);

    auto json = read_record(path);
    if (!json) {
        return false;
    }

    Compiler compiler;
    try {
        compiler = compiler_from_json(*json);
    } catch (const std::exception& e) {
        throw StoreError("compiler '" + id + "': " + e.what());
    }

    if (!mutate(compiler)) {
        return false;
    }
    compiler.updated_at = std::chrono::system_clock::now();
    write_record(path, to_json(compiler));
    return true;
}

bool FileStateStore::remove_compiler(const std::string& id) {
    fs::path path = record_path(compilers_dir_, id);
    ExclusiveLock lock(lock_path_);
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw StoreError("remove " + path.string() + ": " + ec.message());
    }
    return removed;
}

std::vector<Compiler> FileStateStore::list_compilers() const {
    std::vector<Compiler> compilers;
    for (const auto& json : read_all(compilers_dir_)) {
        try {
            compilers.push_back(compiler_from_json(json));
        } catch (const std::exception& e) {
            std::cerr << "[StateStore] Skipping malformed compiler: " << e.what() << std::endl;
        }
    }
    return compilers;
}

// Submissions

std::optional<Submission> FileStateStore::get_submission(const std::string& job_id) const {
    auto json = read_record(record_path(submissions_dir_, job_id));
    if (!json) {
        return std::nullopt;
    }
    try {
        return submission_from_json(*json);
    } catch (const std::exception& e) {
        throw StoreError("submission '" + job_id + "': " + e.what());
    }
}

void FileStateStore::put_submission(const Submission& submission) {
    fs::path path = record_path(submissions_dir_, submission.job_id);
    ExclusiveLock lock(lock_path_);

    Submission copy = submission;
    if (copy.created_at == Timestamp{}) {
        copy.created_at = std::chrono::system_clock::now();
    }
    write_record(path, to_json(copy));
}

bool FileStateStore::update_submission(const std::string& job_id, const SubmissionMutation& mutate) {
    fs::path path = record_path(submissions_dir_, job_id);
    ExclusiveLock lock(lock_path_);

    auto json = read_record(path);
    if (!json) {
        return false;
    }

    Submission submission;
    try {
        submission = submission_from_json(*json);
    } catch (const std::exception& e) {
        throw StoreError("submission '" + job_id + "': " + e.what());
    }

    if (!mutate(submission)) {
        return false;
    }
    write_record(path, to_json(submission));
    return true;
}

bool FileStateStore::remove_submission(const std::string& job_id) {
    fs::path path = record_path(submissions_dir_, job_id);
    ExclusiveLock lock(lock_path_);
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw StoreError("remove " + path.string() + ": " + ec.message());
    }
    return removed;
}

std::vector<Submission> FileStateStore::list_submissions() const {
    std::vector<Submission> submissions;
    for (const auto& json : read_all(submissions_dir_)) {
        try {
            submissions.push_back(submission_from_json(json));
        } catch (const std::exception& e) {
            std::cerr << "[StateStore] Skipping malformed submission: " << e.what() << std::endl;
        }
    }
    return submissions;
}

} // namespace kiln
