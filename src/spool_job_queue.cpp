#include "spool_job_queue.h"
#include "errors.h"
#include "file_utils.h"
#include "record_codec.h"
#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace kiln {

namespace {

std::vector<fs::path> list_entries(const fs::path& dir) {
    std::vector<fs::path> entries;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.path().extension() == ".json") {
            entries.push_back(entry.path());
        }
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

} // namespace

SpoolJobQueue::SpoolJobQueue(const std::string& root, std::chrono::milliseconds poll_interval)
    : root_(root),
      ready_dir_(root_ / "ready"),
      leased_dir_(root_ / "leased"),
      dead_dir_(root_ / "dead"),
      poll_interval_(poll_interval) {
    std::error_code ec;
    for (const auto& dir : {ready_dir_, leased_dir_, dead_dir_}) {
        fs::create_directories(dir, ec);
        if (ec) {
            throw KilnError("Cannot create queue directory " + dir.string() + ": " + ec.message());
        }
    }
}

std::string SpoolJobQueue::next_entry_name() {
    static std::atomic<unsigned long> counter{0};
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();

    std::ostringstream name;
    name << std::setw(20) << std::setfill('0') << ns
         << "-" << getpid() << "-" << ++counter << ".json";
    return name.str();
}

void SpoolJobQueue::write_entry(const fs::path& dir, const std::string& name, const Job& job) {
    try {
        FileUtils::write_file_atomic(dir / name, write_json(to_json(job)));
    } catch (const std::runtime_error& e) {
        throw KilnError(std::string("Cannot enqueue ") + job.describe() + ": " + e.what());
    }
}

void SpoolJobQueue::enqueue(const Job& job) {
    write_entry(ready_dir_, next_entry_name(), job);
    available_.notify_one();
}

std::optional<Lease> SpoolJobQueue::try_lease() {
    for (const auto& ready_path : list_entries(ready_dir_)) {
        std::string name = ready_path.filename().string();
        fs::path leased_path = leased_dir_ / name;

        std::error_code ec;
        fs::rename(ready_path, leased_path, ec);
        if (ec) {
            continue;  // another worker took it
        }
        fs::last_write_time(leased_path, fs::file_time_type::clock::now(), ec);

        try {
            Job job = job_from_json(parse_json(FileUtils::read_file(leased_path)));
            return Lease{name, job};
        } catch (const std::exception& e) {
            std::cerr << "[Queue] Dead-lettering malformed entry " << name
                      << ": " << e.what() << std::endl;
            fs::rename(leased_path, dead_dir_ / name, ec);
            if (ec) {
                std::cerr << "[Queue] Could not move " << name << " to dead/: "
                          << ec.message() << std::endl;
                fs::remove(leased_path, ec);
            }
        }
    }
    return std::nullopt;
}

std::optional<Lease> SpoolJobQueue::lease(std::chrono::milliseconds wait) {
    auto deadline = std::chrono::steady_clock::now() + wait;

    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                return std::nullopt;
            }
        }

        auto lease = try_lease();
        if (lease) {
            return lease;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }

        // Local enqueues notify; other processes are picked up by polling
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait_for(lock, std::min(remaining, poll_interval_));
    }
}

void SpoolJobQueue::ack(const Lease& lease) {
    std::error_code ec;
    fs::remove(leased_dir_ / lease.id, ec);
    if (ec) {
        std::cerr << "[Queue] Failed to ack " << lease.id << ": " << ec.message() << std::endl;
    }
}

void SpoolJobQueue::requeue(const Lease& lease) {
    Job job = lease.job;
    job.attempt++;
    write_entry(ready_dir_, next_entry_name(), job);

    std::error_code ec;
    fs::remove(leased_dir_ / lease.id, ec);
    available_.notify_one();
}

size_t SpoolJobQueue::recover_expired(std::chrono::seconds older_than) {
    auto cutoff = fs::file_time_type::clock::now() - older_than;
    size_t recovered = 0;

    for (const auto& leased_path : list_entries(leased_dir_)) {
        std::error_code ec;
        auto started = fs::last_write_time(leased_path, ec);
        if (ec || started > cutoff) {
            continue;
        }
        // A fresh name, so a late ack from the stalled holder cannot delete
        // the entry once another worker has leased it again
        std::string name = next_entry_name();
        fs::rename(leased_path, ready_dir_ / name, ec);
        if (!ec) {
            std::cout << "[Queue] Recovered expired lease " << leased_path.filename().string()
                      << " as " << name << std::endl;
            recovered++;
        }
    }

    if (recovered > 0) {
        available_.notify_all();
    }
    return recovered;
}

size_t SpoolJobQueue::size() const {
    return list_entries(ready_dir_).size();
}

size_t SpoolJobQueue::leased_count() const {
    return list_entries(leased_dir_).size();
}

size_t SpoolJobQueue::dead_count() const {
    return list_entries(dead_dir_).size();
}

void SpoolJobQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    available_.notify_all();
}

} // namespace kiln
