#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "state_store.h"

namespace kiln {

// StateStore kept as one JSON document per record:
//   <root>/compilers/<id>.json
//   <root>/submissions/<job_id>.json
//
// Writes go through a temp file + rename, so readers (the API layer) never
// see a torn record. Every read-modify-write holds an exclusive flock on
// <root>/.lock, which serializes threads and worker processes alike.
class FileStateStore : public StateStore {
public:
    explicit FileStateStore(const std::string& root);

    std::optional<Compiler> get_compiler(const std::string& id) const override;
    void put_compiler(const Compiler& compiler) override;
    bool update_compiler(const std::string& id, const CompilerMutation& mutate) override;
    bool remove_compiler(const std::string& id) override;
    std::vector<Compiler> list_compilers() const override;

    std::optional<Submission> get_submission(const std::string& job_id) const override;
    void put_submission(const Submission& submission) override;
    bool update_submission(const std::string& job_id, const SubmissionMutation& mutate) override;
    bool remove_submission(const std::string& job_id) override;
    std::vector<Submission> list_submissions() const override;

    const std::filesystem::path& root() const { return root_; }

private:
    class ExclusiveLock;

    std::filesystem::path record_path(const std::filesystem::path& dir, const std::string& key) const;
    std::optional<Json::Value> read_record(const std::filesystem::path& path) const;
    void write_record(const std::filesystem::path& path, const Json::Value& json);
    std::vector<Json::Value> read_all(const std::filesystem::path& dir) const;

    std::filesystem::path root_;
    std::filesystem::path compilers_dir_;
    std::filesystem::path submissions_dir_;
    std::filesystem::path lock_path_;
};

} // namespace kiln
