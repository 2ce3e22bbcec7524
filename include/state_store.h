#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "records.h"

namespace kiln {

// Persisted Compiler and Submission records, addressed by primary key.
//
// update_* is an atomic read-modify-write: the mutation sees the current
// record and returns false to abort without writing. It doubles as the
// compare-and-set primitive for state transitions. Returns true only when
// the record existed and the mutation was committed.
class StateStore {
public:
    using CompilerMutation = std::function<bool(Compiler&)>;
    using SubmissionMutation = std::function<bool(Submission&)>;

    virtual ~StateStore() = default;

    virtual std::optional<Compiler> get_compiler(const std::string& id) const = 0;
    virtual void put_compiler(const Compiler& compiler) = 0;
    virtual bool update_compiler(const std::string& id, const CompilerMutation& mutate) = 0;
    virtual bool remove_compiler(const std::string& id) = 0;
    virtual std::vector<Compiler> list_compilers() const = 0;

    virtual std::optional<Submission> get_submission(const std::string& job_id) const = 0;
    virtual void put_submission(const Submission& submission) = 0;
    virtual bool update_submission(const std::string& job_id, const SubmissionMutation& mutate) = 0;
    virtual bool remove_submission(const std::string& job_id) = 0;
    virtual std::vector<Submission> list_submissions() const = 0;
};

} // namespace kiln
