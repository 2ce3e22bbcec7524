#pragma once

#include <json/json.h>
#include <string>
#include "jobs.h"
#include "records.h"

namespace kiln {

// JSON encoding of persisted records and queue payloads.
// Decoders throw std::runtime_error on malformed input.

Json::Value to_json(const Compiler& compiler);
Compiler compiler_from_json(const Json::Value& json);

Json::Value to_json(const Submission& submission);
Submission submission_from_json(const Json::Value& json);

Json::Value to_json(const Job& job);
Job job_from_json(const Json::Value& json);

std::string write_json(const Json::Value& json, bool pretty = false);
Json::Value parse_json(const std::string& text);

} // namespace kiln
