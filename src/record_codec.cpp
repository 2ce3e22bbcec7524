#include "record_codec.h"
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace kiln {

namespace {

Json::Value time_to_json(const Timestamp& tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    return static_cast<Json::Int64>(ms.count());
}

Json::Value time_to_json(const std::optional<Timestamp>& tp) {
    if (!tp) return Json::Value(Json::nullValue);
    return time_to_json(*tp);
}

Timestamp time_from_json(const Json::Value& value) {
    if (!value.isIntegral()) {
        throw std::runtime_error("Timestamp must be an integer");
    }
    return Timestamp(std::chrono::milliseconds(value.asInt64()));
}

std::optional<Timestamp> optional_time_from_json(const Json::Value& value) {
    if (value.isNull()) return std::nullopt;
    return time_from_json(value);
}

Json::Value string_to_json(const std::optional<std::string>& value) {
    if (!value) return Json::Value(Json::nullValue);
    return *value;
}

std::optional<std::string> optional_string(const Json::Value& value) {
    if (value.isNull()) return std::nullopt;
    if (!value.isString()) {
        throw std::runtime_error("Expected string or null");
    }
    return value.asString();
}

const Json::Value& require(const Json::Value& json, const char* key) {
    if (!json.isObject() || !json.isMember(key)) {
        throw std::runtime_error(std::string("Missing field: ") + key);
    }
    return json[key];
}

std::string require_string(const Json::Value& json, const char* key) {
    const Json::Value& value = require(json, key);
    if (!value.isString()) {
        throw std::runtime_error(std::string("Field must be a string: ") + key);
    }
    return value.asString();
}

} // namespace

Json::Value to_json(const Compiler& compiler) {
    Json::Value json;
    json["id"] = compiler.id;
    json["name"] = compiler.name;
    json["version"] = string_to_json(compiler.version);
    json["dockerfile_content"] = compiler.dockerfile_content;

    Json::Value run_command(Json::arrayValue);
    for (const auto& arg : compiler.run_command) {
        run_command.append(arg);
    }
    json["run_command"] = run_command;

    json["memory_limit"] = compiler.memory_limit;
    json["cpu_limit"] = compiler.cpu_limit;
    json["timeout_seconds"] = compiler.timeout_seconds;
    json["enabled"] = compiler.enabled;
    json["build_status"] = to_string(compiler.build_status);
    json["build_error"] = string_to_json(compiler.build_error);
    json["build_logs"] = compiler.build_logs;
    json["image_tag"] = compiler.image_tag;
    json["built_at"] = time_to_json(compiler.built_at);
    json["build_started_at"] = time_to_json(compiler.build_started_at);
    json["created_at"] = time_to_json(compiler.created_at);
    json["updated_at"] = time_to_json(compiler.updated_at);
    return json;
}

Compiler compiler_from_json(const Json::Value& json) {
    Compiler compiler;
    compiler.id = require_string(json, "id");
    compiler.name = json.get("name", "").asString();
    compiler.version = optional_string(json.get("version", Json::Value()));
    compiler.dockerfile_content = require_string(json, "dockerfile_content");

    const Json::Value& run_command = require(json, "run_command");
    if (!run_command.isArray()) {
        throw std::runtime_error("run_command must be an array");
    }
    for (const auto& arg : run_command) {
        compiler.run_command.push_back(arg.asString());
    }

    compiler.memory_limit = json.get("memory_limit", "512m").asString();
    compiler.cpu_limit = json.get("cpu_limit", "1").asString();
    compiler.timeout_seconds = json.get("timeout_seconds", 10).asInt();
    compiler.enabled = json.get("enabled", true).asBool();
    compiler.build_status = build_status_from_string(json.get("build_status", "pending").asString());
    compiler.build_error = optional_string(json.get("build_error", Json::Value()));
    compiler.build_logs = json.get("build_logs", "").asString();
    compiler.image_tag = json.get("image_tag", "").asString();
    compiler.built_at = optional_time_from_json(json.get("built_at", Json::Value()));
    compiler.build_started_at = optional_time_from_json(json.get("build_started_at", Json::Value()));
    if (json.isMember("created_at")) compiler.created_at = time_from_json(json["created_at"]);
    if (json.isMember("updated_at")) compiler.updated_at = time_from_json(json["updated_at"]);
    return compiler;
}

Json::Value to_json(const Submission& submission) {
    Json::Value json;
    json["job_id"] = submission.job_id;
    json["code"] = submission.code;
    json["language"] = submission.language;
    json["status"] = to_string(submission.status);
    json["output_stdout"] = string_to_json(submission.output_stdout);
    json["output_stderr"] = string_to_json(submission.output_stderr);

    Json::Value files(Json::arrayValue);
    for (const auto& file : submission.uploaded_files) {
        Json::Value entry;
        entry["filename"] = file.filename;
        entry["size"] = static_cast<Json::UInt64>(file.size);
        entry["mime_type"] = file.mime_type;
        files.append(entry);
    }
    json["uploaded_files"] = files;
    json["files_directory"] = string_to_json(submission.files_directory);

    json["created_at"] = time_to_json(submission.created_at);
    json["started_at"] = time_to_json(submission.started_at);
    json["completed_at"] = time_to_json(submission.completed_at);
    return json;
}

Submission submission_from_json(const Json::Value& json) {
    Submission submission;
    submission.job_id = require_string(json, "job_id");
    submission.code = require_string(json, "code");
    submission.language = require_string(json, "language");
    submission.status = submission_status_from_string(json.get("status", "PENDING").asString());
    submission.output_stdout = optional_string(json.get("output_stdout", Json::Value()));
    submission.output_stderr = optional_string(json.get("output_stderr", Json::Value()));

    const Json::Value& files = json["uploaded_files"];
    if (files.isArray()) {
        for (const auto& entry : files) {
            UploadedFile file;
            file.filename = entry.get("filename", "").asString();
            file.size = static_cast<size_t>(entry.get("size", 0).asUInt64());
            file.mime_type = entry.get("mime_type", "application/octet-stream").asString();
            submission.uploaded_files.push_back(file);
        }
    }
    submission.files_directory = optional_string(json.get("files_directory", Json::Value()));

    if (json.isMember("created_at")) submission.created_at = time_from_json(json["created_at"]);
    submission.started_at = optional_time_from_json(json.get("started_at", Json::Value()));
    submission.completed_at = optional_time_from_json(json.get("completed_at", Json::Value()));
    return submission;
}

Json::Value to_json(const Job& job) {
    Json::Value json;
    json["kind"] = to_string(job.kind);
    json["target"] = job.target;
    if (!job.image_tag.empty()) {
        json["image_tag"] = job.image_tag;
    }
    json["attempt"] = job.attempt;
    return json;
}

Job job_from_json(const Json::Value& json) {
    Job job;
    job.kind = job_kind_from_string(require_string(json, "kind"));
    job.target = require_string(json, "target");
    job.image_tag = json.get("image_tag", "").asString();
    job.attempt = json.get("attempt", 0).asInt();
    if (job.target.empty()) {
        throw std::runtime_error("Job target is empty");
    }
    return job;
}

std::string write_json(const Json::Value& json, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, json);
}

Json::Value parse_json(const std::string& text) {
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &json, &errors)) {
        throw std::runtime_error("Invalid JSON: " + errors);
    }
    return json;
}

} // namespace kiln
