#include "config.h"
#include "errors.h"
#include "file_utils.h"
#include "record_codec.h"
#include <functional>
#include <map>
#include <stdexcept>

namespace kiln {

namespace {

using Setter = std::function<void(Config&, const Json::Value&)>;

Setter int_field(int Config::*field, int min_value) {
    return [field, min_value](Config& config, const Json::Value& value) {
        if (!value.isInt()) {
            throw std::invalid_argument("expected integer");
        }
        if (value.asInt() < min_value) {
            throw std::invalid_argument("must be >= " + std::to_string(min_value));
        }
        config.*field = value.asInt();
    };
}

Setter size_field(size_t Config::*field) {
    return [field](Config& config, const Json::Value& value) {
        if (!value.isUInt64() || value.asUInt64() == 0) {
            throw std::invalid_argument("expected positive integer");
        }
        config.*field = static_cast<size_t>(value.asUInt64());
    };
}

Setter string_field(std::string Config::*field) {
    return [field](Config& config, const Json::Value& value) {
        if (!value.isString()) {
            throw std::invalid_argument("expected string");
        }
        config.*field = value.asString();
    };
}

const std::map<std::string, Setter>& setters() {
    static const std::map<std::string, Setter> table = {
        {"state_dir", string_field(&Config::state_dir)},
        {"queue_dir", string_field(&Config::queue_dir)},
        {"staging_root", string_field(&Config::staging_root)},
        {"worker_count", int_field(&Config::worker_count, 1)},
        {"max_concurrent_executions", int_field(&Config::max_concurrent_executions, 1)},
        {"build_timeout_seconds", int_field(&Config::build_timeout_seconds, 1)},
        {"build_log_max_bytes", size_field(&Config::build_log_max_bytes)},
        {"build_error_max_bytes", size_field(&Config::build_error_max_bytes)},
        {"output_max_bytes", size_field(&Config::output_max_bytes)},
        {"infra_retry_limit", int_field(&Config::infra_retry_limit, 0)},
        {"job_retry_limit", int_field(&Config::job_retry_limit, 0)},
        {"reaper_interval_seconds", int_field(&Config::reaper_interval_seconds, 1)},
        {"orphan_grace_seconds", int_field(&Config::orphan_grace_seconds, 0)},
        {"queue_poll_interval_ms", int_field(&Config::queue_poll_interval_ms, 1)},
        {"docker_binary", string_field(&Config::docker_binary)},
        {"oci_runtime", string_field(&Config::oci_runtime)},
        {"image_prefix", string_field(&Config::image_prefix)},
        {"files_mount_path", string_field(&Config::files_mount_path)},
        {"scratch_size", string_field(&Config::scratch_size)},
        {"pids_limit", int_field(&Config::pids_limit, 1)},
    };
    return table;
}

} // namespace

void Config::validate() const {
    if (state_dir.empty() || queue_dir.empty() || staging_root.empty()) {
        throw ConfigError("state_dir, queue_dir and staging_root are required");
    }
    if (worker_count < 1) {
        throw ConfigError("worker_count must be >= 1");
    }
    if (max_concurrent_executions < 1) {
        throw ConfigError("max_concurrent_executions must be >= 1");
    }
    if (build_timeout_seconds < 1) {
        throw ConfigError("build_timeout_seconds must be >= 1");
    }
    if (files_mount_path.empty() || files_mount_path[0] != '/') {
        throw ConfigError("files_mount_path must be an absolute container path");
    }
    if (docker_binary.empty()) {
        throw ConfigError("docker_binary is required");
    }
    if (image_prefix.empty()) {
        throw ConfigError("image_prefix is required");
    }
}

Config Config::from_json_string(const std::string& text) {
    Json::Value json;
    try {
        json = parse_json(text);
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }
    if (!json.isObject()) {
        throw ConfigError("top level must be an object");
    }

    Config config;
    for (const auto& key : json.getMemberNames()) {
        auto it = setters().find(key);
        if (it == setters().end()) {
            throw ConfigError("unknown key '" + key + "'");
        }
        try {
            it->second(config, json[key]);
        } catch (const std::invalid_argument& e) {
            throw ConfigError("'" + key + "': " + e.what());
        }
    }
    config.validate();
    return config;
}

Config Config::load(const std::string& path) {
    std::string text;
    try {
        text = FileUtils::read_file(path);
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }
    return from_json_string(text);
}

} // namespace kiln
