#pragma once
#include <string>
#include <vector>
#include "records.h"

namespace kiln {

// Everything that affects the content of a compiler's image
struct ImageDefinition {
    std::string compiler_id;
    std::string dockerfile_content;
    std::vector<std::string> run_command;

    static ImageDefinition from_compiler(const Compiler& compiler);

    // Deterministic SHA256 over all fields. Each field is length-prefixed,
    // so no choice of content can make two definitions collide by shifting
    // bytes between fields.
    std::string calculate_hash() const;

    // "<prefix>-<sanitized id>"
    std::string repository(const std::string& prefix) const;

    // "<repository>:<first 16 hex chars of hash>". Identical definitions
    // map to the same tag; any edit yields a new one.
    std::string image_tag(const std::string& prefix) const;

    // Throwaway tag a build writes to before promotion
    std::string staging_tag(const std::string& prefix, unsigned long attempt) const;
};

// Lowercase, restricted to characters valid in an image repository name
std::string sanitize_repository_name(const std::string& name);

} // namespace kiln
