#include "image_tag.h"
#include "file_utils.h"
#include <cctype>
#include <sstream>

namespace kiln {

namespace {
constexpr size_t TAG_HASH_CHARS = 16;

void append_field(std::ostringstream& out, const std::string& field) {
    out << field.size() << ':' << field << ';';
}
}

ImageDefinition ImageDefinition::from_compiler(const Compiler& compiler) {
    ImageDefinition def;
    def.compiler_id = compiler.id;
    def.dockerfile_content = compiler.dockerfile_content;
    def.run_command = compiler.run_command;
    return def;
}

std::string ImageDefinition::calculate_hash() const {
    std::ostringstream data;
    append_field(data, compiler_id);
    append_field(data, dockerfile_content);
    data << run_command.size() << '#';
    for (const auto& arg : run_command) {
        append_field(data, arg);
    }
    return FileUtils::sha256_string(data.str());
}

std::string ImageDefinition::repository(const std::string& prefix) const {
    return sanitize_repository_name(prefix + "-" + compiler_id);
}

std::string ImageDefinition::image_tag(const std::string& prefix) const {
    return repository(prefix) + ":" + calculate_hash().substr(0, TAG_HASH_CHARS);
}

std::string ImageDefinition::staging_tag(const std::string& prefix, unsigned long attempt) const {
    return repository(prefix) + ":staging-" + calculate_hash().substr(0, TAG_HASH_CHARS) +
           "-" + std::to_string(attempt);
}

std::string sanitize_repository_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char raw : name) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        bool alnum = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (alnum) {
            out += c;
        } else if (c == '.' && !out.empty() && out.back() != '.' && out.back() != '-') {
            out += '.';
        } else if (!out.empty() && out.back() != '.' && out.back() != '-') {
            out += '-';
        }
    }
    while (!out.empty() && (out.back() == '-' || out.back() == '.')) {
        out.pop_back();
    }
    return out.empty() ? "unnamed" : out;
}

} // namespace kiln
