#include "jpi/types.hpp"

#include <algorithm>
#include <cctype>

namespace jpi {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(delim, start)) != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

bool valid_component(const std::string& s) {
    if (s.empty()) return false;
    return std::none_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) || c == '/' || c == '\\' || c == ':' || c == '@';
    });
}

} // namespace

std::optional<ModuleId> parse_module_id(const std::string& text) {
    auto parts = split(trim(text), ':');
    if (parts.size() != 2) return std::nullopt;
    if (!valid_component(parts[0]) || !valid_component(parts[1])) return std::nullopt;
    return ModuleId{parts[0], parts[1]};
}

std::string Dependency::to_notation() const {
    std::string notation = id.to_string();
    if (is_artifact_only()) {
        notation += "@" + artifact_extension;
    }
    return notation;
}

NotationParseResult parse_dependency_notation(const std::string& notation) {
    NotationParseResult result;

    std::string s = trim(notation);
    if (s.empty()) {
        result.error = "empty dependency notation";
        return result;
    }

    std::string extension;
    auto at_pos = s.rfind('@');
    if (at_pos != std::string::npos) {
        extension = s.substr(at_pos + 1);
        s = s.substr(0, at_pos);
        if (!valid_component(extension)) {
            result.error = "invalid artifact extension in '" + notation + "'";
            return result;
        }
    }

    auto parts = split(s, ':');
    if (parts.size() != 3) {
        result.error = "expected group:name:version, got '" + notation + "'";
        return result;
    }

    for (const auto& part : parts) {
        if (!valid_component(part)) {
            result.error = "invalid component in '" + notation + "'";
            return result;
        }
    }

    result.dependency.id = ModuleVersionId{parts[0], parts[1], parts[2]};
    result.dependency.artifact_extension = extension;
    result.ok = true;
    return result;
}

std::string ResolvedArtifact::file_name() const {
    auto slash = file.find_last_of("/\\");
    if (slash == std::string::npos) return file;
    return file.substr(slash + 1);
}

} // namespace jpi
