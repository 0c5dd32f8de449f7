#include "jpi/version.hpp"

#include <algorithm>
#include <cctype>

namespace jpi {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

std::string normalize_version(const std::string& str) {
    std::string s = trim(str);

    // Split off "-qualifier" / "+build"
    size_t suffix_pos = s.find_first_of("-+");
    std::string release = s.substr(0, suffix_pos);
    std::string suffix = suffix_pos == std::string::npos ? "" : s.substr(suffix_pos);

    int components = 0;
    size_t start = 0;
    while (true) {
        size_t dot = release.find('.', start);
        std::string part = release.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!all_digits(part)) return s;
        ++components;
        if (dot == std::string::npos) break;
        start = dot + 1;
    }

    if (components > 3) return s;
    while (components < 3) {
        release += ".0";
        ++components;
    }
    return release + suffix;
}

std::optional<Version> parse_version(const std::string& str) {
    std::string s = normalize_version(str);
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

std::optional<std::vector<VersionToken>> tokenize_version(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    std::vector<VersionToken> tokens;
    std::string current;
    bool numeric = false;

    auto flush = [&]() {
        if (current.empty()) return;
        if (numeric) {
            size_t nz = current.find_first_not_of('0');
            current = nz == std::string::npos ? "0" : current.substr(nz);
        }
        tokens.push_back(VersionToken{numeric, current});
        current.clear();
    };

    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (c == '.' || c == '-' || c == '_' || c == '+') {
            flush();
            continue;
        }
        if (!std::isalnum(u)) return std::nullopt;

        bool digit = std::isdigit(u) != 0;
        if (!current.empty() && digit != numeric) flush();
        numeric = digit;
        current += static_cast<char>(std::tolower(u));
    }
    flush();

    if (tokens.empty()) return std::nullopt;
    return tokens;
}

namespace {

// Rank of a qualifier; the empty string stands for a release
int qualifier_rank(const std::string& q) {
    if (q == "alpha" || q == "a") return 1;
    if (q == "beta" || q == "b") return 2;
    if (q == "milestone" || q == "m") return 3;
    if (q == "rc" || q == "cr") return 4;
    if (q == "snapshot") return 5;
    if (q.empty() || q == "ga" || q == "final" || q == "release") return 6;
    if (q == "sp") return 7;
    return 8;
}

int compare_numbers(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

int compare_qualifiers(const std::string& a, const std::string& b) {
    int ra = qualifier_rank(a);
    int rb = qualifier_rank(b);
    if (ra != rb) return ra < rb ? -1 : 1;
    if (ra != 8) return 0;
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

int compare_tokens(const VersionToken* a, const VersionToken* b) {
    // A missing token is "0" next to a number and a release next to a qualifier
    if (!a) return -compare_tokens(b, nullptr);
    if (!b) return a->numeric ? compare_numbers(a->text, "0") : compare_qualifiers(a->text, "");

    if (a->numeric && b->numeric) return compare_numbers(a->text, b->text);
    if (a->numeric != b->numeric) return a->numeric ? 1 : -1;
    return compare_qualifiers(a->text, b->text);
}

} // namespace

std::optional<int> compare_maven_versions(const std::string& a, const std::string& b) {
    auto ta = tokenize_version(a);
    auto tb = tokenize_version(b);
    if (!ta || !tb) return std::nullopt;

    size_t n = std::max(ta->size(), tb->size());
    for (size_t i = 0; i < n; ++i) {
        const VersionToken* x = i < ta->size() ? &(*ta)[i] : nullptr;
        const VersionToken* y = i < tb->size() ? &(*tb)[i] : nullptr;
        int c = compare_tokens(x, y);
        if (c != 0) return c;
    }
    return 0;
}

std::optional<int> compare_versions(const std::string& a, const std::string& b) {
    if (trim(a) == trim(b)) return 0;

    auto va = parse_version(a);
    auto vb = parse_version(b);
    if (va && vb) {
        if (*va < *vb) return -1;
        if (*vb < *va) return 1;
        return 0;
    }

    return compare_maven_versions(a, b);
}

} // namespace jpi
