#include "security/path_boundary.hpp"
#include "core/paths.hpp"

namespace fs = std::filesystem;

namespace agentgate::security::path_boundary {

namespace {

// "/a/b/" -> "/a/b" so component comparison does not see a trailing empty name
fs::path strip_trailing_separator(fs::path path) {
    while (!path.has_filename() && path.has_relative_path()) {
        path = path.parent_path();
    }
    return path;
}

} // namespace

fs::path canonicalize(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = path.is_absolute() ? path : fs::absolute(path, ec);
    if (ec) {
        absolute = fs::current_path(ec) / path;
    }

    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        resolved = absolute.lexically_normal();
    }
    return strip_trailing_separator(resolved);
}

fs::path resolve(const fs::path& working_directory, const std::string& token) {
    if (!token.empty() && token[0] == '/') {
        return canonicalize(fs::path(token));
    }
    if (token == "~" || token.rfind("~/", 0) == 0) {
        return canonicalize(core::paths::expand_user(token));
    }
    return canonicalize(working_directory / token);
}

bool contains(const fs::path& root, const fs::path& candidate) {
    const fs::path r = strip_trailing_separator(root);
    const fs::path c = strip_trailing_separator(candidate);

    auto c_it = c.begin();
    for (auto r_it = r.begin(); r_it != r.end(); ++r_it, ++c_it) {
        if (c_it == c.end() || *r_it != *c_it) {
            return false;
        }
    }
    return true;
}

bool within_any(const fs::path& candidate, const std::vector<fs::path>& roots) {
    for (const auto& root : roots) {
        if (contains(root, candidate)) {
            return true;
        }
    }
    return false;
}

PathCheckResult validate_path(const std::string& raw,
                              const fs::path& working_directory,
                              const std::vector<fs::path>& roots) {
    PathCheckResult result;

    if (raw.empty()) {
        result.error = "Empty path";
        return result;
    }
    if (raw.find('\0') != std::string::npos) {
        result.error = "Path contains null byte";
        return result;
    }

    result.resolved = resolve(working_directory, raw);
    if (!within_any(result.resolved, roots)) {
        result.error = "Access denied: path '" + raw + "' resolves to '" +
                       result.resolved.string() + "' outside approved directories";
        return result;
    }

    result.valid = true;
    return result;
}

} // namespace agentgate::security::path_boundary
