/// @file version.cpp
/// @brief Semantic version parsing and compatibility classification

#include <keel/catalog/version.hpp>
#include <charconv>
#include <cctype>

namespace keel_catalog {

namespace {

std::string_view trim(std::string_view str) noexcept {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

keel_core::Error parse_error(const std::string& message) {
    return keel_core::Error(keel_core::ErrorCode::ParseError, message);
}

/// Identifiers in prerelease/build: non-empty, [0-9A-Za-z-] separated by dots
bool valid_identifiers(std::string_view str) noexcept {
    if (str.empty()) {
        return false;
    }
    std::size_t run = 0;
    for (char c : str) {
        if (c == '.') {
            if (run == 0) return false;
            run = 0;
            continue;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }
        ++run;
    }
    return run > 0;
}

bool is_numeric(std::string_view str) noexcept {
    if (str.empty()) return false;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

// =============================================================================
// SemanticVersion
// =============================================================================

keel_core::Result<SemanticVersion> SemanticVersion::parse(std::string_view str) {
    str = trim(str);

    if (str.empty()) {
        return keel_core::Err<SemanticVersion>(parse_error("Empty version string"));
    }

    SemanticVersion result;

    auto plus_pos = str.find('+');
    std::string_view without_build = str.substr(0, plus_pos);
    auto dash_pos = without_build.find('-');
    std::string_view core_str = without_build.substr(0, dash_pos);

    std::uint32_t parts[3] = {0, 0, 0};
    std::size_t part_index = 0;
    std::size_t start = 0;

    for (std::size_t i = 0; i <= core_str.size(); ++i) {
        if (i != core_str.size() && core_str[i] != '.') {
            continue;
        }
        if (part_index == 3) {
            return keel_core::Err<SemanticVersion>(
                parse_error("Too many version components: " + std::string(str)));
        }
        std::string_view num_str = core_str.substr(start, i - start);
        if (num_str.empty() || (num_str.size() > 1 && num_str.front() == '0')) {
            return keel_core::Err<SemanticVersion>(
                parse_error("Invalid version number component: '" + std::string(num_str) + "'"));
        }
        std::uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), value);
        if (ec != std::errc{} || ptr != num_str.data() + num_str.size()) {
            return keel_core::Err<SemanticVersion>(
                parse_error("Invalid version number component: '" + std::string(num_str) + "'"));
        }
        parts[part_index++] = value;
        start = i + 1;
    }

    if (part_index != 3) {
        return keel_core::Err<SemanticVersion>(
            parse_error("Expected major.minor.patch: " + std::string(str)));
    }

    result.major = parts[0];
    result.minor = parts[1];
    result.patch = parts[2];

    if (dash_pos != std::string_view::npos) {
        std::string_view pre = without_build.substr(dash_pos + 1);
        if (!valid_identifiers(pre)) {
            return keel_core::Err<SemanticVersion>(
                parse_error("Invalid prerelease: " + std::string(pre)));
        }
        result.prerelease = std::string(pre);
    }

    if (plus_pos != std::string_view::npos) {
        std::string_view build = str.substr(plus_pos + 1);
        if (!valid_identifiers(build)) {
            return keel_core::Err<SemanticVersion>(
                parse_error("Invalid build metadata: " + std::string(build)));
        }
        result.build_metadata = std::string(build);
    }

    return keel_core::Ok(std::move(result));
}

std::strong_ordering SemanticVersion::operator<=>(const SemanticVersion& other) const noexcept {
    if (auto cmp = major <=> other.major; cmp != 0) return cmp;
    if (auto cmp = minor <=> other.minor; cmp != 0) return cmp;
    if (auto cmp = patch <=> other.patch; cmp != 0) return cmp;

    if (prerelease.empty() && other.prerelease.empty()) {
        return std::strong_ordering::equal;
    }
    if (prerelease.empty()) {
        return std::strong_ordering::greater;
    }
    if (other.prerelease.empty()) {
        return std::strong_ordering::less;
    }
    return compare_prerelease(prerelease, other.prerelease);
}

bool SemanticVersion::operator==(const SemanticVersion& other) const noexcept {
    return major == other.major &&
           minor == other.minor &&
           patch == other.patch &&
           prerelease == other.prerelease;
}

std::string SemanticVersion::to_string() const {
    std::string result = std::to_string(major) + "." +
                         std::to_string(minor) + "." +
                         std::to_string(patch);
    if (!prerelease.empty()) {
        result += "-" + prerelease;
    }
    if (!build_metadata.empty()) {
        result += "+" + build_metadata;
    }
    return result;
}

std::strong_ordering SemanticVersion::compare_prerelease(
    std::string_view a, std::string_view b) noexcept {

    while (!a.empty() && !b.empty()) {
        auto a_dot = a.find('.');
        auto b_dot = b.find('.');
        std::string_view a_id = a.substr(0, a_dot);
        std::string_view b_id = b.substr(0, b_dot);

        bool a_num = is_numeric(a_id);
        bool b_num = is_numeric(b_id);

        if (a_num && b_num) {
            // Longer digit strings are larger (no leading zeros)
            if (auto cmp = a_id.size() <=> b_id.size(); cmp != 0) return cmp;
            if (auto cmp = a_id.compare(b_id) <=> 0; cmp != 0) return cmp;
        } else if (a_num) {
            return std::strong_ordering::less;
        } else if (b_num) {
            return std::strong_ordering::greater;
        } else if (auto cmp = a_id.compare(b_id) <=> 0; cmp != 0) {
            return cmp;
        }

        a = a_dot == std::string_view::npos ? std::string_view{} : a.substr(a_dot + 1);
        b = b_dot == std::string_view::npos ? std::string_view{} : b.substr(b_dot + 1);
    }

    return a.size() <=> b.size();
}

// =============================================================================
// Compatibility
// =============================================================================

const char* version_compatibility_to_string(VersionCompatibility compat) noexcept {
    switch (compat) {
        case VersionCompatibility::Compatible: return "compatible";
        case VersionCompatibility::MinorIncompatible: return "minor_incompatible";
        case VersionCompatibility::MajorIncompatible: return "major_incompatible";
    }
    return "unknown";
}

std::string_view strip_constraint_operator(std::string_view constraint) noexcept {
    constraint = trim(constraint);
    if (constraint.starts_with(">=") || constraint.starts_with("<=")) {
        constraint.remove_prefix(2);
    } else if (!constraint.empty() &&
               (constraint.front() == '>' || constraint.front() == '<' ||
                constraint.front() == '^' || constraint.front() == '~' ||
                constraint.front() == '=')) {
        constraint.remove_prefix(1);
    }
    return trim(constraint);
}

VersionCompatibility classify(std::string_view actual, std::string_view constraint) {
    auto actual_version = SemanticVersion::parse(actual);
    if (!actual_version) {
        return VersionCompatibility::MajorIncompatible;
    }

    auto expected_version = SemanticVersion::parse(strip_constraint_operator(constraint));
    if (!expected_version) {
        return VersionCompatibility::MajorIncompatible;
    }

    if (actual_version->major != expected_version->major) {
        return VersionCompatibility::MajorIncompatible;
    }
    if (actual_version->minor != expected_version->minor) {
        return VersionCompatibility::MinorIncompatible;
    }
    return VersionCompatibility::Compatible;
}

} // namespace keel_catalog
