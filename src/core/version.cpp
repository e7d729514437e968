/// @file version.cpp
/// @brief Semantic versioning implementation for network_rag

#include <network_rag/core/version.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <regex>
#include <sstream>

namespace network_rag {

namespace {

std::string_view trim(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

bool is_numeric(std::string_view id) {
    return !id.empty() && std::all_of(id.begin(), id.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

bool is_wildcard(std::string_view part) {
    return part == "x" || part == "X" || part == "*";
}

/// Validate dot-separated identifiers (prerelease or build metadata)
bool valid_identifiers(std::string_view ids) {
    if (ids.empty()) {
        return false;
    }
    std::size_t start = 0;
    while (start <= ids.size()) {
        std::size_t end = ids.find('.', start);
        if (end == std::string_view::npos) end = ids.size();
        std::string_view id = ids.substr(start, end - start);
        if (id.empty()) {
            return false;
        }
        for (char c : id) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
                return false;
            }
        }
        start = end + 1;
    }
    return true;
}

Result<std::uint32_t> parse_component(std::string_view text, std::string_view input) {
    if (!is_numeric(text)) {
        return Err<std::uint32_t>(VersionError::invalid_format(
            std::string(input), "non-numeric component '" + std::string(text) + "'"));
    }
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return Err<std::uint32_t>(VersionError::invalid_format(
            std::string(input), "component '" + std::string(text) + "' overflows"));
    }
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Err<std::uint32_t>(VersionError::invalid_format(
            std::string(input), "invalid component '" + std::string(text) + "'"));
    }
    return Ok(value);
}

/// Compare digit strings of any length by numeric value
std::strong_ordering compare_numeric_ids(std::string_view a, std::string_view b) noexcept {
    auto strip = [](std::string_view id) {
        while (id.size() > 1 && id.front() == '0') id.remove_prefix(1);
        return id;
    };
    a = strip(a);
    b = strip(b);
    if (auto cmp = a.size() <=> b.size(); cmp != 0) return cmp;
    int c = a.compare(b);
    return c < 0 ? std::strong_ordering::less
         : c > 0 ? std::strong_ordering::greater
                 : std::strong_ordering::equal;
}

enum class Component : std::uint8_t { Major, Minor, Patch };

/// Smallest release above every version sharing the prefix up to `component`.
/// A component at its maximum carries into the one above it; empty when the
/// major component would overflow.
std::optional<Version> bump(const Version& v, Component component) noexcept {
    constexpr auto max = std::numeric_limits<std::uint32_t>::max();
    switch (component) {
        case Component::Patch:
            if (v.patch != max) return Version{v.major, v.minor, v.patch + 1};
            [[fallthrough]];
        case Component::Minor:
            if (v.minor != max) return Version{v.major, v.minor + 1, 0};
            [[fallthrough]];
        case Component::Major:
            if (v.major != max) return Version{v.major + 1, 0, 0};
    }
    return std::nullopt;
}

/// Exclusive upper bound test for caret, tilde and wildcard ranges.
/// A missing bound leaves the range open. Prereleases of the bound's own
/// release are outside the range.
bool below_upper_bound(const Version& v, const std::optional<Version>& bound) noexcept {
    if (!bound) {
        return true;
    }
    if (v.is_prerelease() && v.major == bound->major &&
        v.minor == bound->minor && v.patch == bound->patch) {
        return false;
    }
    return v < *bound;
}

std::vector<std::string_view> split_dots(std::string_view str) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= str.size()) {
        std::size_t end = str.find('.', start);
        if (end == std::string_view::npos) end = str.size();
        parts.push_back(str.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

} // anonymous namespace

// =============================================================================
// Version Parsing
// =============================================================================

Result<Version> Version::parse(std::string_view str) {
    const std::string_view input = str;
    str = trim(str);

    if (str.empty()) {
        return Err<Version>(VersionError::invalid_format(std::string(input), "empty version string"));
    }

    if (str.front() == 'v' || str.front() == 'V') {
        str.remove_prefix(1);
    }

    // A '-' after '+' belongs to the build metadata
    auto plus_pos = str.find('+');
    auto dash_pos = str.substr(0, plus_pos).find('-');

    std::string_view core_str = str;
    if (dash_pos != std::string_view::npos) {
        core_str = str.substr(0, dash_pos);
    } else if (plus_pos != std::string_view::npos) {
        core_str = str.substr(0, plus_pos);
    }

    auto parts = split_dots(core_str);
    if (parts.size() > 3) {
        return Err<Version>(VersionError::invalid_format(
            std::string(input), "more than three numeric components"));
    }

    std::uint32_t values[3] = {0, 0, 0};
    for (std::size_t i = 0; i < parts.size(); ++i) {
        auto component = parse_component(parts[i], input);
        if (!component) {
            return Err<Version>(component.error());
        }
        values[i] = *component;
    }

    Version result{values[0], values[1], values[2]};

    if (dash_pos != std::string_view::npos) {
        std::size_t pre_end = plus_pos != std::string_view::npos ? plus_pos : str.size();
        auto pre = str.substr(dash_pos + 1, pre_end - dash_pos - 1);
        if (!valid_identifiers(pre)) {
            return Err<Version>(VersionError::invalid_format(
                std::string(input), "invalid prerelease '" + std::string(pre) + "'"));
        }
        result.prerelease = std::string(pre);
    }

    if (plus_pos != std::string_view::npos) {
        auto build = str.substr(plus_pos + 1);
        if (!valid_identifiers(build)) {
            return Err<Version>(VersionError::invalid_format(
                std::string(input), "invalid build metadata '" + std::string(build) + "'"));
        }
        result.build_metadata = std::string(build);
    }

    return Ok(std::move(result));
}

Result<Version> Version::parse_strict(std::string_view str) {
    static const std::regex semver_regex(
        R"(^(0|[1-9]\d*)\.(0|[1-9]\d*)\.(0|[1-9]\d*))"
        R"((?:-((?:0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*)(?:\.(?:0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*))*))?)"
        R"((?:\+([0-9a-zA-Z-]+(?:\.[0-9a-zA-Z-]+)*))?$)");

    const std::string text(str);
    if (!std::regex_match(text, semver_regex)) {
        return Err<Version>(VersionError::invalid_format(text, "not a MAJOR.MINOR.PATCH semantic version"));
    }

    return parse(str);
}

bool is_valid_semver(std::string_view str) {
    return Version::parse_strict(str).is_ok();
}

// =============================================================================
// Version Comparison
// =============================================================================

std::strong_ordering Version::operator<=>(const Version& other) const noexcept {
    if (auto cmp = major <=> other.major; cmp != 0) return cmp;
    if (auto cmp = minor <=> other.minor; cmp != 0) return cmp;
    if (auto cmp = patch <=> other.patch; cmp != 0) return cmp;

    if (prerelease.empty() && !other.prerelease.empty()) {
        return std::strong_ordering::greater;
    }
    if (!prerelease.empty() && other.prerelease.empty()) {
        return std::strong_ordering::less;
    }
    if (!prerelease.empty() && !other.prerelease.empty()) {
        return compare_prerelease(prerelease, other.prerelease);
    }

    return std::strong_ordering::equal;
}

bool Version::operator==(const Version& other) const noexcept {
    return major == other.major &&
           minor == other.minor &&
           patch == other.patch &&
           prerelease == other.prerelease;
}

std::strong_ordering Version::compare_prerelease(
    std::string_view a, std::string_view b) noexcept {

    std::size_t a_start = 0, b_start = 0;

    while (a_start < a.size() || b_start < b.size()) {
        std::size_t a_end = a.find('.', a_start);
        if (a_end == std::string_view::npos) a_end = a.size();
        std::size_t b_end = b.find('.', b_start);
        if (b_end == std::string_view::npos) b_end = b.size();

        std::string_view a_id = a_start < a.size() ? a.substr(a_start, a_end - a_start) : std::string_view{};
        std::string_view b_id = b_start < b.size() ? b.substr(b_start, b_end - b_start) : std::string_view{};

        // Fewer identifiers = lower precedence
        if (a_id.empty() && !b_id.empty()) {
            return std::strong_ordering::less;
        }
        if (!a_id.empty() && b_id.empty()) {
            return std::strong_ordering::greater;
        }
        if (a_id.empty() && b_id.empty()) {
            break;
        }

        bool a_numeric = is_numeric(a_id);
        bool b_numeric = is_numeric(b_id);

        if (a_numeric && b_numeric) {
            if (auto cmp = compare_numeric_ids(a_id, b_id); cmp != 0) return cmp;
        } else if (a_numeric) {
            // Numeric identifiers sort below alphanumeric ones
            return std::strong_ordering::less;
        } else if (b_numeric) {
            return std::strong_ordering::greater;
        } else {
            if (auto cmp = a_id.compare(b_id); cmp != 0) {
                return cmp < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
            }
        }

        a_start = a_end + 1;
        b_start = b_end + 1;
    }

    return std::strong_ordering::equal;
}

bool Version::is_compatible_with(const Version& other) const noexcept {
    if (major == 0 && other.major == 0) {
        return minor == other.minor && patch >= other.patch;
    }
    return major == other.major && *this >= other;
}

// =============================================================================
// Version Formatting
// =============================================================================

std::string Version::to_string() const {
    std::ostringstream oss;
    oss << major << '.' << minor << '.' << patch;
    if (!prerelease.empty()) {
        oss << '-' << prerelease;
    }
    if (!build_metadata.empty()) {
        oss << '+' << build_metadata;
    }
    return oss.str();
}

std::string Version::to_string_core() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

// =============================================================================
// VersionConstraint
// =============================================================================

Result<VersionConstraint> VersionConstraint::parse(std::string_view str) {
    str = trim(str);

    VersionConstraint result;
    result.source = std::string(str);

    if (str.empty() || str == "*") {
        return Ok(std::move(result));
    }

    // Comma-separated constraints are ANDed
    if (str.find(',') != std::string_view::npos) {
        result.type = Type::Range;

        std::size_t start = 0;
        while (start <= str.size()) {
            std::size_t end = str.find(',', start);
            if (end == std::string_view::npos) end = str.size();

            auto part = trim(str.substr(start, end - start));
            if (part.empty()) {
                return Err<VersionConstraint>(VersionError::invalid_format(
                    result.source, "empty member in constraint list"));
            }

            auto sub = parse(part);
            if (!sub) {
                return sub;
            }
            result.sub_constraints.push_back(std::move(*sub));

            start = end + 1;
        }

        return Ok(std::move(result));
    }

    if (str.starts_with(">=")) {
        result.type = Type::GreaterEqual;
        str.remove_prefix(2);
    } else if (str.starts_with(">")) {
        result.type = Type::Greater;
        str.remove_prefix(1);
    } else if (str.starts_with("<=")) {
        result.type = Type::LessEqual;
        str.remove_prefix(2);
    } else if (str.starts_with("<")) {
        result.type = Type::Less;
        str.remove_prefix(1);
    } else if (str.starts_with("^")) {
        result.type = Type::Caret;
        str.remove_prefix(1);
    } else if (str.starts_with("~")) {
        result.type = Type::Tilde;
        str.remove_prefix(1);
    } else if (str.starts_with("==") || str.starts_with("=")) {
        result.type = Type::Exact;
        str.remove_prefix(str.starts_with("==") ? 2 : 1);
    } else {
        auto parts = split_dots(str);
        bool has_wildcard = std::any_of(parts.begin(), parts.end(), is_wildcard);

        if (has_wildcard) {
            if (parts.size() > 3) {
                return Err<VersionConstraint>(VersionError::invalid_format(
                    result.source, "more than three components"));
            }

            // Numeric prefix, then wildcards only
            std::uint32_t values[2] = {0, 0};
            std::size_t fixed = 0;
            for (std::size_t i = 0; i < parts.size(); ++i) {
                if (is_wildcard(parts[i])) {
                    continue;
                }
                if (i != fixed || fixed >= 2) {
                    return Err<VersionConstraint>(VersionError::invalid_format(
                        result.source, "numeric component after wildcard"));
                }
                auto component = parse_component(parts[i], result.source);
                if (!component) {
                    return Err<VersionConstraint>(component.error());
                }
                values[fixed++] = *component;
            }

            if (fixed == 0) {
                return Ok(std::move(result));
            }

            result.type = Type::Wildcard;
            if (fixed == 1) {
                result.min_version = Version{values[0], 0, 0};
                result.max_version = bump(result.min_version, Component::Major);
            } else {
                result.min_version = Version{values[0], values[1], 0};
                result.max_version = bump(result.min_version, Component::Minor);
            }
            return Ok(std::move(result));
        }

        result.type = Type::Exact;
    }

    auto version = Version::parse(trim(str));
    if (!version) {
        return Err<VersionConstraint>(version.error());
    }
    result.version = std::move(*version);

    return Ok(std::move(result));
}

bool VersionConstraint::matches(const Version& v) const noexcept {
    switch (type) {
        case Type::Any:
            return true;

        case Type::Exact:
            return v == version;

        case Type::Greater:
            return v > version;

        case Type::GreaterEqual:
            return v >= version;

        case Type::Less:
            return v < version;

        case Type::LessEqual:
            return v <= version;

        case Type::Caret:
            return v >= version && below_upper_bound(v, next_breaking_version(version));

        case Type::Tilde:
            return v >= version && below_upper_bound(v, bump(version, Component::Minor));

        case Type::Wildcard:
            return v >= min_version && below_upper_bound(v, max_version);

        case Type::Range:
            for (const auto& sub : sub_constraints) {
                if (!sub.matches(v)) {
                    return false;
                }
            }
            return true;
    }

    return false;
}

std::string VersionConstraint::to_string() const {
    switch (type) {
        case Type::Any:
            return "*";
        case Type::Exact:
            return version.to_string();
        case Type::Greater:
            return ">" + version.to_string();
        case Type::GreaterEqual:
            return ">=" + version.to_string();
        case Type::Less:
            return "<" + version.to_string();
        case Type::LessEqual:
            return "<=" + version.to_string();
        case Type::Caret:
            return "^" + version.to_string();
        case Type::Tilde:
            return "~" + version.to_string();
        case Type::Wildcard:
            if (!max_version) {
                return ">=" + min_version.to_string();
            }
            return ">=" + min_version.to_string() + ",<" + max_version->to_string();
        case Type::Range: {
            std::string out;
            for (std::size_t i = 0; i < sub_constraints.size(); ++i) {
                if (i > 0) out += ",";
                out += sub_constraints[i].to_string();
            }
            return out;
        }
    }
    return "?";
}

std::optional<Version> next_breaking_version(const Version& v) noexcept {
    if (v.major > 0) {
        return bump(v, Component::Major);
    }
    if (v.minor > 0) {
        return bump(v, Component::Minor);
    }
    return bump(v, Component::Patch);
}

// =============================================================================
// Version Comparison Utilities
// =============================================================================

VersionComparison compare_versions(const Version& from, const Version& to) {
    VersionComparison result;

    result.major_diff = static_cast<std::int64_t>(to.major) - static_cast<std::int64_t>(from.major);
    result.minor_diff = static_cast<std::int64_t>(to.minor) - static_cast<std::int64_t>(from.minor);
    result.patch_diff = static_cast<std::int64_t>(to.patch) - static_cast<std::int64_t>(from.patch);

    result.is_major_change = result.major_diff != 0;
    result.is_minor_change = !result.is_major_change && result.minor_diff != 0;
    result.is_patch_change = !result.is_major_change && !result.is_minor_change && result.patch_diff != 0;
    result.is_prerelease_change = !result.is_major_change && !result.is_minor_change &&
                                  !result.is_patch_change && from.prerelease != to.prerelease;

    if (to > from) {
        result.is_upgrade = true;
    } else if (to < from) {
        result.is_downgrade = true;
    } else {
        result.is_equal = true;
    }

    return result;
}

std::string format_version_comparison(const Version& from, const Version& to) {
    auto cmp = compare_versions(from, to);
    std::ostringstream oss;

    oss << from.to_string() << " -> " << to.to_string() << ": ";

    if (cmp.is_equal) {
        oss << "no change";
    } else if (cmp.is_upgrade) {
        if (cmp.is_major_change) {
            oss << "MAJOR upgrade (breaking changes expected)";
        } else if (cmp.is_minor_change) {
            oss << "minor upgrade (new features)";
        } else if (cmp.is_patch_change) {
            oss << "patch upgrade (bug fixes)";
        } else {
            oss << "prerelease upgrade";
        }
    } else {
        if (cmp.is_major_change) {
            oss << "MAJOR downgrade (compatibility unknown)";
        } else if (cmp.is_minor_change) {
            oss << "minor downgrade";
        } else if (cmp.is_patch_change) {
            oss << "patch downgrade";
        } else {
            oss << "prerelease downgrade";
        }
    }

    return oss.str();
}

} // namespace network_rag
