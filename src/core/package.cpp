/// @file package.cpp
/// @brief Package identity for network_rag

#include <network_rag/core/package.hpp>

#include <sstream>

namespace network_rag {

namespace {

constexpr PackageInfo PACKAGE_INFO{
    "network_rag",
    "Network RAG - Network-based Retrieval-Augmented Generation",
    "Precise retrieval with broad context.",
    "Framework that combines vector search with network relationships for\n"
    "precise retrieval with broad context. Define your graph explicitly in code,\n"
    "deploy anywhere with your current database and tech stack, and query with\n"
    "NXQL, a composable query language built for hybrid retrieval.",
};

static_assert(NETWORK_RAG_VERSION_STRING[0] != '\0', "package version must not be empty");

} // anonymous namespace

const Version& version() {
    static const Version v{VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH};
    return v;
}

std::string version_string() {
    return VERSION_STRING;
}

std::string version_banner() {
    return std::string(PACKAGE_INFO.name) + " " + VERSION_STRING;
}

const PackageInfo& package_info() noexcept {
    return PACKAGE_INFO;
}

std::string format_package_info() {
    std::ostringstream oss;
    oss << PACKAGE_INFO.title << "\n\n"
        << PACKAGE_INFO.tagline << "\n\n"
        << PACKAGE_INFO.summary << "\n\n"
        << "Version: " << VERSION_STRING << "\n";
    return oss.str();
}

Result<void> check_version_requirement(std::string_view constraint) {
    auto parsed = VersionConstraint::parse(constraint);
    if (!parsed) {
        return Err(parsed.error());
    }

    if (!parsed->matches(version())) {
        return Err(VersionError::unsatisfied(parsed->to_string(), VERSION_STRING));
    }

    return Ok();
}

} // namespace network_rag
