/// @file build_info.cpp
/// @brief Build information for network_rag

#include <network_rag/core/build_info.hpp>
#include <network_rag/core/package.hpp>
#include <sstream>

namespace network_rag::build {

BuildInfo get_build_info() {
    return BuildInfo{
        .version = NETWORK_RAG_VERSION_STRING,
        .build_date = __DATE__ " " __TIME__,
#ifdef NDEBUG
        .build_type = "Release",
#else
        .build_type = "Debug",
#endif
#if defined(__clang__)
        .compiler = "Clang " __clang_version__,
#elif defined(__GNUC__)
        .compiler = "GCC " __VERSION__,
#elif defined(_MSC_VER)
        .compiler = "MSVC",
#else
        .compiler = "Unknown",
#endif
#if defined(_WIN32)
        .platform = "Windows",
#elif defined(__APPLE__)
        .platform = "macOS",
#elif defined(__linux__)
        .platform = "Linux",
#else
        .platform = "Unknown",
#endif
    };
}

std::string format_build_info() {
    auto info = get_build_info();
    std::ostringstream oss;
    oss << "network_rag " << info.version << "\n"
        << "  Built: " << info.build_date << "\n"
        << "  Type: " << info.build_type << "\n"
        << "  Compiler: " << info.compiler << "\n"
        << "  Platform: " << info.platform << "\n";
    return oss.str();
}

} // namespace network_rag::build
