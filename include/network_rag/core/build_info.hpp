#pragma once

/// @file build_info.hpp
/// @brief Build information for network_rag

#include <string>

namespace network_rag::build {

/// Build configuration
struct BuildInfo {
    const char* version;
    const char* build_date;
    const char* build_type;
    const char* compiler;
    const char* platform;
};

/// Get build information
BuildInfo get_build_info();

/// Format build information
std::string format_build_info();

} // namespace network_rag::build
