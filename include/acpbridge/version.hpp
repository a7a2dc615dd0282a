#ifndef ACPBRIDGE_VERSION_HPP
#define ACPBRIDGE_VERSION_HPP

#include <string>

namespace acpbridge
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ACP protocol version sent in initialize
constexpr int ACP_PROTOCOL_VERSION = 1;

std::string version_string();

} // namespace acpbridge

#endif // ACPBRIDGE_VERSION_HPP
