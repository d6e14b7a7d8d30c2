#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ferry::util {

struct Endpoint {
    std::string host;
    uint16_t port{};
};

// TCP connect with a hard deadline. Used as the cheap "is the host up" check
// before touching a possibly hung network filesystem.
bool tcpReachable(const Endpoint& ep, std::chrono::milliseconds timeout);

// Host of a UNC-style path ("//nas/share/dir" or "\\nas\share\dir") on the SMB port.
std::optional<Endpoint> smbEndpointOf(const std::filesystem::path& path);

}
