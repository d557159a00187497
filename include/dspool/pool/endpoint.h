#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include <dspool/core/status.h>

namespace dspool::pool {

class ILivenessProbe;

inline constexpr std::uint16_t kDefaultPort = 389;
inline constexpr std::uint16_t kDefaultSslPort = 636;

struct Endpoint {
    std::string host;
    std::uint16_t port = kDefaultPort;
    bool use_ssl = false;

    // Shared by every copy of the endpoint (registry list and cursor snapshots).
    std::shared_ptr<ILivenessProbe> probe;

    // Blocking. An endpoint without a probe is always considered available.
    bool CheckAvailability() const;

    // ldap://host:port or ldaps://host:port
    std::string ToString() const;

    // Accepts "ldap://host[:port]", "ldaps://host[:port]", "host[:port]" and
    // bracketed IPv6 literals ("ldap://[::1]:389"). No probe is attached.
    static dspool::Result<Endpoint> Parse(std::string_view address);
};

// Logical address equality: host (case-insensitive), port and scheme. The probe is ignored.
bool operator==(const Endpoint& a, const Endpoint& b);
bool operator!=(const Endpoint& a, const Endpoint& b);

// invalid_endpoint when the host is empty or the port is 0
dspool::Status ValidateEndpoint(const Endpoint& endpoint);

// An element of a sequence handed to the pool: an endpoint or its address form.
using EndpointLike = std::variant<Endpoint, std::string>;

} // namespace dspool::pool
