#include <dspool/pool/endpoint.h>

#include <dspool/pool/liveness_probe.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace dspool::pool {
namespace {

bool IEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

bool StartsWithNoCase(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && IEquals(s.substr(0, prefix.size()), prefix);
}

dspool::Status InvalidAddress(std::string_view address, std::string_view why) {
    std::string msg = "invalid server address <";
    msg.append(address);
    msg.append(">: ");
    msg.append(why);
    return dspool::Status(dspool::StatusCode::invalid_endpoint, std::move(msg));
}

} // namespace

bool Endpoint::CheckAvailability() const {
    if (!probe) {
        return true;
    }
    return probe->CheckAvailability(*this);
}

std::string Endpoint::ToString() const {
    std::string out = use_ssl ? "ldaps://" : "ldap://";
    if (host.find(':') != std::string::npos) {
        out += "[" + host + "]";
    } else {
        out += host;
    }
    out += ":" + std::to_string(port);
    return out;
}

dspool::Result<Endpoint> Endpoint::Parse(std::string_view address) {
    Endpoint ep;
    std::string_view rest = address;

    if (StartsWithNoCase(rest, "ldaps://")) {
        ep.use_ssl = true;
        ep.port = kDefaultSslPort;
        rest.remove_prefix(8);
    } else if (StartsWithNoCase(rest, "ldap://")) {
        rest.remove_prefix(7);
    } else if (rest.find("://") != std::string_view::npos) {
        return InvalidAddress(address, "unsupported scheme");
    }

    // drop a trailing "/" or any DN path
    if (auto slash = rest.find('/'); slash != std::string_view::npos) {
        rest = rest.substr(0, slash);
    }

    std::string_view port_sv;
    if (!rest.empty() && rest.front() == '[') {
        auto close = rest.find(']');
        if (close == std::string_view::npos) {
            return InvalidAddress(address, "unterminated IPv6 literal");
        }
        ep.host = std::string(rest.substr(1, close - 1));
        auto tail = rest.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return InvalidAddress(address, "unexpected characters after IPv6 literal");
            }
            port_sv = tail.substr(1);
            if (port_sv.empty()) {
                return InvalidAddress(address, "empty port");
            }
        }
    } else {
        auto colon = rest.rfind(':');
        if (colon != std::string_view::npos) {
            if (rest.find(':') != colon) {
                return InvalidAddress(address, "IPv6 literals must be bracketed");
            }
            ep.host = std::string(rest.substr(0, colon));
            port_sv = rest.substr(colon + 1);
            if (port_sv.empty()) {
                return InvalidAddress(address, "empty port");
            }
        } else {
            ep.host = std::string(rest);
        }
    }

    if (ep.host.empty()) {
        return InvalidAddress(address, "empty host");
    }

    if (!port_sv.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_sv.data(), port_sv.data() + port_sv.size(), value);
        if (ec != std::errc() || ptr != port_sv.data() + port_sv.size() || value == 0 || value > 65535) {
            return InvalidAddress(address, "bad port");
        }
        ep.port = static_cast<std::uint16_t>(value);
    }

    return ep;
}

bool operator==(const Endpoint& a, const Endpoint& b) {
    return a.port == b.port && a.use_ssl == b.use_ssl && IEquals(a.host, b.host);
}

bool operator!=(const Endpoint& a, const Endpoint& b) {
    return !(a == b);
}

dspool::Status ValidateEndpoint(const Endpoint& endpoint) {
    if (endpoint.host.empty()) {
        return dspool::Status(dspool::StatusCode::invalid_endpoint, "server must have a host");
    }
    if (endpoint.port == 0) {
        return dspool::Status(dspool::StatusCode::invalid_endpoint, "server port must be > 0");
    }
    return dspool::Status::Ok();
}

} // namespace dspool::pool
