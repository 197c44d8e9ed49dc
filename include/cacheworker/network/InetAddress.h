#pragma once

#include <netinet/in.h>

#include <cstdint>
#include <string>

namespace cacheworker {
namespace network {

// IPv4 host and port, stored in network byte order.
class InetAddress {
public:
    // Wildcard address on port.
    explicit InetAddress(uint16_t port = 0);
    // Throws std::invalid_argument unless ip is a dotted-quad IPv4 address.
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr) : addr_(addr) {}

    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const { return ntohs(addr_.sin_port); }

    const struct sockaddr* rawAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace cacheworker
