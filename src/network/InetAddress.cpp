#include "cacheworker/network/InetAddress.h"

#include <arpa/inet.h>

#include <cstring>
#include <stdexcept>

namespace cacheworker {
namespace network {

InetAddress::InetAddress(uint16_t port) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    addr_.sin_port = htons(port);
}

InetAddress::InetAddress(const std::string& ip, uint16_t port) : InetAddress(port) {
    if (::inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) != 1) {
        throw std::invalid_argument("not an IPv4 address: '" + ip + "'");
    }
}

std::string InetAddress::toIp() const {
    char text[INET_ADDRSTRLEN] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, text, sizeof text);
    return text;
}

std::string InetAddress::toIpPort() const {
    return toIp() + ":" + std::to_string(toPort());
}

} // namespace network
} // namespace cacheworker
