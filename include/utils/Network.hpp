#pragma once

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <string>

namespace hostlink::utils {

/**
 * @brief Первый IPv4-адрес не loopback-интерфейса, иначе 127.0.0.1
 */
inline std::string primaryIpv4Address()
{
    std::string result = "127.0.0.1";
    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        return result;
    }
    for (ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        auto* addr = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        char buffer[INET_ADDRSTRLEN] = {};
        if (inet_ntop(AF_INET, &addr->sin_addr, buffer, sizeof(buffer)) == nullptr) {
            continue;
        }
        std::string ip(buffer);
        if (ip.rfind("127.", 0) != 0) {
            result = ip;
            break;
        }
    }
    freeifaddrs(interfaces);
    return result;
}

} // namespace hostlink::utils
