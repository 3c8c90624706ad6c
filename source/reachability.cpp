#include "ytdle/reachability.hpp"
#include "ytdle/logger.hpp"
#include "ytdle/raii.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace ytdle {

TcpReachabilityProbe::TcpReachabilityProbe(std::string host, int port, int timeoutMs)
    : host_(std::move(host)), port_(port), timeoutMs_(timeoutMs) {}

bool TcpReachabilityProbe::reachable() {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;
    struct addrinfo* res = nullptr;

    const std::string portStr = std::to_string(port_);
    int ret = getaddrinfo(host_.c_str(), portStr.c_str(), &hints, &res);
    if (ret != 0 || !res) {
        lastError_ = "DNS lookup failed for host: " + host_;
        if (res) freeaddrinfo(res);
        status_.store(NetworkStatus::Offline);
        return false;
    }

    bool ok = false;
    for (struct addrinfo* ai = res; ai && !ok; ai = ai->ai_next) {
        UniqueFd sockFd(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sockFd) {
            lastError_ = "Socket creation failed";
            continue;
        }
        // SO_SNDTIMEO bounds connect() on Linux.
        timeval tv{};
        tv.tv_sec = timeoutMs_ / 1000;
        tv.tv_usec = (timeoutMs_ % 1000) * 1000;
        setsockopt(sockFd.fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sockFd.fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        if (connect(sockFd.fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            ok = true;
        } else {
            lastError_ = "Connect failed to " + host_ + ":" + portStr;
        }
    }
    freeaddrinfo(res);

    NetworkStatus next = ok ? NetworkStatus::Online : NetworkStatus::Offline;
    NetworkStatus prev = status_.exchange(next);
    if (prev != next) {
        if (ok) logInfo("Network " + std::string(networkStatusLabel(next)), "NET");
        else logWarn("Network " + std::string(networkStatusLabel(next)) + ": " + lastError_, "NET");
    }
    return ok;
}

} // namespace ytdle
