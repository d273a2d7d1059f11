#include "HostResolver.h"
#include <trantor/utils/Logger.h>
#include <netdb.h>
#include <sys/socket.h>
#include <thread>

std::string resolveHostWithRetry(const std::string& hostname,
                                 int maxAttempts,
                                 std::chrono::milliseconds delay) {
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        struct addrinfo* res = nullptr;
        int err = getaddrinfo(hostname.c_str(), nullptr, &hints, &res);
        if (err == 0) {
            char host[NI_MAXHOST] = {0};
            err = getnameinfo(res->ai_addr, res->ai_addrlen, host, sizeof(host), nullptr, 0, NI_NUMERICHOST);
            freeaddrinfo(res);
            if (err == 0) {
                LOG_DEBUG << "[dns] " << hostname << " -> " << host;
                return host;
            }
        }
        LOG_WARN << "[dns] attempt " << attempt << "/" << maxAttempts << " for " << hostname
                 << ": " << gai_strerror(err);
        if (attempt < maxAttempts) {
            std::this_thread::sleep_for(delay);
        }
    }
    return std::string();
}
