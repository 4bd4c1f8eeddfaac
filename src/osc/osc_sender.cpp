#include "osc/osc_sender.h"
#include "util/logging.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <chrono>
#include <thread>

namespace PulseAnalyzer {
namespace OSC {

// ============================================================================
// Constructor / Destructor
// ============================================================================

OscSender::OscSender() = default;

OscSender::~OscSender() {
    shutdown();
}

// ============================================================================
// Setup
// ============================================================================

bool OscSender::parseHostPort(const std::string& value, std::string& host, int& port) {
    auto colonPos = value.rfind(':');
    if (colonPos == std::string::npos) {
        host = value;
        port = 9000;
        return !host.empty();
    }

    host = value.substr(0, colonPos);
    try {
        size_t used = 0;
        std::string portText = value.substr(colonPos + 1);
        port = std::stoi(portText, &used);
        return !host.empty() && used == portText.size() && port > 0 && port <= 65535;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

void OscSender::addTarget(const std::string& name, const std::string& host, int port) {
    auto t = std::make_unique<Target>();
    t->name = name;
    t->host = host;
    t->port = port;
    m_targets.push_back(std::move(t));
}

bool OscSender::initialize() {
    if (m_targets.empty()) {
        LOG_WARN("No OSC targets configured");
        return false;
    }

    bool anyOk = false;

    for (auto& t : m_targets) {
        // Resolve hostname to IP once
        std::string ip = t->host;
        struct addrinfo hints{}, *res = nullptr;
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;

        if (getaddrinfo(t->host.c_str(), nullptr, &hints, &res) == 0 && res) {
            char ipStr[INET_ADDRSTRLEN];
            auto* sa = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
            inet_ntop(AF_INET, &sa->sin_addr, ipStr, sizeof(ipStr));
            ip = ipStr;
            freeaddrinfo(res);
        }

        std::memset(&t->addr, 0, sizeof(t->addr));
        t->addr.sin_family = AF_INET;
        t->addr.sin_port = htons(static_cast<uint16_t>(t->port));
        if (inet_pton(AF_INET, ip.c_str(), &t->addr.sin_addr) != 1) {
            std::string msg = "OSC: cannot resolve " + t->host + " for target " + t->name;
            LOG_ERROR(msg);
            if (m_errorCallback) m_errorCallback(msg);
            continue;
        }

        // Non-blocking UDP socket
        t->sockfd = socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK, 0);
        if (t->sockfd < 0) {
            std::string msg = "OSC: socket error for " + t->name + ": " + std::strerror(errno);
            LOG_ERROR(msg);
            if (m_errorCallback) m_errorCallback(msg);
            continue;
        }

        t->running = true;
        t->thread = std::thread(targetThreadFunc, t.get());

        LOG_INFO("OSC target (UDP): " + t->name + " -> " + ip + ":" + std::to_string(t->port));
        anyOk = true;
    }

    m_connected = anyOk;
    return anyOk;
}

void OscSender::shutdown() {
    for (auto& t : m_targets) {
        t->running = false;
    }
    for (auto& t : m_targets) {
        if (t->thread.joinable()) t->thread.join();
        if (t->sockfd >= 0) {
            close(t->sockfd);
            t->sockfd = -1;
        }
        uint32_t d = t->dropped.exchange(0);
        if (d > 0) {
            LOG_WARN("OSC " + t->name + ": " + std::to_string(d) + " packets dropped");
        }
        uint32_t e = t->sendErrors.exchange(0);
        if (e > 0) {
            LOG_WARN("OSC " + t->name + ": " + std::to_string(e) + " send errors");
        }
    }
    m_connected = false;
}

// ============================================================================
// Lock-free enqueue to all targets
// ============================================================================

void OscSender::enqueueAll(const char* data, int len) {
    for (auto& t : m_targets) {
        if (!t->running) continue;

        int w = t->wpos.load(std::memory_order_relaxed);
        int next = (w + 1) & QMASK;

        // Full: drop this packet for this target
        if (next == t->rpos.load(std::memory_order_acquire)) {
            t->dropped.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        auto& pkt = t->ring[w];
        std::memcpy(pkt.data, data, len);
        pkt.len = len;

        t->wpos.store(next, std::memory_order_release);
    }
}

bool OscSender::send(const OscMessage& msg) {
    if (!m_connected) return false;

    std::vector<char> bytes = msg.serialize();
    if (bytes.size() > static_cast<size_t>(MAX_PACKET)) {
        LOG_WARN("OSC: " + msg.getPath() + " too large (" + std::to_string(bytes.size()) + " bytes)");
        return false;
    }

    enqueueAll(bytes.data(), static_cast<int>(bytes.size()));
    return true;
}

// ============================================================================
// Target thread: drain ringbuffer, sendto() on non-blocking socket
// ============================================================================

void OscSender::targetThreadFunc(Target* t) {
    while (t->running) {
        int r = t->rpos.load(std::memory_order_relaxed);
        int w = t->wpos.load(std::memory_order_acquire);

        if (r == w) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }

        while (r != w) {
            auto& pkt = t->ring[r];
            ssize_t sent = sendto(t->sockfd, pkt.data, pkt.len, MSG_DONTWAIT,
                                  reinterpret_cast<const struct sockaddr*>(&t->addr),
                                  sizeof(t->addr));
            if (sent < 0) {
                // UDP, unreachable peers are not fatal
                t->sendErrors.fetch_add(1, std::memory_order_relaxed);
            }
            r = (r + 1) & QMASK;
        }

        t->rpos.store(r, std::memory_order_release);
    }
}

} // namespace OSC
} // namespace PulseAnalyzer
