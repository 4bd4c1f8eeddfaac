#pragma once

#include <string>
#include <memory>
#include <functional>
#include <vector>
#include <atomic>
#include <thread>
#include <netinet/in.h>
#include "osc_messages.h"

namespace PulseAnalyzer {
namespace OSC {

/**
 * OSC sender: one thread + socket per target host.
 *
 * - send() serializes once and copies into each target's ringbuffer.
 * - Each target thread does sendto() on its own non-blocking UDP socket.
 * - A full ringbuffer drops the packet for that target only.
 */
class OscSender {
public:
    OscSender();
    ~OscSender();

    OscSender(const OscSender&) = delete;
    OscSender& operator=(const OscSender&) = delete;

    void addTarget(const std::string& name, const std::string& host, int port);
    bool initialize();
    void shutdown();

    bool send(const OscMessage& msg);

    bool isConnected() const { return m_connected; }
    size_t getTargetCount() const { return m_targets.size(); }

    using ErrorCallback = std::function<void(const std::string&)>;
    void setErrorCallback(ErrorCallback cb) { m_errorCallback = cb; }

    // "host:port" or "host" (port 9000)
    static bool parseHostPort(const std::string& value, std::string& host, int& port);

private:
    static constexpr int MAX_PACKET = 512;

    struct Packet {
        char data[MAX_PACKET];
        int len = 0;
    };

    static constexpr int QSIZE = 256;  // power of 2
    static constexpr int QMASK = QSIZE - 1;

    struct Target {
        std::string name;
        std::string host;
        int port = 0;
        int sockfd = -1;
        struct sockaddr_in addr;

        // SPSC ringbuffer
        Packet ring[QSIZE];
        alignas(64) std::atomic<int> wpos{0};
        alignas(64) std::atomic<int> rpos{0};

        std::thread thread;
        std::atomic<bool> running{false};
        std::atomic<uint32_t> dropped{0};
        std::atomic<uint32_t> sendErrors{0};
    };

    std::vector<std::unique_ptr<Target>> m_targets;
    bool m_connected = false;
    ErrorCallback m_errorCallback;

    void enqueueAll(const char* data, int len);
    static void targetThreadFunc(Target* t);
};

using OscSenderPtr = std::shared_ptr<OscSender>;

} // namespace OSC
} // namespace PulseAnalyzer
