// ─────────────────────────────────────────────────────────────────────────────
// telemetry_sender.cpp  –  UDP JSON Telemetry
// ─────────────────────────────────────────────────────────────────────────────

#include "telemetry_sender.h"
#include "swing_json.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <iostream>

namespace swing {

// Keep datagrams under a typical MTU
static constexpr std::size_t kMaxDatagram = 1400;

TelemetrySender::~TelemetrySender() {
    close();
}

bool TelemetrySender::init(const std::string& host, uint16_t port) {
    close();

    sock_fd_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_fd_ < 0) {
        std::cerr << "[Telemetry] socket() failed\n";
        return false;
    }

    dest_addr_ = sockaddr_in{};
    dest_addr_.sin_family = AF_INET;
    dest_addr_.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &dest_addr_.sin_addr) <= 0) {
        std::cerr << "[Telemetry] Invalid address: " << host << "\n";
        close();
        return false;
    }

    std::cout << "[Telemetry] Sending to " << host << ":" << port << "\n";
    return true;
}

bool TelemetrySender::send_event(const SwingEvent& ev) {
    return send_datagram(event_json(ev));
}

bool TelemetrySender::send_live(const DetectorSnapshot& snap) {
    auto now = std::chrono::steady_clock::now();
    uint64_t ts_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         now.time_since_epoch())
                         .count();

    char head[64];
    std::snprintf(head, sizeof(head),
                  "{\"event\":\"live\",\"timestamp_ms\":%" PRIu64 ",", ts_ms);

    return send_datagram(std::string(head) +
                         "\"state\":" + live_json(snap) + "," +
                         "\"session\":" + session_json(snap.session) + "}");
}

bool TelemetrySender::send_datagram(const std::string& payload) {
    if (sock_fd_ < 0) return false;

    if (payload.size() > kMaxDatagram) {
        std::cerr << "[Telemetry] Payload too large (" << payload.size() << " bytes)\n";
        return false;
    }

    ssize_t sent = sendto(sock_fd_, payload.data(), payload.size(), 0,
                          reinterpret_cast<const sockaddr*>(&dest_addr_),
                          sizeof(dest_addr_));
    if (sent < 0) {
        std::cerr << "[Telemetry] sendto() failed\n";
        return false;
    }
    return true;
}

void TelemetrySender::close() {
    if (sock_fd_ >= 0) {
        ::close(sock_fd_);
        sock_fd_ = -1;
    }
}

}  // namespace swing
