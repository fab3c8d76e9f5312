#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// telemetry_sender.h  –  Stream Detector Events & Live State over UDP
//
// Protocol:  one JSON object per datagram.
//
//   {"event":"phase_changed","phase":"<phase>","timestamp":<s>}
//   {"event":"swing_completed","analytics":{...}}
//   {"event":"live","timestamp_ms":<uint64>,"state":{...},"session":{...}}
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_detector.h"

#include <netinet/in.h>

#include <cstdint>
#include <string>

namespace swing {

class TelemetrySender {
public:
    TelemetrySender() = default;
    ~TelemetrySender();

    TelemetrySender(const TelemetrySender&) = delete;
    TelemetrySender& operator=(const TelemetrySender&) = delete;

    /// Initialise the UDP socket.
    /// @param host  destination IPv4 address (e.g. "127.0.0.1")
    /// @param port  destination port (e.g. 7001)
    bool init(const std::string& host, uint16_t port);

    /// Forward one detector event.
    bool send_event(const SwingEvent& ev);

    /// Send the current phase, live readouts and session summary.
    bool send_live(const DetectorSnapshot& snap);

    bool is_open() const { return sock_fd_ >= 0; }

    void close();

private:
    bool send_datagram(const std::string& payload);

    int sock_fd_ = -1;
    ::sockaddr_in dest_addr_{};
};

}  // namespace swing
