#pragma once

#include <cstdint>
#include <string>

#include "tftpkit/protocol/tftp_types.h"

namespace tftpkit::config {

struct EngineConfig {
    // Mode used for requests this engine initiates.
    protocol::Mode defaultMode{protocol::Mode::Binary};

    // Upper bound for an incoming file; 0 means unlimited.
    std::uint64_t maxReceiveBytes{0};

    // Keep a copy of the last outbound datagram so the caller can resend it.
    bool retainLastPacket{true};

    // Message used by abort() when the caller gives none.
    std::string defaultErrorMessage{"Unknown error"};
};

// Abstract storage interface.
class EngineConfigStore {
public:
    virtual ~EngineConfigStore() = default;

    virtual EngineConfig load() = 0;
    virtual void         save(const EngineConfig& cfg) = 0;
};

} // namespace tftpkit::config
