#pragma once

#include "channel/payload.hpp"
#include "model/alert.hpp"
#include "model/peer_message.hpp"
#include "model/reading.hpp"
#include "model/telemetry.hpp"

namespace factory_sim::channel {

// Every decoder throws core::DecodeError on a missing required key or a malformed
// value and ignores keys it does not know.

Payload encode_reading(const model::Reading& reading);
model::Reading decode_reading(const Payload& payload);

Payload encode_alert(const model::Alert& alert);

Payload encode_peer_message(const model::PeerMessage& message);
model::PeerMessage decode_peer_message(const Payload& payload);

Payload encode_controller_telemetry(const model::ControllerTelemetry& telemetry);
model::ControllerTelemetry decode_controller_telemetry(const Payload& payload);

Payload encode_sorting_summary(const model::SortingSummary& summary);
model::SortingSummary decode_sorting_summary(const Payload& payload);

}  // namespace factory_sim::channel
