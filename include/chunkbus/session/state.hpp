#pragma once

namespace chunkbus::session {

enum class PublisherState {
    Idle,
    Sending,
    AwaitingAck,
    Acked,
    Failed
};

enum class SubscriberState {
    AwaitingMeta,
    Receiving,
    Verifying,
    Complete,
    Mismatched
};

const char* to_string(PublisherState state);
const char* to_string(SubscriberState state);

/// Staying in the same state is always allowed; Acked, Failed and Complete are terminal.
bool can_transition(PublisherState current, PublisherState target) noexcept;
bool can_transition(SubscriberState current, SubscriberState target) noexcept;

} // namespace chunkbus::session
