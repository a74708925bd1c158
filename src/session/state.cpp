#include "chunkbus/session/state.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace chunkbus::session {
namespace {

template<typename State>
bool allowed(const std::unordered_map<State, std::vector<State>>& transitions, State current, State target) {
    if (current == target) {
        return true;
    }
    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(PublisherState state) {
    switch (state) {
        case PublisherState::Idle: return "Idle";
        case PublisherState::Sending: return "Sending";
        case PublisherState::AwaitingAck: return "AwaitingAck";
        case PublisherState::Acked: return "Acked";
        case PublisherState::Failed: return "Failed";
    }
    return "Unknown";
}

const char* to_string(SubscriberState state) {
    switch (state) {
        case SubscriberState::AwaitingMeta: return "AwaitingMeta";
        case SubscriberState::Receiving: return "Receiving";
        case SubscriberState::Verifying: return "Verifying";
        case SubscriberState::Complete: return "Complete";
        case SubscriberState::Mismatched: return "Mismatched";
    }
    return "Unknown";
}

bool can_transition(PublisherState current, PublisherState target) noexcept {
    // Idle -> Acked covers resuming a record that was already acknowledged.
    static const std::unordered_map<PublisherState, std::vector<PublisherState>> transitions {
        {PublisherState::Idle, {PublisherState::Sending, PublisherState::Acked, PublisherState::Failed}},
        {PublisherState::Sending, {PublisherState::AwaitingAck, PublisherState::Failed}},
        {PublisherState::AwaitingAck, {PublisherState::Sending, PublisherState::Acked, PublisherState::Failed}},
    };
    return allowed(transitions, current, target);
}

bool can_transition(SubscriberState current, SubscriberState target) noexcept {
    static const std::unordered_map<SubscriberState, std::vector<SubscriberState>> transitions {
        {SubscriberState::AwaitingMeta, {SubscriberState::Receiving}},
        {SubscriberState::Receiving, {SubscriberState::Verifying}},
        {SubscriberState::Verifying, {SubscriberState::Complete, SubscriberState::Mismatched, SubscriberState::Receiving}},
        {SubscriberState::Mismatched, {SubscriberState::Receiving}},
    };
    return allowed(transitions, current, target);
}

} // namespace chunkbus::session
