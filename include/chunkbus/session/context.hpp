#pragma once

#include "chunkbus/core/config.hpp"
#include "chunkbus/events/event_bus.hpp"
#include "chunkbus/state/state_store.hpp"
#include "chunkbus/transport/transport.hpp"

namespace chunkbus::session {

/**
 * @brief Collaborators shared by every session of a service
 *
 * All references must outlive the sessions built on them.
 */
struct SessionContext {
    transport::Transport& transport;
    state::TransferStateStore& store;
    events::EventBus& bus;
    const TransferConfig& config;
};

} // namespace chunkbus::session
