//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_SHARED_STATE_HPP
#define RCFACADE_INCLUDE_SHARED_STATE_HPP

#include <memory>

#include "credential_store.hpp"
#include "services/http_client.hpp"
#include "services/message_client.hpp"
#include "services/room_client.hpp"
#include "services/session_manager.hpp"

namespace rcfacade {

// Singleton objects shared by all connections. The services hold references
// to each other, so this object can't be copied or moved.
class shared_state
{
    credential_store store_;
    std::unique_ptr<http_client> http_;
    session_manager sessions_;
    room_client rooms_;
    message_client messages_;

public:
    shared_state(upstream_config config, std::unique_ptr<http_client> http);
    shared_state(const shared_state&) = delete;
    shared_state(shared_state&&) = delete;
    shared_state& operator=(const shared_state&) = delete;
    shared_state& operator=(shared_state&&) = delete;
    ~shared_state();

    session_manager& sessions() noexcept { return sessions_; }
    room_client& rooms() noexcept { return rooms_; }
    message_client& messages() noexcept { return messages_; }
};

}  // namespace rcfacade

#endif
