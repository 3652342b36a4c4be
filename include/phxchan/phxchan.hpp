#pragma once

// Phoenix channels client: one websocket connection actor multiplexing
// topic subscriptions, request/reply correlation and heartbeats.

#include "phxchan/channel.hpp"
#include "phxchan/connection.hpp"
#include "phxchan/envelope.hpp"
#include "phxchan/error.hpp"
#include "phxchan/mailbox.hpp"
#include "phxchan/options.hpp"
#include "phxchan/subscription.hpp"
#include "phxchan/transport.hpp"
#include "phxchan/ws_transport.hpp"
