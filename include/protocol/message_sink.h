#pragma once

/**
 * @file message_sink.h
 * @brief Outbound message channel of one session
 */

#include "protocol/messages.h"

namespace samaira {
namespace protocol {

/**
 * @brief Ordered outbound channel
 *
 * send() must be safe to call from several threads; messages from one
 * thread reach the peer in call order. After the peer is gone send()
 * drops the message and returns false.
 */
class IMessageSink {
public:
    virtual ~IMessageSink() = default;
    virtual bool send(const ServerMessage& message) = 0;
};

} // namespace protocol
} // namespace samaira
