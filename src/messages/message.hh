/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstdint>
#include <optional>
#include <queue>
#include <string>
#include <string_view>

#include "util/util.hh"

namespace fanout {

/* Frame layout: sender id (8 bytes), payload length (4 bytes), opcode
   (1 byte), all big-endian, followed by the payload. The sender id is the
   worker slot; the coordinator sends with id 0. */
class Message
{
public:
  enum class OpCode : char
  {
    Hey = 0x1,
    Dispatch,
    Completion,
    Shutdown,

    COUNT
  };

  static constexpr char const* OPCODE_NAMES[to_underlying( OpCode::COUNT )]
    = { "", "Hey", "Dispatch", "Completion", "Shutdown" };

  constexpr static size_t HEADER_LENGTH = 13;

  /* anything larger is a corrupt stream, not a real batch */
  constexpr static uint32_t MAX_PAYLOAD_LENGTH = 1u << 30;

private:
  uint64_t sender_id_ { 0 };
  uint32_t payload_length_ { 0 };
  OpCode opcode_ { OpCode::Hey };
  std::string payload_ {};

public:
  Message( const std::string_view header, std::string&& payload );

  Message( const uint64_t sender_id,
           const OpCode opcode,
           std::string&& payload = {} );

  uint64_t sender_id() const { return sender_id_; }
  uint32_t payload_length() const { return payload_length_; }
  OpCode opcode() const { return opcode_; }
  const std::string& payload() const { return payload_; }

  void serialize_header( std::string& output ) const;

  /* header and payload, ready to be written */
  std::string str() const;

  std::string info() const;

  size_t total_length() const { return HEADER_LENGTH + payload_length(); }
  static uint32_t expected_payload_length( const std::string_view header );
};

class MessageParser
{
private:
  std::optional<size_t> expected_payload_length_ { std::nullopt };

  std::string incomplete_header_ {};
  std::string incomplete_payload_ {};

  std::queue<Message> completed_messages_ {};

  void complete_message();

public:
  size_t parse( std::string_view buf );

  bool empty() const { return completed_messages_.empty(); }
  Message& front() { return completed_messages_.front(); }
  void pop() { completed_messages_.pop(); }

  size_t size() const { return completed_messages_.size(); }

  /* true while a frame has been started but not finished */
  bool mid_frame() const
  {
    return not incomplete_header_.empty() or expected_payload_length_.has_value();
  }
};

} // namespace fanout
