/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "message.hh"

#include <algorithm>
#include <stdexcept>

using namespace std;
using namespace fanout;

constexpr char const*
  Message::OPCODE_NAMES[to_underlying( Message::OpCode::COUNT )];

Message::Message( const string_view header, string&& payload )
  : payload_( move( payload ) )
{
  if ( header.length() != HEADER_LENGTH ) {
    throw out_of_range( "incomplete header" );
  }

  sender_id_ = get_field<uint64_t>( header );
  payload_length_ = get_field<uint32_t>( header.substr( 8 ) );
  opcode_ = static_cast<OpCode>( header[12] );

  if ( payload_length_ != payload_.length() ) {
    throw runtime_error( "payload length does not match header" );
  }

  if ( to_underlying( opcode_ ) < to_underlying( OpCode::Hey )
       or to_underlying( opcode_ ) >= to_underlying( OpCode::COUNT ) ) {
    throw runtime_error( "invalid opcode: "
                         + to_string( static_cast<int>( header[12] ) ) );
  }
}

Message::Message( const uint64_t sender_id,
                  const OpCode opcode,
                  string&& payload )
  : sender_id_( sender_id )
  , payload_length_( static_cast<uint32_t>( payload.length() ) )
  , opcode_( opcode )
  , payload_( move( payload ) )
{
  if ( payload_.length() > MAX_PAYLOAD_LENGTH ) {
    throw runtime_error( "message payload too large" );
  }
}

void Message::serialize_header( string& output ) const
{
  output.reserve( output.length() + HEADER_LENGTH );

  output += put_field( sender_id_ );
  output += put_field( payload_length_ );
  output += to_underlying( opcode_ );
}

string Message::str() const
{
  string output;
  output.reserve( total_length() );
  serialize_header( output );
  output += payload_;
  return output;
}

string Message::info() const
{
  return string( OPCODE_NAMES[to_underlying( opcode_ )] ) + " (sender="
         + to_string( sender_id_ ) + ", " + to_string( payload_length_ )
         + " bytes)";
}

uint32_t Message::expected_payload_length( const string_view header )
{
  return ( header.length() < HEADER_LENGTH )
           ? 0
           : get_field<uint32_t>( header.substr( 8, 4 ) );
}

void MessageParser::complete_message()
{
  expected_payload_length_.reset();

  completed_messages_.emplace( incomplete_header_,
                               move( incomplete_payload_ ) );

  incomplete_header_.clear();
  incomplete_payload_.clear();
}

size_t MessageParser::parse( string_view buf )
{
  const size_t consumed_bytes = buf.length();

  while ( not buf.empty() ) {
    if ( not expected_payload_length_.has_value() ) {
      const auto remaining_length = min(
        buf.length(), Message::HEADER_LENGTH - incomplete_header_.length() );

      incomplete_header_.append( buf.substr( 0, remaining_length ) );
      buf.remove_prefix( remaining_length );

      if ( incomplete_header_.length() == Message::HEADER_LENGTH ) {
        expected_payload_length_
          = Message::expected_payload_length( incomplete_header_ );

        if ( *expected_payload_length_ > Message::MAX_PAYLOAD_LENGTH ) {
          throw runtime_error( "MessageParser: payload length out of range" );
        }

        incomplete_payload_.reserve( *expected_payload_length_ );

        if ( *expected_payload_length_ == 0 ) {
          complete_message();
          continue;
        }
      }
    }

    if ( expected_payload_length_.has_value() and not buf.empty() ) {
      const auto remaining_length
        = min( buf.length(),
               *expected_payload_length_ - incomplete_payload_.length() );

      incomplete_payload_.append( buf.substr( 0, remaining_length ) );
      buf.remove_prefix( remaining_length );

      if ( incomplete_payload_.length() == *expected_payload_length_ ) {
        complete_message();
      }
    }
  }

  return consumed_bytes;
}
