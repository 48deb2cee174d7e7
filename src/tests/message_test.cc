#include <gtest/gtest.h>

#include <string>

#include "messages/message.hh"
#include "messages/utils.hh"

using namespace std;
using namespace fanout;

using OpCode = Message::OpCode;

TEST( Message, HeaderLayout )
{
  const Message message { 0x0102030405060708, OpCode::Completion, "abc" };
  const string frame = message.str();

  ASSERT_EQ( Message::HEADER_LENGTH + 3, frame.length() );
  EXPECT_EQ( string( "\x01\x02\x03\x04\x05\x06\x07\x08", 8 ), frame.substr( 0, 8 ) );
  EXPECT_EQ( string( "\x00\x00\x00\x03", 4 ), frame.substr( 8, 4 ) );
  EXPECT_EQ( static_cast<char>( OpCode::Completion ), frame[12] );
  EXPECT_EQ( "abc", frame.substr( 13 ) );
}

TEST( MessageParser, ReassemblesSplitFrames )
{
  string stream = Message( 1, OpCode::Hey, "hello" ).str()
                  + Message( 0, OpCode::Shutdown ).str()
                  + Message( 2, OpCode::Completion, string( 1000, 'x' ) ).str();

  MessageParser parser;

  /* one byte at a time */
  for ( const char c : stream ) {
    parser.parse( string_view { &c, 1 } );
  }

  EXPECT_FALSE( parser.mid_frame() );
  ASSERT_EQ( 3u, parser.size() );

  EXPECT_EQ( OpCode::Hey, parser.front().opcode() );
  EXPECT_EQ( 1u, parser.front().sender_id() );
  EXPECT_EQ( "hello", parser.front().payload() );
  parser.pop();

  EXPECT_EQ( OpCode::Shutdown, parser.front().opcode() );
  EXPECT_TRUE( parser.front().payload().empty() );
  parser.pop();

  EXPECT_EQ( 1000u, parser.front().payload_length() );
  parser.pop();

  EXPECT_TRUE( parser.empty() );
}

TEST( MessageParser, PartialFrameIsPending )
{
  const string frame = Message( 3, OpCode::Dispatch, "payload" ).str();

  MessageParser parser;
  parser.parse( string_view { frame }.substr( 0, 15 ) );

  EXPECT_TRUE( parser.empty() );
  EXPECT_TRUE( parser.mid_frame() );

  parser.parse( string_view { frame }.substr( 15 ) );
  ASSERT_EQ( 1u, parser.size() );
  EXPECT_EQ( "payload", parser.front().payload() );
}

TEST( MessageParser, RejectsBadOpcode )
{
  string frame = Message( 0, OpCode::Hey, "x" ).str();
  frame[12] = 0x7f;

  MessageParser parser;
  EXPECT_THROW( parser.parse( frame ), runtime_error );
}

TEST( MessageParser, RejectsOversizedPayload )
{
  string header = put_field( uint64_t { 0 } ) + put_field( uint32_t { 0xffffffff } );
  header += static_cast<char>( OpCode::Dispatch );

  MessageParser parser;
  EXPECT_THROW( parser.parse( header ), runtime_error );
}

TEST( Protobuf, DispatchCarriesBatch )
{
  Batch batch { 7, {} };
  batch.tasks.push_back( { 3, "three", 1.5 } );
  batch.tasks.push_back( { 4, "four", nullopt } );

  protobuf::Dispatch proto;
  protoutil::from_string( protoutil::to_string( to_protobuf( batch, true ) ),
                          proto );

  EXPECT_EQ( 7u, proto.batch_id() );
  EXPECT_TRUE( proto.stop_on_failure() );
  ASSERT_EQ( 2, proto.tasks_size() );

  const Task first = from_protobuf( proto.tasks( 0 ) );
  const Task second = from_protobuf( proto.tasks( 1 ) );

  EXPECT_EQ( 3u, first.id );
  EXPECT_EQ( "three", first.payload );
  EXPECT_EQ( 1.5, first.estimated_cost.value_or( 0 ) );
  EXPECT_FALSE( second.estimated_cost.has_value() );
}

TEST( Protobuf, GarbageDoesNotParse )
{
  protobuf::Completion proto;
  EXPECT_THROW( protoutil::from_string( string( "\xff\xff\xff", 3 ), proto ),
                runtime_error );
}
