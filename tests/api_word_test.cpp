#include <gtest/gtest.h>

#include "api_word.hpp"
#include "errors.hpp"

TEST( ApiWordTest, LengthPrefixBoundaries ) {
    EXPECT_EQ( encodeLength( 0 ), std::vector<uint8_t>( { 0x00 } ) );
    EXPECT_EQ( encodeLength( 0x7F ), std::vector<uint8_t>( { 0x7F } ) );
    EXPECT_EQ( encodeLength( 0x80 ), std::vector<uint8_t>( { 0x80, 0x80 } ) );
    EXPECT_EQ( encodeLength( 0x3FFF ), std::vector<uint8_t>( { 0xBF, 0xFF } ) );
    EXPECT_EQ( encodeLength( 0x4000 ), std::vector<uint8_t>( { 0xC0, 0x40, 0x00 } ) );
    EXPECT_EQ( encodeLength( 0x1FFFFF ), std::vector<uint8_t>( { 0xDF, 0xFF, 0xFF } ) );
    EXPECT_EQ( encodeLength( 0x200000 ), std::vector<uint8_t>( { 0xE0, 0x20, 0x00, 0x00 } ) );
    EXPECT_EQ( encodeLength( 0xFFFFFFF ), std::vector<uint8_t>( { 0xEF, 0xFF, 0xFF, 0xFF } ) );
    EXPECT_EQ( encodeLength( 0x10000000 ), std::vector<uint8_t>( { 0xF0, 0x10, 0x00, 0x00, 0x00 } ) );
}

TEST( ApiWordTest, DecodeMatchesEncode ) {
    for( uint32_t len: { 0u, 1u, 0x7Fu, 0x80u, 0x3FFFu, 0x4000u, 0x1FFFFFu, 0x200000u, 0xFFFFFFFu, 0x10000000u, 0xFFFFFFFFu } ) {
        auto enc = encodeLength( len );
        ASSERT_EQ( prefixSize( enc[ 0 ] ), enc.size() ) << len;
        EXPECT_EQ( decodeLength( enc.data(), enc.size() ), len );
    }
}

TEST( ApiWordTest, ControlByteIsMalformed ) {
    EXPECT_EQ( prefixSize( 0xF1 ), 0 );
    EXPECT_EQ( prefixSize( 0xFF ), 0 );

    WordDecoder dec;
    uint8_t data[] { 0xF8, 0x01 };
    dec.feed( data, sizeof( data ) );
    EXPECT_THROW( dec.next(), ApiProtocolError );
}

TEST( ApiWordTest, SentenceEndsWithZeroLengthWord ) {
    auto enc = encodeSentence( { "/login", "=name=admin" } );
    std::vector<uint8_t> expected { 6, '/', 'l', 'o', 'g', 'i', 'n', 11, '=', 'n', 'a', 'm', 'e', '=', 'a', 'd', 'm', 'i', 'n', 0 };
    EXPECT_EQ( enc, expected );
}

TEST( ApiWordTest, DecoderWaitsForWholeWord ) {
    std::string long_word( 200, 'x' );
    auto enc = encodeSentence( { "!re", "=comment=" + long_word } );
    auto enc2 = encodeSentence( { "!done" } );
    enc.insert( enc.end(), enc2.begin(), enc2.end() );

    SentenceDecoder dec;
    std::vector<api_sentence_t> got;
    // one byte at a time, prefixes are split too
    for( auto b: enc ) {
        dec.feed( &b, 1 );
        while( auto s = dec.next() ) {
            got.push_back( *s );
        }
    }

    ASSERT_EQ( got.size(), 2 );
    EXPECT_EQ( got[ 0 ], api_sentence_t( { "!re", "=comment=" + long_word } ) );
    EXPECT_EQ( got[ 1 ], api_sentence_t( { "!done" } ) );
    EXPECT_TRUE( dec.empty() );
}

TEST( ApiWordTest, SplitAttribute ) {
    auto attr = splitAttribute( "=rate-limit=10k/20k" );
    ASSERT_TRUE( attr.has_value() );
    EXPECT_EQ( attr->first, "rate-limit" );
    EXPECT_EQ( attr->second, "10k/20k" );

    attr = splitAttribute( "=comment=a=b" );
    ASSERT_TRUE( attr.has_value() );
    EXPECT_EQ( attr->first, "comment" );
    EXPECT_EQ( attr->second, "a=b" );

    attr = splitAttribute( "=empty=" );
    ASSERT_TRUE( attr.has_value() );
    EXPECT_EQ( attr->second, "" );

    EXPECT_FALSE( splitAttribute( "!re" ).has_value() );
    EXPECT_FALSE( splitAttribute( "=novalue" ).has_value() );
}

TEST( ApiWordTest, ParseReplyRecords ) {
    auto reply = parseReply( {
        "!re", "=.id=*1", "=name=alice",
        "!re", "=.id=*2", "=name=bob",
        "!done", "=ret=2"
    } );

    EXPECT_FALSE( reply.trap );
    EXPECT_FALSE( reply.fatal );
    ASSERT_EQ( reply.records.size(), 2 );
    EXPECT_EQ( reply.records[ 0 ].at( ".id" ), "*1" );
    EXPECT_EQ( reply.records[ 1 ].at( "name" ), "bob" );
    EXPECT_EQ( reply.done.at( "ret" ), "2" );
}

TEST( ApiWordTest, ParseReplyTrap ) {
    auto reply = parseReply( { "!trap", "=category=0", "=message=no such item", "!done" } );
    EXPECT_TRUE( reply.trap );
    EXPECT_EQ( reply.message, "no such item" );
    EXPECT_TRUE( reply.records.empty() );
}

TEST( ApiWordTest, ParseReplyFatal ) {
    auto reply = parseReply( { "!fatal", "session", "terminated" } );
    EXPECT_TRUE( reply.fatal );
    EXPECT_EQ( reply.message, "session terminated" );
}

TEST( ApiWordTest, FinalSentence ) {
    EXPECT_TRUE( isFinalSentence( { "!done" } ) );
    EXPECT_TRUE( isFinalSentence( { "!fatal", "x" } ) );
    EXPECT_FALSE( isFinalSentence( { "!re" } ) );
    EXPECT_FALSE( isFinalSentence( { "!trap", "=message=x" } ) );
    EXPECT_FALSE( isFinalSentence( {} ) );
}
