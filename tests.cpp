#include "mpc.hpp"
#include "gtest/gtest.h"

#include <spdlog/sinks/ostream_sink.h>

#include <cstring>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace
{
    using mpc::mp_u8;
    using Bytes = std::vector< mp_u8 >;

    std::string hex( const Bytes &bytes )
    {
        static const char digits[ ] = "0123456789abcdef";

        std::string text;
        text.reserve( bytes.size( ) * 2 );

        for ( const auto byte : bytes )
        {
            text.push_back( digits[ byte >> 4 ] );
            text.push_back( digits[ byte & 0xf ] );
        }

        return text;
    }

    Bytes unhex( const std::string &text )
    {
        Bytes bytes;

        for ( std::size_t index = 0; index + 1 < text.size( ); index += 2 )
            bytes.push_back( static_cast< mp_u8 >( std::stoul( text.substr( index, 2 ), nullptr, 16 ) ) );

        return bytes;
    }

    std::string encode_hex( const mpc::Value &value )
    {
        const auto result = mpc::encode( value );

        EXPECT_TRUE( result ) << mpc::to_string( result.error );

        return hex( result.bytes );
    }

    /**
     * @brief Encode, decode, and check that the decoder consumed exactly what the encoder produced.
     */
    mpc::Value round_trip( const mpc::Value &value )
    {
        const auto encoded = mpc::encode( value );
        EXPECT_TRUE( encoded );

        const auto decoded = mpc::decode( encoded.bytes );
        EXPECT_TRUE( decoded ) << mpc::to_string( decoded.error );
        EXPECT_EQ( decoded.size, encoded.bytes.size( ) );

        return decoded.value;
    }

    const char lorem[ ] =
        "Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod tempor incididunt ut labore et dolore magna aliqua."
        "Ut enim ad minim veniam, quis nostrud exercitation ullamco laboris nisi ut aliquip ex ea commodo consequat."
        "Duis aute irure dolor in reprehenderit in voluptate velit esse cillum dolore eu fugiat nulla pariatur."
        "Excepteur sint occaecat cupidatat non proident, sunt in culpa qui officia deserunt mollit anim id est laborum.";

    const char lorem_ru[ ] =
        "\xd0\x94\xd0\xb0\xd0\xb2\xd0\xbd\xd0\xbe \xd0\xb2\xd1\x8b\xd1\x8f\xd1\x81\xd0\xbd\xd0\xb5\xd0\xbd\xd0\xbe, "
        "\xd1\x87\xd1\x82\xd0\xbe \xd0\xbf\xd1\x80\xd0\xb8 \xd0\xbe\xd1\x86\xd0\xb5\xd0\xbd\xd0\xba\xd0\xb5 "
        "\xd0\xb4\xd0\xb8\xd0\xb7\xd0\xb0\xd0\xb9\xd0\xbd\xd0\xb0 \xd0\xb8 "
        "\xd0\xba\xd0\xbe\xd0\xbc\xd0\xbf\xd0\xbe\xd0\xb7\xd0\xb8\xd1\x86\xd0\xb8\xd0\xb8.";
}

namespace integers
{
    class IntegerFixture : public testing::Test
    {
    protected:
        Bytes buffer { };
        mpc::Writer writer { buffer };
    };

    TEST_F( IntegerFixture, TestFixInt )
    {
        EXPECT_EQ( "2d", encode_hex( 45 ) );
        EXPECT_EQ( "f4", encode_hex( -12 ) );
        EXPECT_EQ( "00", encode_hex( 0 ) );
        EXPECT_EQ( "7f", encode_hex( 0x7f ) );
        EXPECT_EQ( "ff", encode_hex( -1 ) );
        EXPECT_EQ( "e0", encode_hex( -32 ) );
    }

    TEST_F( IntegerFixture, TestUnsignedBoundaries )
    {
        EXPECT_EQ( "cc80", encode_hex( 0x80 ) );
        EXPECT_EQ( "ccff", encode_hex( 0xff ) );
        EXPECT_EQ( "cd0100", encode_hex( 0x100 ) );
        EXPECT_EQ( "cdffff", encode_hex( 0xffff ) );
        EXPECT_EQ( "ce00010000", encode_hex( 0x10000 ) );
        EXPECT_EQ( "ce00010002", encode_hex( 65538 ) );
        EXPECT_EQ( "ceffffffff", encode_hex( 0xffffffffULL ) );
        EXPECT_EQ( "cf0000000100000000", encode_hex( 0x100000000ULL ) );
        EXPECT_EQ( "cfffffffffffffffff", encode_hex( 0xffffffffffffffffULL ) );
    }

    TEST_F( IntegerFixture, TestSignedBoundaries )
    {
        EXPECT_EQ( "d0df", encode_hex( -33 ) );
        EXPECT_EQ( "d080", encode_hex( -128 ) );
        EXPECT_EQ( "d1ff7f", encode_hex( -129 ) );
        EXPECT_EQ( "d18000", encode_hex( -32768 ) );
        EXPECT_EQ( "d2ffff7fff", encode_hex( -32769 ) );
        EXPECT_EQ( "d280000000", encode_hex( limits::int32_min ) );
        EXPECT_EQ( "d3ffffffff7fffffff", encode_hex( limits::int32_min - 1 ) );
        EXPECT_EQ( "d38000000000000000", encode_hex( limits::int64_min ) );
    }

    TEST_F( IntegerFixture, TestSignedTypeNonNegativeUsesUnsignedFamily )
    {
        EXPECT_EQ( "ccc8", encode_hex( static_cast< mpc::mp_i64 >( 200 ) ) );
        EXPECT_EQ( "cf7fffffffffffffff", encode_hex( static_cast< mpc::mp_i64 >( 0x7fffffffffffffffLL ) ) );
    }

    TEST_F( IntegerFixture, TestExplicitMarkers )
    {
        writer.write_integer( 45, mpc::MPMarker::PosFixInt )
              .write_integer( -12, mpc::MPMarker::NegFixInt )
              .write_integer( 65538, mpc::MPMarker::Uint16 )
              .write_integer( 4294967295ULL, mpc::MPMarker::Uint32 )
              .write_integer( 4294967297ULL, mpc::MPMarker::Uint32 )
              .write_integer( 2147483645, mpc::MPMarker::Int32 )
              .write_integer( 2147483649LL, mpc::MPMarker::Int32 );

        ASSERT_TRUE( writer );
        EXPECT_EQ( "2df4cd0002ceffffffffce00000001d27ffffffdd280000001", hex( buffer ) );

        mpc::Reader reader { buffer.data( ), buffer.size( ) };

        EXPECT_EQ( mpc::Value( 45 ), reader.decode_single( ).value );
        EXPECT_EQ( mpc::Value( -12 ), reader.decode_single( ).value );
        EXPECT_EQ( mpc::Value( 2 ), reader.decode_single( ).value );
        EXPECT_EQ( mpc::Value( 4294967295ULL ), reader.decode_single( ).value );
        EXPECT_EQ( mpc::Value( 1 ), reader.decode_single( ).value );
        EXPECT_EQ( mpc::Value( 2147483645 ), reader.decode_single( ).value );
        EXPECT_EQ( mpc::Value( static_cast< mpc::mp_i32 >( 0x80000001u ) ), reader.decode_single( ).value );
        EXPECT_EQ( 0u, reader.remaining( ) );
    }

    TEST_F( IntegerFixture, TestExplicitMarkerSignMismatch )
    {
        writer.write_integer( -5, mpc::MPMarker::Uint8 );

        EXPECT_EQ( mpc::EncodeError::UnsupportedValue, writer.error( ) );
        EXPECT_TRUE( buffer.empty( ) );

        writer.reset( );
        writer.write_integer( 5, mpc::MPMarker::NegFixInt );

        EXPECT_EQ( mpc::EncodeError::UnsupportedValue, writer.error( ) );

        writer.reset( );
        writer.write_integer( 5, mpc::MPMarker::Str8 );

        EXPECT_EQ( mpc::EncodeError::UnsupportedValue, writer.error( ) );
        EXPECT_TRUE( buffer.empty( ) );
    }

    TEST_F( IntegerFixture, TestRoundTrip )
    {
        const mpc::Value values[ ] = {
            0, 1, 0x7f, 0x80, 0xff, 0x100, 0xffff, 0x10000, 0xffffffffULL, 0x100000000ULL, 0xffffffffffffffffULL,
            -1, -32, -33, -128, -129, -32768, -32769, limits::int32_min, limits::int32_min - 1, limits::int64_min
        };

        for ( const auto &value : values )
            EXPECT_EQ( value, round_trip( value ) );
    }

    TEST_F( IntegerFixture, TestDecodeSignedFamilyWithPositiveValue )
    {
        const auto dr = mpc::decode( unhex( "d005" ) );

        ASSERT_TRUE( dr );
        EXPECT_EQ( mpc::MPMarker::Int8, dr.marker );
        EXPECT_EQ( mpc::Value( 5u ), dr.value );
        EXPECT_FALSE( dr.value.as< mpc::Integer >( ).is_negative( ) );
    }

    TEST_F( IntegerFixture, TestDecodeUint64KeepsSign )
    {
        const auto dr = mpc::decode( unhex( "cfffffffffffffffff" ) );

        ASSERT_TRUE( dr );
        EXPECT_FALSE( dr.value.as< mpc::Integer >( ).is_negative( ) );
        EXPECT_EQ( 0xffffffffffffffffULL, dr.value.as< mpc::Integer >( ).as_u64( ) );
    }
}

namespace floats
{
    TEST( Floats, TestFloat32 )
    {
        EXPECT_EQ( "ca4048f5c3", encode_hex( 3.14f ) );
        EXPECT_EQ( "ca40bfffd6", encode_hex( 5.99998f ) );
        EXPECT_EQ( "ca4476fec9", encode_hex( 987.981f ) );

        const auto dr = mpc::decode( unhex( "ca4048f5c3" ) );

        ASSERT_TRUE( dr );
        EXPECT_EQ( mpc::MPMarker::Float32, dr.marker );
        EXPECT_EQ( mpc::FloatWidth::F32, dr.value.as< mpc::Float >( ).width( ) );
        EXPECT_EQ( static_cast< double >( 3.14f ), dr.value.as< mpc::Float >( ).as_f64( ) );
    }

    TEST( Floats, TestFloat64IsNotNarrowed )
    {
        EXPECT_EQ( "cb40091eb851eb851f", encode_hex( 3.14 ) );

        const auto value = round_trip( 1.1 );

        EXPECT_EQ( mpc::FloatWidth::F64, value.as< mpc::Float >( ).width( ) );
        EXPECT_EQ( 1.1, value.as< mpc::Float >( ).as_f64( ) );
    }

    TEST( Floats, TestExplicitWidth )
    {
        Bytes buffer;
        mpc::Writer writer { buffer };

        writer.write_float( 3.14, mpc::MPMarker::Float32 ).write_float( 3.14, mpc::MPMarker::Float64 );

        ASSERT_TRUE( writer );
        EXPECT_EQ( "ca4048f5c3cb40091eb851eb851f", hex( buffer ) );

        writer.write_float( 1.0, mpc::MPMarker::Uint8 );

        EXPECT_EQ( mpc::EncodeError::UnsupportedValue, writer.error( ) );
        EXPECT_EQ( 14u, buffer.size( ) );
    }

    TEST( Floats, TestBitPatternEquality )
    {
        EXPECT_NE( mpc::Value( 0.0 ), mpc::Value( -0.0 ) );
        EXPECT_NE( mpc::Value( 1.5f ), mpc::Value( 1.5 ) );
        EXPECT_EQ( mpc::Value( -0.0 ), round_trip( -0.0 ) );
        EXPECT_EQ( mpc::Value( 1.5f ), round_trip( 1.5f ) );
    }

    TEST( Floats, TestFloat32BitsPreserved )
    {
        const mpc::mp_u32 bits = 0x7f800001; // signalling NaN
        float value = 0;
        std::memcpy( &value, &bits, sizeof( value ) );

        const auto result = mpc::encode( value );

        ASSERT_TRUE( result );
        EXPECT_EQ( "ca7f800001", hex( result.bytes ) );

        const auto dr = mpc::decode( result.bytes );

        ASSERT_TRUE( dr );

        const auto decoded = dr.value.as< mpc::Float >( ).as_f32( );
        mpc::mp_u32 decoded_bits = 0;
        std::memcpy( &decoded_bits, &decoded, sizeof( decoded_bits ) );

        EXPECT_EQ( bits, decoded_bits );
        EXPECT_EQ( mpc::Value( value ), dr.value );
    }
}

namespace strings
{
    TEST( Strings, TestFixStr )
    {
        EXPECT_EQ( "ab48656c6c6f20776f726c64", encode_hex( "Hello world" ) );
        EXPECT_EQ( "a0", encode_hex( "" ) );

        const auto dr = mpc::decode( unhex( "ab48656c6c6f20776f726c64" ) );

        ASSERT_TRUE( dr );
        EXPECT_EQ( mpc::MPMarker::FixStr, dr.marker );
        EXPECT_EQ( 12u, dr.size );
        EXPECT_EQ( "Hello world", dr.value.as< std::string >( ) );
    }

    TEST( Strings, TestLengthFamilies )
    {
        const std::pair< std::size_t, std::string > cases[ ] = {
            { 31, "bf" },
            { 32, "d920" },
            { 255, "d9ff" },
            { 256, "da0100" },
            { 65535, "daffff" },
            { 65536, "db00010000" }
        };

        for ( const auto &test : cases )
        {
            const auto result = mpc::encode( std::string( test.first, 'x' ) );

            ASSERT_TRUE( result );
            EXPECT_EQ( test.second, hex( Bytes( result.bytes.begin( ), result.bytes.begin( ) + test.second.size( ) / 2 ) ) )
                << "length " << test.first;
            EXPECT_EQ( test.first + test.second.size( ) / 2, result.bytes.size( ) );
            EXPECT_EQ( std::string( test.first, 'x' ), round_trip( std::string( test.first, 'x' ) ).as< std::string >( ) );
        }
    }

    TEST( Strings, TestMultiByteLengthCountsBytes )
    {
        const std::string text = lorem_ru;

        const auto result = mpc::encode( text );

        ASSERT_TRUE( result );
        EXPECT_EQ( "d9" + hex( Bytes { static_cast< mp_u8 >( text.size( ) ) } ), hex( result.bytes ).substr( 0, 4 ) );
        EXPECT_EQ( text, round_trip( text ).as< std::string >( ) );
    }

    TEST( Strings, TestExplicitMarker )
    {
        Bytes buffer;
        mpc::Writer writer { buffer };

        writer.write_str( "Hello world", 11, mpc::MPMarker::FixStr );

        ASSERT_TRUE( writer );
        EXPECT_EQ( "ab48656c6c6f20776f726c64", hex( buffer ) );

        buffer.clear( );
        writer.write_str( lorem, sizeof( lorem ) - 1, mpc::MPMarker::Str16 );

        ASSERT_TRUE( writer );
        EXPECT_EQ( "da01ba", hex( buffer ).substr( 0, 6 ) );
        EXPECT_EQ( 3 + 442u, buffer.size( ) );

        buffer.clear( );
        writer.write_str( "45", 2, mpc::MPMarker::Str8 );

        EXPECT_EQ( "d9023435", hex( buffer ) );

        buffer.clear( );
        writer.write_str( lorem, sizeof( lorem ) - 1, mpc::MPMarker::FixStr );

        EXPECT_EQ( mpc::EncodeError::ValueTooLarge, writer.error( ) );
        EXPECT_TRUE( buffer.empty( ) );

        writer.reset( );
        writer.write_str( "abc", 3, mpc::MPMarker::Bin8 );

        EXPECT_EQ( mpc::EncodeError::UnsupportedValue, writer.error( ) );
    }

    TEST( Strings, TestTooLarge )
    {
        Bytes buffer;
        mpc::Writer writer { buffer };

        /* length is rejected before the payload is touched */
        writer.write_str( "x", 0x100000000ULL );

        EXPECT_EQ( mpc::EncodeError::ValueTooLarge, writer.error( ) );
        EXPECT_TRUE( buffer.empty( ) );

        writer.write_nil( );

        EXPECT_TRUE( buffer.empty( ) );
    }

    TEST( Strings, TestInvalidUtf8Rejected )
    {
        const auto result = mpc::encode( std::string( "\xc3\x28" ) );

        EXPECT_EQ( mpc::EncodeError::UnsupportedValue, result.error );
        EXPECT_TRUE( result.bytes.empty( ) );

        /* nested strings are checked too, and nothing of the enclosing value is left behind */
        Bytes out = unhex( "c0" );

        EXPECT_EQ( mpc::EncodeError::UnsupportedValue,
                   mpc::encode_into( mpc::Array { "ok", std::string( "\xed\xa0\x80" ) }, out ) );
        EXPECT_EQ( "c0", hex( out ) );

        Bytes buffer;
        mpc::Writer writer { buffer };

        writer.write_str( "\xc3\x28", 2, mpc::MPMarker::Str8 );

        EXPECT_EQ( mpc::EncodeError::UnsupportedValue, writer.error( ) );
        EXPECT_TRUE( buffer.empty( ) );

        writer.reset( );
        writer.write_str( "\xc3\xa9", 2 );

        ASSERT_TRUE( writer );
        EXPECT_EQ( "a2c3a9", hex( buffer ) );
    }
}

namespace binary
{
    TEST( Binary, TestBin8 )
    {
        mpc::Binary bytes;

        for ( auto index = 0; index < 32; index++ )
            bytes.push_back( static_cast< mp_u8 >( index ) );

        EXPECT_EQ( "c420000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f", encode_hex( bytes ) );
        EXPECT_EQ( mpc::Value( bytes ), round_trip( bytes ) );
        EXPECT_EQ( "c400", encode_hex( mpc::Binary { } ) );
    }

    TEST( Binary, TestExplicitBin16 )
    {
        Bytes buffer;
        mpc::Writer writer { buffer };

        const mp_u8 payload[ ] = { 0x41, 0x41, 0x41, 0x41, 0x41 };

        writer.write_bin( payload, sizeof( payload ), mpc::MPMarker::Bin16 );

        ASSERT_TRUE( writer );
        EXPECT_EQ( "c500054141414141", hex( buffer ) );

        const auto dr = mpc::decode( buffer );

        ASSERT_TRUE( dr );
        EXPECT_EQ( mpc::MPMarker::Bin16, dr.marker );
        EXPECT_EQ( mpc::Value( mpc::Binary( 5, 0x41 ) ), dr.value );
    }

    TEST( Binary, TestLengthFamilies )
    {
        const std::pair< std::size_t, std::string > cases[ ] = {
            { 255, "c4ff" },
            { 256, "c50100" },
            { 65535, "c5ffff" },
            { 65536, "c600010000" }
        };

        for ( const auto &test : cases )
        {
            const mpc::Binary bytes( test.first, 0xab );
            const auto result = mpc::encode( bytes );

            ASSERT_TRUE( result );
            EXPECT_EQ( test.second, hex( result.bytes ).substr( 0, test.second.size( ) ) ) << "length " << test.first;
            EXPECT_EQ( mpc::Value( bytes ), round_trip( bytes ) );
        }
    }

    TEST( Binary, TestBinaryIsNotString )
    {
        EXPECT_NE( mpc::Value( mpc::Binary { 'a' } ), mpc::Value( "a" ) );
        EXPECT_TRUE( round_trip( mpc::Binary { 'a' } ).is_bin( ) );
    }
}

namespace containers
{
    TEST( Containers, TestEmpty )
    {
        EXPECT_EQ( "80", encode_hex( mpc::Map { } ) );
        EXPECT_EQ( "90", encode_hex( mpc::Array { } ) );
        EXPECT_TRUE( round_trip( mpc::Map { } ).is_map( ) );
        EXPECT_TRUE( round_trip( mpc::Array { } ).is_array( ) );
    }

    TEST( Containers, TestMixedArray )
    {
        const mpc::Array values = {
            0xca, 0xfe, 0xba, 0xbe,
            "Hello world", "45",
            mpc::Nil { }, mpc::Nil { },
            1.618f, 3.14f,
            mpc::Map { { "hello", "world" } }
        };

        EXPECT_EQ(
            "9bcccaccfeccbaccbe" "ab48656c6c6f20776f726c64" "a23435" "c0c0" "ca3fcf1aa0" "ca4048f5c3"
            "81a568656c6c6fa5776f726c64",
            encode_hex( values )
        );

        EXPECT_EQ( mpc::Value( values ), round_trip( values ) );
    }

    TEST( Containers, TestMapPreservesOrder )
    {
        const mpc::Map values = {
            { "Hello", "World" },
            { "A", mpc::Array { "B", "C", "D" } },
            { "user", mpc::Map { { "abc", "cba" } } },
            { "connected", false },
            { "authenticated", true },
            { "password", mpc::Nil { } }
        };

        EXPECT_EQ(
            "86a548656c6c6fa5576f726c64a14193a142a143a144a47573657281a3616263a3636261"
            "a9636f6e6e6563746564c2ad61757468656e74696361746564c3a870617373776f7264c0",
            encode_hex( values )
        );

        const auto decoded = round_trip( values );

        ASSERT_TRUE( decoded.is_map( ) );
        ASSERT_EQ( 6u, decoded.as< mpc::Map >( ).size( ) );
        EXPECT_EQ( mpc::Value( "user" ), decoded.as< mpc::Map >( )[ 2 ].first );
        EXPECT_EQ( mpc::Value( values ), decoded );
    }

    TEST( Containers, TestDuplicateKeysSurvive )
    {
        const mpc::Map values = { { 1, "a" }, { 1, "b" } };

        EXPECT_EQ( "8201a16101a162", encode_hex( values ) );
        EXPECT_EQ( mpc::Value( values ), round_trip( values ) );
    }

    TEST( Containers, TestArrayLengthFamilies )
    {
        const std::pair< std::size_t, std::string > cases[ ] = {
            { 15, "9f" },
            { 16, "dc0010" },
            { 65535, "dcffff" },
            { 65536, "dd00010000" }
        };

        for ( const auto &test : cases )
        {
            const mpc::Array values( test.first, mpc::Value { } );
            const auto result = mpc::encode( values );

            ASSERT_TRUE( result );
            EXPECT_EQ( test.second, hex( result.bytes ).substr( 0, test.second.size( ) ) ) << "count " << test.first;
            EXPECT_EQ( test.second.size( ) / 2 + test.first, result.bytes.size( ) );
            EXPECT_EQ( mpc::Value( values ), round_trip( values ) );
        }
    }

    TEST( Containers, TestMapLengthFamilies )
    {
        const std::pair< std::size_t, std::string > cases[ ] = {
            { 15, "8f" },
            { 16, "de0010" },
            { 65535, "deffff" },
            { 65536, "df00010000" }
        };

        for ( const auto &test : cases )
        {
            const mpc::Map values( test.first, { mpc::Value { }, mpc::Value { } } );
            const auto result = mpc::encode( values );

            ASSERT_TRUE( result );
            EXPECT_EQ( test.second, hex( result.bytes ).substr( 0, test.second.size( ) ) ) << "count " << test.first;
            EXPECT_EQ( test.second.size( ) / 2 + test.first * 2, result.bytes.size( ) );
            EXPECT_EQ( mpc::Value( values ), round_trip( values ) );
        }
    }

    TEST( Containers, TestNestedRoundTrip )
    {
        const mpc::Value value = mpc::Map {
            { "ints", mpc::Array { 0, -1, 300, -300, 70000, 0x1ffffffffULL, limits::int64_min } },
            { "floats", mpc::Array { 0.5f, -2.25 } },
            { mpc::Binary { 1, 2, 3 }, mpc::Extension { -1, { 1, 2, 3, 4 } } },
            { true, mpc::Array { mpc::Value( mpc::Array { mpc::Map { } } ) } },
            { mpc::Nil { }, std::string( 300, 'z' ) }
        };

        EXPECT_EQ( value, round_trip( value ) );
    }

    TEST( Containers, TestWriterStartArray )
    {
        Bytes buffer;
        mpc::Writer writer { buffer };

        writer.start_array( 2 ).write_uint( 1 ).write_str( "a" );
        writer.start_map( 1 ).write_nil( ).write_boolean( true );

        ASSERT_TRUE( writer );
        EXPECT_EQ( "9201a16181c0c3", hex( buffer ) );

        writer.start_array( 0x100000000ULL );

        EXPECT_EQ( mpc::EncodeError::ValueTooLarge, writer.error( ) );
        EXPECT_EQ( 7u, buffer.size( ) );
        EXPECT_EQ( 7u, writer.write_cursor( ) );

        writer.reset( );
        writer.start_map( 0x100000000ULL );

        EXPECT_EQ( mpc::EncodeError::ValueTooLarge, writer.error( ) );
    }

    TEST( Containers, TestEncodeDepthLimit )
    {
        mpc::Value nested = mpc::Nil { };

        for ( auto level = 0; level < MPC_MAX_DEPTH; level++ )
            nested = mpc::Array { nested };

        EXPECT_EQ( nested, round_trip( nested ) );

        const auto deeper = mpc::encode( mpc::Array { nested } );

        EXPECT_EQ( mpc::EncodeError::ValueTooLarge, deeper.error );
        EXPECT_TRUE( deeper.bytes.empty( ) );

        const auto keyed = mpc::encode( mpc::Map { { mpc::Nil { }, nested } } );

        EXPECT_EQ( mpc::EncodeError::ValueTooLarge, keyed.error );
    }
}

namespace values
{
    TEST( Values, TestTypeAndAccess )
    {
        const std::pair< mpc::Value, mpc::type::TypeValue > cases[ ] = {
            { mpc::Nil { }, mpc::type::TypeValue::Nil },
            { true, mpc::type::TypeValue::Boolean },
            { -7, mpc::type::TypeValue::Integer },
            { 2.5, mpc::type::TypeValue::Float },
            { "text", mpc::type::TypeValue::String },
            { mpc::Binary { 1 }, mpc::type::TypeValue::Binary },
            { mpc::Array { }, mpc::type::TypeValue::Array },
            { mpc::Map { }, mpc::type::TypeValue::Map },
            { mpc::Extension { 1, { 2 } }, mpc::type::TypeValue::Extension }
        };

        for ( const auto &test : cases )
            EXPECT_EQ( test.second, test.first.type( ) );

        const mpc::Value text = "text";

        ASSERT_NE( nullptr, text.get_if< std::string >( ) );
        EXPECT_EQ( "text", *text.get_if< std::string >( ) );
        EXPECT_EQ( nullptr, text.get_if< mpc::Binary >( ) );
        EXPECT_EQ( mpc::type::TypeValue::String, round_trip( text ).type( ) );
    }
}

namespace extensions
{
    TEST( Extensions, TestFixExt )
    {
        const std::pair< std::size_t, std::string > cases[ ] = {
            { 1, "d4" },
            { 2, "d5" },
            { 4, "d6" },
            { 8, "d7" },
            { 16, "d8" }
        };

        for ( const auto &test : cases )
        {
            const mpc::Extension ext { 0x0a, mpc::Binary( test.first, 0x0b ) };
            const auto result = mpc::encode( ext );

            ASSERT_TRUE( result );
            EXPECT_EQ( test.second + "0a" + hex( ext.data ), hex( result.bytes ) );

            const auto dr = mpc::decode( result.bytes );

            ASSERT_TRUE( dr );
            EXPECT_EQ( 2 + test.first, dr.size );
            EXPECT_EQ( mpc::Value( ext ), dr.value );
        }
    }

    TEST( Extensions, TestExtFamilies )
    {
        EXPECT_EQ( "c700ff", encode_hex( mpc::Extension { -1, { } } ) );
        EXPECT_EQ( "c70305616263", encode_hex( mpc::Extension { 5, { 'a', 'b', 'c' } } ) );

        const std::pair< std::size_t, std::string > cases[ ] = {
            { 255, "c7ff7f" },
            { 256, "c801007f" },
            { 65535, "c8ffff7f" },
            { 65536, "c9000100007f" }
        };

        for ( const auto &test : cases )
        {
            const mpc::Extension ext { 0x7f, mpc::Binary( test.first, 0 ) };
            const auto result = mpc::encode( ext );

            ASSERT_TRUE( result );
            EXPECT_EQ( test.second, hex( result.bytes ).substr( 0, test.second.size( ) ) ) << "length " << test.first;
            EXPECT_EQ( mpc::Value( ext ), round_trip( ext ) );
        }
    }

    TEST( Extensions, TestNegativeTypeTag )
    {
        const auto dr = mpc::decode( unhex( "d6ff0000000a" ) );

        ASSERT_TRUE( dr );
        EXPECT_EQ( mpc::MPMarker::FixExt4, dr.marker );
        EXPECT_EQ( -1, dr.value.as< mpc::Extension >( ).type );
        EXPECT_EQ( ( mpc::Binary { 0, 0, 0, 0x0a } ), dr.value.as< mpc::Extension >( ).data );
    }
}

namespace errors
{
    TEST( Errors, TestEmptyBuffer )
    {
        const auto dr = mpc::decode( Bytes { } );

        EXPECT_FALSE( dr );
        EXPECT_EQ( mpc::DecodeError::UnexpectedEnd, dr.error );
        EXPECT_EQ( 0u, dr.size );
        EXPECT_TRUE( dr.value.is_nil( ) );
    }

    TEST( Errors, TestUnknownMarker )
    {
        const auto dr = mpc::decode( unhex( "c1" ) );

        EXPECT_EQ( mpc::DecodeError::UnknownMarker, dr.error );

        /* also inside a container */
        EXPECT_EQ( mpc::DecodeError::UnknownMarker, mpc::decode( unhex( "9201c1" ) ).error );
    }

    TEST( Errors, TestInvalidUtf8 )
    {
        EXPECT_EQ( mpc::DecodeError::InvalidUtf8, mpc::decode( unhex( "a2c328" ) ).error );
        EXPECT_EQ( mpc::DecodeError::InvalidUtf8, mpc::decode( unhex( "a2c080" ) ).error );    // overlong
        EXPECT_EQ( mpc::DecodeError::InvalidUtf8, mpc::decode( unhex( "a3eda080" ) ).error );  // surrogate
        EXPECT_EQ( mpc::DecodeError::InvalidUtf8, mpc::decode( unhex( "a4f4908080" ) ).error ); // > U+10FFFF
        EXPECT_EQ( mpc::DecodeError::InvalidUtf8, mpc::decode( unhex( "a2e282" ) ).error );    // truncated
        EXPECT_EQ( mpc::DecodeError::InvalidUtf8, mpc::decode( unhex( "d901ff" ) ).error );

        /* binary payloads are not validated */
        EXPECT_TRUE( mpc::decode( unhex( "c402c328" ) ) );

        const auto dr = mpc::decode( unhex( "a4f09f9880" ) );

        ASSERT_TRUE( dr );
        EXPECT_EQ( "\xf0\x9f\x98\x80", dr.value.as< std::string >( ) );
    }

    TEST( Errors, TestTruncated )
    {
        const char *cases[ ] = {
            "cd00",         // uint 16 missing a byte
            "cb400000",     // float 64 missing half
            "d905616263",   // str 8 shorter than declared
            "c5",           // bin 16 missing its length
            "dcffff",       // array 16 with no elements
            "ddffffffff01", // array 32 count the buffer cannot hold
            "df0000000101", // map 32 with a key and no value
            "9201",         // fixarray missing its second element
            "8101",         // fixmap missing a value
            "d401",         // fixext 1 missing its payload
            "c70501616263"  // ext 8 shorter than declared
        };

        for ( const auto text : cases )
        {
            const auto dr = mpc::decode( unhex( text ) );

            EXPECT_EQ( mpc::DecodeError::UnexpectedEnd, dr.error ) << text;
            EXPECT_EQ( 0u, dr.size ) << text;
            EXPECT_TRUE( dr.value.is_nil( ) ) << text;
        }
    }

    TEST( Errors, TestCursorPastEnd )
    {
        const auto bytes = unhex( "c0" );

        EXPECT_EQ( mpc::DecodeError::UnexpectedEnd, mpc::decode( bytes, 1 ).error );
        EXPECT_EQ( mpc::DecodeError::UnexpectedEnd, mpc::decode( bytes, 7 ).error );
    }

    TEST( Errors, TestFailedDecodeKeepsCursor )
    {
        const auto bytes = unhex( "c0" "92c1" );
        mpc::Reader reader { bytes.data( ), bytes.size( ) };

        EXPECT_TRUE( reader.decode_single( ) );
        EXPECT_EQ( 1u, reader.read_cursor( ) );

        EXPECT_EQ( mpc::DecodeError::UnknownMarker, reader.decode_single( ).error );
        EXPECT_EQ( 1u, reader.read_cursor( ) );
    }

    TEST( Errors, TestDepthLimit )
    {
        Bytes nested( MPC_MAX_DEPTH, 0x91 );
        nested.push_back( 0xc0 );

        EXPECT_TRUE( mpc::decode( nested ) );

        nested.insert( nested.begin( ), 0x81 );
        nested.insert( nested.begin( ) + 1, 0xc0 );

        EXPECT_EQ( mpc::DecodeError::DepthExceeded, mpc::decode( nested ).error );
    }
}

namespace decoding
{
    TEST( Decoding, TestSequence )
    {
        Bytes buffer;

        ASSERT_EQ( mpc::EncodeError::None, mpc::encode_into( 45, buffer ) );
        ASSERT_EQ( mpc::EncodeError::None, mpc::encode_into( "Hello world", buffer ) );
        ASSERT_EQ( mpc::EncodeError::None, mpc::encode_into( mpc::Array { 1, 2 }, buffer ) );

        mpc::mp_u64 cursor = 0;
        std::vector< mpc::Value > values;

        while ( cursor < buffer.size( ) )
        {
            const auto dr = mpc::decode( buffer, cursor );

            ASSERT_TRUE( dr );
            cursor += dr.size;
            values.push_back( dr.value );
        }

        ASSERT_EQ( 3u, values.size( ) );
        EXPECT_EQ( mpc::Value( "Hello world" ), values[ 1 ] );

        const auto all = mpc::decode_all( buffer );

        ASSERT_TRUE( all );
        EXPECT_EQ( values, all.values );
        EXPECT_EQ( buffer.size( ), all.size );
    }

    TEST( Decoding, TestDecodeAllStopsAtError )
    {
        const auto all = mpc::decode_all( unhex( "01" "02" "c1" "03" ) );

        EXPECT_EQ( mpc::DecodeError::UnknownMarker, all.error );
        EXPECT_EQ( 2u, all.size );
        EXPECT_TRUE( all.values.empty( ) );
    }

    TEST( Decoding, TestIdempotent )
    {
        const auto bytes = mpc::encode( mpc::Map { { "k", mpc::Array { 1.5, -7, mpc::Binary { 9 } } } } ).bytes;

        const auto first = mpc::decode( bytes );
        const auto second = mpc::decode( bytes );

        ASSERT_TRUE( first );
        ASSERT_TRUE( second );
        EXPECT_EQ( first.value, second.value );
        EXPECT_EQ( first.size, second.size );
        EXPECT_EQ( first.marker, second.marker );
    }

    TEST( Decoding, TestSharedBufferAcrossThreads )
    {
        mpc::Array values;

        for ( auto index = 0; index < 1000; index++ )
            values.push_back( mpc::Map { { index, std::to_string( index ) } } );

        const auto bytes = mpc::encode( values ).bytes;
        const mpc::Value expected = values;

        std::vector< std::thread > threads;
        std::vector< int > matches( 4, 0 );

        for ( auto index = 0; index < 4; index++ )
        {
            threads.emplace_back( [ &, index ]
            {
                for ( auto round = 0; round < 10; round++ )
                    matches[ index ] += mpc::decode( bytes ).value == expected ? 1 : 0;
            } );
        }

        for ( auto &thread : threads )
            thread.join( );

        for ( const auto count : matches )
            EXPECT_EQ( 10, count );
    }
}

namespace markers
{
    TEST( Markers, TestOnlyC1IsUnknown )
    {
        for ( auto byte = 0; byte <= 0xff; byte++ )
        {
            const auto info = mpc::lookup_marker( static_cast< mp_u8 >( byte ) );

            if ( byte == 0xc1 )
                EXPECT_EQ( nullptr, info );
            else
                EXPECT_NE( nullptr, info ) << byte;
        }
    }

    TEST( Markers, TestFixFamiliesByBitPattern )
    {
        EXPECT_EQ( mpc::MPMarker::PosFixInt, mpc::lookup_marker( 0x7f )->marker );
        EXPECT_EQ( mpc::MPMarker::FixMap, mpc::lookup_marker( 0x8f )->marker );
        EXPECT_EQ( mpc::MPMarker::FixArray, mpc::lookup_marker( 0x93 )->marker );
        EXPECT_EQ( mpc::MPMarker::FixStr, mpc::lookup_marker( 0xbf )->marker );
        EXPECT_EQ( mpc::MPMarker::NegFixInt, mpc::lookup_marker( 0xe5 )->marker );
        EXPECT_EQ( mpc::MPMarker::Map32, mpc::lookup_marker( 0xdf )->marker );

        EXPECT_TRUE( mpc::lookup_marker( 0x85 )->embedded );
        EXPECT_FALSE( mpc::lookup_marker( 0xda )->embedded );
    }

    TEST( Markers, TestFraming )
    {
        EXPECT_EQ( 1, mpc::marker_info( mpc::MPMarker::Str8 )->length_width );
        EXPECT_EQ( 2, mpc::marker_info( mpc::MPMarker::Array16 )->length_width );
        EXPECT_EQ( 4, mpc::marker_info( mpc::MPMarker::Ext32 )->length_width );
        EXPECT_EQ( 8, mpc::marker_info( mpc::MPMarker::Int64 )->payload_width );
        EXPECT_EQ( 16, mpc::marker_info( mpc::MPMarker::FixExt16 )->payload_width );
        EXPECT_EQ( mpc::type::TypeValue::Extension, mpc::marker_info( mpc::MPMarker::FixExt2 )->type );
        EXPECT_EQ( nullptr, mpc::marker_info( mpc::MPMarker::Unused ) );

        EXPECT_EQ( mpc::MPMarker::FixExt8, mpc::fixext_marker( 8 ) );
        EXPECT_EQ( mpc::MPMarker::Unused, mpc::fixext_marker( 3 ) );
        EXPECT_EQ( 16u, mpc::fixext_size( mpc::MPMarker::FixExt16 ) );
    }
}

/**
 * @brief Test `stream::Stream(Reader|Writer)` behaviour.
 */
namespace streams
{
    TEST( Streams, ReadOOB )
    {
        const mp_u8 buf[ ] = { 'a', 'b', 'c' };
        stream::StreamReader sr { buf, sizeof( buf ) };

        EXPECT_EQ( sr.read_u8( ), 'a' );
        EXPECT_EQ( sr.read_u8( ), 'b' );
        EXPECT_EQ( sr.read_u8( ), 'c' );
        EXPECT_TRUE( sr );

        EXPECT_EQ( sr.read_u8( ), '\0' ); // 0 for reads past the end
        EXPECT_FALSE( sr );
        EXPECT_EQ( sr.position( ), sr.stream_size( ) );

        sr.reset_cursor( 1 );

        EXPECT_TRUE( sr );
        EXPECT_EQ( sr.peek_u8( ), 'b' );
        EXPECT_EQ( sr.read_u16( ), 0x6362 ); // host order, little-endian
        EXPECT_TRUE( sr );
        EXPECT_EQ( 0u, sr.remaining( ) );
    }

    TEST( Streams, WriteAppendsAndTruncates )
    {
        Bytes buffer;
        stream::StreamWriter wr { &buffer };

        wr.write_u8( 1 ).write_u32( 0x0badf00d ).write( 0, nullptr );

        EXPECT_EQ( 5u, wr.position( ) );

        wr.truncate( 1 );

        EXPECT_EQ( Bytes { 1 }, buffer );
    }
}

namespace logging
{
    TEST( Logging, TestFailuresAreLogged )
    {
        std::ostringstream output;
        auto sink = std::make_shared< spdlog::sinks::ostream_sink_mt >( output );
        const auto logger = mpc::logger( );
        const auto level = logger->level( );

        EXPECT_EQ( "mpc", logger->name( ) );

        logger->sinks( ).push_back( sink );
        mpc::set_log_level( spdlog::level::debug );

        EXPECT_FALSE( mpc::decode( unhex( "c1" ) ) );

        logger->flush( );
        logger->sinks( ).pop_back( );
        mpc::set_log_level( level );

        EXPECT_NE( std::string::npos, output.str( ).find( "UnknownMarker" ) );
    }
}
