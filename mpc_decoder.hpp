#pragma once

#include "mpc_config.hpp"
#include "mpc_error.hpp"
#include "mpc_log.hpp"
#include "mpc_marker.hpp"
#include "mpc_stream.hpp"
#include "mpc_utf8.hpp"
#include "mpc_value.hpp"

#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace mpc
{
    struct MPDecodeResult
    {
        DecodeError error { DecodeError::None };
        MPMarker marker { MPMarker::Unused }; // Marker of the top-level value; fix families report their base marker
        mp_u64 size { 0 };                    // Bytes occupied by the encoded value. Advance the caller's cursor by this much.
        Value value { };

        explicit operator bool( ) const { return error == DecodeError::None; }
    };

    struct MPDecodeAllResult
    {
        DecodeError error { DecodeError::None };
        mp_u64 size { 0 }; // Bytes consumed; on failure, offset of the value that failed to decode
        std::vector< Value > values { };

        explicit operator bool( ) const { return error == DecodeError::None; }
    };

    /**
     * @brief MessagePack reader over a caller-owned, read-only buffer.
     *
     * Holds nothing but a cursor, so several readers may decode from the same buffer concurrently.
     * A failed decode leaves the cursor where the failing value started.
     */
    class Reader
    {
    private:
        /**
         * @brief Internal object used for reading from the byte stream.
         */
        stream::StreamReader sr_ { };

    public:
        /**
         * @param data Pointer to `size` readable bytes
         * @param size Total size, in bytes, of the buffer
         * @param cursor Offset of the first value to decode
         */
        Reader( const mp_u8 *data, const mp_u64 size, const mp_u64 cursor = 0 )
            : sr_ { data, size, cursor }
        {
        }

        Reader( const Reader &other ) = delete;
        Reader &operator=( const Reader &other ) = delete;

        /**
         * @brief Position of the read cursor in the stream.
         * @return mp_u64
         */
        mp_u64 read_cursor( ) const { return sr_.position( ); }

        mp_u64 remaining( ) const { return sr_.remaining( ); }

        /**
         * @brief Decode one complete value at the cursor, recursing into arrays and maps, and advance the
         * cursor past it.
         * @return MPDecodeResult with the value and its encoded size, or the error and a Nil value
         */
        MPDecodeResult decode_single( )
        {
            MPDecodeResult dr { };

            const auto start = sr_.position( );

            dr.error = read_value( dr.value, 0, &dr.marker );

            if ( dr.error != DecodeError::None )
            {
                MPC_DEBUG( "decode failed at offset {} (value at {}, {}): {}",
                           sr_.position( ), start, marker_name( dr.marker ), to_string( dr.error ) );

                sr_.reset_cursor( start );
                dr.value = Value { };

                return dr;
            }

            dr.size = sr_.position( ) - start;

            MPC_TRACE( "decoded {} of {} bytes at offset {}", marker_name( dr.marker ), dr.size, start );

            return dr;
        }

    private:
        bool has( const mp_u64 count ) const { return sr_.remaining( ) >= count; }

        mp_u16 read_u16( ) { return MPC_BSWAP16( sr_.read_u16( ) ); }
        mp_u32 read_u32( ) { return MPC_BSWAP32( sr_.read_u32( ) ); }
        mp_u64 read_u64( ) { return MPC_BSWAP64( sr_.read_u64( ) ); }

        /**
         * @brief Read a big-endian length field of `width` bytes.
         */
        DecodeError read_length( const mp_u8 width, mp_u64 &length )
        {
            if ( !has( width ) )
                return DecodeError::UnexpectedEnd;

            switch ( width )
            {
            case 1:
                length = sr_.read_u8( );
                break;
            case 2:
                length = read_u16( );
                break;
            default:
                length = read_u32( );
                break;
            }

            return DecodeError::None;
        }

        DecodeError read_value( Value &out, const mp_u32 depth, MPMarker *marker = nullptr )
        {
            if ( !has( 1 ) )
                return DecodeError::UnexpectedEnd;

            const auto raw = sr_.read_u8( );

            /*
             * Fixints carry their value in the marker byte and are told apart by bit pattern alone.
             */
            if ( is_pos_fixint( raw ) )
            {
                if ( marker )
                    *marker = MPMarker::PosFixInt;

                out = Integer { static_cast< mp_u8 >( raw & 0x7f ) };
                return DecodeError::None;
            }

            if ( is_neg_fixint( raw ) )
            {
                if ( marker )
                    *marker = MPMarker::NegFixInt;

                out = Integer { static_cast< mp_i8 >( raw ) };
                return DecodeError::None;
            }

            const auto info = lookup_marker( raw );

            if ( !info )
                return DecodeError::UnknownMarker;

            if ( marker )
                *marker = info->marker;

            if ( info->payload_width && !has( info->payload_width ) )
                return DecodeError::UnexpectedEnd;

            mp_u64 length = 0;

            if ( info->length_width )
            {
                const auto error = read_length( info->length_width, length );

                if ( error != DecodeError::None )
                    return error;
            }

            switch ( info->marker )
            {
            case MPMarker::FixMap:
                return read_map( raw & 0x0f, out, depth );
            case MPMarker::FixArray:
                return read_array( raw & 0x0f, out, depth );
            case MPMarker::FixStr:
                return read_str( raw & 0x1f, out );
            case MPMarker::Nil:
                out = Nil { };
                return DecodeError::None;
            case MPMarker::False:
                out = false;
                return DecodeError::None;
            case MPMarker::True:
                out = true;
                return DecodeError::None;
            case MPMarker::Bin8:
            case MPMarker::Bin16:
            case MPMarker::Bin32:
                return read_bin( length, out );
            case MPMarker::Str8:
            case MPMarker::Str16:
            case MPMarker::Str32:
                return read_str( length, out );
            case MPMarker::Ext8:
            case MPMarker::Ext16:
            case MPMarker::Ext32:
                return read_ext( length, out );
            case MPMarker::FixExt1:
            case MPMarker::FixExt2:
            case MPMarker::FixExt4:
            case MPMarker::FixExt8:
            case MPMarker::FixExt16:
                return read_ext( fixext_size( info->marker ), out );
            case MPMarker::Array16:
            case MPMarker::Array32:
                return read_array( length, out, depth );
            case MPMarker::Map16:
            case MPMarker::Map32:
                return read_map( length, out, depth );
            case MPMarker::Float32:
                {
                    const auto bits = read_u32( );
                    float value = 0;
                    std::memcpy( &value, &bits, sizeof( value ) );

                    out = Float { value };
                    return DecodeError::None;
                }
            case MPMarker::Float64:
                {
                    const auto bits = read_u64( );
                    double value = 0;
                    std::memcpy( &value, &bits, sizeof( value ) );

                    out = Float { value };
                    return DecodeError::None;
                }
            case MPMarker::Uint8:
                out = Integer { sr_.read_u8( ) };
                return DecodeError::None;
            case MPMarker::Uint16:
                out = Integer { read_u16( ) };
                return DecodeError::None;
            case MPMarker::Uint32:
                out = Integer { read_u32( ) };
                return DecodeError::None;
            case MPMarker::Uint64:
                out = Integer { read_u64( ) };
                return DecodeError::None;
            case MPMarker::Int8:
                out = Integer { static_cast< mp_i8 >( sr_.read_u8( ) ) };
                return DecodeError::None;
            case MPMarker::Int16:
                out = Integer { static_cast< mp_i16 >( read_u16( ) ) };
                return DecodeError::None;
            case MPMarker::Int32:
                out = Integer { static_cast< mp_i32 >( read_u32( ) ) };
                return DecodeError::None;
            case MPMarker::Int64:
                out = Integer { static_cast< mp_i64 >( read_u64( ) ) };
                return DecodeError::None;
            case MPMarker::PosFixInt: // handled above, by bit pattern
            case MPMarker::NegFixInt: // handled above, by bit pattern
            case MPMarker::Unused:
                break;
            }

            return DecodeError::UnknownMarker;
        }

        DecodeError read_str( const mp_u64 length, Value &out )
        {
            if ( !has( length ) )
                return DecodeError::UnexpectedEnd;

            if ( !is_valid_utf8( sr_.cursor( ), length ) )
                return DecodeError::InvalidUtf8;

            out = std::string { reinterpret_cast< const char * >( sr_.cursor( ) ), static_cast< std::size_t >( length ) };
            sr_.skip( length );

            return DecodeError::None;
        }

        DecodeError read_bin( const mp_u64 length, Value &out )
        {
            if ( !has( length ) )
                return DecodeError::UnexpectedEnd;

            out = Binary( sr_.cursor( ), sr_.cursor( ) + length );
            sr_.skip( length );

            return DecodeError::None;
        }

        /**
         * @brief Read the type tag and `length` payload bytes of an extension.
         */
        DecodeError read_ext( const mp_u64 length, Value &out )
        {
            if ( !has( length + 1 ) )
                return DecodeError::UnexpectedEnd;

            Extension ext { };
            ext.type = static_cast< mp_i8 >( sr_.read_u8( ) );
            ext.data.assign( sr_.cursor( ), sr_.cursor( ) + length );
            sr_.skip( length );

            out = std::move( ext );
            return DecodeError::None;
        }

        /**
         * @brief Decode exactly `count` elements. Every element takes at least one byte, so a count larger
         * than what remains cannot be satisfied and is rejected before anything is allocated.
         */
        DecodeError read_array( const mp_u64 count, Value &out, const mp_u32 depth )
        {
            if ( depth >= MPC_MAX_DEPTH )
                return DecodeError::DepthExceeded;

            if ( !has( count ) )
                return DecodeError::UnexpectedEnd;

            Array array { };
            array.reserve( static_cast< std::size_t >( count ) );

            for ( mp_u64 index = 0; index < count; index++ )
            {
                array.emplace_back( );

                const auto error = read_value( array.back( ), depth + 1 );

                if ( error != DecodeError::None )
                    return error;
            }

            out = std::move( array );
            return DecodeError::None;
        }

        /**
         * @brief Decode exactly `count` key/value pairs. Each pair takes at least two bytes.
         */
        DecodeError read_map( const mp_u64 count, Value &out, const mp_u32 depth )
        {
            if ( depth >= MPC_MAX_DEPTH )
                return DecodeError::DepthExceeded;

            if ( !has( count * 2 ) )
                return DecodeError::UnexpectedEnd;

            Map map { };
            map.reserve( static_cast< std::size_t >( count ) );

            for ( mp_u64 index = 0; index < count; index++ )
            {
                map.emplace_back( );

                auto error = read_value( map.back( ).first, depth + 1 );

                if ( error == DecodeError::None )
                    error = read_value( map.back( ).second, depth + 1 );

                if ( error != DecodeError::None )
                    return error;
            }

            out = std::move( map );
            return DecodeError::None;
        }
    };

    /**
     * @brief Decode the value starting at `cursor`.
     * @param data Encoded bytes; must hold the complete encoding of the value
     * @param size Size, in bytes, of `data`
     * @param cursor Offset of the value in `data`
     * @return MPDecodeResult; on success advance `cursor` by `result.size` to reach the next value
     */
    inline MPDecodeResult decode( const mp_u8 *data, const mp_u64 size, const mp_u64 cursor = 0 )
    {
        Reader reader { data, size, cursor };
        return reader.decode_single( );
    }

    inline MPDecodeResult decode( const std::vector< mp_u8 > &bytes, const mp_u64 cursor = 0 )
    {
        return decode( bytes.data( ), bytes.size( ), cursor );
    }

    /**
     * @brief Decode a concatenation of values until the buffer is exhausted.
     * @return All values in order, or the first error with no values
     */
    inline MPDecodeAllResult decode_all( const mp_u8 *data, const mp_u64 size )
    {
        MPDecodeAllResult result { };
        Reader reader { data, size };

        while ( reader.remaining( ) )
        {
            auto dr = reader.decode_single( );

            if ( !dr )
            {
                result.error = dr.error;
                result.size = reader.read_cursor( );
                result.values.clear( );

                return result;
            }

            result.values.push_back( std::move( dr.value ) );
        }

        result.size = reader.read_cursor( );
        return result;
    }

    inline MPDecodeAllResult decode_all( const std::vector< mp_u8 > &bytes )
    {
        return decode_all( bytes.data( ), bytes.size( ) );
    }
}
