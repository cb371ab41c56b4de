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
#include <vector>

namespace mpc
{
    struct MPEncodeResult
    {
        EncodeError error { EncodeError::None };
        std::vector< mp_u8 > bytes { }; // Empty unless `error == EncodeError::None`

        explicit operator bool( ) const { return error == EncodeError::None; }
    };

    namespace detail
    {
        /*
         * Family selection. Each ladder is checked narrowest first; `MPMarker::Unused` means no family can frame the length.
         */

        constexpr MPMarker str_marker( const mp_u64 length )
        {
            if ( length <= value_limits::FixStrMax )
                return MPMarker::FixStr;
            if ( length <= value_limits::Length8Max )
                return MPMarker::Str8;
            if ( length <= value_limits::Length16Max )
                return MPMarker::Str16;
            if ( length <= value_limits::Length32Max )
                return MPMarker::Str32;

            return MPMarker::Unused;
        }

        constexpr MPMarker bin_marker( const mp_u64 length )
        {
            if ( length <= value_limits::Length8Max )
                return MPMarker::Bin8;
            if ( length <= value_limits::Length16Max )
                return MPMarker::Bin16;
            if ( length <= value_limits::Length32Max )
                return MPMarker::Bin32;

            return MPMarker::Unused;
        }

        constexpr MPMarker ext_marker( const mp_u64 length )
        {
            if ( fixext_marker( length ) != MPMarker::Unused )
                return fixext_marker( length );
            if ( length <= value_limits::Length8Max )
                return MPMarker::Ext8;
            if ( length <= value_limits::Length16Max )
                return MPMarker::Ext16;
            if ( length <= value_limits::Length32Max )
                return MPMarker::Ext32;

            return MPMarker::Unused;
        }

        constexpr MPMarker array_marker( const mp_u64 count )
        {
            if ( count <= value_limits::FixArrayMax )
                return MPMarker::FixArray;
            if ( count <= value_limits::Length16Max )
                return MPMarker::Array16;
            if ( count <= value_limits::ArrayMax )
                return MPMarker::Array32;

            return MPMarker::Unused;
        }

        constexpr MPMarker map_marker( const mp_u64 count )
        {
            if ( count <= value_limits::FixMapMax )
                return MPMarker::FixMap;
            if ( count <= value_limits::Length16Max )
                return MPMarker::Map16;
            if ( count <= value_limits::KVMax )
                return MPMarker::Map32;

            return MPMarker::Unused;
        }

        /**
         * @brief Largest length a length-carrying family can frame.
         */
        inline mp_u64 length_capacity( const MarkerInfo &info )
        {
            if ( info.embedded )
                return info.marker == MPMarker::FixStr ? value_limits::FixStrMax : value_limits::FixArrayMax;

            switch ( info.length_width )
            {
            case 1:
                return value_limits::Length8Max;
            case 2:
                return value_limits::Length16Max;
            default:
                return value_limits::Length32Max;
            }
        }
    }

    /**
     * @brief MessagePack writer over a caller-owned byte buffer.
     *
     * Values are appended to the buffer passed at construction. The first failing write latches its error,
     * removes whatever that write had appended and turns every later write into a no-op until `reset( )`.
     */
    class Writer
    {
    private:
        /**
         * @brief Internal object used for writing to the byte stream.
         */
        stream::StreamWriter wr_ { };

        EncodeError error_ { EncodeError::None };

    public:
        explicit Writer( std::vector< mp_u8 > &buffer )
            : wr_ { &buffer }
        {
        }

        Writer( const Writer &other ) = delete;
        Writer &operator=( const Writer &other ) = delete;

        explicit operator bool( ) const { return error_ == EncodeError::None; }

        EncodeError error( ) const { return error_; }

        /**
         * @brief Clear the latched error. Bytes written before the failure stay in the buffer.
         */
        void reset( ) { error_ = EncodeError::None; }

        /**
         * @brief Position of the write cursor, i.e. the size of the underlying buffer.
         * @return mp_u64
         */
        mp_u64 write_cursor( ) const { return wr_.position( ); }

    private:
        Writer &fail( const EncodeError error, const mp_u64 rollback, const char *what )
        {
            wr_.truncate( rollback );
            error_ = error;

            MPC_DEBUG( "encode failed at offset {}: {} ({})", rollback, to_string( error ), what );

            return *this;
        }

        void put_u16( const mp_u16 value ) { wr_.write_u16( MPC_BSWAP16( value ) ); }
        void put_u32( const mp_u32 value ) { wr_.write_u32( MPC_BSWAP32( value ) ); }
        void put_u64( const mp_u64 value ) { wr_.write_u64( MPC_BSWAP64( value ) ); }

        /**
         * @brief Write `marker` followed by its length field. For fix families the length goes into the marker's low bits.
         * @remark `length` must already be known to fit the family.
         */
        void put_header( const MarkerInfo &info, const mp_u64 length )
        {
            if ( info.embedded )
            {
                wr_.write_u8( static_cast< mp_u8 >( static_cast< mp_u8 >( info.marker ) | static_cast< mp_u8 >( length ) ) );
                return;
            }

            write_marker( info.marker );

            switch ( info.length_width )
            {
            case 1:
                wr_.write_u8( static_cast< mp_u8 >( length ) );
                break;
            case 2:
                put_u16( static_cast< mp_u16 >( length ) );
                break;
            case 4:
                put_u32( static_cast< mp_u32 >( length ) );
                break;
            default:
                break;
            }
        }

        /**
         * @brief Write a length-prefixed str/bin payload with an already selected marker.
         * @remark String payloads must be well-formed UTF-8, the decoder rejects anything else.
         */
        Writer &write_raw( const MPMarker kind, const type::TypeValue family, const mp_u8 *data, const mp_u64 size )
        {
            const auto start = wr_.position( );
            const auto info = marker_info( kind );

            if ( !info || info->type != family || ( info->length_width == 0 && !info->embedded ) )
                return fail( EncodeError::UnsupportedValue, start, marker_name( kind ) );

            if ( size > detail::length_capacity( *info ) )
                return fail( EncodeError::ValueTooLarge, start, marker_name( kind ) );

            if ( family == type::TypeValue::String && !is_valid_utf8( data, size ) )
                return fail( EncodeError::UnsupportedValue, start, "string is not valid UTF-8" );

            put_header( *info, size );
            wr_.write( size, data );

            return *this;
        }

    public:
        /**
         * @brief Write a bare marker byte.
         * @param marker Value of type `MPMarker` denoting the start of a MessagePack value.
         */
        Writer &write_marker( const MPMarker marker )
        {
            if ( error_ == EncodeError::None )
                wr_.write_u8( static_cast< mp_u8 >( marker ) );

            return *this;
        }

        Writer &write_nil( )
        {
            return write_marker( MPMarker::Nil );
        }

        /**
         * @brief Write `true` or `false` to the stream depending on `value`.
         * @param value Boolean value to write
         * @return Writer&
         */
        Writer &write_boolean( const bool value )
        {
            return write_marker( value ? MPMarker::True : MPMarker::False );
        }

        /**
         * @brief Write an integer with a caller-chosen integer marker. The value is masked to the width of
         * the marker, mirroring a fixed-width store: `write_integer( 65538, MPMarker::Uint16 )` writes `cd 00 02`.
         * @param value Integer to write
         * @param kind One of PosFixInt, NegFixInt, Uint8/16/32/64 or Int8/16/32/64
         * @remark A negative value with an unsigned marker, or a non-negative value with `NegFixInt`, fails
         * with `EncodeError::UnsupportedValue`; the sign would not survive decoding.
         * @return Writer&
         */
        Writer &write_integer( const Integer value, const MPMarker kind )
        {
            if ( error_ != EncodeError::None )
                return *this;

            const auto start = wr_.position( );
            const auto data = value.as_u64( );

            switch ( kind )
            {
            case MPMarker::PosFixInt:
            case MPMarker::Uint8:
            case MPMarker::Uint16:
            case MPMarker::Uint32:
            case MPMarker::Uint64:
                if ( value.is_negative( ) )
                    return fail( EncodeError::UnsupportedValue, start, "negative value with an unsigned marker" );
                break;
            case MPMarker::NegFixInt:
                if ( !value.is_negative( ) )
                    return fail( EncodeError::UnsupportedValue, start, "non-negative value with negative fixint" );
                break;
            case MPMarker::Int8:
            case MPMarker::Int16:
            case MPMarker::Int32:
            case MPMarker::Int64:
                break;
            default:
                return fail( EncodeError::UnsupportedValue, start, marker_name( kind ) );
            }

            switch ( kind )
            {
            case MPMarker::PosFixInt:
                wr_.write_u8( static_cast< mp_u8 >( data & 0x7f ) );
                break;
            case MPMarker::NegFixInt:
                wr_.write_u8( static_cast< mp_u8 >( 0xe0 | ( data & 0x1f ) ) );
                break;
            case MPMarker::Uint8:
            case MPMarker::Int8:
                write_marker( kind );
                wr_.write_u8( static_cast< mp_u8 >( data & 0xff ) );
                break;
            case MPMarker::Uint16:
            case MPMarker::Int16:
                write_marker( kind );
                put_u16( static_cast< mp_u16 >( data & 0xffff ) );
                break;
            case MPMarker::Uint32:
            case MPMarker::Int32:
                write_marker( kind );
                put_u32( static_cast< mp_u32 >( data & 0xffffffff ) );
                break;
            default:
                write_marker( kind );
                put_u64( data );
                break;
            }

            return *this;
        }

        /**
         * @brief Write an unsigned integer using the smallest possible representation. Never uses a signed marker.
         * @param value Integer value to write to the stream
         * @return Writer&
         */
        Writer &write_uint( const mp_u64 value )
        {
            if ( value <= value_limits::PosFixIntMax )
                return write_integer( value, MPMarker::PosFixInt );
            if ( value <= limits::uint8_max )
                return write_integer( value, MPMarker::Uint8 );
            if ( value <= limits::uint16_max )
                return write_integer( value, MPMarker::Uint16 );
            if ( value <= limits::uint32_max )
                return write_integer( value, MPMarker::Uint32 );

            return write_integer( value, MPMarker::Uint64 );
        }

        /**
         * @brief Write a signed integer using the smallest possible representation. Non-negative values
         * take the unsigned ladder, so 200 is `cc c8` rather than `d1 00 c8`.
         * @param value Integer value to write to the stream
         * @return Writer&
         */
        Writer &write_int( const mp_i64 value )
        {
            if ( value >= 0 )
                return write_uint( static_cast< mp_u64 >( value ) );
            if ( value >= value_limits::NegFixIntMin )
                return write_integer( value, MPMarker::NegFixInt );
            if ( value >= limits::int8_min )
                return write_integer( value, MPMarker::Int8 );
            if ( value >= limits::int16_min )
                return write_integer( value, MPMarker::Int16 );
            if ( value >= limits::int32_min )
                return write_integer( value, MPMarker::Int32 );

            return write_integer( value, MPMarker::Int64 );
        }

        Writer &write_int( const Integer value )
        {
            return value.is_negative( ) ? write_int( value.as_i64( ) ) : write_uint( value.as_u64( ) );
        }

        Writer &write_float32( const float value )
        {
            if ( error_ != EncodeError::None )
                return *this;

            mp_u32 bits = 0;
            std::memcpy( &bits, &value, sizeof( bits ) );

            write_marker( MPMarker::Float32 );
            put_u32( bits );

            return *this;
        }

        Writer &write_float64( const double value )
        {
            if ( error_ != EncodeError::None )
                return *this;

            mp_u64 bits = 0;
            std::memcpy( &bits, &value, sizeof( bits ) );

            write_marker( MPMarker::Float64 );
            put_u64( bits );

            return *this;
        }

        /**
         * @brief Write a floating point value with a caller-chosen width. `MPMarker::Float32` rounds `value` to single precision.
         * @param value Value to write
         * @param kind `MPMarker::Float32` or `MPMarker::Float64`
         * @return Writer&
         */
        Writer &write_float( const double value, const MPMarker kind )
        {
            if ( error_ != EncodeError::None )
                return *this;

            if ( kind == MPMarker::Float32 )
                return write_float32( static_cast< float >( value ) );
            if ( kind == MPMarker::Float64 )
                return write_float64( value );

            return fail( EncodeError::UnsupportedValue, wr_.position( ), marker_name( kind ) );
        }

        Writer &write_float( const Float value )
        {
            return value.width( ) == FloatWidth::F32 ? write_float32( value.as_f32( ) ) : write_float64( value.as_f64( ) );
        }

        /**
         * @brief Write a UTF-8 string of `size` bytes, choosing fixstr, str 8, str 16 or str 32 by length.
         * @param string Pointer to the string payload, no null terminator is written
         * @param size Size, in bytes, of the string
         * @return Writer&
         */
        Writer &write_str( const char *string, const mp_u64 size )
        {
            if ( error_ != EncodeError::None )
                return *this;

            const auto kind = detail::str_marker( size );

            if ( kind == MPMarker::Unused )
                return fail( EncodeError::ValueTooLarge, wr_.position( ), "string longer than 2^32 - 1 bytes" );

            return write_raw( kind, type::TypeValue::String, reinterpret_cast< const mp_u8 * >( string ), size );
        }

        Writer &write_str( const std::string &string )
        {
            return write_str( string.data( ), string.size( ) );
        }

        /**
         * @brief Write a string with a caller-chosen string marker, e.g. str 16 for a 200 byte string.
         * @remark Fails with `EncodeError::ValueTooLarge` if `size` does not fit `kind` and with
         * `EncodeError::UnsupportedValue` if `kind` is not a string marker.
         * @return Writer&
         */
        Writer &write_str( const char *string, const mp_u64 size, const MPMarker kind )
        {
            if ( error_ != EncodeError::None )
                return *this;

            return write_raw( kind, type::TypeValue::String, reinterpret_cast< const mp_u8 * >( string ), size );
        }

        /**
         * @brief Write a byte array of `count` bytes, choosing bin 8, bin 16 or bin 32 by length.
         * @param bytes Pointer to a byte array of `count` bytes
         * @param count Size, in bytes, of the byte array
         * @return Writer&
         */
        Writer &write_bin( const mp_u8 *bytes, const mp_u64 count )
        {
            if ( error_ != EncodeError::None )
                return *this;

            const auto kind = detail::bin_marker( count );

            if ( kind == MPMarker::Unused )
                return fail( EncodeError::ValueTooLarge, wr_.position( ), "binary longer than 2^32 - 1 bytes" );

            return write_raw( kind, type::TypeValue::Binary, bytes, count );
        }

        Writer &write_bin( const mp_u8 *bytes, const mp_u64 count, const MPMarker kind )
        {
            if ( error_ != EncodeError::None )
                return *this;

            return write_raw( kind, type::TypeValue::Binary, bytes, count );
        }

        /**
         * @brief Write an extension value. Payloads of 1, 2, 4, 8 and 16 bytes use fixext, anything else ext 8/16/32.
         * @param type Application-defined type tag
         * @param data Payload
         * @param size Size, in bytes, of the payload
         * @return Writer&
         */
        Writer &write_ext( const mp_i8 type, const mp_u8 *data, const mp_u64 size )
        {
            if ( error_ != EncodeError::None )
                return *this;

            const auto start = wr_.position( );
            const auto kind = detail::ext_marker( size );

            if ( kind == MPMarker::Unused )
                return fail( EncodeError::ValueTooLarge, start, "extension payload longer than 2^32 - 1 bytes" );

            put_header( *marker_info( kind ), size );

            /* type tag sits between the length field and the payload */
            wr_.write_u8( static_cast< mp_u8 >( type ) );
            wr_.write( size, data );

            return *this;
        }

        /**
         * @brief Mark the start of an array. The array type chosen depends on `num_elem`; exactly `num_elem`
         * values must follow.
         * @param num_elem Number of elements in the array
         * @return Writer&
         */
        Writer &start_array( const mp_u64 num_elem )
        {
            if ( error_ != EncodeError::None )
                return *this;

            const auto kind = detail::array_marker( num_elem );

            if ( kind == MPMarker::Unused )
                return fail( EncodeError::ValueTooLarge, wr_.position( ), "array longer than 2^32 - 1 elements" );

            put_header( *marker_info( kind ), num_elem );

            return *this;
        }

        /**
         * @brief Mark the start of a map. The map type chosen depends on `num_pairs`; exactly `num_pairs`
         * key/value pairs must follow, each key immediately followed by its value.
         * @param num_pairs Number of key-value pairs in this map. Both keys and values can be any MessagePack type.
         * @return Writer&
         */
        Writer &start_map( const mp_u64 num_pairs )
        {
            if ( error_ != EncodeError::None )
                return *this;

            const auto kind = detail::map_marker( num_pairs );

            if ( kind == MPMarker::Unused )
                return fail( EncodeError::ValueTooLarge, wr_.position( ), "map larger than 2^32 - 1 pairs" );

            put_header( *marker_info( kind ), num_pairs );

            return *this;
        }

        /**
         * @brief Encode a whole value tree, depth-first. On failure nothing of `value` remains in the buffer.
         * @param value Value to encode
         * @remark Containers nested deeper than `MPC_MAX_DEPTH` fail with `EncodeError::ValueTooLarge`,
         * the same limit the decoder enforces.
         * @return Writer&
         */
        Writer &write_value( const Value &value )
        {
            return write_nested( value, 0 );
        }

    private:
        Writer &write_nested( const Value &value, const mp_u32 depth )
        {
            if ( error_ != EncodeError::None )
                return *this;

            const auto start = wr_.position( );

            value.visit( ValueWriter { *this, depth } );

            if ( error_ != EncodeError::None )
                wr_.truncate( start );

            return *this;
        }

        struct ValueWriter
        {
            Writer &writer;
            mp_u32 depth;

            void operator( )( const Nil & ) const { writer.write_nil( ); }
            void operator( )( const bool value ) const { writer.write_boolean( value ); }
            void operator( )( const Integer &value ) const { writer.write_int( value ); }
            void operator( )( const Float &value ) const { writer.write_float( value ); }
            void operator( )( const std::string &value ) const { writer.write_str( value ); }
            void operator( )( const Binary &value ) const { writer.write_bin( value.data( ), value.size( ) ); }

            void operator( )( const Array &value ) const
            {
                if ( depth >= MPC_MAX_DEPTH )
                {
                    writer.fail( EncodeError::ValueTooLarge, writer.wr_.position( ), "nesting deeper than MPC_MAX_DEPTH" );
                    return;
                }

                writer.start_array( value.size( ) );

                for ( const auto &element : value )
                    writer.write_nested( element, depth + 1 );
            }

            void operator( )( const Map &value ) const
            {
                if ( depth >= MPC_MAX_DEPTH )
                {
                    writer.fail( EncodeError::ValueTooLarge, writer.wr_.position( ), "nesting deeper than MPC_MAX_DEPTH" );
                    return;
                }

                writer.start_map( value.size( ) );

                for ( const auto &pair : value )
                    writer.write_nested( pair.first, depth + 1 ).write_nested( pair.second, depth + 1 );
            }

            void operator( )( const Extension &value ) const
            {
                writer.write_ext( value.type, value.data.data( ), value.data.size( ) );
            }
        };
    };

    /**
     * @brief Encode `value` into a fresh buffer.
     * @param value Value tree to encode
     * @return MPEncodeResult holding the bytes, or the error with an empty buffer
     */
    inline MPEncodeResult encode( const Value &value )
    {
        MPEncodeResult result { };

        {
            Writer writer { result.bytes };
            writer.write_value( value );
            result.error = writer.error( );
        }

        if ( !result )
            result.bytes.clear( );

        return result;
    }

    /**
     * @brief Append the encoding of `value` to `out`. On failure `out` is left as it was.
     * @return EncodeError::None on success
     */
    inline EncodeError encode_into( const Value &value, std::vector< mp_u8 > &out )
    {
        Writer writer { out };
        writer.write_value( value );

        return writer.error( );
    }
}
