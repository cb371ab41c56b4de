#pragma once

#include "mpc_types.hpp"

namespace mpc
{
    namespace value_limits
    {
        // - (2 ^ 63)
        constexpr mp_i64 IntMin = limits::int64_min;

        // ( 2^64 ) - 1
        constexpr mp_u64 IntMax = limits::uint64_max;

        //  ( 2^32 ) - 1
        constexpr mp_u64 BinMax = limits::uint32_max;

        //  ( 2^32 ) - 1
        constexpr mp_u64 StringMax = limits::uint32_max;

        //  ( 2^32 ) - 1
        constexpr mp_u64 ArrayMax = limits::uint32_max;

        //  ( 2^32 ) - 1
        constexpr mp_u64 KVMax = limits::uint32_max;

        constexpr mp_u64 PosFixIntMax = 127;
        constexpr mp_i64 NegFixIntMin = -32;

        constexpr mp_u64 FixStrMax = 31;
        constexpr mp_u64 FixArrayMax = 15;
        constexpr mp_u64 FixMapMax = 15;

        constexpr mp_u64 Length8Max = limits::uint8_max;
        constexpr mp_u64 Length16Max = limits::uint16_max;
        constexpr mp_u64 Length32Max = limits::uint32_max;
    }

    namespace type
    {
        enum class TypeValue : mp_u32
        {
            Integer,
            Nil,
            Boolean,
            Float,
            String,
            Binary,
            Array,
            Map,
            Extension
        };
    }

    enum class MPMarker : mp_u8
    {
        PosFixInt,
        FixMap    = 0x80,
        FixArray  = 0x90,
        FixStr    = 0xa0,
        Nil       = 0xc0,
        Unused    = 0xc1,
        False     = 0xc2,
        True      = 0xc3,
        Bin8      = 0xc4,
        Bin16     = 0xc5,
        Bin32     = 0xc6,
        Ext8      = 0xc7,
        Ext16     = 0xc8,
        Ext32     = 0xc9,
        Float32   = 0xca,
        Float64   = 0xcb,
        Uint8     = 0xcc,
        Uint16    = 0xcd,
        Uint32    = 0xce,
        Uint64    = 0xcf,
        Int8      = 0xd0,
        Int16     = 0xd1,
        Int32     = 0xd2,
        Int64     = 0xd3,
        FixExt1   = 0xd4,
        FixExt2   = 0xd5,
        FixExt4   = 0xd6,
        FixExt8   = 0xd7,
        FixExt16  = 0xd8,
        Str8      = 0xd9,
        Str16     = 0xda,
        Str32     = 0xdb,
        Array16   = 0xdc,
        Array32   = 0xdd,
        Map16     = 0xde,
        Map32     = 0xdf,
        NegFixInt = 0xe0
    };

    /**
     * @brief Framing of one marker family.
     */
    struct MarkerInfo
    {
        MPMarker marker;
        type::TypeValue type;
        mp_u8 length_width;  // Width, in bytes, of the length field following the marker (0, 1, 2 or 4)
        bool embedded;       // Length or value lives in the low bits of the marker itself
        mp_u8 payload_width; // Fixed payload width for scalar and fixext families, 0 when length-prefixed
    };

    namespace detail
    {
        using type::TypeValue;

        constexpr MarkerInfo marker_table[ ] = {
            { MPMarker::PosFixInt, TypeValue::Integer,   0, true,  0 },
            { MPMarker::FixMap,    TypeValue::Map,       0, true,  0 },
            { MPMarker::FixArray,  TypeValue::Array,     0, true,  0 },
            { MPMarker::FixStr,    TypeValue::String,    0, true,  0 },
            { MPMarker::Nil,       TypeValue::Nil,       0, false, 0 },
            { MPMarker::False,     TypeValue::Boolean,   0, false, 0 },
            { MPMarker::True,      TypeValue::Boolean,   0, false, 0 },
            { MPMarker::Bin8,      TypeValue::Binary,    1, false, 0 },
            { MPMarker::Bin16,     TypeValue::Binary,    2, false, 0 },
            { MPMarker::Bin32,     TypeValue::Binary,    4, false, 0 },
            { MPMarker::Ext8,      TypeValue::Extension, 1, false, 0 },
            { MPMarker::Ext16,     TypeValue::Extension, 2, false, 0 },
            { MPMarker::Ext32,     TypeValue::Extension, 4, false, 0 },
            { MPMarker::Float32,   TypeValue::Float,     0, false, 4 },
            { MPMarker::Float64,   TypeValue::Float,     0, false, 8 },
            { MPMarker::Uint8,     TypeValue::Integer,   0, false, 1 },
            { MPMarker::Uint16,    TypeValue::Integer,   0, false, 2 },
            { MPMarker::Uint32,    TypeValue::Integer,   0, false, 4 },
            { MPMarker::Uint64,    TypeValue::Integer,   0, false, 8 },
            { MPMarker::Int8,      TypeValue::Integer,   0, false, 1 },
            { MPMarker::Int16,     TypeValue::Integer,   0, false, 2 },
            { MPMarker::Int32,     TypeValue::Integer,   0, false, 4 },
            { MPMarker::Int64,     TypeValue::Integer,   0, false, 8 },
            { MPMarker::FixExt1,   TypeValue::Extension, 0, false, 1 },
            { MPMarker::FixExt2,   TypeValue::Extension, 0, false, 2 },
            { MPMarker::FixExt4,   TypeValue::Extension, 0, false, 4 },
            { MPMarker::FixExt8,   TypeValue::Extension, 0, false, 8 },
            { MPMarker::FixExt16,  TypeValue::Extension, 0, false, 16 },
            { MPMarker::Str8,      TypeValue::String,    1, false, 0 },
            { MPMarker::Str16,     TypeValue::String,    2, false, 0 },
            { MPMarker::Str32,     TypeValue::String,    4, false, 0 },
            { MPMarker::Array16,   TypeValue::Array,     2, false, 0 },
            { MPMarker::Array32,   TypeValue::Array,     4, false, 0 },
            { MPMarker::Map16,     TypeValue::Map,       2, false, 0 },
            { MPMarker::Map32,     TypeValue::Map,       4, false, 0 },
            { MPMarker::NegFixInt, TypeValue::Integer,   0, true,  0 }
        };
    }

    /*
     * Fix families are recognised by bit pattern. Check these before `lookup_marker`, the table only
     * holds their base marker.
     */

    constexpr bool is_pos_fixint( const mp_u8 byte ) { return ( byte & 0x80 ) == 0; }
    constexpr bool is_neg_fixint( const mp_u8 byte ) { return ( byte & 0xe0 ) == 0xe0; }
    constexpr bool is_fixmap( const mp_u8 byte ) { return ( byte & 0xf0 ) == 0x80; }
    constexpr bool is_fixarray( const mp_u8 byte ) { return ( byte & 0xf0 ) == 0x90; }
    constexpr bool is_fixstr( const mp_u8 byte ) { return ( byte & 0xe0 ) == 0xa0; }

    /**
     * @brief Exact-match lookup of a marker byte in the marker table.
     * @param marker Base marker of the family. For fix families pass the base marker, not the raw byte.
     * @return Pointer to the family description, `nullptr` for `MPMarker::Unused`
     */
    inline const MarkerInfo *marker_info( const MPMarker marker )
    {
        for ( const auto &info : detail::marker_table )
        {
            if ( info.marker == marker )
                return &info;
        }

        return nullptr;
    }

    /**
     * @brief Classify a raw marker byte read from a stream.
     * @param byte First byte of an encoded value
     * @return Family description or `nullptr` if `byte` is not a valid marker
     */
    inline const MarkerInfo *lookup_marker( const mp_u8 byte )
    {
        if ( is_pos_fixint( byte ) )
            return marker_info( MPMarker::PosFixInt );

        if ( is_neg_fixint( byte ) )
            return marker_info( MPMarker::NegFixInt );

        if ( is_fixmap( byte ) )
            return marker_info( MPMarker::FixMap );

        if ( is_fixarray( byte ) )
            return marker_info( MPMarker::FixArray );

        if ( is_fixstr( byte ) )
            return marker_info( MPMarker::FixStr );

        return marker_info( static_cast< MPMarker >( byte ) );
    }

    /**
     * @brief Map a fixext payload size to its marker.
     * @return FixExt1/2/4/8/16 or `MPMarker::Unused` for any other size
     */
    constexpr MPMarker fixext_marker( const mp_u64 size )
    {
        switch ( size )
        {
        case 1:
            return MPMarker::FixExt1;
        case 2:
            return MPMarker::FixExt2;
        case 4:
            return MPMarker::FixExt4;
        case 8:
            return MPMarker::FixExt8;
        case 16:
            return MPMarker::FixExt16;
        default:
            return MPMarker::Unused;
        }
    }

    constexpr mp_u32 fixext_size( const MPMarker marker )
    {
        switch ( marker )
        {
        case MPMarker::FixExt1:
            return 1;
        case MPMarker::FixExt2:
            return 2;
        case MPMarker::FixExt4:
            return 4;
        case MPMarker::FixExt8:
            return 8;
        case MPMarker::FixExt16:
            return 16;
        default:
            return 0;
        }
    }

    inline const char *marker_name( const MPMarker marker )
    {
        switch ( marker )
        {
        case MPMarker::PosFixInt: return "positive fixint";
        case MPMarker::FixMap:    return "fixmap";
        case MPMarker::FixArray:  return "fixarray";
        case MPMarker::FixStr:    return "fixstr";
        case MPMarker::Nil:       return "nil";
        case MPMarker::Unused:    return "(never used)";
        case MPMarker::False:     return "false";
        case MPMarker::True:      return "true";
        case MPMarker::Bin8:      return "bin 8";
        case MPMarker::Bin16:     return "bin 16";
        case MPMarker::Bin32:     return "bin 32";
        case MPMarker::Ext8:      return "ext 8";
        case MPMarker::Ext16:     return "ext 16";
        case MPMarker::Ext32:     return "ext 32";
        case MPMarker::Float32:   return "float 32";
        case MPMarker::Float64:   return "float 64";
        case MPMarker::Uint8:     return "uint 8";
        case MPMarker::Uint16:    return "uint 16";
        case MPMarker::Uint32:    return "uint 32";
        case MPMarker::Uint64:    return "uint 64";
        case MPMarker::Int8:      return "int 8";
        case MPMarker::Int16:     return "int 16";
        case MPMarker::Int32:     return "int 32";
        case MPMarker::Int64:     return "int 64";
        case MPMarker::FixExt1:   return "fixext 1";
        case MPMarker::FixExt2:   return "fixext 2";
        case MPMarker::FixExt4:   return "fixext 4";
        case MPMarker::FixExt8:   return "fixext 8";
        case MPMarker::FixExt16:  return "fixext 16";
        case MPMarker::Str8:      return "str 8";
        case MPMarker::Str16:     return "str 16";
        case MPMarker::Str32:     return "str 32";
        case MPMarker::Array16:   return "array 16";
        case MPMarker::Array32:   return "array 32";
        case MPMarker::Map16:     return "map 16";
        case MPMarker::Map32:     return "map 32";
        case MPMarker::NegFixInt: return "negative fixint";
        }

        return "?";
    }
}
