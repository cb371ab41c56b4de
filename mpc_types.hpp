#pragma once

#include <cstdint>

#ifdef _MSC_VER
#include <intrin.h>
#define MPC_BSWAP16( v ) ( _byteswap_ushort( v ) )
#define MPC_BSWAP32( v ) ( _byteswap_ulong( v ) )
#define MPC_BSWAP64( v ) ( _byteswap_uint64( v ) )
#elif defined(__GNUC__) || defined(__clang__)
#define MPC_BSWAP16( v ) ( __builtin_bswap16( v ) )
#define MPC_BSWAP32( v ) ( __builtin_bswap32( v ) )
#define MPC_BSWAP64( v ) ( __builtin_bswap64( v ) )
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ != __ORDER_LITTLE_ENDIAN__
#error "mpcodec assumes a little-endian host."
#endif
#endif

namespace mpc
{
    using mp_u32 = std::uint32_t;
    using mp_u64 = std::uint64_t;

    using mp_i32 = std::int32_t;
    using mp_i64 = std::int64_t;

    using mp_u16 = std::uint16_t;
    using mp_i16 = std::int16_t;

    using mp_u8 = std::uint8_t;
    using mp_i8 = std::int8_t;

    static_assert(
        sizeof( float ) == 4,
        "incorrectly sized `float` type."
    );

    static_assert(
        sizeof( double ) == 8,
        "incorrectly sized `double` type."
    );
}

namespace limits
{
    constexpr mpc::mp_i64 int8_min = -128;
    constexpr mpc::mp_i64 int16_min = -32768;
    constexpr mpc::mp_i64 int32_min = -2147483647LL - 1;
    constexpr mpc::mp_i64 int64_min = -9223372036854775807LL - 1;
    constexpr mpc::mp_u64 uint8_max = 0xffULL;
    constexpr mpc::mp_u64 uint16_max = 0xffffULL;
    constexpr mpc::mp_u64 uint32_max = 0xffffffffULL;
    constexpr mpc::mp_u64 uint64_max = 0xffffffffffffffffULL;
}
