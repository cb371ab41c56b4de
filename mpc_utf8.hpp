#pragma once

#include "mpc_types.hpp"

namespace mpc
{
    /**
     * @brief Check that `size` bytes at `data` form well-formed UTF-8 (RFC 3629): no overlong forms,
     * no UTF-16 surrogates, nothing above U+10FFFF and no truncated sequence at the end.
     * @param data Pointer to the string payload
     * @param size Size, in bytes, of the payload
     * @return bool
     */
    inline bool is_valid_utf8( const mp_u8 *data, const mp_u64 size )
    {
        mp_u64 index = 0;

        while ( index < size )
        {
            const auto lead = data[ index ];

            if ( lead < 0x80 )
            {
                index++;
                continue;
            }

            mp_u64 length = 0;
            mp_u8 lower = 0x80, upper = 0xbf; // bounds of the first continuation byte

            if ( lead >= 0xc2 && lead <= 0xdf )
            {
                length = 2;
            }
            else if ( lead >= 0xe0 && lead <= 0xef )
            {
                length = 3;

                if ( lead == 0xe0 )
                    lower = 0xa0; // overlong
                else if ( lead == 0xed )
                    upper = 0x9f; // surrogates
            }
            else if ( lead >= 0xf0 && lead <= 0xf4 )
            {
                length = 4;

                if ( lead == 0xf0 )
                    lower = 0x90; // overlong
                else if ( lead == 0xf4 )
                    upper = 0x8f; // > U+10FFFF
            }
            else
            {
                return false;
            }

            if ( size - index < length )
                return false;

            const auto second = data[ index + 1 ];

            if ( second < lower || second > upper )
                return false;

            for ( mp_u64 offset = 2; offset < length; offset++ )
            {
                if ( ( data[ index + offset ] & 0xc0 ) != 0x80 )
                    return false;
            }

            index += length;
        }

        return true;
    }
}
