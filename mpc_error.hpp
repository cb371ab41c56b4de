#pragma once

namespace mpc
{
    enum class EncodeError
    {
        None,
        ValueTooLarge,   // integer, length or element count beyond what any family can frame
        UnsupportedValue // value or marker outside the model for the requested write
    };

    enum class DecodeError
    {
        None,
        UnexpectedEnd,  // fewer bytes remain than the current field requires
        UnknownMarker,  // leading byte matches no family
        InvalidUtf8,    // string payload is not well-formed UTF-8
        DepthExceeded   // nesting deeper than MPC_MAX_DEPTH
    };

    inline const char *to_string( const EncodeError error )
    {
        switch ( error )
        {
        case EncodeError::None:
            return "None";
        case EncodeError::ValueTooLarge:
            return "ValueTooLarge";
        case EncodeError::UnsupportedValue:
            return "UnsupportedValue";
        }

        return "?";
    }

    inline const char *to_string( const DecodeError error )
    {
        switch ( error )
        {
        case DecodeError::None:
            return "None";
        case DecodeError::UnexpectedEnd:
            return "UnexpectedEnd";
        case DecodeError::UnknownMarker:
            return "UnknownMarker";
        case DecodeError::InvalidUtf8:
            return "InvalidUtf8";
        case DecodeError::DepthExceeded:
            return "DepthExceeded";
        }

        return "?";
    }
}
