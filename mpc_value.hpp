#pragma once

#include "mpc_marker.hpp"

#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace mpc
{
    struct Nil
    {
        bool operator==( const Nil & ) const { return true; }
        bool operator!=( const Nil & ) const { return false; }
    };

    /**
     * @brief MessagePack integer: a 64-bit payload and a sign flag. Non-negative values are always held
     * unsigned, so the same number compares equal whichever C++ type or wire family it came from.
     */
    class Integer
    {
        mp_u64 bits_ { 0 };
        bool negative_ { false };

    public:
        Integer( ) = default;

        template < typename Ty,
                   typename = std::enable_if_t< std::is_integral< Ty >::value && !std::is_same< Ty, bool >::value > >
        Integer( const Ty value )
            : bits_ { static_cast< mp_u64 >( value ) },
              negative_ { std::is_signed< Ty >::value && value < static_cast< Ty >( 0 ) }
        {
        }

        bool is_negative( ) const { return negative_; }

        /**
         * @brief The value as unsigned. Only meaningful when `!is_negative( )`.
         */
        mp_u64 as_u64( ) const { return bits_; }

        /**
         * @brief The value as two's complement. Only meaningful when `is_negative( )` or `as_u64( ) <= INT64_MAX`.
         */
        mp_i64 as_i64( ) const { return static_cast< mp_i64 >( bits_ ); }

        bool operator==( const Integer &other ) const
        {
            return negative_ == other.negative_ && bits_ == other.bits_;
        }

        bool operator!=( const Integer &other ) const { return !( *this == other ); }
    };

    enum class FloatWidth : mp_u8
    {
        F32,
        F64
    };

    /**
     * @brief IEEE-754 value tagged with the width it is written and read at. An `F32` value is kept as
     * `float` and never passes through `double`, so its bit pattern (signalling NaNs included) survives.
     */
    class Float
    {
        FloatWidth width_ { FloatWidth::F64 };
        float single_ { 0.0f };
        double double_ { 0.0 };

    public:
        Float( ) = default;

        Float( const float value )
            : width_ { FloatWidth::F32 }, single_ { value }
        {
        }

        Float( const double value )
            : width_ { FloatWidth::F64 }, double_ { value }
        {
        }

        FloatWidth width( ) const { return width_; }

        float as_f32( ) const { return width_ == FloatWidth::F32 ? single_ : static_cast< float >( double_ ); }
        double as_f64( ) const { return width_ == FloatWidth::F64 ? double_ : static_cast< double >( single_ ); }

        /**
         * @brief Compare bit patterns at the stored width, so NaN payloads and signed zeros round-trip exactly.
         */
        bool operator==( const Float &other ) const
        {
            if ( width_ != other.width_ )
                return false;

            if ( width_ == FloatWidth::F32 )
                return std::memcmp( &single_, &other.single_, sizeof( float ) ) == 0;

            return std::memcmp( &double_, &other.double_, sizeof( double ) ) == 0;
        }

        bool operator!=( const Float &other ) const { return !( *this == other ); }
    };

    class Value;

    using Binary = std::vector< mp_u8 >;
    using Array = std::vector< Value >;
    using Map = std::vector< std::pair< Value, Value > >;

    struct Extension
    {
        mp_i8 type { 0 };
        Binary data { };

        bool operator==( const Extension &other ) const
        {
            return type == other.type && data == other.data;
        }

        bool operator!=( const Extension &other ) const { return !( *this == other ); }
    };

    /**
     * @brief Dynamically typed MessagePack value. The set of alternatives is closed; use `visit` for exhaustive dispatch.
     */
    class Value
    {
    public:
        using storage_type = std::variant< Nil, bool, Integer, Float, std::string, Binary, Array, Map, Extension >;

    private:
        storage_type storage_ { };

        /* One overload per alternative, so a new alternative fails to compile until it is classified. */
        struct TypeOf
        {
            type::TypeValue operator( )( const Nil & ) const { return type::TypeValue::Nil; }
            type::TypeValue operator( )( const bool ) const { return type::TypeValue::Boolean; }
            type::TypeValue operator( )( const Integer & ) const { return type::TypeValue::Integer; }
            type::TypeValue operator( )( const Float & ) const { return type::TypeValue::Float; }
            type::TypeValue operator( )( const std::string & ) const { return type::TypeValue::String; }
            type::TypeValue operator( )( const Binary & ) const { return type::TypeValue::Binary; }
            type::TypeValue operator( )( const Array & ) const { return type::TypeValue::Array; }
            type::TypeValue operator( )( const Map & ) const { return type::TypeValue::Map; }
            type::TypeValue operator( )( const Extension & ) const { return type::TypeValue::Extension; }
        };

    public:
        Value( ) = default;

        Value( Nil ) { }
        Value( const bool value ) : storage_ { value } { }
        Value( const Integer value ) : storage_ { value } { }
        Value( const Float value ) : storage_ { value } { }
        Value( const float value ) : storage_ { Float { value } } { }
        Value( const double value ) : storage_ { Float { value } } { }
        Value( const char *value ) : storage_ { std::string { value } } { }
        Value( std::string value ) : storage_ { std::move( value ) } { }
        Value( Binary value ) : storage_ { std::move( value ) } { }
        Value( Array value ) : storage_ { std::move( value ) } { }
        Value( Map value ) : storage_ { std::move( value ) } { }
        Value( Extension value ) : storage_ { std::move( value ) } { }

        template < typename Ty,
                   typename = std::enable_if_t< std::is_integral< Ty >::value && !std::is_same< Ty, bool >::value > >
        Value( const Ty value ) : storage_ { Integer { value } } { }

        /**
         * @brief Semantic family of the held alternative.
         * @return type::TypeValue
         */
        type::TypeValue type( ) const
        {
            return std::visit( TypeOf { }, storage_ );
        }

        bool is_nil( ) const { return std::holds_alternative< Nil >( storage_ ); }
        bool is_bool( ) const { return std::holds_alternative< bool >( storage_ ); }
        bool is_integer( ) const { return std::holds_alternative< Integer >( storage_ ); }
        bool is_float( ) const { return std::holds_alternative< Float >( storage_ ); }
        bool is_str( ) const { return std::holds_alternative< std::string >( storage_ ); }
        bool is_bin( ) const { return std::holds_alternative< Binary >( storage_ ); }
        bool is_array( ) const { return std::holds_alternative< Array >( storage_ ); }
        bool is_map( ) const { return std::holds_alternative< Map >( storage_ ); }
        bool is_ext( ) const { return std::holds_alternative< Extension >( storage_ ); }

        /**
         * @brief Access the held alternative. Throws `std::bad_variant_access` on a type mismatch.
         */
        template < typename Ty >
        const Ty &as( ) const { return std::get< Ty >( storage_ ); }

        template < typename Ty >
        Ty &as( ) { return std::get< Ty >( storage_ ); }

        /**
         * @brief Pointer to the held alternative or `nullptr` on a type mismatch.
         */
        template < typename Ty >
        const Ty *get_if( ) const { return std::get_if< Ty >( &storage_ ); }

        template < typename Visitor >
        decltype( auto ) visit( Visitor &&visitor ) const
        {
            return std::visit( std::forward< Visitor >( visitor ), storage_ );
        }

        bool operator==( const Value &other ) const { return storage_ == other.storage_; }
        bool operator!=( const Value &other ) const { return !( *this == other ); }
    };
}
