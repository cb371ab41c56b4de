#pragma once

#include "mpc_types.hpp"

#include <cstring>
#include <vector>

/*
 * Note: Neither Stream interface takes ownership of the underlying memory.
 * The caller keeps the buffer alive for as long as the stream object is in use.
 *
 * Usage:
 *  1) StreamWriter: hand it a `std::vector< mp_u8 >`, every write is appended at the end of the vector;
 *  2) StreamReader: hand it a pointer, size and starting cursor, every read advances the cursor;
 *  3) A read past the end of the buffer fails, the cursor does not move and the reader stays failed
 *     until `reset_cursor( )` or `set( )`. Check `operator bool` after a sequence of reads.
 *
 *  Notes:
 *      1) Not thread safe. Concurrent decoders may share a buffer as long as each has its own StreamReader;
 *      2) Multi-byte values are copied in host byte order, byte swapping is the codec's job.
 */

namespace stream
{
    using mpc::mp_u8;
    using mpc::mp_u64;

    struct StreamReader
    {
    private:
        const mp_u8 *buffer_ { nullptr };
        mp_u64 stream_size_ { 0 };
        mp_u64 position_ { 0 };
        bool failed_ { false };

    public:
        explicit StreamReader(
            const mp_u8 *buffer = nullptr,
            const mp_u64 stream_size = 0,
            const mp_u64 position = 0
        )
        {
            set( buffer, stream_size, position );
        }

        /* Disallow copies. */
        StreamReader( const StreamReader &other ) = delete;
        StreamReader &operator=( const StreamReader &other ) = delete;

        /**
         * @brief `false` once any read ran past the end of the stream.
         */
        explicit operator bool( ) const
        {
            return !failed_;
        }

        /**
         * @brief Point the reader at a new buffer and clear the failure state.
         * @param buffer Pointer to at least `stream_size` readable bytes
         * @param stream_size Total size, in bytes, of `buffer`
         * @param position Cursor to start reading at. A cursor past the end leaves zero bytes to read.
         * @return StreamReader&
         */
        StreamReader &set( const mp_u8 *buffer, const mp_u64 stream_size, const mp_u64 position = 0 )
        {
            buffer_ = buffer;
            stream_size_ = buffer ? stream_size : 0;
            position_ = position;
            failed_ = false;

            return *this;
        }

        void reset_cursor( const mp_u64 position = 0 )
        {
            position_ = position;
            failed_ = false;
        }

        /**
         * @brief Current cursor position.
         * @return mp_u64
         */
        mp_u64 position( ) const
        {
            return position_;
        }

        mp_u64 stream_size( ) const
        {
            return stream_size_;
        }

        /**
         * @brief Number of bytes between the cursor and the end of the stream.
         * @return mp_u64
         */
        mp_u64 remaining( ) const
        {
            return position_ < stream_size_ ? stream_size_ - position_ : 0;
        }

        /**
         * @brief Address of the byte under the cursor. Only meaningful while `remaining( ) > 0`.
         */
        const mp_u8 *cursor( ) const
        {
            return buffer_ + position_;
        }

    private:
        /**
         * @brief The core of the `StreamReader` interface. Copies `count` bytes from the stream into `dst`.
         * @param count Number of bytes to read from the stream.
         * @param dst Buffer of at least `count` bytes to copy into.
         * @param peek Read without advancing the cursor
         * @return `false` if fewer than `count` bytes remain; nothing is copied in that case.
         */
        bool _read_and_advance( const mp_u64 count, void *dst, const bool peek = false )
        {
            if ( failed_ || count > remaining( ) )
            {
                failed_ = true;
                return false;
            }

            if ( count )
                std::memcpy( dst, buffer_ + position_, count );

            if ( !peek )
                position_ += count;

            return true;
        }

        /**
         * @brief Read a plain old data (POD) value in host byte order.
         * @tparam Ty One of `mp_i8`, `mp_u8`, `mp_i16`, `mp_u16`, `mp_i32`, `mp_u32`, `mp_i64`, `mp_u64`, `float`, `double`
         * @return The value, or a value-initialized `Ty` when the stream is exhausted
         */
        template < typename Ty >
        Ty _read_pod( const bool peek = false )
        {
            Ty pod { };

            _read_and_advance( sizeof( Ty ), &pod, peek );

            return pod;
        }

    public:
        mpc::mp_u8 read_u8( ) { return _read_pod< mpc::mp_u8 >( ); }
        mpc::mp_u16 read_u16( ) { return _read_pod< mpc::mp_u16 >( ); }
        mpc::mp_u32 read_u32( ) { return _read_pod< mpc::mp_u32 >( ); }
        mpc::mp_u64 read_u64( ) { return _read_pod< mpc::mp_u64 >( ); }

        /**
         * @brief Read an unsigned byte from the stream without advancing the cursor.
         * @return mp_u8
         */
        mpc::mp_u8 peek_u8( )
        {
            return _read_pod< mpc::mp_u8 >( true );
        }

        /**
         * @brief Read exactly `count` bytes from the stream and advance the internal cursor by the same amount.
         * @param count Number of bytes to read.
         * @param dst Buffer of at least `count` bytes.
         * @return StreamReader&
         */
        StreamReader &read( const mp_u64 count, mp_u8 *dst )
        {
            _read_and_advance( count, dst );

            return *this;
        }

        /**
         * @brief Advance the cursor by `count` bytes without copying them.
         * @return StreamReader&
         */
        StreamReader &skip( const mp_u64 count )
        {
            if ( failed_ || count > remaining( ) )
                failed_ = true;
            else
                position_ += count;

            return *this;
        }
    };

    struct StreamWriter
    {
    private:
        std::vector< mp_u8 > *buffer_ { nullptr };

    public:
        explicit StreamWriter( std::vector< mp_u8 > *buffer = nullptr )
            : buffer_ { buffer }
        {
        }

        /* Disallow copies. */
        StreamWriter( const StreamWriter &other ) = delete;
        StreamWriter &operator=( const StreamWriter &other ) = delete;

        explicit operator bool( ) const
        {
            return buffer_ != nullptr;
        }

        StreamWriter &set( std::vector< mp_u8 > *buffer )
        {
            buffer_ = buffer;
            return *this;
        }

        /**
         * @brief Number of bytes in the underlying buffer, i.e. the write cursor.
         * @return mp_u64
         */
        mp_u64 position( ) const
        {
            return buffer_ ? buffer_->size( ) : 0;
        }

        /**
         * @brief Drop everything written after `position`. Used to roll back a failed write.
         */
        void truncate( const mp_u64 position )
        {
            if ( buffer_ && position < buffer_->size( ) )
                buffer_->resize( static_cast< std::size_t >( position ) );
        }

        std::vector< mp_u8 > *buffer( ) const
        {
            return buffer_;
        }

        /**
         * @brief Write a plain old data (POD) value to the byte stream in host byte order.
         * @tparam Ty One of `mp_i8`, `mp_u8`, `mp_i16`, `mp_u16`, `mp_i32`, `mp_u32`, `mp_i64`, `mp_u64`
         * @param value Value to write to the stream.
         */
        template < typename Ty >
        void write_pod( const Ty value )
        {
            _write_and_advance( sizeof( Ty ), &value );
        }

    private:
        void _write_and_advance( const mp_u64 count, const void *src )
        {
            if ( !buffer_ || !count )
                return;

            const auto bytes = static_cast< const mp_u8 * >( src );
            buffer_->insert( buffer_->end( ), bytes, bytes + count );
        }

    public:
        StreamWriter &write_u8( const mpc::mp_u8 value )
        {
            write_pod< mpc::mp_u8 >( value );
            return *this;
        }

        StreamWriter &write_u16( const mpc::mp_u16 value )
        {
            write_pod< mpc::mp_u16 >( value );
            return *this;
        }

        StreamWriter &write_u32( const mpc::mp_u32 value )
        {
            write_pod< mpc::mp_u32 >( value );
            return *this;
        }

        StreamWriter &write_u64( const mpc::mp_u64 value )
        {
            write_pod< mpc::mp_u64 >( value );
            return *this;
        }

        /**
         * @brief Append `count` bytes from `src` to the stream.
         * @param count Size, in bytes, of the data pointed to by `src`.
         * @param src Buffer containing at least `count` bytes.
         * @return StreamWriter&
         */
        StreamWriter &write( const mp_u64 count, const mp_u8 *src )
        {
            _write_and_advance( count, src );
            return *this;
        }
    };
}
