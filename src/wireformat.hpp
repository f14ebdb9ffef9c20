#ifndef WIREFORMAT_HPP
#define WIREFORMAT_HPP

#include "utils.hpp"
#include <boost/cstdint.hpp>
#include <stdexcept>
#include <string>
#include <vector>

/*!
 * DNS Messageを組み立てるための連続したバッファ
 * コンストラクタで確保した容量を超えない限り、data()の指す領域は移動しない
 */
class WireFormat
{
private:
    PacketData mBuffer;

    void checkIndex( size_t i, size_t length = 1 ) const
    {
        if ( i + length > mBuffer.size() )
            throw std::out_of_range( "range error" );
    }

public:
    WireFormat( size_t capacity = 512 );
    WireFormat( const PacketData &data );
    WireFormat( const uint8_t *begin, const uint8_t *end );

    void push_back( uint8_t v )
    {
        mBuffer.push_back( v );
    }

    void pushUInt8( uint8_t v )
    {
        push_back( v );
    }

    void pushUInt16HtoN( uint16_t v )
    {
        push_back( 0xff & ( v >> 8 ) );
        push_back( 0xff & ( v >> 0 ) );
    }

    void pushUInt32HtoN( uint32_t v )
    {
        push_back( 0xff & ( v >> 24 ) );
        push_back( 0xff & ( v >> 16 ) );
        push_back( 0xff & ( v >> 8 ) );
        push_back( 0xff & ( v >> 0 ) );
    }

    void pushBuffer( const uint8_t *begin, const uint8_t *end )
    {
        mBuffer.insert( mBuffer.end(), begin, end );
    }

    void pushBuffer( const PacketData &data )
    {
        mBuffer.insert( mBuffer.end(), data.begin(), data.end() );
    }

    void pushBuffer( const std::string &data )
    {
        mBuffer.insert( mBuffer.end(), data.begin(), data.end() );
    }

    // overwrite 16bit value which has been already pushed.
    void setUInt16HtoN( size_t offset, uint16_t v );
    uint16_t getUInt16NtoH( size_t offset ) const;

    const uint8_t &operator[]( size_t i ) const
    {
        checkIndex( i );
        return mBuffer[ i ];
    }

    uint8_t &operator[]( size_t i )
    {
        checkIndex( i );
        return mBuffer[ i ];
    }

    const uint8_t &at( size_t i ) const
    {
        return ( *this )[ i ];
    }

    size_t size() const
    {
        return mBuffer.size();
    }

    size_t capacity() const
    {
        return mBuffer.capacity();
    }

    const uint8_t *data() const
    {
        return mBuffer.data();
    }

    const uint8_t *begin() const
    {
        return mBuffer.data();
    }

    const uint8_t *end() const
    {
        return mBuffer.data() + mBuffer.size();
    }

    const PacketData &get() const
    {
        return mBuffer;
    }
};

#endif
