#include "wireformat.hpp"

WireFormat::WireFormat( size_t capacity )
{
    mBuffer.reserve( capacity );
}

WireFormat::WireFormat( const PacketData &data )
    : mBuffer( data )
{
}

WireFormat::WireFormat( const uint8_t *begin, const uint8_t *end )
    : mBuffer( begin, end )
{
}

void WireFormat::setUInt16HtoN( size_t offset, uint16_t v )
{
    checkIndex( offset, 2 );
    mBuffer[ offset ]     = 0xff & ( v >> 8 );
    mBuffer[ offset + 1 ] = 0xff & ( v >> 0 );
}

uint16_t WireFormat::getUInt16NtoH( size_t offset ) const
{
    checkIndex( offset, 2 );
    return ( mBuffer[ offset ] << 8 ) | mBuffer[ offset + 1 ];
}
