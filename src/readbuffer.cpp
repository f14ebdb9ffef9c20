#include "readbuffer.hpp"
#include <algorithm>
#include <sstream>

namespace sig0
{
    ReadBuffer::ReadBuffer( const uint8_t *begin, const uint8_t *end )
        : mBegin( begin ), mEnd( end ), mPosition( 0 )
    {
        if ( begin > end )
            throw std::logic_error( "begin of ReadBuffer must not be after end" );
    }

    ReadBuffer::ReadBuffer( const PacketData &buf )
        : mBegin( buf.data() ), mEnd( buf.data() + buf.size() ), mPosition( 0 )
    {}

    void ReadBuffer::checkRemained( size_t length, const char *what ) const
    {
        if ( getRemainedSize() < length ) {
            std::ostringstream os;
            os << "too few buffer remained to read " << what
               << " at offset " << mPosition << "(remained " << getRemainedSize() << " bytes)";
            throw FormatError( os.str() );
        }
    }

    uint8_t ReadBuffer::readUInt8()
    {
        checkRemained( 1, "uint8" );
        return mBegin[ mPosition++ ];
    }

    uint16_t ReadBuffer::readUInt16NtoH()
    {
        checkRemained( 2, "uint16" );
        uint16_t v = ( mBegin[ mPosition ] << 8 ) | mBegin[ mPosition + 1 ];
        mPosition += 2;
        return v;
    }

    uint32_t ReadBuffer::readUInt32NtoH()
    {
        checkRemained( 4, "uint32" );
        uint32_t v = ( static_cast<uint32_t>( mBegin[ mPosition ] ) << 24 ) |
                     ( static_cast<uint32_t>( mBegin[ mPosition + 1 ] ) << 16 ) |
                     ( static_cast<uint32_t>( mBegin[ mPosition + 2 ] ) << 8 ) |
                     ( static_cast<uint32_t>( mBegin[ mPosition + 3 ] ) << 0 );
        mPosition += 4;
        return v;
    }

    Domainname ReadBuffer::readDomainname()
    {
        if ( mPosition >= size() )
            throw FormatError( "no data remained for domainname" );

        Domainname name;
        const uint8_t *next = Domainname::parsePacket( name, mBegin, mEnd, mBegin + mPosition );
        mPosition = next - mBegin;
        return name;
    }

    size_t ReadBuffer::readBuffer( PacketData &buf, size_t req_size )
    {
        size_t read_size = std::min( req_size, getRemainedSize() );
        buf.assign( mBegin + mPosition, mBegin + mPosition + read_size );
        mPosition += read_size;
        return read_size;
    }

    void ReadBuffer::skip( size_t length )
    {
        checkRemained( length, "skipped field" );
        mPosition += length;
    }

    void ReadBuffer::seek( size_t position )
    {
        if ( position > size() )
            throw FormatError( "cannot seek beyond end of buffer" );
        mPosition = position;
    }

    size_t ReadBuffer::getRemainedSize() const
    {
        if ( size() < mPosition )
            return 0;
        return size() - mPosition;
    }
}
