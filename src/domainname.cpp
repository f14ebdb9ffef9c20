#include "domainname.hpp"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace sig0
{
    const unsigned int MAX_LABEL_LENGTH      = 63;
    const unsigned int MAX_DOMAINNAME_LENGTH = 255;
    const int          MAX_DECOMPRESS_DEPTH  = 100;

    static uint8_t toLower( uint8_t c )
    {
        if ( 'A' <= c && c <= 'Z' ) {
            return 'a' + c - 'A';
        }
        return c;
    }

    static std::string toLowerLabel( const std::string &label )
    {
        std::string lower_label;
        for ( unsigned int i = 0; i < label.size(); i++ )
            lower_label.push_back( toLower( label[ i ] ) );
        return lower_label;
    }

    static void throwInvalidDomainnameString( const char *name )
    {
        std::ostringstream os;
        os << "invalid domainname string: \"" << name << "\"";
        throw FormatError( os.str() );
    }

    static void stringToLabels( const char *name, std::deque<std::string> &labels )
    {
        labels.clear();

        if ( name == NULL || name[ 0 ] == 0 )
            return;

        unsigned int name_length = std::strlen( name );
        std::string  label;
        for ( unsigned int i = 0; i < name_length; i++ ) {
            if ( name[ i ] == '\\' ) {
                if ( name_length <= i + 1 )
                    throwInvalidDomainnameString( name );
                if ( name[ i + 1 ] == '\\' ) {
                    label.push_back( '\\' );
                    i++;
                }
                else if ( name[ i + 1 ] == '.' ) {
                    label.push_back( '.' );
                    i++;
                }
                else if ( std::isdigit( static_cast<unsigned char>( name[ i + 1 ] ) ) ) {
                    if ( name_length <= i + 3 ||
                         name[ i + 1 ] < '0' || name[ i + 1 ] > '3' ||
                         name[ i + 2 ] < '0' || name[ i + 2 ] > '7' ||
                         name[ i + 3 ] < '0' || name[ i + 3 ] > '7' ) {
                        throwInvalidDomainnameString( name );
                    }
                    char oct[ 4 ] = { name[ i + 1 ], name[ i + 2 ], name[ i + 3 ], 0 };
                    label.push_back( (uint8_t)std::strtol( oct, nullptr, 8 ) );
                    i += 3;
                }
                else
                    throwInvalidDomainnameString( name );
            }
            else if ( name[ i ] == '.' ) {
                if ( label.size() > 0 )
                    labels.push_back( label );
                label = "";
            }
            else {
                label.push_back( name[ i ] );
            }
            if ( label.size() > MAX_LABEL_LENGTH )
                throwInvalidDomainnameString( name );
        }
        if ( label != "" )
            labels.push_back( label );
    }

    static void canonicalizeLabels( const std::deque<std::string> &from,
                                    std::deque<std::string> &to )
    {
        to.clear();
        for ( unsigned int i = 0; i < from.size(); i++ ) {
            if ( from[ i ].size() == 0 )
                break;
            to.push_back( toLowerLabel( from[ i ] ) );
        }
    }

    static void outputWireFormat( const std::deque<std::string> &labels,
                                  WireFormat &message, Offset offset )
    {
        for ( unsigned int i = 0; i < labels.size(); i++ ) {
            if ( labels[ i ].size() == 0 )
                break;
            message.pushUInt8( labels[ i ].size() );
            message.pushBuffer( labels[ i ] );
        }

        if ( offset == NO_COMPRESSION ) {
            message.pushUInt8( 0 );
        } else {
            message.pushUInt8( 0xC0 | ( uint8_t )( offset >> 8 ) );
            message.pushUInt8( 0xff & (uint8_t)offset );
        }
    }

    Domainname::Domainname( const std::deque<std::string> &l )
        : labels( l )
    {
        canonicalizeLabels( labels, canonical_labels );
    }

    Domainname::Domainname( const char *name )
    {
        stringToLabels( name, labels );
        canonicalizeLabels( labels, canonical_labels );
    }

    Domainname::Domainname( const std::string &name )
    {
        stringToLabels( name.c_str(), labels );
        canonicalizeLabels( labels, canonical_labels );
    }

    std::string Domainname::toString() const
    {
        if ( labels.empty() )
            return ".";

        std::stringstream result;
        for ( auto label : labels ) {
            for ( auto c : label ) {
                if ( c == '\\' ) {
                    result << '\\' << '\\';
                }
                else if ( c == '.' ) {
                    result << '\\' << '.';
                }
                else if ( std::isprint( static_cast<unsigned char>( c ) ) ) {
                    result << c;
                }
                else {
                    result << '\\' << std::oct << std::setw( 3 ) << std::setfill( '0' )
                           << (uint16_t)(uint8_t)c << std::dec;
                }
            }
            result << '.';
        }

        return result.str();
    }

    void Domainname::outputWireFormat( WireFormat &message, Offset offset ) const
    {
        sig0::outputWireFormat( labels, message, offset );
    }

    void Domainname::outputCanonicalWireFormat( WireFormat &message ) const
    {
        sig0::outputWireFormat( canonical_labels, message, NO_COMPRESSION );
    }

    PacketData Domainname::getWireFormat() const
    {
        WireFormat message;
        outputWireFormat( message );
        return message.get();
    }

    const uint8_t *Domainname::parsePacket( Domainname    &ref_domainname,
                                            const uint8_t *packet_begin,
                                            const uint8_t *packet_end,
                                            const uint8_t *begin,
                                            int            recur )
    {
        if ( recur > MAX_DECOMPRESS_DEPTH ) {
            throw FormatError( "detected domainname decompress loop" );
        }
        if ( packet_begin == packet_end ) {
            throw FormatError( "cannot parse empty data as a domainname" );
        }
        if ( begin < packet_begin || begin >= packet_end ) {
            throw FormatError( "domainname is out of packet" );
        }

        const uint8_t *p = begin;
        while ( true ) {
            if ( packet_end - p < 1 )
                throw FormatError( "domainname size is too short(truncated ?)" );
            if ( *p == 0 )
                break;

            // メッセージ圧縮を行っている場合
            if ( ( *p & 0xC0 ) == 0xC0 ) {
                if ( packet_end - p < 2 ) {
                    throw FormatError( "domainname size is too short for decompression" );
                }
                int offset = ( ( p[ 0 ] << 8 ) | p[ 1 ] ) & 0x3fff;
                if ( packet_begin + offset >= p ) {
                    throw FormatError( "detected forward reference of domainname decompress" );
                }

                parsePacket( ref_domainname, packet_begin, packet_end, packet_begin + offset, recur + 1 );
                return p + 2;
            }
            if ( *p & 0xC0 ) {
                throw FormatError( "unsupported label type" );
            }

            uint8_t label_length = *p;
            p++;

            if ( packet_end - p < label_length )
                throw FormatError( "domainname size is too short(truncated ?)" );
            ref_domainname.addSuffix( std::string( p, p + label_length ) );
            p += label_length;

            if ( ref_domainname.size() > MAX_DOMAINNAME_LENGTH )
                throw FormatError( "domainname is too long" );
        }

        p++;
        return p;
    }

    unsigned int Domainname::size( Offset offset ) const
    {
        unsigned int size = 0;
        for ( auto &label : labels ) {
            size += ( 1 + label.size() );
        }
        if ( offset == NO_COMPRESSION )
            return size + 1;
        else
            return size + 2;
    }

    void Domainname::addSubdomain( const std::string &label )
    {
        labels.push_front( label );
        canonical_labels.push_front( toLowerLabel( label ) );
    }

    void Domainname::addSuffix( const std::string &label )
    {
        labels.push_back( label );
        canonical_labels.push_back( toLowerLabel( label ) );
    }

    void Domainname::popSubdomain()
    {
        labels.pop_front();
        canonical_labels.pop_front();
    }

    std::ostream &operator<<( std::ostream &os, const Domainname &name )
    {
        return os << name.toString();
    }

    bool Domainname::operator==( const Domainname &rhs ) const
    {
        return getCanonicalLabels() == rhs.getCanonicalLabels();
    }

    bool Domainname::operator!=( const Domainname &rhs ) const
    {
        return !( *this == rhs );
    }

    bool Domainname::operator<( const Domainname &rhs ) const
    {
        if ( *this == rhs )
            return false;

        auto llabel = getCanonicalLabels().rbegin();
        auto rlabel = rhs.getCanonicalLabels().rbegin();

        for ( ; true; llabel++, rlabel++ ) {
            if ( llabel == getCanonicalLabels().rend() )
                return true;
            if ( rlabel == rhs.getCanonicalLabels().rend() )
                return false;
            if ( *llabel == *rlabel )
                continue;
            return *llabel < *rlabel;
        }
    }

    uint16_t OffsetDB::findDomainname( const Domainname &name ) const
    {
        OffsetContainerIterator offset = mOffsets.find( name );
        if ( offset == mOffsets.end() )
            return NOT_FOUND;
        else
            return offset->second;
    }

    void OffsetDB::add( const Domainname &name, size_t offset )
    {
        // compression pointer can refer only first 16KB of message.
        if ( offset > 0x3fff )
            return;
        if ( NOT_FOUND == findDomainname( name ) )
            mOffsets.insert( std::make_pair( name, offset ) );
    }

    uint16_t OffsetDB::outputWireFormat( const Domainname &original, WireFormat &message )
    {
        size_t   pos        = message.size();
        uint16_t wrote_size = 0;

        for ( Domainname name = original; name.getLabelCount() > 0; ) {
            uint16_t offset = findDomainname( name );
            if ( offset != NOT_FOUND ) {
                message.pushUInt8( 0xC0 | ( ( offset >> 8 ) & 0xff ) );
                message.pushUInt8( 0xff & offset );
                wrote_size += 2;
                return wrote_size;
            }
            else {
                add( name, pos );
                std::string label = name.getLabels().front();
                message.pushUInt8( label.size() );
                message.pushBuffer( label );
                pos += ( 1 + label.size() );
                wrote_size += ( 1 + label.size() );
                name.popSubdomain();
            }
        }
        message.pushUInt8( 0 );
        wrote_size++;

        return wrote_size;
    }
}
