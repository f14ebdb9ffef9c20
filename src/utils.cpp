#include "utils.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

static const char *to_base64 = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static uint8_t convertFromBase64( char c )
{
    if ( 'A' <= c && c <= 'Z' )
        return c - 'A';
    if ( 'a' <= c && c <= 'z' )
        return c - 'a' + 0x1a;
    if ( '0' <= c && c <= '9' )
        return c - '0' + 0x34;
    if ( c == '+' )
        return 0x3e;
    if ( c == '/' )
        return 0x3f;

    std::ostringstream os;
    os << "invalid base64 data \"" << c << "\"";
    throw InvalidEncodingError( os.str() );
}

//   +--first octet--+-second octet--+--third octet--+
//   |7 6 5 4 3 2 1 0|7 6 5 4 3 2 1 0|7 6 5 4 3 2 1 0|
//   +-----------+---+-------+-------+---+-----------+
//   |5 4 3 2 1 0|5 4 3 2 1 0|5 4 3 2 1 0|5 4 3 2 1 0|
//   +--1.index--+--2.index--+--3.index--+--4.index--+

void encodeToBase64( const std::vector<uint8_t> &data, std::string &output )
{
    output.clear();
    output.reserve( ( data.size() + 2 ) / 3 * 4 );

    unsigned int i = 0;
    for ( ; i + 2 < data.size(); i += 3 ) {
        uint32_t v = ( data[ i ] << 16 ) | ( data[ i + 1 ] << 8 ) | data[ i + 2 ];
        output.push_back( to_base64[ ( v >> 18 ) & 0x3f ] );
        output.push_back( to_base64[ ( v >> 12 ) & 0x3f ] );
        output.push_back( to_base64[ ( v >> 6 ) & 0x3f ] );
        output.push_back( to_base64[ v & 0x3f ] );
    }

    unsigned int remained = data.size() - i;
    if ( remained == 1 ) {
        uint32_t v = data[ i ] << 16;
        output.push_back( to_base64[ ( v >> 18 ) & 0x3f ] );
        output.push_back( to_base64[ ( v >> 12 ) & 0x3f ] );
        output.append( "==" );
    }
    else if ( remained == 2 ) {
        uint32_t v = ( data[ i ] << 16 ) | ( data[ i + 1 ] << 8 );
        output.push_back( to_base64[ ( v >> 18 ) & 0x3f ] );
        output.push_back( to_base64[ ( v >> 12 ) & 0x3f ] );
        output.push_back( to_base64[ ( v >> 6 ) & 0x3f ] );
        output.push_back( '=' );
    }
}

void decodeFromBase64( const std::string &data, std::vector<uint8_t> &output )
{
    output.clear();

    uint32_t     buffer = 0;
    unsigned int bits   = 0;
    bool         padded = false;
    for ( auto c : data ) {
        if ( std::isspace( static_cast<unsigned char>( c ) ) )
            continue;
        if ( c == '=' ) {
            padded = true;
            continue;
        }
        if ( padded )
            throw InvalidEncodingError( "base64 data after padding" );

        buffer = ( buffer << 6 ) | convertFromBase64( c );
        bits += 6;
        if ( bits >= 8 ) {
            bits -= 8;
            output.push_back( 0xff & ( buffer >> bits ) );
        }
    }
}

void encodeToHex( const std::vector<uint8_t> &src, std::string &dst )
{
    static const char *to_hex = "0123456789abcdef";

    dst.clear();
    dst.reserve( src.size() * 2 );
    for ( auto v : src ) {
        dst.push_back( to_hex[ v >> 4 ] );
        dst.push_back( to_hex[ v & 0x0f ] );
    }
}

static uint8_t convertFromHex( char c )
{
    if ( '0' <= c && c <= '9' )
        return c - '0';
    if ( 'a' <= c && c <= 'f' )
        return c - 'a' + 10;
    if ( 'A' <= c && c <= 'F' )
        return c - 'A' + 10;

    std::ostringstream os;
    os << "invalid hex data \"" << c << "\"";
    throw InvalidEncodingError( os.str() );
}

void decodeFromHex( const std::string &src, std::vector<uint8_t> &dst )
{
    std::string digits;
    for ( auto c : src ) {
        if ( ! std::isspace( static_cast<unsigned char>( c ) ) )
            digits.push_back( c );
    }
    if ( digits.size() % 2 != 0 )
        throw InvalidEncodingError( "hex data must have even length" );

    dst.clear();
    dst.reserve( digits.size() / 2 );
    for ( unsigned int i = 0; i < digits.size(); i += 2 ) {
        dst.push_back( ( convertFromHex( digits[ i ] ) << 4 ) | convertFromHex( digits[ i + 1 ] ) );
    }
}

std::string printPacketData( const PacketData &p )
{
    std::ostringstream os;
    for ( unsigned int i = 0; i < p.size(); i++ ) {
        if ( i % 16 == 0 )
            os << std::setw( 4 ) << std::setfill( '0' ) << std::hex << i << ": ";
        os << std::setw( 2 ) << std::setfill( '0' ) << std::hex << (unsigned int)p[ i ];
        if ( i % 16 == 15 || i + 1 == p.size() )
            os << std::endl;
        else
            os << " ";
    }
    return os.str();
}
