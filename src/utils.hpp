#ifndef UTILS_HPP
#define UTILS_HPP

#include <boost/cstdint.hpp>
#include <stdexcept>
#include <string>
#include <vector>

typedef std::vector<uint8_t> PacketData;

/*!
 * base64/hex文字列を変換できない場合にthrowする例外
 */
class InvalidEncodingError : public std::runtime_error
{
public:
    InvalidEncodingError( const std::string &msg ) : std::runtime_error( msg )
    {
    }
};

void encodeToBase64( const std::vector<uint8_t> &, std::string & );
void decodeFromBase64( const std::string &, std::vector<uint8_t> & );

void encodeToHex( const std::vector<uint8_t> &src, std::string &dst );
void decodeFromHex( const std::string &src, std::vector<uint8_t> &dst );

std::string printPacketData( const PacketData &p );

#endif
