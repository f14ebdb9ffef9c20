#include "sig0.hpp"
#include <boost/lexical_cast.hpp>
#include <cstring>
#include <sstream>
#include <openssl/err.h>

namespace sig0
{
    const EVP_MD *getHashAlgorithm( uint8_t algo )
    {
        switch ( algo ) {
        case DNSSEC_DSA:
        case DNSSEC_RSASHA1:
            return EVP_sha1();
        case DNSSEC_RSASHA256:
        case DNSSEC_ECDSAP256SHA256:
            return EVP_sha256();
        case DNSSEC_ECDSAP384SHA384:
            return EVP_sha384();
        case DNSSEC_RSASHA512:
            return EVP_sha512();
        default:
            throw AlgorithmError( "unknown sign algorithm " + boost::lexical_cast<std::string>( (unsigned int)algo ) );
        }
    }

    bool isSupportedAlgorithm( uint8_t algo )
    {
        return algo == DNSSEC_DSA || isRSAAlgorithm( algo ) || isECDSAAlgorithm( algo );
    }

    bool isRSAAlgorithm( uint8_t algo )
    {
        return algo == DNSSEC_RSASHA1 || algo == DNSSEC_RSASHA256 || algo == DNSSEC_RSASHA512;
    }

    bool isECDSAAlgorithm( uint8_t algo )
    {
        return algo == DNSSEC_ECDSAP256SHA256 || algo == DNSSEC_ECDSAP384SHA384;
    }

    SignAlgorithm stringToSignAlgorithm( const std::string &str )
    {
        if ( str == "DSA" )
            return DNSSEC_DSA;
        else if ( str == "RSASHA1" )
            return DNSSEC_RSASHA1;
        else if ( str == "RSASHA256" )
            return DNSSEC_RSASHA256;
        else if ( str == "RSASHA512" )
            return DNSSEC_RSASHA512;
        else if ( str == "ECDSAP256SHA256" )
            return DNSSEC_ECDSAP256SHA256;
        else if ( str == "ECDSAP384SHA384" )
            return DNSSEC_ECDSAP384SHA384;

        throw std::runtime_error( "unknown algorithm \"" + str + "\"" );
    }

    std::string signAlgorithmToString( uint8_t algo )
    {
        switch ( algo ) {
        case DNSSEC_DSA:
            return "DSA";
        case DNSSEC_RSASHA1:
            return "RSASHA1";
        case DNSSEC_RSASHA256:
            return "RSASHA256";
        case DNSSEC_RSASHA512:
            return "RSASHA512";
        case DNSSEC_ECDSAP256SHA256:
            return "ECDSAP256SHA256";
        case DNSSEC_ECDSAP384SHA384:
            return "ECDSAP384SHA384";
        default:
            return boost::lexical_cast<std::string>( (unsigned int)algo );
        }
    }

    void throwOpenSSLException( const std::string &message )
    {
        unsigned long code = ERR_get_error();
        char openssl_error[ 1024 ];
        std::memset( openssl_error, 0, sizeof( openssl_error ) );
        ERR_error_string_n( code, openssl_error, sizeof( openssl_error ) );
        ERR_clear_error();

        std::ostringstream err;
        err << message << "(" << openssl_error << ")";
        throw SIG0Error( err.str() );
    }
}
