#include "publickey.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/param_build.h>
#include <openssl/params.h>

namespace sig0
{
    typedef std::unique_ptr<BIGNUM, void ( * )( BIGNUM * )>                 BIGNUMPtr;
    typedef std::unique_ptr<OSSL_PARAM_BLD, void ( * )( OSSL_PARAM_BLD * )> OSSLParamBldPtr;
    typedef std::unique_ptr<OSSL_PARAM, void ( * )( OSSL_PARAM * )>         OSSLParamPtr;
    typedef std::unique_ptr<EVP_PKEY_CTX, void ( * )( EVP_PKEY_CTX * )>     EVPPKeyCtxPtr;

    static EVPPKeyPtr failed( const std::string &reason )
    {
        BOOST_LOG_TRIVIAL( debug ) << "cannot load public key: " << reason;
        ERR_clear_error();
        return EVPPKeyPtr();
    }

    static BIGNUMPtr toBN( const uint8_t *begin, size_t size )
    {
        return BIGNUMPtr( BN_bin2bn( begin, size, nullptr ), BN_free );
    }

    static EVPPKeyPtr fromParameters( const char *key_type, const OSSL_PARAM *params )
    {
        EVPPKeyCtxPtr ctx( EVP_PKEY_CTX_new_from_name( nullptr, key_type, nullptr ), EVP_PKEY_CTX_free );
        if ( !ctx )
            return failed( std::string( "cannot create context for " ) + key_type );
        if ( EVP_PKEY_fromdata_init( ctx.get() ) != 1 )
            return failed( std::string( "cannot initialize " ) + key_type + " key" );

        EVP_PKEY *pkey = nullptr;
        if ( EVP_PKEY_fromdata( ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, const_cast<OSSL_PARAM *>( params ) ) != 1 )
            return failed( std::string( "cannot construct " ) + key_type + " key" );
        return wrapEVPPKey( pkey );
    }

    static EVPPKeyPtr buildKey( const char *key_type, OSSL_PARAM_BLD *param_bld )
    {
        OSSLParamPtr params( OSSL_PARAM_BLD_to_param( param_bld ), OSSL_PARAM_free );
        if ( !params )
            return failed( std::string( "cannot build parameters for " ) + key_type );
        return fromParameters( key_type, params.get() );
    }

    static EVPPKeyPtr loadRSAKey( const PacketData &key )
    {
        // exponent lengthが0の場合は、続く2 octetsがexponent length
        size_t exponent_offset;
        size_t exponent_length;
        if ( key.size() < 1 )
            return failed( "empty RSA key" );
        if ( key[ 0 ] != 0 ) {
            exponent_length = key[ 0 ];
            exponent_offset = 1;
        }
        else {
            if ( key.size() < 3 )
                return failed( "too short RSA key" );
            exponent_length = ( key[ 1 ] << 8 ) | key[ 2 ];
            exponent_offset = 3;
        }
        if ( exponent_length == 0 || key.size() <= exponent_offset + exponent_length )
            return failed( "invalid RSA exponent length" );

        BIGNUMPtr e = toBN( key.data() + exponent_offset, exponent_length );
        BIGNUMPtr n = toBN( key.data() + exponent_offset + exponent_length,
                            key.size() - exponent_offset - exponent_length );
        if ( !e || !n )
            return failed( "cannot load RSA parameters" );

        OSSLParamBldPtr param_bld( OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free );
        if ( !param_bld ||
             OSSL_PARAM_BLD_push_BN( param_bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get() ) != 1 ||
             OSSL_PARAM_BLD_push_BN( param_bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get() ) != 1 )
            return failed( "cannot build RSA parameters" );

        return buildKey( "RSA", param_bld.get() );
    }

    static EVPPKeyPtr loadDSAKey( const PacketData &key )
    {
        if ( key.size() < 1 )
            return failed( "empty DSA key" );
        uint8_t t = key[ 0 ];
        if ( t > 8 )
            return failed( "invalid DSA T parameter" );
        size_t field_size = 64 + t * 8;
        if ( key.size() != 1 + 20 + field_size * 3 )
            return failed( "invalid DSA key length" );

        const uint8_t *pos = key.data() + 1;
        BIGNUMPtr q = toBN( pos, 20 );
        pos += 20;
        BIGNUMPtr p = toBN( pos, field_size );
        pos += field_size;
        BIGNUMPtr g = toBN( pos, field_size );
        pos += field_size;
        BIGNUMPtr y = toBN( pos, field_size );
        if ( !q || !p || !g || !y )
            return failed( "cannot load DSA parameters" );

        OSSLParamBldPtr param_bld( OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free );
        if ( !param_bld ||
             OSSL_PARAM_BLD_push_BN( param_bld.get(), OSSL_PKEY_PARAM_FFC_P, p.get() ) != 1 ||
             OSSL_PARAM_BLD_push_BN( param_bld.get(), OSSL_PKEY_PARAM_FFC_Q, q.get() ) != 1 ||
             OSSL_PARAM_BLD_push_BN( param_bld.get(), OSSL_PKEY_PARAM_FFC_G, g.get() ) != 1 ||
             OSSL_PARAM_BLD_push_BN( param_bld.get(), OSSL_PKEY_PARAM_PUB_KEY, y.get() ) != 1 )
            return failed( "cannot build DSA parameters" );

        return buildKey( "DSA", param_bld.get() );
    }

    static EVPPKeyPtr loadECDSAKey( const PacketData &key, const char *curve, size_t field_size )
    {
        if ( key.size() != field_size * 2 )
            return failed( std::string( "invalid public key length for " ) + curve );

        // OpenSSLは先頭にpoint conversion formを必要とする
        PacketData point;
        point.reserve( key.size() + 1 );
        point.push_back( POINT_CONVERSION_UNCOMPRESSED );
        point.insert( point.end(), key.begin(), key.end() );

        std::string group( curve );
        OSSL_PARAM  params[] = {
            OSSL_PARAM_construct_utf8_string( OSSL_PKEY_PARAM_GROUP_NAME, &group[ 0 ], 0 ),
            OSSL_PARAM_construct_octet_string( OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size() ),
            OSSL_PARAM_construct_end(),
        };

        return fromParameters( "EC", params );
    }

    EVPPKeyPtr loadPublicKey( const RecordKEY &key )
    {
        switch ( key.getAlgorithm() ) {
        case DNSSEC_DSA:
            return loadDSAKey( key.getPublicKey() );
        case DNSSEC_RSASHA1:
        case DNSSEC_RSASHA256:
        case DNSSEC_RSASHA512:
            return loadRSAKey( key.getPublicKey() );
        case DNSSEC_ECDSAP256SHA256:
            return loadECDSAKey( key.getPublicKey(), "prime256v1", 32 );
        case DNSSEC_ECDSAP384SHA384:
            return loadECDSAKey( key.getPublicKey(), "secp384r1", 48 );
        default:
            return failed( "unsupported algorithm " + signAlgorithmToString( key.getAlgorithm() ) );
        }
    }
}
