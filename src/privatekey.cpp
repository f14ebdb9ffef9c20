#include "privatekey.hpp"
#include <cstdio>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/objects.h>
#include <openssl/pem.h>

namespace sig0
{
    EVPPKeyPtr wrapEVPPKey( EVP_PKEY *key )
    {
        return EVPPKeyPtr( key, EVP_PKEY_free );
    }

    static PacketData getBNParameter( EVP_PKEY *key, const char *name, size_t pad_size = 0 )
    {
        BIGNUM *bn = nullptr;
        if ( EVP_PKEY_get_bn_param( key, name, &bn ) != 1 || bn == nullptr )
            throwOpenSSLException( std::string( "cannot get key parameter " ) + name );
        std::shared_ptr<BIGNUM> bn_ptr( bn, BN_free );

        size_t size = pad_size ? pad_size : BN_num_bytes( bn );
        PacketData buf( size );
        if ( BN_bn2binpad( bn, buf.data(), size ) < 0 )
            throw PrivateKeyError( std::string( "key parameter " ) + name + " is too large" );
        return buf;
    }

    static size_t getBNParameterSize( EVP_PKEY *key, const char *name )
    {
        return getBNParameter( key, name ).size();
    }

    static void copyFactor( const PacketData &src, PacketData &dst )
    {
        dst.clear();
        auto i = src.begin();
        for ( ; i != src.end() && *i == 0; i++ ); // skip front 0x00. see RFC3110 2
        dst.insert( dst.end(), i, src.end() );
    }

    /*******************************************************************************************
     * RSAPrivateKey
     *******************************************************************************************/
    bool RSAPrivateKey::isValid() const
    {
        return get() != nullptr && EVP_PKEY_get_base_id( get() ) == EVP_PKEY_RSA;
    }

    size_t RSAPrivateKey::getModulusSize() const
    {
        return getBNParameterSize( get(), OSSL_PKEY_PARAM_RSA_N );
    }

    PacketData RSAPrivateKey::getKEYFormat() const
    {
        PacketData exponent, modulus;
        copyFactor( getBNParameter( get(), OSSL_PKEY_PARAM_RSA_E ), exponent );
        copyFactor( getBNParameter( get(), OSSL_PKEY_PARAM_RSA_N ), modulus );

        PacketData result;
        uint32_t   exponent_size = exponent.size();
        if ( exponent_size < 0x0100 ) {
            result.push_back( exponent_size );
        }
        else {
            result.push_back( 0 );
            result.push_back( ( exponent_size & 0xff00 ) >> 8 );
            result.push_back( ( exponent_size & 0x00ff ) >> 0 );
        }

        result.insert( result.end(), exponent.begin(), exponent.end() );
        result.insert( result.end(), modulus.begin(), modulus.end() );
        return result;
    }

    /*******************************************************************************************
     * DSAPrivateKey
     *******************************************************************************************/
    bool DSAPrivateKey::isValid() const
    {
        return get() != nullptr && EVP_PKEY_get_base_id( get() ) == EVP_PKEY_DSA;
    }

    uint8_t DSAPrivateKey::getT() const
    {
        size_t p_size = getBNParameterSize( get(), OSSL_PKEY_PARAM_FFC_P );
        if ( p_size < 64 || p_size > 128 || ( p_size - 64 ) % 8 != 0 )
            throw PrivateKeyError( "DSA prime must be 512 - 1024 bits and multiple of 64 bits" );
        return ( p_size - 64 ) / 8;
    }

    //  +--+--------+--------+--------+--------+
    //  |T | Q(20)  | P      | G      | Y      |
    //  +--+--------+--------+--------+--------+
    //  P, G, Y: 64 + T*8 octets
    PacketData DSAPrivateKey::getKEYFormat() const
    {
        uint8_t t          = getT();
        size_t  field_size = 64 + t * 8;

        PacketData q = getBNParameter( get(), OSSL_PKEY_PARAM_FFC_Q );
        if ( q.size() > 20 )
            throw PrivateKeyError( "DSA subprime must be 160 bits" );

        PacketData result;
        result.push_back( t );
        PacketData q_pad = getBNParameter( get(), OSSL_PKEY_PARAM_FFC_Q, 20 );
        PacketData p     = getBNParameter( get(), OSSL_PKEY_PARAM_FFC_P, field_size );
        PacketData g     = getBNParameter( get(), OSSL_PKEY_PARAM_FFC_G, field_size );
        PacketData y     = getBNParameter( get(), OSSL_PKEY_PARAM_PUB_KEY, field_size );
        result.insert( result.end(), q_pad.begin(), q_pad.end() );
        result.insert( result.end(), p.begin(), p.end() );
        result.insert( result.end(), g.begin(), g.end() );
        result.insert( result.end(), y.begin(), y.end() );
        return result;
    }

    /*******************************************************************************************
     * ECDSAPrivateKey
     *******************************************************************************************/
    bool ECDSAPrivateKey::isValid() const
    {
        return get() != nullptr && EVP_PKEY_get_base_id( get() ) == EVP_PKEY_EC && getCurve() != NID_undef;
    }

    int ECDSAPrivateKey::getCurve() const
    {
        char   group_name[ 80 ];
        size_t group_name_length = 0;
        if ( EVP_PKEY_get_utf8_string_param( get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                             group_name, sizeof( group_name ), &group_name_length ) != 1 )
            return NID_undef;

        int nid = OBJ_sn2nid( group_name );
        if ( nid == NID_undef )
            nid = EC_curve_nist2nid( group_name );
        if ( nid == NID_X9_62_prime256v1 || nid == NID_secp384r1 )
            return nid;
        return NID_undef;
    }

    size_t ECDSAPrivateKey::getFieldSize() const
    {
        switch ( getCurve() ) {
        case NID_X9_62_prime256v1:
            return 32;
        case NID_secp384r1:
            return 48;
        default:
            throw PrivateKeyError( "unsupported curve for ECDSA" );
        }
    }

    // RFC 6605 4. Q = X | Y
    PacketData ECDSAPrivateKey::getKEYFormat() const
    {
        size_t     field_size = getFieldSize();
        PacketData x          = getBNParameter( get(), OSSL_PKEY_PARAM_EC_PUB_X, field_size );
        PacketData y          = getBNParameter( get(), OSSL_PKEY_PARAM_EC_PUB_Y, field_size );

        PacketData result( x );
        result.insert( result.end(), y.begin(), y.end() );
        return result;
    }

    /*******************************************************************************************
     * PrivateKey
     *******************************************************************************************/
    PrivateKey makePrivateKey( const EVPPKeyPtr &key )
    {
        if ( !key )
            throw PrivateKeyError( "private key is empty" );

        switch ( EVP_PKEY_get_base_id( key.get() ) ) {
        case EVP_PKEY_RSA:
            return RSAPrivateKey( key );
        case EVP_PKEY_DSA:
            return DSAPrivateKey( key );
        case EVP_PKEY_EC: {
            ECDSAPrivateKey ecdsa( key );
            if ( ecdsa.getCurve() == NID_undef )
                throw PrivateKeyError( "unsupported curve for ECDSA" );
            return ecdsa;
        }
        default:
            throw PrivateKeyError( "unsupported private key type" );
        }
    }

    PrivateKey loadPrivateKey( const std::string &key_filename )
    {
        FILE *fp_private_key = std::fopen( key_filename.c_str(), "r" );
        if ( !fp_private_key ) {
            throw std::runtime_error( "cannot open private key \"" + key_filename + "\"" );
        }
        BIO *bio_private_key = BIO_new_fp( fp_private_key, BIO_CLOSE );
        if ( !bio_private_key ) {
            std::fclose( fp_private_key );
            throw std::runtime_error( "cannot create bio for private key file" );
        }

        EVP_PKEY *private_key = PEM_read_bio_PrivateKey( bio_private_key, NULL, NULL, NULL );
        BIO_free_all( bio_private_key );
        if ( !private_key ) {
            throwOpenSSLException( "cannot read private key \"" + key_filename + "\"" );
        }

        return makePrivateKey( wrapEVPPKey( private_key ) );
    }

    class ValidKeyVisitor : public boost::static_visitor<bool>
    {
    public:
        template <typename KEY>
        bool operator()( const KEY &key ) const
        {
            return key.isValid();
        }
    };

    bool isValidPrivateKey( const PrivateKey &key )
    {
        return boost::apply_visitor( ValidKeyVisitor(), key );
    }

    class UsableKeyVisitor : public boost::static_visitor<bool>
    {
    public:
        UsableKeyVisitor( uint8_t algo ) : mAlgorithm( algo ) {}

        bool operator()( const RSAPrivateKey & ) const
        {
            return isRSAAlgorithm( mAlgorithm );
        }

        bool operator()( const DSAPrivateKey & ) const
        {
            return mAlgorithm == DNSSEC_DSA;
        }

        bool operator()( const ECDSAPrivateKey &key ) const
        {
            int curve = key.getCurve();
            return ( mAlgorithm == DNSSEC_ECDSAP256SHA256 && curve == NID_X9_62_prime256v1 ) ||
                   ( mAlgorithm == DNSSEC_ECDSAP384SHA384 && curve == NID_secp384r1 );
        }

    private:
        uint8_t mAlgorithm;
    };

    bool isUsableWith( const PrivateKey &key, uint8_t algo )
    {
        return boost::apply_visitor( UsableKeyVisitor( algo ), key );
    }

    class KEYFormatVisitor : public boost::static_visitor<PacketData>
    {
    public:
        template <typename KEY>
        PacketData operator()( const KEY &key ) const
        {
            return key.getKEYFormat();
        }
    };

    RecordKEY getKEYRecord( const PrivateKey &key, uint8_t algo, uint16_t flags )
    {
        if ( !isValidPrivateKey( key ) )
            throw PrivateKeyError( "invalid private key" );
        if ( !isUsableWith( key, algo ) )
            throw AlgorithmError( "private key cannot be used with " + signAlgorithmToString( algo ) );

        return RecordKEY( flags, algo, boost::apply_visitor( KEYFormatVisitor(), key ) );
    }

    uint16_t getKeyTag( const RecordKEY &key )
    {
        WireFormat message;
        key.outputCanonicalWireFormat( message );

        // From RFC4034
        uint32_t ac = 0;

        for ( size_t i = 0; i < message.size(); ++i )
            ac += ( i & 1 ) ? message[ i ] : message[ i ] << 8;
        ac += ( ac >> 16 ) & 0xFFFF;
        return ac & 0xffff;
    }
}
