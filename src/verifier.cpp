#include "verifier.hpp"
#include "publickey.hpp"
#include "readbuffer.hpp"
#include <boost/log/trivial.hpp>
#include <ctime>
#include <sstream>
#include <openssl/bn.h>
#include <openssl/dsa.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/rsa.h>

namespace sig0
{
    typedef std::unique_ptr<EVP_PKEY_CTX, void ( * )( EVP_PKEY_CTX * )> EVPPKeyCtxPtr;
    typedef std::unique_ptr<EVP_MD_CTX, void ( * )( EVP_MD_CTX * )>     EVPMDCtxPtr;
    typedef std::unique_ptr<DSA_SIG, void ( * )( DSA_SIG * )>           DSASIGPtr;
    typedef std::unique_ptr<ECDSA_SIG, void ( * )( ECDSA_SIG * )>       ECDSASIGPtr;

    template <typename ERROR>
    static void fail( const std::string &message )
    {
        BOOST_LOG_TRIVIAL( debug ) << "SIG(0) verification failed: " << message;
        throw ERROR( message );
    }

    uint32_t getCurrentTime()
    {
        return static_cast<uint32_t>( std::time( nullptr ) );
    }

    /*******************************************************************************************
     * message layout
     *******************************************************************************************/
    struct SignedMessageLayout {
        uint16_t   mAdditionalCount;
        size_t     mBodyEnd;  // SIG recordの直前
        size_t     mSIGStart; // SIG RDATAの先頭
        size_t     mSIGEnd;   // signer nameの直後
        uint32_t   mExpiration;
        uint32_t   mInception;
        Domainname mSigner;

        SignedMessageLayout()
            : mAdditionalCount( 0 ), mBodyEnd( 0 ), mSIGStart( 0 ), mSIGEnd( 0 ), mExpiration( 0 ), mInception( 0 )
        {}
    };

    static SignedMessageLayout parseLayout( const PacketData &message )
    {
        if ( message.size() < HEADER_SIZE )
            throw FormatError( "message is shorter than DNS header" );

        ReadBuffer buffer( message );
        buffer.seek( HEADER_QDCOUNT_OFFSET );
        uint16_t question_count   = buffer.readUInt16NtoH();
        uint16_t answer_count     = buffer.readUInt16NtoH();
        uint16_t authority_count  = buffer.readUInt16NtoH();
        uint16_t additional_count = buffer.readUInt16NtoH();
        if ( additional_count == 0 )
            throw FormatError( "message has no SIG record" );

        for ( uint16_t i = 0; i < question_count; i++ ) {
            buffer.readDomainname();
            buffer.skip( 2 + 2 ); // type, class
        }

        uint32_t record_count = answer_count + authority_count + additional_count - 1;
        for ( uint32_t i = 0; i < record_count; i++ ) {
            buffer.readDomainname();
            buffer.skip( 2 + 2 + 4 ); // type, class, ttl
            uint16_t rdata_length = buffer.readUInt16NtoH();
            buffer.skip( rdata_length );
        }

        SignedMessageLayout layout;
        layout.mAdditionalCount = additional_count;
        layout.mBodyEnd         = buffer.getPosition();

        buffer.readDomainname();
        buffer.skip( 2 + 2 + 4 + 2 ); // type, class, ttl, rdlength
        layout.mSIGStart = buffer.getPosition();

        buffer.skip( 2 + 1 + 1 + 4 ); // type covered, algorithm, labels, original ttl
        layout.mExpiration = buffer.readUInt32NtoH();
        layout.mInception  = buffer.readUInt32NtoH();
        buffer.skip( 2 ); // key tag
        layout.mSigner = buffer.readDomainname();
        layout.mSIGEnd = buffer.getPosition();

        return layout;
    }

    static PacketData computeDigest( const EVP_MD *md, const PacketData &message, const SignedMessageLayout &layout )
    {
        // ARCOUNTはSIG recordを除いた値に戻す
        uint16_t unsigned_count = layout.mAdditionalCount - 1;
        uint8_t  additional_count[ 2 ];
        additional_count[ 0 ] = ( unsigned_count >> 8 ) & 0xff;
        additional_count[ 1 ] = ( unsigned_count >> 0 ) & 0xff;

        EVPMDCtxPtr md_ctx( EVP_MD_CTX_new(), EVP_MD_CTX_free );
        if ( !md_ctx )
            throwOpenSSLException( "cannot create MD_CTX" );
        if ( EVP_DigestInit_ex( md_ctx.get(), md, nullptr ) != 1 )
            throwOpenSSLException( "EVP_DigestInit failed" );
        if ( EVP_DigestUpdate( md_ctx.get(), message.data() + layout.mSIGStart, layout.mSIGEnd - layout.mSIGStart ) != 1 ||
             EVP_DigestUpdate( md_ctx.get(), message.data(), HEADER_ARCOUNT_OFFSET ) != 1 ||
             EVP_DigestUpdate( md_ctx.get(), additional_count, sizeof( additional_count ) ) != 1 ||
             EVP_DigestUpdate( md_ctx.get(), message.data() + HEADER_SIZE, layout.mBodyEnd - HEADER_SIZE ) != 1 )
            throwOpenSSLException( "EVP_DigestUpdate failed" );

        PacketData   digest( EVP_MAX_MD_SIZE );
        unsigned int digest_length = 0;
        if ( EVP_DigestFinal_ex( md_ctx.get(), digest.data(), &digest_length ) != 1 )
            throwOpenSSLException( "EVP_DigestFinal failed" );
        digest.resize( digest_length );
        return digest;
    }

    /*******************************************************************************************
     * signature encoding
     *******************************************************************************************/
    static void splitSignature( const uint8_t *begin, size_t size, BIGNUM **r, BIGNUM **s )
    {
        if ( size == 0 || size % 2 != 0 )
            fail<SignatureError>( "invalid signature length" );
        size_t half = size / 2;
        *r          = BN_bin2bn( begin, half, nullptr );
        *s          = BN_bin2bn( begin + half, half, nullptr );
        if ( *r == nullptr || *s == nullptr ) {
            BN_free( *r );
            BN_free( *s );
            throwOpenSSLException( "cannot load signature" );
        }
    }

    // RFC 2536: T | R(20) | S(20)
    static PacketData toDERFromDSA( const PacketData &signature )
    {
        if ( signature.size() < 1 )
            fail<SignatureError>( "empty DSA signature" );

        BIGNUM *r, *s;
        splitSignature( signature.data() + 1, signature.size() - 1, &r, &s );
        DSASIGPtr sig( DSA_SIG_new(), DSA_SIG_free );
        if ( !sig || DSA_SIG_set0( sig.get(), r, s ) != 1 ) {
            BN_free( r );
            BN_free( s );
            throwOpenSSLException( "cannot create DSA signature" );
        }

        int length = i2d_DSA_SIG( sig.get(), nullptr );
        if ( length <= 0 )
            throwOpenSSLException( "cannot encode DSA signature" );
        PacketData der( length );
        uint8_t   *p = der.data();
        i2d_DSA_SIG( sig.get(), &p );
        return der;
    }

    // RFC 6605: R | S
    static PacketData toDERFromECDSA( const PacketData &signature )
    {
        BIGNUM *r, *s;
        splitSignature( signature.data(), signature.size(), &r, &s );
        ECDSASIGPtr sig( ECDSA_SIG_new(), ECDSA_SIG_free );
        if ( !sig || ECDSA_SIG_set0( sig.get(), r, s ) != 1 ) {
            BN_free( r );
            BN_free( s );
            throwOpenSSLException( "cannot create ECDSA signature" );
        }

        int length = i2d_ECDSA_SIG( sig.get(), nullptr );
        if ( length <= 0 )
            throwOpenSSLException( "cannot encode ECDSA signature" );
        PacketData der( length );
        uint8_t   *p = der.data();
        i2d_ECDSA_SIG( sig.get(), &p );
        return der;
    }

    static bool verifyDigest( EVP_PKEY         *key,
                              const EVP_MD     *md,
                              const PacketData &digest,
                              const PacketData &signature,
                              bool              pkcs1_padding )
    {
        EVPPKeyCtxPtr ctx( EVP_PKEY_CTX_new_from_pkey( nullptr, key, nullptr ), EVP_PKEY_CTX_free );
        if ( !ctx )
            throwOpenSSLException( "cannot create context for verification" );
        if ( EVP_PKEY_verify_init( ctx.get() ) != 1 )
            throwOpenSSLException( "EVP_PKEY_verify_init failed" );
        if ( pkcs1_padding && EVP_PKEY_CTX_set_rsa_padding( ctx.get(), RSA_PKCS1_PADDING ) != 1 )
            throwOpenSSLException( "cannot set PKCS#1 v1.5 padding" );
        if ( EVP_PKEY_CTX_set_signature_md( ctx.get(), md ) != 1 )
            throwOpenSSLException( "cannot set signature digest" );

        int result = EVP_PKEY_verify( ctx.get(), signature.data(), signature.size(), digest.data(), digest.size() );
        ERR_clear_error();
        return result == 1;
    }

    /*******************************************************************************************
     * verifyMessage
     *******************************************************************************************/
    void verifyMessage( const RecordSIG      &sig,
                        const ResourceRecord &key_record,
                        const PacketData     &signed_message,
                        uint32_t              now )
    {
        if ( !key_record.mRData || key_record.mType != TYPE_KEY )
            fail<KeyError>( "KEY record is not specified" );
        const RecordKEY *key = dynamic_cast<const RecordKEY *>( key_record.mRData.get() );
        if ( key == nullptr )
            fail<KeyError>( "KEY record has no KEY RDATA" );

        if ( sig.getKeyTag() == 0 || sig.getSigner().isRoot() || sig.getAlgorithm() == 0 )
            fail<KeyError>( "key tag, signer name and algorithm must be specified" );
        const EVP_MD *md = getHashAlgorithm( sig.getAlgorithm() );

        SignedMessageLayout layout = parseLayout( signed_message );

        if ( now < layout.mInception || now > layout.mExpiration ) {
            std::ostringstream os;
            os << "signature is not valid at " << now
               << " (inception " << layout.mInception << ", expiration " << layout.mExpiration << ")";
            fail<TimeError>( os.str() );
        }

        if ( layout.mSigner != key_record.mDomainname ) {
            std::ostringstream os;
            os << "signer " << layout.mSigner << " does not match KEY owner " << key_record.mDomainname;
            fail<SignerNameError>( os.str() );
        }

        PacketData digest = computeDigest( md, signed_message, layout );
        PacketData signature( signed_message.begin() + layout.mSIGEnd, signed_message.end() );

        uint8_t algo = key->getAlgorithm();
        if ( !isSupportedAlgorithm( algo ) || algo != sig.getAlgorithm() )
            fail<KeyAlgorithmError>( "KEY algorithm " + signAlgorithmToString( algo ) +
                                     " does not match SIG algorithm " + signAlgorithmToString( sig.getAlgorithm() ) );

        EVPPKeyPtr public_key = loadPublicKey( *key );
        if ( !public_key )
            fail<KeyAlgorithmError>( "cannot load public key for " + signAlgorithmToString( algo ) );

        bool verified = false;
        if ( algo == DNSSEC_DSA )
            verified = verifyDigest( public_key.get(), md, digest, toDERFromDSA( signature ), false );
        else if ( isECDSAAlgorithm( algo ) )
            verified = verifyDigest( public_key.get(), md, digest, toDERFromECDSA( signature ), false );
        else
            verified = verifyDigest( public_key.get(), md, digest, signature, true );

        if ( !verified )
            fail<SignatureError>( "signature does not match" );

        BOOST_LOG_TRIVIAL( debug ) << "verified message signed by " << layout.mSigner
                                   << " (algorithm " << signAlgorithmToString( algo )
                                   << ", key tag " << sig.getKeyTag() << ")";
    }

    void verifyMessage( const RecordSIG &sig, const ResourceRecord &key_record, const PacketData &signed_message )
    {
        verifyMessage( sig, key_record, signed_message, getCurrentTime() );
    }

    void verifyMessage( const ResourceRecord &key_record, const PacketData &signed_message, uint32_t now )
    {
        MessageInfo message = parseDNSMessage( signed_message.data(), signed_message.data() + signed_message.size() );
        const std::vector<ResourceRecord> &additional = message.getAdditionalSection();
        if ( additional.empty() || additional.back().mType != TYPE_SIG )
            throw FormatError( "last additional record is not SIG" );
        const RecordSIG *sig = dynamic_cast<const RecordSIG *>( additional.back().mRData.get() );
        if ( sig == nullptr )
            throw FormatError( "last additional record has no SIG RDATA" );

        verifyMessage( *sig, key_record, signed_message, now );
    }

    void verifyMessage( const ResourceRecord &key_record, const PacketData &signed_message )
    {
        verifyMessage( key_record, signed_message, getCurrentTime() );
    }
}
