#include "signer.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/bn.h>
#include <openssl/dsa.h>
#include <openssl/ecdsa.h>
#include <openssl/rsa.h>

namespace sig0
{
    typedef std::unique_ptr<EVP_PKEY_CTX, void ( * )( EVP_PKEY_CTX * )> EVPPKeyCtxPtr;
    typedef std::unique_ptr<EVP_MD_CTX, void ( * )( EVP_MD_CTX * )>     EVPMDCtxPtr;

    const size_t DSA_SIGNATURE_SLACK   = 40;
    const size_t ECDSA_SIGNATURE_SLACK = 96;
    const size_t DSA_COMPONENT_SIZE    = 20;

    ResourceRecord SignedMessage::getSIGResourceRecord() const
    {
        ResourceRecord record = makeSIG0ResourceRecord( mSIG );
        record.mRData         = RDATAPtr( mSIG.clone() );
        return record;
    }

    ResourceRecord makeSIG0ResourceRecord( const RecordSIG &sig )
    {
        ResourceRecord record;
        record.mDomainname = Domainname();
        record.mType       = TYPE_SIG;
        record.mClass      = CLASS_ANY;
        record.mTTL        = 0;
        record.mRData      = RDATAPtr( new RecordSIG( 0, // type covered
                                                      sig.getAlgorithm(),
                                                      0, // labels
                                                      0, // original ttl
                                                      sig.getExpiration(),
                                                      sig.getInception(),
                                                      sig.getKeyTag(),
                                                      sig.getSigner() ) );
        return record;
    }

    /*******************************************************************************************
     * raw signature
     *******************************************************************************************/
    static PacketData signDigest( EVP_PKEY     *key,
                                  const EVP_MD *md,
                                  const PacketData &digest,
                                  OSSL_LIB_CTX *libctx,
                                  bool          pkcs1_padding )
    {
        EVPPKeyCtxPtr ctx( EVP_PKEY_CTX_new_from_pkey( libctx, key, nullptr ), EVP_PKEY_CTX_free );
        if ( !ctx )
            throwOpenSSLException( "cannot create context for signing" );
        if ( EVP_PKEY_sign_init( ctx.get() ) != 1 )
            throwOpenSSLException( "EVP_PKEY_sign_init failed" );
        if ( pkcs1_padding && EVP_PKEY_CTX_set_rsa_padding( ctx.get(), RSA_PKCS1_PADDING ) != 1 )
            throwOpenSSLException( "cannot set PKCS#1 v1.5 padding" );
        if ( EVP_PKEY_CTX_set_signature_md( ctx.get(), md ) != 1 )
            throwOpenSSLException( "cannot set signature digest" );

        size_t signature_length = 0;
        if ( EVP_PKEY_sign( ctx.get(), nullptr, &signature_length, digest.data(), digest.size() ) != 1 )
            throwOpenSSLException( "EVP_PKEY_sign failed" );
        PacketData signature( signature_length );
        if ( EVP_PKEY_sign( ctx.get(), signature.data(), &signature_length, digest.data(), digest.size() ) != 1 )
            throwOpenSSLException( "EVP_PKEY_sign failed" );
        signature.resize( signature_length );
        return signature;
    }

    static void appendFixedWidth( const BIGNUM *bn, size_t width, PacketData &output )
    {
        size_t offset = output.size();
        output.resize( offset + width );
        if ( BN_bn2binpad( bn, output.data() + offset, width ) < 0 )
            throw SIG0Error( "signature component is too large" );
    }

    class SignVisitor : public boost::static_visitor<PacketData>
    {
    public:
        SignVisitor( const EVP_MD *md, const PacketData &digest, OSSL_LIB_CTX *libctx )
            : mMD( md ), mDigest( digest ), mLibContext( libctx )
        {}

        // PKCS#1 v1.5
        PacketData operator()( const RSAPrivateKey &key ) const
        {
            return signDigest( key.get(), mMD, mDigest, mLibContext, true );
        }

        // RFC 2536: T | R(20) | S(20)
        PacketData operator()( const DSAPrivateKey &key ) const
        {
            uint8_t    t   = key.getT();
            PacketData der = signDigest( key.get(), mMD, mDigest, mLibContext, false );

            const uint8_t *p   = der.data();
            DSA_SIG       *sig = d2i_DSA_SIG( nullptr, &p, der.size() );
            if ( sig == nullptr )
                throwOpenSSLException( "cannot decode DSA signature" );
            std::unique_ptr<DSA_SIG, void ( * )( DSA_SIG * )> sig_ptr( sig, DSA_SIG_free );

            const BIGNUM *r, *s;
            DSA_SIG_get0( sig, &r, &s );

            PacketData signature;
            signature.push_back( t );
            appendFixedWidth( r, DSA_COMPONENT_SIZE, signature );
            appendFixedWidth( s, DSA_COMPONENT_SIZE, signature );
            return signature;
        }

        // RFC 6605: R | S
        PacketData operator()( const ECDSAPrivateKey &key ) const
        {
            size_t     field_size = key.getFieldSize();
            PacketData der        = signDigest( key.get(), mMD, mDigest, mLibContext, false );

            const uint8_t *p   = der.data();
            ECDSA_SIG     *sig = d2i_ECDSA_SIG( nullptr, &p, der.size() );
            if ( sig == nullptr )
                throwOpenSSLException( "cannot decode ECDSA signature" );
            std::unique_ptr<ECDSA_SIG, void ( * )( ECDSA_SIG * )> sig_ptr( sig, ECDSA_SIG_free );

            const BIGNUM *r, *s;
            ECDSA_SIG_get0( sig, &r, &s );

            PacketData signature;
            appendFixedWidth( r, field_size, signature );
            appendFixedWidth( s, field_size, signature );
            return signature;
        }

    private:
        const EVP_MD     *mMD;
        const PacketData &mDigest;
        OSSL_LIB_CTX     *mLibContext;
    };

    // 署名長の見積もり
    class SignatureSlackVisitor : public boost::static_visitor<size_t>
    {
    public:
        size_t operator()( const RSAPrivateKey &key ) const
        {
            return key.getModulusSize();
        }
        size_t operator()( const DSAPrivateKey & ) const
        {
            return DSA_SIGNATURE_SLACK;
        }
        size_t operator()( const ECDSAPrivateKey & ) const
        {
            return ECDSA_SIGNATURE_SLACK;
        }
    };

    /*******************************************************************************************
     * signMessage
     *******************************************************************************************/
    SignedMessage signMessage( const RecordSIG   &sig,
                               const MessageInfo &message,
                               const PrivateKey  &key,
                               OSSL_LIB_CTX      *libctx )
    {
        if ( !isValidPrivateKey( key ) )
            throw PrivateKeyError( "private key is empty or unsupported" );
        if ( sig.getKeyTag() == 0 || sig.getSigner().isRoot() || sig.getAlgorithm() == 0 )
            throw KeyError( "key tag, signer name and algorithm must be specified" );

        const EVP_MD *md = getHashAlgorithm( sig.getAlgorithm() );
        if ( !isUsableWith( key, sig.getAlgorithm() ) )
            throw AlgorithmError( "private key cannot be used with " + signAlgorithmToString( sig.getAlgorithm() ) );

        // SIG RRの分だけARCOUNTを増やせること
        if ( message.getAdditionalSection().size() >= 0xffff )
            throw BufferError( "too many additional records" );

        ResourceRecord sig_rr = makeSIG0ResourceRecord( sig );

        size_t capacity = message.getMessageSize() + sig_rr.size() +
                          boost::apply_visitor( SignatureSlackVisitor(), key );
        WireFormat     buffer( capacity );
        const uint8_t *storage = buffer.data();

        message.generateMessage( buffer );
        if ( buffer.data() != storage )
            throw BufferError( "message buffer was reallocated while packing message" );
        size_t message_size = buffer.size();

        OffsetDB offset_db;
        generateResourceRecord( sig_rr, buffer, offset_db, false );
        if ( buffer.data() != storage )
            throw BufferError( "message buffer was reallocated while packing SIG" );

        // owner name(root), type, class, ttl, rdlengthの後ろがSIGのRDATA
        size_t rdlength_offset = message_size + 1 + 2 + 2 + 4;
        size_t rdata_offset    = rdlength_offset + 2;

        EVPMDCtxPtr md_ctx( EVP_MD_CTX_new(), EVP_MD_CTX_free );
        if ( !md_ctx )
            throwOpenSSLException( "cannot create MD_CTX" );
        if ( EVP_DigestInit_ex( md_ctx.get(), md, nullptr ) != 1 )
            throwOpenSSLException( "EVP_DigestInit failed" );
        if ( EVP_DigestUpdate( md_ctx.get(), buffer.data() + rdata_offset, buffer.size() - rdata_offset ) != 1 ||
             EVP_DigestUpdate( md_ctx.get(), buffer.data(), message_size ) != 1 )
            throwOpenSSLException( "EVP_DigestUpdate failed" );
        PacketData   digest( EVP_MAX_MD_SIZE );
        unsigned int digest_length = 0;
        if ( EVP_DigestFinal_ex( md_ctx.get(), digest.data(), &digest_length ) != 1 )
            throwOpenSSLException( "EVP_DigestFinal failed" );
        digest.resize( digest_length );

        PacketData signature = boost::apply_visitor( SignVisitor( md, digest, libctx ), key );

        buffer.pushBuffer( signature );
        if ( buffer.size() > MAX_MESSAGE_SIZE )
            throw BufferError( "signed message is larger than 65535 bytes" );

        buffer.setUInt16HtoN( rdlength_offset, buffer.getUInt16NtoH( rdlength_offset ) + signature.size() );
        buffer.setUInt16HtoN( HEADER_ARCOUNT_OFFSET, buffer.getUInt16NtoH( HEADER_ARCOUNT_OFFSET ) + 1 );

        BOOST_LOG_TRIVIAL( debug ) << "signed message by " << sig.getSigner()
                                   << " (algorithm " << signAlgorithmToString( sig.getAlgorithm() )
                                   << ", key tag " << sig.getKeyTag()
                                   << ", " << buffer.size() << " bytes)";

        const RecordSIG &normalized = dynamic_cast<const RecordSIG &>( *sig_rr.mRData );
        return SignedMessage( buffer.get(), normalized.withSignature( signature ) );
    }
}
