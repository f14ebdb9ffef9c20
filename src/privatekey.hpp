#ifndef PRIVATE_KEY_HPP
#define PRIVATE_KEY_HPP

#include "dns.hpp"
#include "sig0.hpp"
#include <boost/variant.hpp>
#include <memory>
#include <string>
#include <openssl/evp.h>

namespace sig0
{
    typedef std::shared_ptr<EVP_PKEY> EVPPKeyPtr;

    // EVP_PKEYの所有権を引き取ってshared_ptrに包む
    EVPPKeyPtr wrapEVPPKey( EVP_PKEY *key );

    class PrivateKeyBase
    {
    public:
        PrivateKeyBase() {}
        explicit PrivateKeyBase( const EVPPKeyPtr &key ) : mKey( key ) {}

        EVP_PKEY *get() const { return mKey.get(); }
        const EVPPKeyPtr &getPtr() const { return mKey; }
        bool empty() const { return !mKey; }

    private:
        EVPPKeyPtr mKey;
    };

    class RSAPrivateKey : public PrivateKeyBase
    {
    public:
        RSAPrivateKey() {}
        explicit RSAPrivateKey( const EVPPKeyPtr &key ) : PrivateKeyBase( key ) {}

        bool       isValid() const;
        size_t     getModulusSize() const;
        // RFC 3110
        PacketData getKEYFormat() const;
    };

    class DSAPrivateKey : public PrivateKeyBase
    {
    public:
        DSAPrivateKey() {}
        explicit DSAPrivateKey( const EVPPKeyPtr &key ) : PrivateKeyBase( key ) {}

        bool       isValid() const;
        // RFC 2536のT. 0 - 8
        uint8_t    getT() const;
        // RFC 2536
        PacketData getKEYFormat() const;
    };

    class ECDSAPrivateKey : public PrivateKeyBase
    {
    public:
        ECDSAPrivateKey() {}
        explicit ECDSAPrivateKey( const EVPPKeyPtr &key ) : PrivateKeyBase( key ) {}

        bool       isValid() const;
        // NID_X9_62_prime256v1 or NID_secp384r1. それ以外はNID_undef
        int        getCurve() const;
        // 32 for P-256, 48 for P-384
        size_t     getFieldSize() const;
        // RFC 6605
        PacketData getKEYFormat() const;
    };

    typedef boost::variant<RSAPrivateKey, DSAPrivateKey, ECDSAPrivateKey> PrivateKey;

    const uint16_t KEY_FLAG_HOST = 0x0200;

    /*!
     * EVP_PKEYの種類に応じたPrivateKeyを返す
     * RSA, DSA, EC(P-256/P-384)以外の鍵はPrivateKeyErrorをthrowする
     */
    PrivateKey makePrivateKey( const EVPPKeyPtr &key );
    PrivateKey loadPrivateKey( const std::string &key_file );

    bool isValidPrivateKey( const PrivateKey &key );

    // 秘密鍵が署名アルゴリズムに使用できるか
    bool isUsableWith( const PrivateKey &key, uint8_t algo );

    RecordKEY getKEYRecord( const PrivateKey &key, uint8_t algo, uint16_t flags = KEY_FLAG_HOST );

    // RFC 4034 Appendix B
    uint16_t getKeyTag( const RecordKEY &key );
}

#endif
