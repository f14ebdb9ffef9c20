#ifndef SIG0_HPP
#define SIG0_HPP

#include <boost/cstdint.hpp>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>

namespace sig0
{
    enum SignAlgorithm : uint8_t {
        DNSSEC_DSA             = 3,
        DNSSEC_RSASHA1         = 5,
        DNSSEC_RSASHA256       = 8,
        DNSSEC_RSASHA512       = 10,
        DNSSEC_ECDSAP256SHA256 = 13,
        DNSSEC_ECDSAP384SHA384 = 14,
    };

    /*!
     * SIG(0)の署名・検証に失敗した場合にthrowする例外の基底クラス
     */
    class SIG0Error : public std::runtime_error
    {
    public:
        SIG0Error( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    // 秘密鍵が無い、または扱えない種類の鍵
    class PrivateKeyError : public SIG0Error
    {
    public:
        PrivateKeyError( const std::string &msg ) : SIG0Error( msg ) {}
    };

    // SIGのkey tag/signer name/algorithmが未設定、またはKEY recordが不正
    class KeyError : public SIG0Error
    {
    public:
        KeyError( const std::string &msg ) : SIG0Error( msg ) {}
    };

    class AlgorithmError : public SIG0Error
    {
    public:
        AlgorithmError( const std::string &msg ) : SIG0Error( msg ) {}
    };

    class BufferError : public SIG0Error
    {
    public:
        BufferError( const std::string &msg ) : SIG0Error( msg ) {}
    };

    class TimeError : public SIG0Error
    {
    public:
        TimeError( const std::string &msg ) : SIG0Error( msg ) {}
    };

    class SignerNameError : public SIG0Error
    {
    public:
        SignerNameError( const std::string &msg ) : SIG0Error( msg ) {}
    };

    class KeyAlgorithmError : public SIG0Error
    {
    public:
        KeyAlgorithmError( const std::string &msg ) : SIG0Error( msg ) {}
    };

    class SignatureError : public SIG0Error
    {
    public:
        SignatureError( const std::string &msg ) : SIG0Error( msg ) {}
    };

    /*!
     * 署名アルゴリズムに対応するハッシュ関数を返す
     * DSA, RSASHA1 => SHA1
     * RSASHA256, ECDSAP256SHA256 => SHA256
     * ECDSAP384SHA384 => SHA384
     * RSASHA512 => SHA512
     * それ以外はAlgorithmErrorをthrowする
     */
    const EVP_MD *getHashAlgorithm( uint8_t algo );

    bool isSupportedAlgorithm( uint8_t algo );
    bool isRSAAlgorithm( uint8_t algo );
    bool isECDSAAlgorithm( uint8_t algo );

    SignAlgorithm stringToSignAlgorithm( const std::string &str );
    std::string   signAlgorithmToString( uint8_t algo );

    // OpenSSLのエラーキューの内容をメッセージに付加してSIG0Errorをthrowする
    void throwOpenSSLException( const std::string &message );
}

#endif
