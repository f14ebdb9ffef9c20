#ifndef SIGNER_HPP
#define SIGNER_HPP

#include "dns.hpp"
#include "privatekey.hpp"
#include "sig0.hpp"
#include <openssl/types.h>

namespace sig0
{
    struct SignedMessage {
        PacketData mMessage;
        RecordSIG  mSIG;

        SignedMessage( const PacketData &message, const RecordSIG &sig )
            : mMessage( message ), mSIG( sig )
        {}

        // additional sectionの末尾に追加されたSIG Resource Record
        ResourceRecord getSIGResourceRecord() const;
    };

    /*!
     * messageにSIG(0)を付加したwire formatを返す
     * sigにはsigner name, key tag, algorithm, inception, expirationを設定しておくこと
     * owner name, class, TTL, type covered, labels, original TTLはSIG(0)の値に置き換える
     * libctxを指定した場合は、その乱数生成器とproviderを使用して署名する
     */
    SignedMessage signMessage( const RecordSIG   &sig,
                               const MessageInfo &message,
                               const PrivateKey  &key,
                               OSSL_LIB_CTX      *libctx = nullptr );

    // SIG(0)用にowner name等を正規化したSIG Resource Recordを返す
    ResourceRecord makeSIG0ResourceRecord( const RecordSIG &sig );
}

#endif
