#ifndef PUBLIC_KEY_HPP
#define PUBLIC_KEY_HPP

#include "dns.hpp"
#include "privatekey.hpp"

namespace sig0
{
    /*!
     * KEY recordの公開鍵部分をEVP_PKEYに変換する
     * RSA(RFC 3110), DSA(RFC 2536), ECDSA(RFC 6605)に対応
     * 公開鍵をアルゴリズムに従って解釈できない場合は空のポインタを返す
     */
    EVPPKeyPtr loadPublicKey( const RecordKEY &key );
}

#endif
