#ifndef VERIFIER_HPP
#define VERIFIER_HPP

#include "dns.hpp"
#include "sig0.hpp"

namespace sig0
{
    /*!
     * SIG(0)付きのDNS Messageを検証する
     * sigはsigned_messageから取り出したSIG record, key_recordは署名者のKEY Resource Record
     * SIG recordはadditional sectionの最後のrecordであること
     * 検証に失敗した場合はSIG0Errorの派生クラス, messageが壊れている場合はFormatErrorをthrowする
     */
    void verifyMessage( const RecordSIG      &sig,
                        const ResourceRecord &key_record,
                        const PacketData     &signed_message,
                        uint32_t              now );
    void verifyMessage( const RecordSIG &sig, const ResourceRecord &key_record, const PacketData &signed_message );

    // additional sectionの最後のSIG recordを取り出して検証する
    void verifyMessage( const ResourceRecord &key_record, const PacketData &signed_message, uint32_t now );
    void verifyMessage( const ResourceRecord &key_record, const PacketData &signed_message );

    uint32_t getCurrentTime();
}

#endif
