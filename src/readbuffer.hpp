#ifndef READ_BUFFER_HPP
#define READ_BUFFER_HPP

#include "domainname.hpp"
#include "utils.hpp"
#include <cstddef>

namespace sig0
{
    /*!
     * 受信したDNS Messageを先頭から読み進めるためのカーソル
     * 範囲外の読み込みは FormatError をthrowする
     * 参照先のバッファはReadBufferより長く生存していなければならない
     */
    class ReadBuffer
    {
    private:
        const uint8_t *mBegin;
        const uint8_t *mEnd;
        size_t         mPosition;

        void checkRemained( size_t length, const char *what ) const;

    public:
        ReadBuffer( const uint8_t *begin, const uint8_t *end );
        explicit ReadBuffer( const PacketData &buf );

        uint8_t  readUInt8();
        uint16_t readUInt16NtoH();
        uint32_t readUInt32NtoH();

        Domainname readDomainname();
        size_t     readBuffer( PacketData &, size_t );
        void       skip( size_t length );

        size_t getPosition() const { return mPosition; }
        void   seek( size_t position );
        size_t getRemainedSize() const;
        size_t size() const { return mEnd - mBegin; }

        const uint8_t *begin() const { return mBegin; }
        const uint8_t *end() const { return mEnd; }
    };
}

#endif
