#ifndef DOMAINNAME_HPP
#define DOMAINNAME_HPP

#include "wireformat.hpp"
#include <boost/operators.hpp>
#include <deque>
#include <iostream>
#include <map>
#include <stdexcept>

namespace sig0
{
    typedef uint16_t Offset;
    const Offset     NO_COMPRESSION = 0xffff;

    /*!
     * DNS Packetのフォーマットエラーを検知した場合にthrowする例外
     */
    class FormatError : public std::runtime_error
    {
    public:
        FormatError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    class Domainname : public boost::less_than_comparable<Domainname>
    {
    private:
        std::deque<std::string> labels;
        std::deque<std::string> canonical_labels;

    public:
        Domainname( const std::deque<std::string> &l = std::deque<std::string>() );
        explicit Domainname( const std::string &name );
        Domainname( const char *name );

        std::string toString() const;

        void outputWireFormat( WireFormat &, Offset offset = NO_COMPRESSION ) const;
        void outputCanonicalWireFormat( WireFormat & ) const;
        PacketData getWireFormat() const;

        unsigned int size( Offset offset = NO_COMPRESSION ) const;

        const std::deque<std::string> &getLabels() const
        {
            return labels;
        }
        const std::deque<std::string> &getCanonicalLabels() const
        {
            return canonical_labels;
        }
        uint32_t getLabelCount() const
        {
            return labels.size();
        }
        bool isRoot() const
        {
            return labels.empty();
        }

        void addSubdomain( const std::string & );
        void addSuffix( const std::string & );
        void popSubdomain();

        /*!
         * beginからdomainnameを読み込み、domainnameの次の位置を返す
         * 圧縮ポインタはpacket_beginからのオフセットとして解釈する
         */
        static const uint8_t *parsePacket( Domainname &   ref_domainname,
                                           const uint8_t *packet_begin,
                                           const uint8_t *packet_end,
                                           const uint8_t *begin,
                                           int            recur = 0 );

        // compare with canonical(lower case) labels
        bool operator==( const Domainname &rhs ) const;
        bool operator!=( const Domainname &rhs ) const;
        bool operator<( const Domainname &rhs ) const;
    };

    std::ostream &operator<<( std::ostream &os, const Domainname &name );

    /*!
     * メッセージ圧縮のため、出力済みのdomainnameとそのオフセットを保持する
     */
    class OffsetDB
    {
    private:
        typedef std::map<Domainname, uint16_t>  OffsetContainer;
        typedef OffsetContainer::const_iterator OffsetContainerIterator;

        OffsetContainer mOffsets;

        uint16_t findDomainname( const Domainname &name ) const;
        void add( const Domainname &name, size_t offset );

    public:
        static const uint16_t NOT_FOUND = 0xffff;

        uint16_t outputWireFormat( const Domainname &, WireFormat & );
    };
}

#endif
