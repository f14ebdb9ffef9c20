#ifndef DNS_HPP
#define DNS_HPP

#include "utils.hpp"
#include "domainname.hpp"
#include <boost/cstdint.hpp>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sig0
{
    typedef uint8_t Opcode;
    const Opcode    OPCODE_QUERY = 0;

    typedef uint16_t Class;
    const Class      CLASS_IN  = 1;
    const Class      CLASS_ANY = 255;

    typedef uint16_t Type;
    const Type       TYPE_A   = 1;
    const Type       TYPE_NS  = 2;
    const Type       TYPE_MX  = 15;
    const Type       TYPE_SIG = 24;
    const Type       TYPE_KEY = 25;
    const Type       TYPE_ANY = 255;

    typedef uint8_t    ResponseCode;
    const ResponseCode NO_ERROR = 0;

    const size_t HEADER_SIZE              = 12;
    const size_t HEADER_QDCOUNT_OFFSET    = 4;
    const size_t HEADER_ANCOUNT_OFFSET    = 6;
    const size_t HEADER_NSCOUNT_OFFSET    = 8;
    const size_t HEADER_ARCOUNT_OFFSET    = 10;
    const size_t MAX_MESSAGE_SIZE         = 0xffff;

    class RDATA;
    typedef std::shared_ptr<RDATA>       RDATAPtr;
    typedef std::shared_ptr<const RDATA> ConstRDATAPtr;

    class RDATA
    {
    public:
        virtual ~RDATA()
        {
        }

        virtual std::string toString() const                                             = 0;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const  = 0;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const              = 0;
        virtual Type     type() const                                                    = 0;
        virtual uint16_t size() const                                                    = 0;
        virtual RDATA   *clone() const                                                   = 0;
    };

    class RecordRaw : public RDATA
    {
    private:
        uint16_t   mRRType;
        PacketData mData;

    public:
        RecordRaw( uint16_t t, const PacketData &d )
            : mRRType( t ), mData( d )
        {
        }

        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual Type type() const
        {
            return mRRType;
        }
        virtual uint16_t size() const
        {
            return mData.size();
        }
        virtual RecordRaw *clone() const { return new RecordRaw( mRRType, mData ); }

        const PacketData &getData() const { return mData; }
    };

    class RecordA : public RDATA
    {
    private:
        uint8_t mSinAddr[ 4 ];

    public:
        RecordA( const uint8_t *sin_addr );
        RecordA( const std::string &address );

        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual Type type() const
        {
            return TYPE_A;
        }
        virtual uint16_t size() const
        {
            return sizeof( mSinAddr );
        }
        virtual RecordA *clone() const { return new RecordA( mSinAddr ); }

        std::string getAddress() const { return toString(); }

        static RDATAPtr parse( const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    class RecordNS : public RDATA
    {
    private:
        Domainname mDomainname;

    public:
        RecordNS( const Domainname &name ) : mDomainname( name ) {}

        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual Type type() const
        {
            return TYPE_NS;
        }
        virtual uint16_t size() const
        {
            return mDomainname.size();
        }
        virtual RecordNS *clone() const { return new RecordNS( mDomainname ); }

        const Domainname &getNameServer() const { return mDomainname; }

        static RDATAPtr parse( const uint8_t *packet_begin, const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    class RecordMX : public RDATA
    {
    private:
        uint16_t   mPriority;
        Domainname mDomainname;

    public:
        RecordMX( uint16_t pri, const Domainname &name )
            : mPriority( pri ), mDomainname( name )
        {}

        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual Type type() const
        {
            return TYPE_MX;
        }
        virtual uint16_t size() const
        {
            return sizeof( mPriority ) + mDomainname.size();
        }
        virtual RecordMX *clone() const { return new RecordMX( mPriority, mDomainname ); }

        uint16_t          getPriority() const { return mPriority; }
        const Domainname &getExchange() const { return mDomainname; }

        static RDATAPtr parse( const uint8_t *packet_begin, const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    const uint8_t PROTOCOL_DNSSEC = 0x03;

    /*!
     * KEY Resource Record (RFC 2535)
     * 公開鍵部分の解釈はアルゴリズムごとに異なるため、ここでは不透明なバイト列として保持する
     */
    class RecordKEY : public RDATA
    {
    private:
        uint16_t   mFlag;
        uint8_t    mProtocol;
        uint8_t    mAlgorithm;
        PacketData mPublicKey;

    public:
        RecordKEY( uint16_t f, uint8_t algo, const PacketData &key, uint8_t proto = PROTOCOL_DNSSEC )
            : mFlag( f ), mProtocol( proto ), mAlgorithm( algo ), mPublicKey( key )
        {}

        uint16_t          getFlag() const { return mFlag; }
        uint8_t           getProtocol() const { return mProtocol; }
        uint8_t           getAlgorithm() const { return mAlgorithm; }
        const PacketData &getPublicKey() const { return mPublicKey; }

        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual Type type() const
        {
            return TYPE_KEY;
        }
        virtual uint16_t size() const
        {
            return sizeof( mFlag ) + sizeof( mProtocol ) + sizeof( mAlgorithm ) + mPublicKey.size();
        }
        virtual RecordKEY *clone() const
        {
            return new RecordKEY( mFlag, mAlgorithm, mPublicKey, mProtocol );
        }

        static RDATAPtr parse( const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    /*!
     * SIG Resource Record (RFC 2535, RFC 2931)
     * signer nameは圧縮せずに出力する
     */
    class RecordSIG : public RDATA
    {
    private:
        Type       mTypeCovered;
        uint8_t    mAlgorithm;
        uint8_t    mLabelCount;
        uint32_t   mOriginalTTL;
        uint32_t   mExpiration;
        uint32_t   mInception;
        uint16_t   mKeyTag;
        Domainname mSigner;
        PacketData mSignature;

    public:
        RecordSIG( Type              t,
                   uint8_t           algo,
                   uint8_t           label,
                   uint32_t          ttl,
                   uint32_t          expire,
                   uint32_t          incept,
                   uint16_t          tag,
                   const Domainname &sign,
                   const PacketData &sig = PacketData() )
            : mTypeCovered( t ),
              mAlgorithm( algo ),
              mLabelCount( label ),
              mOriginalTTL( ttl ),
              mExpiration( expire ),
              mInception( incept ),
              mKeyTag( tag ),
              mSigner( sign ),
              mSignature( sig )
        {
        }

        Type              getTypeCovered() const { return mTypeCovered; }
        uint8_t           getAlgorithm() const { return mAlgorithm; }
        uint8_t           getLabelCount() const { return mLabelCount; }
        uint32_t          getOriginalTTL() const { return mOriginalTTL; }
        uint32_t          getExpiration() const { return mExpiration; }
        uint32_t          getInception() const { return mInception; }
        uint16_t          getKeyTag() const { return mKeyTag; }
        const Domainname &getSigner() const { return mSigner; }
        const PacketData &getSignature() const { return mSignature; }

        // signature以外のフィールドを引き継いだコピーを返す
        RecordSIG withSignature( const PacketData &sig ) const
        {
            return RecordSIG( mTypeCovered, mAlgorithm, mLabelCount, mOriginalTTL,
                              mExpiration, mInception, mKeyTag, mSigner, sig );
        }

        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual uint16_t size() const
        {
            return 2 + // type_covered(uint16_t)
                   1 + // algorithm
                   1 + // label count
                   4 + // original ttl
                   4 + // expiration
                   4 + // inception
                   2 + // key tag
                   mSigner.size() +
                   mSignature.size();
        }
        virtual Type type() const
        {
            return TYPE_SIG;
        }
        virtual RecordSIG *clone() const
        {
            return new RecordSIG( *this );
        }

        static RDATAPtr parse( const uint8_t *packet_begin, const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    struct QuestionSectionEntry {
        Domainname mDomainname;
        uint16_t   mType;
        uint16_t   mClass;

        QuestionSectionEntry() : mType( 0 ), mClass( 0 )
        {
        }

        uint16_t size() const;
    };

    struct ResourceRecord {
        Domainname mDomainname;
        uint16_t   mType;
        uint16_t   mClass;
        uint32_t   mTTL;
        RDATAPtr   mRData;

        ResourceRecord() : mType( 0 ), mClass( 0 ), mTTL( 0 )
        {
        }

        // 圧縮しない場合のwire formatのサイズ
        uint32_t size() const;

        ResourceRecord( const ResourceRecord &entry )
            : mDomainname( entry.mDomainname ),
              mType( entry.mType ),
              mClass( entry.mClass ),
              mTTL( entry.mTTL )
        {
            if ( entry.mRData )
                mRData = RDATAPtr( entry.mRData->clone() );
        }

        ResourceRecord &operator=( const ResourceRecord &rhs )
        {
            mDomainname = rhs.mDomainname;
            mType       = rhs.mType;
            mClass      = rhs.mClass;
            mTTL        = rhs.mTTL;
            if ( rhs.mRData )
                mRData = RDATAPtr( rhs.mRData->clone() );
            else
                mRData = RDATAPtr();

            return *this;
        }
    };

    struct MessageInfo {
        uint16_t mID;

        bool    mQueryResponse;
        Opcode  mOpcode;
        bool    mAuthoritativeAnswer;
        bool    mTruncation;
        bool    mRecursionDesired;

        bool         mRecursionAvailable;
        bool         mCheckingDisabled;
        bool         mAuthenticData;
        ResponseCode mResponseCode;

        std::vector<QuestionSectionEntry> mQuestionSection;
        std::vector<ResourceRecord>       mAnswerSection;
        std::vector<ResourceRecord>       mAuthoritySection;
        std::vector<ResourceRecord>       mAdditionalSection;

        MessageInfo()
            : mID( 0 ), mQueryResponse( false ), mOpcode( OPCODE_QUERY ), mAuthoritativeAnswer( false ),
              mTruncation( false ), mRecursionDesired( false ), mRecursionAvailable( false ),
              mCheckingDisabled( false ), mAuthenticData( false ), mResponseCode( NO_ERROR )
        {
        }

        const std::vector<QuestionSectionEntry> &getQuestionSection() const { return mQuestionSection; }
        const std::vector<ResourceRecord> &getAnswerSection() const { return mAnswerSection; }
        const std::vector<ResourceRecord> &getAuthoritySection() const { return mAuthoritySection; }
        const std::vector<ResourceRecord> &getAdditionalSection() const { return mAdditionalSection; }

        void pushQuestionSection( const QuestionSectionEntry &e ) { mQuestionSection.push_back( e ); }
        void pushAnswerSection( const ResourceRecord &e ) { mAnswerSection.push_back( e ); }
        void pushAuthoritySection( const ResourceRecord &e ) { mAuthoritySection.push_back( e ); }
        void pushAdditionalSection( const ResourceRecord &e ) { mAdditionalSection.push_back( e ); }

        /*!
         * messageの末尾にDNS Messageを出力する
         * messageは空であること(圧縮ポインタはmessageの先頭からのオフセット)
         */
        void generateMessage( WireFormat &message ) const;
        uint32_t getMessageSize() const;
    };

    MessageInfo parseDNSMessage( const uint8_t *begin, const uint8_t *end );

    void generateQuestion( const QuestionSectionEntry &q, WireFormat &message, OffsetDB &offset_db );
    void generateResourceRecord( const ResourceRecord &r, WireFormat &message, OffsetDB &offset_db, bool compression = true );

    std::ostream &operator<<( std::ostream &os, const MessageInfo &message );
    std::ostream &printHeader( std::ostream &os, const MessageInfo &message );
    std::string   typeCodeToString( Type t );
    std::string   classCodeToString( Class c );
    std::string   responseCodeToString( uint8_t rcode );
    Type          stringToTypeCode( const std::string & );
}

#endif
