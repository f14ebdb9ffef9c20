#include "dns.hpp"
#include "readbuffer.hpp"
#include "utils.hpp"
#include <arpa/inet.h>
#include <boost/lexical_cast.hpp>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace sig0
{
    static QuestionSectionEntry parseQuestion( ReadBuffer &buffer );
    static ResourceRecord parseResourceRecord( ReadBuffer &buffer );

    uint16_t QuestionSectionEntry::size() const
    {
        return mDomainname.size() + sizeof( mType ) + sizeof( mClass );
    }

    uint32_t ResourceRecord::size() const
    {
        return mDomainname.size() + sizeof( mType ) + sizeof( mClass ) + sizeof( mTTL ) +
               sizeof( uint16_t ) + // size of resource data size
               ( mRData ? mRData->size() : 0 );
    }

    void MessageInfo::generateMessage( WireFormat &message ) const
    {
        OffsetDB offset_db;

        uint8_t flags1 = ( mQueryResponse ? 0x80 : 0 ) |
                         ( ( mOpcode & 0x0f ) << 3 ) |
                         ( mAuthoritativeAnswer ? 0x04 : 0 ) |
                         ( mTruncation ? 0x02 : 0 ) |
                         ( mRecursionDesired ? 0x01 : 0 );
        uint8_t flags2 = ( mRecursionAvailable ? 0x80 : 0 ) |
                         ( mAuthenticData ? 0x20 : 0 ) |
                         ( mCheckingDisabled ? 0x10 : 0 ) |
                         ( mResponseCode & 0x0f );

        message.pushUInt16HtoN( mID );
        message.pushUInt8( flags1 );
        message.pushUInt8( flags2 );
        message.pushUInt16HtoN( mQuestionSection.size() );
        message.pushUInt16HtoN( mAnswerSection.size() );
        message.pushUInt16HtoN( mAuthoritySection.size() );
        message.pushUInt16HtoN( mAdditionalSection.size() );

        for ( auto &q : mQuestionSection ) {
            generateQuestion( q, message, offset_db );
        }
        for ( auto &r : mAnswerSection ) {
            generateResourceRecord( r, message, offset_db );
        }
        for ( auto &r : mAuthoritySection ) {
            generateResourceRecord( r, message, offset_db );
        }
        for ( auto &r : mAdditionalSection ) {
            generateResourceRecord( r, message, offset_db );
        }
    }

    uint32_t MessageInfo::getMessageSize() const
    {
        WireFormat output;
        generateMessage( output );
        return output.size();
    }

    MessageInfo parseDNSMessage( const uint8_t *begin, const uint8_t *end )
    {
        if ( end < begin || static_cast<size_t>( end - begin ) < HEADER_SIZE ) {
            throw FormatError( "too short message size( less than DNS message header size )." );
        }

        ReadBuffer  buffer( begin, end );
        MessageInfo message_info;

        message_info.mID = buffer.readUInt16NtoH();
        uint8_t flags1   = buffer.readUInt8();
        uint8_t flags2   = buffer.readUInt8();

        message_info.mQueryResponse       = flags1 & 0x80;
        message_info.mOpcode              = ( flags1 >> 3 ) & 0x0f;
        message_info.mAuthoritativeAnswer = flags1 & 0x04;
        message_info.mTruncation          = flags1 & 0x02;
        message_info.mRecursionDesired    = flags1 & 0x01;
        message_info.mRecursionAvailable  = flags2 & 0x80;
        message_info.mAuthenticData       = flags2 & 0x20;
        message_info.mCheckingDisabled    = flags2 & 0x10;
        message_info.mResponseCode        = flags2 & 0x0f;

        uint16_t question_count   = buffer.readUInt16NtoH();
        uint16_t answer_count     = buffer.readUInt16NtoH();
        uint16_t authority_count  = buffer.readUInt16NtoH();
        uint16_t additional_count = buffer.readUInt16NtoH();

        for ( int i = 0; i < question_count; i++ ) {
            message_info.mQuestionSection.push_back( parseQuestion( buffer ) );
        }
        for ( int i = 0; i < answer_count; i++ ) {
            message_info.mAnswerSection.push_back( parseResourceRecord( buffer ) );
        }
        for ( int i = 0; i < authority_count; i++ ) {
            message_info.mAuthoritySection.push_back( parseResourceRecord( buffer ) );
        }
        for ( int i = 0; i < additional_count; i++ ) {
            message_info.mAdditionalSection.push_back( parseResourceRecord( buffer ) );
        }

        return message_info;
    }

    void generateQuestion( const QuestionSectionEntry &question, WireFormat &message, OffsetDB &offset_db )
    {
        offset_db.outputWireFormat( question.mDomainname, message );
        message.pushUInt16HtoN( question.mType );
        message.pushUInt16HtoN( question.mClass );
    }

    static QuestionSectionEntry parseQuestion( ReadBuffer &buffer )
    {
        QuestionSectionEntry question;
        question.mDomainname = buffer.readDomainname();
        question.mType       = buffer.readUInt16NtoH();
        question.mClass      = buffer.readUInt16NtoH();
        return question;
    }

    void generateResourceRecord( const ResourceRecord &record, WireFormat &message, OffsetDB &offset_db, bool compression )
    {
        if ( compression )
            offset_db.outputWireFormat( record.mDomainname, message );
        else
            record.mDomainname.outputWireFormat( message );
        message.pushUInt16HtoN( record.mType );
        message.pushUInt16HtoN( record.mClass );
        message.pushUInt32HtoN( record.mTTL );

        // RDLENGTHは出力後のサイズで上書きする
        size_t rdlength_offset = message.size();
        message.pushUInt16HtoN( 0 );
        if ( record.mRData ) {
            if ( compression ) {
                record.mRData->outputWireFormat( message, offset_db );
            }
            else {
                OffsetDB no_compression;
                record.mRData->outputWireFormat( message, no_compression );
            }
            size_t rdata_size = message.size() - rdlength_offset - 2;
            if ( rdata_size > 0xffff )
                throw std::length_error( "rdata is too long" );
            message.setUInt16HtoN( rdlength_offset, rdata_size );
        }
    }

    static ResourceRecord parseResourceRecord( ReadBuffer &buffer )
    {
        ResourceRecord record;

        record.mDomainname   = buffer.readDomainname();
        record.mType         = buffer.readUInt16NtoH();
        record.mClass        = buffer.readUInt16NtoH();
        record.mTTL          = buffer.readUInt32NtoH();
        uint16_t data_length = buffer.readUInt16NtoH();
        if ( buffer.getRemainedSize() < data_length )
            throw FormatError( "rdata length is longer than end of message" );

        const uint8_t *packet_begin = buffer.begin();
        const uint8_t *rdata_begin  = buffer.begin() + buffer.getPosition();
        const uint8_t *rdata_end    = rdata_begin + data_length;

        switch ( record.mType ) {
        case TYPE_A:
            record.mRData = RecordA::parse( rdata_begin, rdata_end );
            break;
        case TYPE_NS:
            record.mRData = RecordNS::parse( packet_begin, rdata_begin, rdata_end );
            break;
        case TYPE_MX:
            record.mRData = RecordMX::parse( packet_begin, rdata_begin, rdata_end );
            break;
        case TYPE_KEY:
            record.mRData = RecordKEY::parse( rdata_begin, rdata_end );
            break;
        case TYPE_SIG:
            record.mRData = RecordSIG::parse( packet_begin, rdata_begin, rdata_end );
            break;
        default:
            record.mRData = RDATAPtr( new RecordRaw( record.mType, PacketData( rdata_begin, rdata_end ) ) );
        }
        buffer.skip( data_length );

        return record;
    }

    std::ostream &printHeader( std::ostream &os, const MessageInfo &message )
    {
        os << "ID: "                   << message.mID << std::endl
           << "Query/Response: "       << ( message.mQueryResponse ? "Response" : "Query" ) << std::endl
           << "OpCode: "               << (unsigned int)message.mOpcode << std::endl
           << "Authoritative Answer: " << message.mAuthoritativeAnswer << std::endl
           << "Truncation: "           << message.mTruncation << std::endl
           << "Recursion Desired: "    << message.mRecursionDesired << std::endl
           << "Recursion Available: "  << message.mRecursionAvailable << std::endl
           << "Checking Disabled: "    << message.mCheckingDisabled << std::endl
           << "Response Code: "        << responseCodeToString( message.mResponseCode ) << std::endl;

        return os;
    }

    std::ostream &operator<<( std::ostream &os, const MessageInfo &message )
    {
        printHeader( os, message );

        for ( auto &q : message.mQuestionSection )
            os << "Query: " << q.mDomainname << " " << classCodeToString( q.mClass ) << " "
               << typeCodeToString( q.mType ) << std::endl;

        const char *section_names[] = { "Answer", "Authority", "Additional" };
        const std::vector<ResourceRecord> *sections[] = {
            &message.mAnswerSection, &message.mAuthoritySection, &message.mAdditionalSection };
        for ( int i = 0; i < 3; i++ ) {
            for ( auto &r : *sections[ i ] ) {
                os << section_names[ i ] << ": " << r.mDomainname << " " << r.mTTL << " "
                   << classCodeToString( r.mClass ) << " " << typeCodeToString( r.mType ) << " "
                   << ( r.mRData ? r.mRData->toString() : "" ) << std::endl;
            }
        }

        return os;
    }

    std::string classCodeToString( Class c )
    {
        switch ( c ) {
        case CLASS_IN:
            return "IN";
        case CLASS_ANY:
            return "ANY";
        default:
            return boost::lexical_cast<std::string>( c );
        }
    }

    std::string typeCodeToString( Type t )
    {
        switch ( t ) {
        case TYPE_A:
            return "A";
        case TYPE_NS:
            return "NS";
        case TYPE_MX:
            return "MX";
        case TYPE_SIG:
            return "SIG";
        case TYPE_KEY:
            return "KEY";
        case TYPE_ANY:
            return "ANY";
        default:
            return boost::lexical_cast<std::string>( t );
        }
    }

    Type stringToTypeCode( const std::string &t )
    {
        if ( t == "A" )     return TYPE_A;
        if ( t == "NS" )    return TYPE_NS;
        if ( t == "MX" )    return TYPE_MX;
        if ( t == "SIG" )   return TYPE_SIG;
        if ( t == "KEY" )   return TYPE_KEY;
        if ( t == "ANY" )   return TYPE_ANY;

        // 数値での指定
        if ( !t.empty() && t.size() <= 5 && t.find_first_not_of( "0123456789" ) == std::string::npos ) {
            unsigned int code = boost::lexical_cast<unsigned int>( t );
            if ( code <= 0xffff )
                return code;
        }
        throw std::runtime_error( "unknown type \"" + t + "\"" );
    }

    std::string responseCodeToString( uint8_t rcode )
    {
        const char *rcode2str[] = {
            "NoError", "FormErr", "ServFail", "NXDomain", "NotImp", "Refused",
        };

        if ( rcode < sizeof( rcode2str ) / sizeof( char * ) )
            return rcode2str[ rcode ];
        return boost::lexical_cast<std::string>( (unsigned int)rcode );
    }

    std::string RecordRaw::toString() const
    {
        std::string hex;
        encodeToHex( mData, hex );
        std::ostringstream os;
        os << "type: RAW(" << mRRType << "), data: " << hex;
        return os.str();
    }

    void RecordRaw::outputWireFormat( WireFormat &message, OffsetDB & ) const
    {
        outputCanonicalWireFormat( message );
    }

    void RecordRaw::outputCanonicalWireFormat( WireFormat &message ) const
    {
        message.pushBuffer( mData );
    }

    RecordA::RecordA( const uint8_t *addr )
    {
        std::memcpy( mSinAddr, addr, sizeof( mSinAddr ) );
    }

    RecordA::RecordA( const std::string &addr )
    {
        if ( inet_pton( AF_INET, addr.c_str(), mSinAddr ) != 1 )
            throw std::runtime_error( "invalid IPv4 address \"" + addr + "\"" );
    }

    std::string RecordA::toString() const
    {
        char buf[ INET_ADDRSTRLEN ];
        inet_ntop( AF_INET, mSinAddr, buf, sizeof( buf ) );
        return std::string( buf );
    }

    void RecordA::outputWireFormat( WireFormat &message, OffsetDB & ) const
    {
        outputCanonicalWireFormat( message );
    }

    void RecordA::outputCanonicalWireFormat( WireFormat &message ) const
    {
        message.pushBuffer( mSinAddr, mSinAddr + sizeof( mSinAddr ) );
    }

    RDATAPtr RecordA::parse( const uint8_t *begin, const uint8_t *end )
    {
        if ( end - begin != 4 )
            throw FormatError( "invalid A Record length" );
        return RDATAPtr( new RecordA( begin ) );
    }

    /*!
     * rdataに含まれるdomainnameを読み込む
     * 圧縮ポインタは後方参照のみ許可されるため、rdata_endより後ろを参照することはない
     */
    static const uint8_t *parseRDATADomainname( Domainname    &name,
                                                const uint8_t *packet_begin,
                                                const uint8_t *pos,
                                                const uint8_t *rdata_end )
    {
        if ( pos >= rdata_end )
            throw FormatError( "too few length for domainname in rdata" );
        return Domainname::parsePacket( name, packet_begin, rdata_end, pos );
    }

    std::string RecordNS::toString() const
    {
        return mDomainname.toString();
    }

    void RecordNS::outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const
    {
        offset_db.outputWireFormat( mDomainname, message );
    }

    void RecordNS::outputCanonicalWireFormat( WireFormat &message ) const
    {
        mDomainname.outputCanonicalWireFormat( message );
    }

    RDATAPtr RecordNS::parse( const uint8_t *packet_begin, const uint8_t *rdata_begin, const uint8_t *rdata_end )
    {
        Domainname name;
        parseRDATADomainname( name, packet_begin, rdata_begin, rdata_end );
        return RDATAPtr( new RecordNS( name ) );
    }

    std::string RecordMX::toString() const
    {
        std::ostringstream os;
        os << mPriority << " " << mDomainname.toString();
        return os.str();
    }

    void RecordMX::outputWireFormat( WireFormat &message, OffsetDB &offset_db ) const
    {
        message.pushUInt16HtoN( mPriority );
        offset_db.outputWireFormat( mDomainname, message );
    }

    void RecordMX::outputCanonicalWireFormat( WireFormat &message ) const
    {
        message.pushUInt16HtoN( mPriority );
        mDomainname.outputCanonicalWireFormat( message );
    }

    RDATAPtr RecordMX::parse( const uint8_t *packet_begin, const uint8_t *rdata_begin, const uint8_t *rdata_end )
    {
        if ( rdata_end - rdata_begin < 3 )
            throw FormatError( "too few length for MX record" );
        uint16_t priority = ( rdata_begin[ 0 ] << 8 ) | rdata_begin[ 1 ];

        Domainname name;
        parseRDATADomainname( name, packet_begin, rdata_begin + 2, rdata_end );
        return RDATAPtr( new RecordMX( priority, name ) );
    }

    std::string RecordKEY::toString() const
    {
        std::string public_key_str;
        encodeToBase64( mPublicKey, public_key_str );

        std::ostringstream os;
        os << "Flags: "      << mFlag                    << ", "
           << "Protocol: "   << (unsigned int)mProtocol  << ", "
           << "Algorithm: "  << (unsigned int)mAlgorithm << ", "
           << "Public Key: " << public_key_str;
        return os.str();
    }

    void RecordKEY::outputWireFormat( WireFormat &message, OffsetDB & ) const
    {
        outputCanonicalWireFormat( message );
    }

    void RecordKEY::outputCanonicalWireFormat( WireFormat &message ) const
    {
        message.pushUInt16HtoN( mFlag );
        message.pushUInt8( mProtocol );
        message.pushUInt8( mAlgorithm );
        message.pushBuffer( mPublicKey );
    }

    RDATAPtr RecordKEY::parse( const uint8_t *rdata_begin, const uint8_t *rdata_end )
    {
        ReadBuffer buffer( rdata_begin, rdata_end );
        uint16_t   flag     = buffer.readUInt16NtoH();
        uint8_t    protocol = buffer.readUInt8();
        uint8_t    algo     = buffer.readUInt8();
        PacketData key;
        buffer.readBuffer( key, buffer.getRemainedSize() );

        return RDATAPtr( new RecordKEY( flag, algo, key, protocol ) );
    }

    std::string RecordSIG::toString() const
    {
        std::string signature_str;
        encodeToBase64( mSignature, signature_str );

        std::ostringstream os;
        os << "Type Covered: " << typeCodeToString( mTypeCovered ) << ", "
           << "Algorithm: "    << (uint32_t)mAlgorithm             << ", "
           << "Label Count: "  << (uint32_t)mLabelCount            << ", "
           << "Original TTL: " << mOriginalTTL                     << ", "
           << "Expiration: "   << mExpiration                      << ", "
           << "Inception: "    << mInception                       << ", "
           << "Key Tag: "      << mKeyTag                          << ", "
           << "Signer: "       << mSigner                          << ", "
           << "Signature: "    << signature_str;
        return os.str();
    }

    void RecordSIG::outputWireFormat( WireFormat &message, OffsetDB & ) const
    {
        message.pushUInt16HtoN( mTypeCovered );
        message.pushUInt8( mAlgorithm );
        message.pushUInt8( mLabelCount );
        message.pushUInt32HtoN( mOriginalTTL );
        message.pushUInt32HtoN( mExpiration );
        message.pushUInt32HtoN( mInception );
        message.pushUInt16HtoN( mKeyTag );
        mSigner.outputWireFormat( message );
        message.pushBuffer( mSignature );
    }

    void RecordSIG::outputCanonicalWireFormat( WireFormat &message ) const
    {
        message.pushUInt16HtoN( mTypeCovered );
        message.pushUInt8( mAlgorithm );
        message.pushUInt8( mLabelCount );
        message.pushUInt32HtoN( mOriginalTTL );
        message.pushUInt32HtoN( mExpiration );
        message.pushUInt32HtoN( mInception );
        message.pushUInt16HtoN( mKeyTag );
        mSigner.outputCanonicalWireFormat( message );
        message.pushBuffer( mSignature );
    }

    RDATAPtr RecordSIG::parse( const uint8_t *packet_begin, const uint8_t *rdata_begin, const uint8_t *rdata_end )
    {
        ReadBuffer buffer( rdata_begin, rdata_end );
        Type       type_covered = buffer.readUInt16NtoH();
        uint8_t    algorithm    = buffer.readUInt8();
        uint8_t    label_count  = buffer.readUInt8();
        uint32_t   original_ttl = buffer.readUInt32NtoH();
        uint32_t   expiration   = buffer.readUInt32NtoH();
        uint32_t   inception    = buffer.readUInt32NtoH();
        uint16_t   key_tag      = buffer.readUInt16NtoH();

        Domainname     signer;
        const uint8_t *pos = parseRDATADomainname( signer, packet_begin, rdata_begin + buffer.getPosition(), rdata_end );

        PacketData signature( pos, rdata_end );
        return RDATAPtr( new RecordSIG( type_covered, algorithm, label_count, original_ttl,
                                        expiration, inception, key_tag, signer, signature ) );
    }
}
