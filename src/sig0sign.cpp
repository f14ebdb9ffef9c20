#include "dns.hpp"
#include "keyconfig.hpp"
#include "logger.hpp"
#include "signer.hpp"
#include "utils.hpp"
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

int main( int argc, char **argv )
{
    namespace po = boost::program_options;

    std::string config_file;
    std::string qname;
    std::string qtype;
    uint16_t    id;
    std::string output_file;
    std::string log_level;

    po::options_description desc( "SIG(0) signer" );
    desc.add_options()( "help,h", "print this message" )
        ( "config,c", po::value<std::string>( &config_file ), "signer key config(YAML)" )
        ( "qname,n", po::value<std::string>( &qname ), "query name" )
        ( "qtype,t", po::value<std::string>( &qtype )->default_value( "A" ), "query type" )
        ( "id,i", po::value<uint16_t>( &id )->default_value( 0 ), "message ID" )
        ( "output,o", po::value<std::string>( &output_file ), "output file. hex dump to stdout if not specified" )
        ( "log-level,l",
          po::value<std::string>( &log_level )->default_value( "warning" ),
          "trace|debug|info|warning|error|fatal" )
        ;

    po::variables_map vm;
    try {
        po::store( po::parse_command_line( argc, argv, desc ), vm );
        po::notify( vm );
    }
    catch ( po::error &e ) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    if ( vm.count( "help" ) ) {
        std::cerr << desc << "\n";
        return 1;
    }
    if ( config_file.empty() || qname.empty() ) {
        std::cerr << "--config and --qname must be specified" << std::endl << desc << std::endl;
        return 1;
    }

    try {
        sig0::logger::initialize( log_level );

        std::vector<sig0::SignerConfig> keys = sig0::SignerConfig::loadConfig( config_file );
        if ( keys.empty() )
            throw std::runtime_error( "no key in " + config_file );
        const sig0::SignerConfig &signer = keys.front();

        sig0::MessageInfo query;
        query.mID               = id;
        query.mOpcode           = sig0::OPCODE_QUERY;
        query.mRecursionDesired = true;

        sig0::QuestionSectionEntry question;
        question.mDomainname = sig0::Domainname( qname );
        question.mType       = sig0::stringToTypeCode( qtype );
        question.mClass      = sig0::CLASS_IN;
        query.pushQuestionSection( question );

        sig0::SignedMessage signed_message = sig0::signMessage( signer.makeSIG(), query, signer.getPrivateKey() );

        if ( output_file.empty() ) {
            std::cout << printPacketData( signed_message.mMessage );
        }
        else {
            std::ofstream fs( output_file, std::ios::binary );
            fs.write( reinterpret_cast<const char *>( signed_message.mMessage.data() ), signed_message.mMessage.size() );
            if ( !fs )
                throw std::runtime_error( "cannot write \"" + output_file + "\"" );
        }

        BOOST_LOG_TRIVIAL( info ) << "signed " << qname << " by " << signer.getDomainname()
                                  << " (key tag " << signer.getKeyTag() << ")";
    }
    catch ( std::exception &e ) {
        std::cerr << "cannot sign message: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
