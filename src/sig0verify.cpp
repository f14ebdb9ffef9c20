#include "dns.hpp"
#include "keyconfig.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include "verifier.hpp"
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <iterator>

static PacketData readMessage( const std::string &filename )
{
    std::ifstream fs( filename, std::ios::binary );
    if ( !fs )
        throw std::runtime_error( "cannot open \"" + filename + "\"" );
    std::istreambuf_iterator<char> begin( fs );
    std::istreambuf_iterator<char> end;
    return PacketData( begin, end );
}

static sig0::ResourceRecord makeKEYResourceRecord( const std::string &key_name,
                                                   const std::string &algorithm,
                                                   const std::string &base64_key )
{
    PacketData public_key;
    decodeFromBase64( base64_key, public_key );

    sig0::ResourceRecord key;
    key.mDomainname = sig0::Domainname( key_name );
    key.mType       = sig0::TYPE_KEY;
    key.mClass      = sig0::CLASS_IN;
    key.mTTL        = 0;
    key.mRData      = sig0::RDATAPtr(
        new sig0::RecordKEY( sig0::KEY_FLAG_HOST, sig0::stringToSignAlgorithm( algorithm ), public_key ) );
    return key;
}

int main( int argc, char **argv )
{
    namespace po = boost::program_options;

    std::string input_file;
    std::string config_file;
    std::string key_name;
    std::string algorithm;
    std::string base64_key;
    std::string log_level;

    po::options_description desc( "SIG(0) verifier" );
    desc.add_options()( "help,h", "print this message" )
        ( "input,i", po::value<std::string>( &input_file ), "signed message(wire format)" )
        ( "config,c", po::value<std::string>( &config_file ), "signer key config(YAML)" )
        ( "key-name,n", po::value<std::string>( &key_name ), "KEY owner name" )
        ( "algorithm,a", po::value<std::string>( &algorithm ), "KEY algorithm" )
        ( "public-key,k", po::value<std::string>( &base64_key ), "KEY public key(base64)" )
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
    if ( input_file.empty() ||
         ( config_file.empty() && ( key_name.empty() || algorithm.empty() || base64_key.empty() ) ) ) {
        std::cerr << "--input and either --config or --key-name/--algorithm/--public-key must be specified"
                  << std::endl << desc << std::endl;
        return 1;
    }

    try {
        sig0::logger::initialize( log_level );

        sig0::ResourceRecord key;
        if ( !config_file.empty() ) {
            std::vector<sig0::SignerConfig> keys = sig0::SignerConfig::loadConfig( config_file );
            if ( keys.empty() )
                throw std::runtime_error( "no key in " + config_file );
            key = keys.front().getKEYResourceRecord();
        }
        else {
            key = makeKEYResourceRecord( key_name, algorithm, base64_key );
        }

        PacketData message = readMessage( input_file );
        std::cout << sig0::parseDNSMessage( message.data(), message.data() + message.size() ) << std::endl;

        sig0::verifyMessage( key, message );
        std::cout << "verified" << std::endl;
    }
    catch ( sig0::SIG0Error &e ) {
        std::cout << "verification failed: " << e.what() << std::endl;
        return 1;
    }
    catch ( std::exception &e ) {
        std::cerr << "cannot verify message: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
