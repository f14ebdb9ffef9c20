#include "keyconfig.hpp"
#include "verifier.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iterator>

namespace sig0
{
    RecordKEY SignerConfig::getKEYRecord() const
    {
        return sig0::getKEYRecord( mPrivateKey, mAlgorithm );
    }

    ResourceRecord SignerConfig::getKEYResourceRecord() const
    {
        ResourceRecord record;
        record.mDomainname = mDomainname;
        record.mType       = TYPE_KEY;
        record.mClass      = CLASS_IN;
        record.mTTL        = 0;
        record.mRData      = RDATAPtr( getKEYRecord().clone() );
        return record;
    }

    uint16_t SignerConfig::getKeyTag() const
    {
        return sig0::getKeyTag( getKEYRecord() );
    }

    RecordSIG SignerConfig::makeSIG() const
    {
        return RecordSIG( 0, mAlgorithm, 0, 0, mNotAfter, mNotBefore, getKeyTag(), mDomainname );
    }

    std::vector<SignerConfig> SignerConfig::loadConfig( const std::string &config_filename )
    {
        std::ifstream                  fs( config_filename );
        std::istreambuf_iterator<char> begin( fs );
        std::istreambuf_iterator<char> end;

        if ( !fs ) {
            throw std::runtime_error( "cannot load config file \"" + config_filename + "\"" );
        }
        std::string config( begin, end );
        return load( config );
    }

    std::vector<SignerConfig> SignerConfig::load( const std::string &config )
    {
        return load( config, getCurrentTime() );
    }

    std::vector<SignerConfig> SignerConfig::load( const std::string &config, uint32_t now )
    {
        YAML::Node top;
        try {
            top = YAML::Load( config );
        }
        catch ( YAML::ParserException &e ) {
            throw std::runtime_error( "cannot load signer config: " + std::string( e.what() ) );
        }
        if ( !top.IsSequence() )
            throw std::runtime_error( "signer config must be a sequence of keys" );

        std::vector<SignerConfig> keys;
        for ( auto key_config = top.begin(); key_config != top.end(); key_config++ ) {
            Domainname    domain( loadParameter<std::string>( *key_config, "domain" ) );
            SignAlgorithm algo = stringToSignAlgorithm( loadParameter<std::string>( *key_config, "algorithm" ) );
            PrivateKey    key  = loadPrivateKey( loadParameter<std::string>( *key_config, "key_file" ) );

            uint32_t not_before, not_after;
            if ( ( *key_config )[ "validity" ] ) {
                uint32_t validity = loadParameter<uint32_t>( *key_config, "validity" );
                uint32_t skew     = DEFAULT_CLOCK_SKEW;
                if ( ( *key_config )[ "skew" ] )
                    skew = loadParameter<uint32_t>( *key_config, "skew" );
                not_before = now > skew ? now - skew : 0;
                not_after  = now + validity;
            }
            else {
                not_before = loadParameter<uint32_t>( *key_config, "not_before" );
                not_after  = loadParameter<uint32_t>( *key_config, "not_after" );
            }
            if ( not_before > not_after )
                throw std::runtime_error( "not_before must not be later than not_after" );

            if ( !isUsableWith( key, algo ) )
                throw std::runtime_error( "private key for " + domain.toString() + " cannot be used with " +
                                          signAlgorithmToString( algo ) );

            BOOST_LOG_TRIVIAL( debug ) << "loaded key for " << domain << " (" << signAlgorithmToString( algo )
                                       << ", " << not_before << " - " << not_after << ")";
            keys.push_back( SignerConfig( domain, algo, key, not_before, not_after ) );
        }

        return keys;
    }
}
