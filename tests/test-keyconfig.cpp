#include "keyconfig.hpp"
#include "logger.hpp"
#include "signer.hpp"
#include "testkeys.hpp"
#include "verifier.hpp"
#include "gtest/gtest.h"
#include <cstdio>
#include <fstream>
#include <iostream>

class SignerConfigTest : public ::testing::Test
{
protected:
    static sig0::EVPPKeyPtr rsa_key;
    static sig0::EVPPKeyPtr p256_key;

    std::string rsa_key_file;
    std::string p256_key_file;
    std::string config_file;

public:
    static void SetUpTestCase()
    {
        rsa_key  = generateRSAKey( 1024 );
        p256_key = generateECKey( "P-256" );
    }

    static void TearDownTestCase()
    {
        rsa_key.reset();
        p256_key.reset();
    }

    virtual void SetUp()
    {
        rsa_key_file  = "test-keyconfig-rsa.pem";
        p256_key_file = "test-keyconfig-p256.pem";
        config_file   = "test-keyconfig.yaml";
        writePrivateKey( rsa_key, rsa_key_file );
        writePrivateKey( p256_key, p256_key_file );
    }

    virtual void TearDown()
    {
        std::remove( rsa_key_file.c_str() );
        std::remove( p256_key_file.c_str() );
        std::remove( config_file.c_str() );
    }

    std::string getErrorMessage( const std::string &config )
    {
        try {
            sig0::SignerConfig::load( config, 1000000 );
        }
        catch ( std::runtime_error &e ) {
            return e.what();
        }
        return "";
    }
};

sig0::EVPPKeyPtr SignerConfigTest::rsa_key;
sig0::EVPPKeyPtr SignerConfigTest::p256_key;

TEST_F( SignerConfigTest, LoadFixedPeriod )
{
    std::string config = "- domain: signer.example.com\n"
                         "  algorithm: RSASHA256\n"
                         "  key_file: " + rsa_key_file + "\n"
                         "  not_before: 1000\n"
                         "  not_after: 2000\n";

    std::vector<sig0::SignerConfig> keys = sig0::SignerConfig::load( config );
    ASSERT_EQ( 1, keys.size() );
    EXPECT_EQ( sig0::Domainname( "signer.example.com" ), keys[ 0 ].getDomainname() );
    EXPECT_EQ( sig0::DNSSEC_RSASHA256, keys[ 0 ].getAlgorithm() );
    EXPECT_EQ( 1000, keys[ 0 ].getNotBefore() );
    EXPECT_EQ( 2000, keys[ 0 ].getNotAfter() );
    EXPECT_TRUE( sig0::isUsableWith( keys[ 0 ].getPrivateKey(), sig0::DNSSEC_RSASHA256 ) );
}

TEST_F( SignerConfigTest, LoadValidity )
{
    std::string config = "- domain: signer.example.com\n"
                         "  algorithm: ECDSAP256SHA256\n"
                         "  key_file: " + p256_key_file + "\n"
                         "  validity: 3600\n"
                         "- domain: rsa.example.com\n"
                         "  algorithm: RSASHA1\n"
                         "  key_file: " + rsa_key_file + "\n"
                         "  validity: 600\n"
                         "  skew: 30\n";

    std::vector<sig0::SignerConfig> keys = sig0::SignerConfig::load( config, 1000000 );
    ASSERT_EQ( 2, keys.size() );

    EXPECT_EQ( sig0::DNSSEC_ECDSAP256SHA256, keys[ 0 ].getAlgorithm() );
    EXPECT_EQ( 1000000 - sig0::DEFAULT_CLOCK_SKEW, keys[ 0 ].getNotBefore() );
    EXPECT_EQ( 1000000 + 3600, keys[ 0 ].getNotAfter() );

    EXPECT_EQ( sig0::Domainname( "rsa.example.com" ), keys[ 1 ].getDomainname() );
    EXPECT_EQ( sig0::DNSSEC_RSASHA1, keys[ 1 ].getAlgorithm() );
    EXPECT_EQ( 1000000 - 30, keys[ 1 ].getNotBefore() );
    EXPECT_EQ( 1000000 + 600, keys[ 1 ].getNotAfter() );
}

TEST_F( SignerConfigTest, LoadConfigFile )
{
    std::ofstream fs( config_file );
    fs << "- domain: signer.example.com\n"
       << "  algorithm: RSASHA512\n"
       << "  key_file: " << rsa_key_file << "\n"
       << "  validity: 3600\n";
    fs.close();

    std::vector<sig0::SignerConfig> keys = sig0::SignerConfig::loadConfig( config_file );
    ASSERT_EQ( 1, keys.size() );
    EXPECT_EQ( sig0::DNSSEC_RSASHA512, keys[ 0 ].getAlgorithm() );

    EXPECT_THROW( { sig0::SignerConfig::loadConfig( "no-such-config.yaml" ); }, std::runtime_error );
}

TEST_F( SignerConfigTest, MissingParameter )
{
    EXPECT_EQ( "domain must be specified", getErrorMessage( "- algorithm: RSASHA256\n"
                                                            "  key_file: " + rsa_key_file + "\n"
                                                            "  validity: 3600\n" ) );
    EXPECT_EQ( "algorithm must be specified", getErrorMessage( "- domain: signer.example.com\n"
                                                               "  key_file: " + rsa_key_file + "\n"
                                                               "  validity: 3600\n" ) );
    EXPECT_EQ( "key_file must be specified", getErrorMessage( "- domain: signer.example.com\n"
                                                              "  algorithm: RSASHA256\n"
                                                              "  validity: 3600\n" ) );
    EXPECT_EQ( "not_after must be specified", getErrorMessage( "- domain: signer.example.com\n"
                                                               "  algorithm: RSASHA256\n"
                                                               "  key_file: " + rsa_key_file + "\n"
                                                               "  not_before: 1000\n" ) );
}

TEST_F( SignerConfigTest, InvalidConfig )
{
    // not a sequence
    EXPECT_NE( "", getErrorMessage( "domain: signer.example.com\n" ) );
    // broken yaml
    EXPECT_NE( "", getErrorMessage( "- domain: [signer.example.com\n" ) );
    // unknown algorithm
    EXPECT_NE( "", getErrorMessage( "- domain: signer.example.com\n"
                                    "  algorithm: RSAMD5\n"
                                    "  key_file: " + rsa_key_file + "\n"
                                    "  validity: 3600\n" ) );
    // key file not found
    EXPECT_NE( "", getErrorMessage( "- domain: signer.example.com\n"
                                    "  algorithm: RSASHA256\n"
                                    "  key_file: no-such-key.pem\n"
                                    "  validity: 3600\n" ) );
    // not_before > not_after
    EXPECT_NE( "", getErrorMessage( "- domain: signer.example.com\n"
                                    "  algorithm: RSASHA256\n"
                                    "  key_file: " + rsa_key_file + "\n"
                                    "  not_before: 2000\n"
                                    "  not_after: 1000\n" ) );
}

TEST_F( SignerConfigTest, KeyNotUsableWithAlgorithm )
{
    std::string message = getErrorMessage( "- domain: signer.example.com\n"
                                           "  algorithm: ECDSAP256SHA256\n"
                                           "  key_file: " + rsa_key_file + "\n"
                                           "  validity: 3600\n" );
    EXPECT_NE( std::string::npos, message.find( "cannot be used with ECDSAP256SHA256" ) );
}

TEST_F( SignerConfigTest, MakeSIG )
{
    std::vector<sig0::SignerConfig> keys = sig0::SignerConfig::load( "- domain: signer.example.com\n"
                                                                      "  algorithm: RSASHA256\n"
                                                                      "  key_file: " + rsa_key_file + "\n"
                                                                      "  not_before: 1000\n"
                                                                      "  not_after: 2000\n" );
    ASSERT_EQ( 1, keys.size() );

    sig0::RecordSIG sig = keys[ 0 ].makeSIG();
    EXPECT_EQ( sig0::DNSSEC_RSASHA256, sig.getAlgorithm() );
    EXPECT_EQ( 1000, sig.getInception() );
    EXPECT_EQ( 2000, sig.getExpiration() );
    EXPECT_EQ( keys[ 0 ].getKeyTag(), sig.getKeyTag() );
    EXPECT_NE( 0, sig.getKeyTag() );
    EXPECT_EQ( sig0::Domainname( "signer.example.com" ), sig.getSigner() );
    EXPECT_TRUE( sig.getSignature().empty() );

    sig0::ResourceRecord key_record = keys[ 0 ].getKEYResourceRecord();
    EXPECT_EQ( sig0::TYPE_KEY, key_record.mType );
    EXPECT_EQ( sig0::CLASS_IN, key_record.mClass );
    EXPECT_EQ( sig0::Domainname( "signer.example.com" ), key_record.mDomainname );

    const sig0::RecordKEY *key = dynamic_cast<const sig0::RecordKEY *>( key_record.mRData.get() );
    ASSERT_TRUE( key != nullptr );
    EXPECT_EQ( sig0::KEY_FLAG_HOST, key->getFlag() );
    EXPECT_EQ( sig0::DNSSEC_RSASHA256, key->getAlgorithm() );
}

TEST_F( SignerConfigTest, SignAndVerify )
{
    std::vector<sig0::SignerConfig> keys = sig0::SignerConfig::load( "- domain: signer.example.com\n"
                                                                      "  algorithm: ECDSAP256SHA256\n"
                                                                      "  key_file: " + p256_key_file + "\n"
                                                                      "  validity: 3600\n",
                                                                      1000000 );
    ASSERT_EQ( 1, keys.size() );

    sig0::MessageInfo query;
    query.mID = 0xabcd;
    sig0::QuestionSectionEntry question;
    question.mDomainname = "www.example.com";
    question.mType       = sig0::TYPE_A;
    question.mClass      = sig0::CLASS_IN;
    query.pushQuestionSection( question );

    sig0::SignedMessage signed_message = sig0::signMessage( keys[ 0 ].makeSIG(), query, keys[ 0 ].getPrivateKey() );
    EXPECT_NO_THROW( { sig0::verifyMessage( keys[ 0 ].getKEYResourceRecord(), signed_message.mMessage, 1000000 ); } );
    EXPECT_THROW( { sig0::verifyMessage( keys[ 0 ].getKEYResourceRecord(), signed_message.mMessage, 1003601 ); },
                  sig0::TimeError );
}

int main( int argc, char **argv )
{
    sig0::logger::initialize( sig0::logger::WARNING );
    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
