#ifndef KEY_CONFIG_HPP
#define KEY_CONFIG_HPP

#include "dns.hpp"
#include "privatekey.hpp"
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace sig0
{
    const uint32_t DEFAULT_CLOCK_SKEW = 300;

    /*!
     * 署名に使用する鍵の設定
     *
     * - domain: signer.example.com
     *   algorithm: RSASHA256
     *   key_file: signer.pem
     *   validity: 3600      # not_before/not_afterの代わりに有効期間(秒)を指定できる
     *   skew: 300           # inceptionをnowより前にずらす秒数
     */
    class SignerConfig
    {
    public:
        SignerConfig( const Domainname &domain,
                      SignAlgorithm     algo,
                      const PrivateKey &key,
                      uint32_t          not_before,
                      uint32_t          not_after )
            : mDomainname( domain ), mAlgorithm( algo ), mPrivateKey( key ), mNotBefore( not_before ), mNotAfter( not_after )
        {}

        const Domainname &getDomainname() const { return mDomainname; }
        SignAlgorithm     getAlgorithm() const { return mAlgorithm; }
        const PrivateKey &getPrivateKey() const { return mPrivateKey; }
        uint32_t          getNotBefore() const { return mNotBefore; }
        uint32_t          getNotAfter() const { return mNotAfter; }

        RecordKEY      getKEYRecord() const;
        ResourceRecord getKEYResourceRecord() const;
        uint16_t       getKeyTag() const;

        // signMessageに渡すSIG recordを作成する
        RecordSIG makeSIG() const;

        static std::vector<SignerConfig> load( const std::string &config, uint32_t now );
        static std::vector<SignerConfig> load( const std::string &config );
        static std::vector<SignerConfig> loadConfig( const std::string &config_file );

    private:
        Domainname    mDomainname;
        SignAlgorithm mAlgorithm;
        PrivateKey    mPrivateKey;
        uint32_t      mNotBefore;
        uint32_t      mNotAfter;

        template <typename TYPE>
        static TYPE loadParameter( const YAML::Node &node, const std::string param_name )
        {
            if ( node[ param_name ] )
                return node[ param_name ].as<TYPE>();
            throw std::runtime_error( param_name + " must be specified" );
        }
    };
}

#endif
