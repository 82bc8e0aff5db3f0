#pragma once

#include <boost/asio/ssl/context.hpp>

#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>
#include <stdexcept>

namespace Perpfeed
{
namespace Test
{

// Server context with a throwaway self-signed certificate for loopback servers.
inline std::shared_ptr< boost::asio::ssl::context > make_server_ssl_context( )
{
    auto context = std::make_shared< boost::asio::ssl::context >( boost::asio::ssl::context::method::tls_server );

    std::unique_ptr< EVP_PKEY, decltype( &EVP_PKEY_free ) > key( EVP_RSA_gen( 2048 ), &EVP_PKEY_free );
    std::unique_ptr< X509, decltype( &X509_free ) > certificate( X509_new( ), &X509_free );
    if ( !key || !certificate )
    {
        throw std::runtime_error( "Unable to allocate test certificate" );
    }

    X509_set_version( certificate.get( ), 2 );
    ASN1_INTEGER_set( X509_get_serialNumber( certificate.get( ) ), 1 );
    X509_gmtime_adj( X509_getm_notBefore( certificate.get( ) ), 0 );
    X509_gmtime_adj( X509_getm_notAfter( certificate.get( ) ), 3600 );
    X509_set_pubkey( certificate.get( ), key.get( ) );

    auto * subject = X509_get_subject_name( certificate.get( ) );
    X509_NAME_add_entry_by_txt( subject, "CN", MBSTRING_ASC, reinterpret_cast< const unsigned char * >( "localhost" ), -1, -1, 0 );
    X509_set_issuer_name( certificate.get( ), subject );

    if ( X509_sign( certificate.get( ), key.get( ), EVP_sha256( ) ) == 0
        || SSL_CTX_use_certificate( context->native_handle( ), certificate.get( ) ) != 1
        || SSL_CTX_use_PrivateKey( context->native_handle( ), key.get( ) ) != 1 )
    {
        throw std::runtime_error( "Unable to install test certificate" );
    }

    return context;
}

} // namespace Test
} // namespace Perpfeed
