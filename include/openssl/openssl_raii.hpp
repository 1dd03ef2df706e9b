#pragma once

#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <memory>
#include <string>
#include <string_view>

#include "crypt_util.hpp"
#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace challtestsrv {
namespace opensslutil {

inline constexpr std::string_view kAcmeIdentifierOid = "1.3.6.1.5.5.7.1.31";
inline constexpr std::string_view kFallbackCommonName = "challenge test server";

/**
 * A certificate together with its private key, as handed to the TLS stack.
 * Both members are immutable once built and may be shared across threads;
 * SSL_use_certificate/SSL_use_PrivateKey take their own references.
 */
struct TlsIdentity {
  std::shared_ptr<X509> cert;
  std::shared_ptr<EVP_PKEY> key;

  explicit operator bool() const { return cert && key; }
};

monad::MyResult<cryptutil::EVP_PKEY_ptr> make_ec_p256_key();

// Cryptographically random serial in [0, 2^63 - 1).
monad::MyResult<cryptutil::ASN1_INTEGER_ptr> make_random_serial();

monad::MyVoidResult add_ext(cryptutil::X509_ptr& cert, int nid,
                            const std::string& val);

// Adds a subjectAltName holding exactly one dNSName entry.
monad::MyVoidResult add_dns_san(cryptutil::X509_ptr& cert,
                                std::string_view dns_name);

// DER encoding of an ASN.1 OCTET STRING wrapping the given bytes.
monad::MyResult<std::string> der_octet_string(const unsigned char* data,
                                              std::size_t len);

// Adds the critical id-pe-acmeIdentifier extension whose value is the DER
// OCTET STRING of SHA-256(key_authorization).
monad::MyVoidResult add_acme_identifier(cryptutil::X509_ptr& cert,
                                        std::string_view key_authorization);

/**
 * @brief Self-signed, long-lived identity served to ordinary TLS clients.
 *
 * ECDSA P-256, CN "challenge test server", random serial, valid from one
 * hour ago until one year from now, keyUsage digitalSignature|keyCertSign,
 * extKeyUsage serverAuth|clientAuth, basicConstraints CA:TRUE.
 */
monad::MyResult<TlsIdentity> make_fallback_identity();

/**
 * @brief Mints a TLS-ALPN-01 challenge certificate for server_name.
 *
 * The certificate is self-signed by key, carries server_name as its only
 * subjectAltName and exactly one extra extension, the critical
 * acmeIdentifier holding the digest of key_authorization.
 */
monad::MyResult<cryptutil::X509_ptr> make_tls_alpn01_cert(
    EVP_PKEY* key, std::string_view server_name,
    std::string_view key_authorization);

monad::MyResult<std::string> cert_to_pem(X509* cert);

std::shared_ptr<X509> share_cert(cryptutil::X509_ptr cert);
std::shared_ptr<EVP_PKEY> share_key(cryptutil::EVP_PKEY_ptr key);

}  // namespace opensslutil
}  // namespace challtestsrv
