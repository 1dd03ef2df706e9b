#pragma once

#include <memory>

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include "acme/challenge_registry.hpp"
#include "acme/client_hello_info.hpp"
#include "my_error_codes.hpp"
#include "openssl/openssl_raii.hpp"
#include "result_monad.hpp"

namespace challtestsrv::acme {

namespace src = boost::log::sources;
namespace trivial = boost::log::trivial;

/**
 * @brief Chooses the certificate for each incoming TLS handshake.
 *
 * Clients that do not offer exactly ["acme-tls/1"] get the fallback
 * identity. Clients that do get a freshly minted TLS-ALPN-01 certificate
 * for their SNI name, or an UNKNOWN_SERVER_NAME error when nothing is
 * registered for it. Safe to call from many handshakes at once: the only
 * shared mutable state is the registry, read under its shared lock.
 */
class TlsAlpn01CertIssuer {
public:
  TlsAlpn01CertIssuer(std::shared_ptr<const ChallengeRegistry> registry,
                      opensslutil::TlsIdentity fallback,
                      std::shared_ptr<EVP_PKEY> signing_key)
      : registry_(std::move(registry)), fallback_(std::move(fallback)),
        signing_key_(std::move(signing_key)) {}

  monad::MyResult<opensslutil::TlsIdentity>
  select(const ClientHelloInfo &hello) const;

  const opensslutil::TlsIdentity &fallback() const { return fallback_; }

  static bool offers_only_acme_tls1(const ClientHelloInfo &hello) {
    return hello.supported_protos.size() == 1 &&
           hello.supported_protos.front() == kAcmeTls1Protocol;
  }

private:
  std::shared_ptr<const ChallengeRegistry> registry_;
  const opensslutil::TlsIdentity fallback_;
  const std::shared_ptr<EVP_PKEY> signing_key_;

  mutable src::severity_logger_mt<trivial::severity_level> lg_;
};

} // namespace challtestsrv::acme
