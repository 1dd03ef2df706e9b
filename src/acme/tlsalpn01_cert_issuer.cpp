#include "acme/tlsalpn01_cert_issuer.hpp"

#include <fmt/format.h>

namespace challtestsrv::acme {

monad::MyResult<opensslutil::TlsIdentity>
TlsAlpn01CertIssuer::select(const ClientHelloInfo &hello) const {
  using IdentityResult = monad::MyResult<opensslutil::TlsIdentity>;

  if (!offers_only_acme_tls1(hello)) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "TLS-ALPN-01 serving fallback identity to sni='"
        << hello.server_name << "'";
    opensslutil::TlsIdentity fallback = fallback_;
    return IdentityResult::Ok(std::move(fallback));
  }

  // The registry lock is held only for the lookup; signing runs unlocked.
  auto ka = registry_->get(hello.server_name);
  if (!ka) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "TLS-ALPN-01 rejecting unknown server name '" << hello.server_name
        << "'";
    return IdentityResult::Err(monad::make_error(
        my_errors::TLSALPN::UNKNOWN_SERVER_NAME,
        fmt::format("unknown ClientHelloInfo.ServerName: {}",
                    hello.server_name)));
  }

  auto cert_r = opensslutil::make_tls_alpn01_cert(
      signing_key_.get(), hello.server_name, *ka);
  if (cert_r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "TLS-ALPN-01 challenge certificate for '" << hello.server_name
        << "' failed: " << cert_r.error().what;
    return IdentityResult::Err(std::move(cert_r.error()));
  }

  BOOST_LOG_SEV(lg_, trivial::debug)
      << "TLS-ALPN-01 minted challenge certificate for '" << hello.server_name
      << "'";

  opensslutil::TlsIdentity identity;
  identity.cert = opensslutil::share_cert(std::move(cert_r.value()));
  identity.key = signing_key_;
  return IdentityResult::Ok(std::move(identity));
}

} // namespace challtestsrv::acme
