#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "acme/challenge_registry.hpp"
#include "acme/management_server.hpp"
#include "acme/tlsalpn01_cert_issuer.hpp"
#include "acme/tlsalpn01_server.hpp"
#include "conf/challtestsrv_config.hpp"
#include "my_error_codes.hpp"
#include "openssl/openssl_raii.hpp"
#include "result_monad.hpp"

namespace challtestsrv::acme {

/**
 * @brief Challenge test server: owns the registry and the listeners.
 *
 * The fallback identity is generated once per instance and every
 * TLS-ALPN-01 listener gets its own signing key; failure to generate
 * either makes create() fail. Registration calls may come from any thread
 * while handshakes are in flight.
 */
class ChallTestServer {
public:
  struct Options {
    std::vector<ListenAddress> tlsalpn01;
    std::optional<ListenAddress> management;
    TlsAlpn01Server::Options server{};
    TlsAlpn01Server::RequestHandler handler{};
  };

  using CreateResult =
      monad::Result<std::unique_ptr<ChallTestServer>, monad::Error>;

  static monad::MyResult<Options>
  options_from_config(const ChallTestSrvConfig &config);

  static CreateResult create(Options options);

  ~ChallTestServer();

  ChallTestServer(const ChallTestServer &) = delete;
  ChallTestServer &operator=(const ChallTestServer &) = delete;

  void add_tlsalpn01_challenge(const std::string &host, std::string content);
  void delete_tlsalpn01_challenge(const std::string &host);
  std::optional<std::string>
  get_tlsalpn01_challenge(const std::string &host) const;

  const std::vector<std::shared_ptr<TlsAlpn01Server>> &
  tlsalpn01_servers() const {
    return servers_;
  }

  const std::shared_ptr<ManagementServer> &management() const {
    return management_;
  }

  const opensslutil::TlsIdentity &fallback_identity() const {
    return fallback_;
  }

  void shutdown();
  bool shutdown(std::chrono::steady_clock::duration deadline);

private:
  ChallTestServer(std::shared_ptr<ChallengeRegistry> registry,
                  opensslutil::TlsIdentity fallback);

  std::shared_ptr<ChallengeRegistry> registry_;
  opensslutil::TlsIdentity fallback_;
  std::vector<std::shared_ptr<TlsAlpn01Server>> servers_;
  std::shared_ptr<ManagementServer> management_;

  src::severity_logger_mt<trivial::severity_level> lg_;
};

} // namespace challtestsrv::acme
