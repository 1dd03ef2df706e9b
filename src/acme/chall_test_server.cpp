#include "acme/chall_test_server.hpp"

namespace challtestsrv::acme {

monad::MyResult<ChallTestServer::Options>
ChallTestServer::options_from_config(const ChallTestSrvConfig &config) {
  Options options;
  for (const auto &listen : config.tlsalpn01.listen) {
    auto addr_r = parse_listen_address(listen);
    if (addr_r.is_err()) {
      return monad::MyResult<Options>::Err(std::move(addr_r.error()));
    }
    options.tlsalpn01.push_back(std::move(addr_r.value()));
  }

  if (!config.management.listen.empty()) {
    auto addr_r = parse_listen_address(config.management.listen);
    if (addr_r.is_err()) {
      return monad::MyResult<Options>::Err(std::move(addr_r.error()));
    }
    options.management = std::move(addr_r.value());
  }

  options.server.read_timeout =
      std::chrono::seconds(config.tlsalpn01.read_timeout_seconds);
  options.server.write_timeout =
      std::chrono::seconds(config.tlsalpn01.write_timeout_seconds);
  options.server.threads = config.effective_threads();
  return monad::MyResult<Options>::Ok(std::move(options));
}

ChallTestServer::CreateResult ChallTestServer::create(Options options) {
  auto fallback_r = opensslutil::make_fallback_identity();
  if (fallback_r.is_err()) {
    return CreateResult::Err(std::move(fallback_r.error()));
  }

  auto registry = std::make_shared<ChallengeRegistry>();
  std::unique_ptr<ChallTestServer> srv(
      new ChallTestServer(registry, std::move(fallback_r.value())));

  if (auto pem_r = opensslutil::cert_to_pem(srv->fallback_.cert.get());
      pem_r.is_ok()) {
    BOOST_LOG_SEV(srv->lg_, trivial::debug)
        << "fallback certificate:\n" << pem_r.value();
  } else {
    BOOST_LOG_SEV(srv->lg_, trivial::warning)
        << "cannot encode fallback certificate: " << pem_r.error().what;
  }

  for (const auto &addr : options.tlsalpn01) {
    // One signing key per listener, distinct from the fallback key.
    auto key_r = opensslutil::make_ec_p256_key();
    if (key_r.is_err()) {
      srv->shutdown();
      return CreateResult::Err(monad::make_error(
          my_errors::TLSALPN::IDENTITY_GENERATION_FAILED,
          "failed to generate challenge signing key: " +
              key_r.error().what));
    }

    auto issuer = std::make_shared<const TlsAlpn01CertIssuer>(
        registry, srv->fallback_,
        opensslutil::share_key(std::move(key_r.value())));

    auto started = TlsAlpn01Server::start(
        TlsAlpn01Server::ListenConfig{addr.host, addr.port}, options.server,
        std::move(issuer), options.handler);
    if (started.is_err()) {
      srv->shutdown();
      return CreateResult::Err(std::move(started.error()));
    }
    srv->servers_.push_back(std::move(started.value()));
  }

  if (options.management) {
    auto started = ManagementServer::start(
        ManagementServer::ListenConfig{options.management->host,
                                       options.management->port},
        registry);
    if (started.is_err()) {
      srv->shutdown();
      return CreateResult::Err(std::move(started.error()));
    }
    srv->management_ = std::move(started.value());
  }

  BOOST_LOG_SEV(srv->lg_, trivial::info)
      << "challenge test server started with " << srv->servers_.size()
      << " TLS-ALPN-01 listener(s)";
  return CreateResult::Ok(std::move(srv));
}

ChallTestServer::ChallTestServer(std::shared_ptr<ChallengeRegistry> registry,
                                 opensslutil::TlsIdentity fallback)
    : registry_(std::move(registry)), fallback_(std::move(fallback)) {}

ChallTestServer::~ChallTestServer() { shutdown(); }

void ChallTestServer::add_tlsalpn01_challenge(const std::string &host,
                                              std::string content) {
  registry_->add(host, std::move(content));
}

void ChallTestServer::delete_tlsalpn01_challenge(const std::string &host) {
  registry_->remove(host);
}

std::optional<std::string>
ChallTestServer::get_tlsalpn01_challenge(const std::string &host) const {
  return registry_->get(host);
}

void ChallTestServer::shutdown() {
  if (management_) {
    management_->stop();
  }
  for (auto &server : servers_) {
    server->shutdown();
  }
}

bool ChallTestServer::shutdown(std::chrono::steady_clock::duration deadline) {
  if (management_) {
    management_->stop();
  }

  using clock = std::chrono::steady_clock;
  const auto until = clock::now() + deadline;
  bool drained = true;
  for (auto &server : servers_) {
    clock::duration left = until - clock::now();
    if (left < clock::duration::zero()) {
      left = clock::duration::zero();
    }
    drained = server->shutdown(left) && drained;
  }
  return drained;
}

} // namespace challtestsrv::acme
