#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "acme/chall_test_server.hpp"
#include "conf/challtestsrv_config.hpp"
#include "my_error_codes.hpp"
#include "tls_client_helpers.hpp"

namespace {

using namespace challtestsrv;
using challtestsrv::acme::ChallTestServer;

std::unique_ptr<ChallTestServer> must_create(ChallTestServer::Options options) {
  auto r = ChallTestServer::create(std::move(options));
  if (r.is_err()) {
    ADD_FAILURE() << r.error().what;
    return nullptr;
  }
  return std::move(r.value());
}

ChallTestServer::Options loopback_options(std::size_t listeners) {
  ChallTestServer::Options options;
  for (std::size_t i = 0; i < listeners; ++i) {
    options.tlsalpn01.push_back(ListenAddress{"127.0.0.1", 0});
  }
  options.server.threads = 2;
  return options;
}

} // namespace

TEST(ChallTestServer, OptionsFromConfig) {
  auto config_r = parse_config(R"({
    "tlsalpn01": {"listen": ["127.0.0.1:5001", ":5002"],
                  "read_timeout_seconds": 7},
    "management": {"listen": "127.0.0.1:8055"},
    "threads_num": 3
  })");
  ASSERT_TRUE(config_r.is_ok()) << config_r.error().what;

  auto options_r = ChallTestServer::options_from_config(config_r.value());
  ASSERT_TRUE(options_r.is_ok()) << options_r.error().what;
  const auto &options = options_r.value();

  ASSERT_EQ(options.tlsalpn01.size(), 2u);
  EXPECT_EQ(options.tlsalpn01[0].port, 5001);
  EXPECT_EQ(options.tlsalpn01[1].host, "0.0.0.0");
  ASSERT_TRUE(options.management.has_value());
  EXPECT_EQ(options.management->port, 8055);
  EXPECT_EQ(options.server.read_timeout, std::chrono::seconds(7));
  EXPECT_EQ(options.server.threads, 3u);

  ChallTestSrvConfig no_mgmt;
  no_mgmt.management.listen.clear();
  auto r = ChallTestServer::options_from_config(no_mgmt);
  ASSERT_TRUE(r.is_ok());
  EXPECT_FALSE(r.value().management.has_value());
}

TEST(ChallTestServer, ServesRegisteredChallengeOnEveryListener) {
  auto srv = must_create(loopback_options(2));
  ASSERT_TRUE(srv);
  ASSERT_EQ(srv->tlsalpn01_servers().size(), 2u);
  EXPECT_FALSE(srv->management());

  srv->add_tlsalpn01_challenge("example.com", "token.thumbprint");
  EXPECT_EQ(srv->get_tlsalpn01_challenge("example.com").value_or(""),
            "token.thumbprint");

  for (const auto &listener : srv->tlsalpn01_servers()) {
    auto client = test_support::connect_tls(listener->port(), "example.com",
                                            {"acme-tls/1"});
    ASSERT_TRUE(client);
    client->handshake();

    auto peer = test_support::peer_certificate(client->native());
    ASSERT_TRUE(peer);
    EXPECT_EQ(test_support::acme_identifier_value(peer.get()).value_or(""),
              test_support::expected_acme_identifier("token.thumbprint"));
  }

  EXPECT_TRUE(srv->shutdown(std::chrono::seconds(10)));
}

TEST(ChallTestServer, ListenersShareOneFallbackIdentity) {
  auto srv = must_create(loopback_options(2));
  ASSERT_TRUE(srv);
  ASSERT_TRUE(static_cast<bool>(srv->fallback_identity()));

  for (const auto &listener : srv->tlsalpn01_servers()) {
    auto client = test_support::connect_tls(listener->port(), "example.com", {});
    ASSERT_TRUE(client);
    client->handshake();

    auto peer = test_support::peer_certificate(client->native());
    ASSERT_TRUE(peer);
    EXPECT_EQ(X509_cmp(peer.get(), srv->fallback_identity().cert.get()), 0);
  }

  srv->shutdown();
}

TEST(ChallTestServer, DeletedChallengeFailsHandshake) {
  auto srv = must_create(loopback_options(1));
  ASSERT_TRUE(srv);

  srv->add_tlsalpn01_challenge("example.com", "ka");
  srv->delete_tlsalpn01_challenge("example.com");
  EXPECT_FALSE(srv->get_tlsalpn01_challenge("example.com").has_value());

  auto client = test_support::connect_tls(
      srv->tlsalpn01_servers().front()->port(), "example.com", {"acme-tls/1"});
  ASSERT_TRUE(client);
  EXPECT_THROW(client->handshake(), boost::system::system_error);

  srv->shutdown();
}

TEST(ChallTestServer, StartsManagementApiWhenConfigured) {
  auto options = loopback_options(1);
  options.management = ListenAddress{"127.0.0.1", 0};

  auto srv = must_create(std::move(options));
  ASSERT_TRUE(srv);
  ASSERT_TRUE(srv->management());
  EXPECT_GT(srv->management()->port(), 0);

  srv->shutdown();
  EXPECT_TRUE(srv->management()->is_stopped());
}

TEST(ChallTestServer, ShutdownDeadlineIsSharedAcrossListeners) {
  auto options = loopback_options(2);
  options.server.read_timeout = std::chrono::seconds(30);
  auto srv = must_create(std::move(options));
  ASSERT_TRUE(srv);

  // One idle connection per listener keeps each of them from draining.
  std::vector<std::unique_ptr<test_support::TlsClient>> clients;
  for (const auto &listener : srv->tlsalpn01_servers()) {
    auto client = test_support::connect_tls(listener->port(), "example.com", {});
    ASSERT_TRUE(client);
    client->handshake();
    clients.push_back(std::move(client));
  }

  const auto budget = std::chrono::milliseconds(500);
  const auto began = std::chrono::steady_clock::now();
  EXPECT_FALSE(srv->shutdown(budget));
  const auto took = std::chrono::steady_clock::now() - began;
  EXPECT_LT(took, 2 * budget);

  for (const auto &listener : srv->tlsalpn01_servers()) {
    EXPECT_TRUE(listener->is_stopped());
  }
  for (auto &client : clients) {
    const auto closed =
        test_support::wait_for_close(*client, std::chrono::seconds(3));
    ASSERT_TRUE(closed.has_value()) << "connection still open";
    EXPECT_TRUE(*closed);
  }
}

TEST(ChallTestServer, CreateFailsOnBadListener) {
  auto options = loopback_options(1);
  options.tlsalpn01.push_back(ListenAddress{"not-an-address", 0});

  auto r = ChallTestServer::create(std::move(options));
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::INVALID_ARGUMENT);
}
