#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <memory>
#include <string>

#include "acme/challenge_registry.hpp"
#include "acme/management_server.hpp"

namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace json = boost::json;
using tcp = net::ip::tcp;

using challtestsrv::acme::ChallengeRegistry;
using challtestsrv::acme::ManagementServer;

ManagementServer::Request make_request(http::verb method,
                                       const std::string &target,
                                       const std::string &body = {}) {
  ManagementServer::Request req{method, target, 11};
  req.body() = body;
  req.prepare_payload();
  return req;
}

} // namespace

TEST(ManagementServer, AddRegistersChallenge) {
  ChallengeRegistry registry;
  auto res = ManagementServer::handle_request(
      registry,
      make_request(http::verb::post, "/add-tlsalpn01",
                   R"({"host":"example.com","content":"token.thumbprint"})"));

  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(registry.get("example.com").value_or(""), "token.thumbprint");
}

TEST(ManagementServer, DeleteRemovesChallenge) {
  ChallengeRegistry registry;
  registry.add("example.com", "ka");

  auto res = ManagementServer::handle_request(
      registry, make_request(http::verb::post, "/del-tlsalpn01",
                             R"({"host":"example.com"})"));

  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_FALSE(registry.get("example.com").has_value());
}

TEST(ManagementServer, ListReturnsSortedHosts) {
  ChallengeRegistry registry;
  registry.add("b.example", "x");
  registry.add("a.example", "y");

  auto res = ManagementServer::handle_request(
      registry, make_request(http::verb::get, "/tlsalpn01"));
  ASSERT_EQ(res.result(), http::status::ok);

  auto jv = json::parse(res.body());
  const auto &hosts = jv.as_object().at("hosts").as_array();
  ASSERT_EQ(hosts.size(), 2u);
  EXPECT_EQ(hosts[0].as_string(), "a.example");
  EXPECT_EQ(hosts[1].as_string(), "b.example");
}

TEST(ManagementServer, RejectsBadRequests) {
  ChallengeRegistry registry;

  auto not_json = ManagementServer::handle_request(
      registry, make_request(http::verb::post, "/add-tlsalpn01", "nope"));
  EXPECT_EQ(not_json.result(), http::status::bad_request);

  auto no_host = ManagementServer::handle_request(
      registry, make_request(http::verb::post, "/add-tlsalpn01",
                             R"({"content":"ka"})"));
  EXPECT_EQ(no_host.result(), http::status::bad_request);

  auto no_content = ManagementServer::handle_request(
      registry, make_request(http::verb::post, "/add-tlsalpn01",
                             R"({"host":"example.com"})"));
  EXPECT_EQ(no_content.result(), http::status::bad_request);

  auto wrong_method = ManagementServer::handle_request(
      registry, make_request(http::verb::get, "/add-tlsalpn01"));
  EXPECT_EQ(wrong_method.result(), http::status::method_not_allowed);

  auto unknown = ManagementServer::handle_request(
      registry, make_request(http::verb::get, "/http01"));
  EXPECT_EQ(unknown.result(), http::status::not_found);

  EXPECT_EQ(registry.size(), 0u);
}

TEST(ManagementServer, ServesOverHttp) {
  auto registry = std::make_shared<ChallengeRegistry>();
  auto started = ManagementServer::start(
      ManagementServer::ListenConfig{"127.0.0.1", 0}, registry);
  ASSERT_TRUE(started.is_ok()) << started.error().what;
  auto srv = started.value();
  ASSERT_GT(srv->port(), 0);

  net::io_context ioc;
  beast::tcp_stream stream(ioc);
  stream.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"),
                               srv->port()));

  auto req = make_request(http::verb::post, "/add-tlsalpn01",
                          R"({"host":"example.com","content":"ka"})");
  req.set(http::field::host, "127.0.0.1");
  http::write(stream, req);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res);
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(registry->get("example.com").value_or(""), "ka");

  srv->stop();
  EXPECT_TRUE(srv->is_stopped());
  // Idempotent.
  srv->stop();
}
