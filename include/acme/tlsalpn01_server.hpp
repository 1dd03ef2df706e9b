#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <openssl/ssl.h>

#include "acme/tlsalpn01_cert_issuer.hpp"
#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace challtestsrv::acme {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

/**
 * @brief TLS-only listener for TLS-ALPN-01 validation attempts.
 *
 * Certificates come exclusively from the issuer, chosen per handshake in
 * OpenSSL's client-hello callback; nothing is ever loaded from disk and
 * there is no plaintext path. Each connection serves at most one HTTP
 * request and is then closed, so every validation attempt is a fresh
 * handshake.
 */
class TlsAlpn01Server : public std::enable_shared_from_this<TlsAlpn01Server> {
public:
  struct ListenConfig {
    std::string bind;
    std::uint16_t port{};
  };

  struct Options {
    std::chrono::seconds read_timeout{5};
    std::chrono::seconds write_timeout{5};
    std::size_t threads{1};
  };

  using Request = http::request<http::string_body>;
  using Response = http::response<http::string_body>;
  using RequestHandler = std::function<Response(const Request &)>;

  using StartResult =
      monad::Result<std::shared_ptr<TlsAlpn01Server>, monad::Error>;

  static StartResult start(ListenConfig listen, Options options,
                           std::shared_ptr<const TlsAlpn01CertIssuer> issuer,
                           RequestHandler handler = {});

  ~TlsAlpn01Server();

  TlsAlpn01Server(const TlsAlpn01Server &) = delete;
  TlsAlpn01Server &operator=(const TlsAlpn01Server &) = delete;

  std::string bind() const { return listen_.bind; }

  std::uint16_t port() const { return actual_port_.load(); }

  bool is_stopped() const { return stopped_.load(); }

  // Stops accepting and waits for in-flight connections to finish.
  void shutdown();

  // As shutdown(), but cuts remaining connections off once deadline
  // elapses. Returns false if connections had to be cut off.
  bool shutdown(std::chrono::steady_clock::duration deadline);

  static Response not_found(const Request &req);

private:
  class Session;

  TlsAlpn01Server(ListenConfig listen, Options options,
                  std::shared_ptr<const TlsAlpn01CertIssuer> issuer,
                  RequestHandler handler);

  monad::MyVoidResult make_ssl_context();
  monad::MyVoidResult start_listening();
  void start_threads();
  void do_accept();
  void begin_stop();
  bool wait_threads(std::chrono::steady_clock::duration *deadline);
  void join_threads();
  void close_sessions();

  static int client_hello_cb(SSL *ssl, int *al, void *arg);
  static int alpn_select_cb(SSL *ssl, const unsigned char **out,
                            unsigned char *outlen, const unsigned char *in,
                            unsigned int inlen, void *arg);

  ListenConfig listen_;
  Options options_;
  std::shared_ptr<const TlsAlpn01CertIssuer> issuer_;
  std::shared_ptr<const RequestHandler> handler_;
  std::unique_ptr<ssl::context> ssl_ctx_;

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> threads_;

  // Connections still open when a shutdown deadline passes.
  std::mutex sessions_mu_;
  std::vector<std::weak_ptr<Session>> sessions_;

  std::mutex join_mu_;
  std::mutex threads_mu_;
  std::condition_variable threads_cv_;
  std::size_t running_threads_{0};

  std::atomic<bool> stopped_{false};
  std::atomic<std::uint16_t> actual_port_{0};

  src::severity_logger_mt<trivial::severity_level> lg_;
};

} // namespace challtestsrv::acme
