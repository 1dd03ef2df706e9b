#include "acme/tlsalpn01_server.hpp"

#include <boost/beast/ssl.hpp>

#include <cstring>
#include <exception>
#include <string_view>

namespace challtestsrv::acme {

class TlsAlpn01Server::Session
    : public std::enable_shared_from_this<TlsAlpn01Server::Session> {
public:
  Session(tcp::socket socket, ssl::context &ctx, const Options &options,
          std::shared_ptr<const RequestHandler> handler)
      : stream_(std::move(socket), ctx), options_(options),
        handler_(std::move(handler)) {}

  void run() {
    beast::get_lowest_layer(stream_).expires_after(options_.read_timeout);
    stream_.async_handshake(
        ssl::stream_base::server,
        beast::bind_front_handler(&Session::on_handshake, shared_from_this()));
  }

  // Only safe once no io thread can run this session's handlers.
  void force_close() { close_socket(); }

private:
  beast::ssl_stream<beast::tcp_stream> stream_;
  beast::flat_buffer buffer_;
  Request req_;
  std::shared_ptr<Response> res_;
  Options options_;
  std::shared_ptr<const RequestHandler> handler_;
  src::severity_logger<trivial::severity_level> lg_;

  void on_handshake(const boost::system::error_code &ec) {
    if (ec) {
      // Unknown names and minting failures end up here as TLS alerts; the
      // client sees a failed handshake, the server carries on.
      BOOST_LOG_SEV(lg_, trivial::debug)
          << "TLS-ALPN-01 handshake failed: " << ec.message();
      close_socket();
      return;
    }

    const unsigned char *proto = nullptr;
    unsigned int proto_len = 0;
    SSL_get0_alpn_selected(stream_.native_handle(), &proto, &proto_len);
    BOOST_LOG_SEV(lg_, trivial::trace)
        << "TLS-ALPN-01 handshake done, alpn='"
        << std::string_view(reinterpret_cast<const char *>(proto), proto_len)
        << "'";

    do_read();
  }

  void do_read() {
    req_ = {};
    beast::get_lowest_layer(stream_).expires_after(options_.read_timeout);
    http::async_read(
        stream_, buffer_, req_,
        beast::bind_front_handler(&Session::on_read, shared_from_this()));
  }

  void on_read(const boost::system::error_code &ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      do_shutdown();
      return;
    }
    if (ec) {
      // Validators usually hang up right after the handshake.
      BOOST_LOG_SEV(lg_, trivial::trace)
          << "TLS-ALPN-01 read ended: " << ec.message();
      close_socket();
      return;
    }

    Response res;
    try {
      res = (handler_ && *handler_) ? (*handler_)(req_) : not_found(req_);
    } catch (const std::exception &e) {
      BOOST_LOG_SEV(lg_, trivial::error)
          << "TLS-ALPN-01 request handler threw: " << e.what();
      res = Response{http::status::internal_server_error, req_.version()};
      res.set(http::field::content_type, "text/plain");
      res.body() = "internal error";
    }
    res.keep_alive(false);
    res.prepare_payload();

    // Response must outlive the async_write.
    res_ = std::make_shared<Response>(std::move(res));
    beast::get_lowest_layer(stream_).expires_after(options_.write_timeout);
    http::async_write(
        stream_, *res_,
        beast::bind_front_handler(&Session::on_write, shared_from_this()));
  }

  void on_write(const boost::system::error_code &ec, std::size_t) {
    if (ec) {
      BOOST_LOG_SEV(lg_, trivial::debug)
          << "TLS-ALPN-01 write failed: " << ec.message();
      close_socket();
      return;
    }
    do_shutdown();
  }

  void do_shutdown() {
    beast::get_lowest_layer(stream_).expires_after(options_.write_timeout);
    stream_.async_shutdown(
        beast::bind_front_handler(&Session::on_shutdown, shared_from_this()));
  }

  void on_shutdown(const boost::system::error_code &) { close_socket(); }

  void close_socket() {
    boost::system::error_code ignored;
    [[maybe_unused]] const auto shutdown_rc =
        beast::get_lowest_layer(stream_).socket().shutdown(
            tcp::socket::shutdown_both, ignored);
    [[maybe_unused]] const auto close_rc =
        beast::get_lowest_layer(stream_).socket().close(ignored);
  }
};

TlsAlpn01Server::StartResult
TlsAlpn01Server::start(ListenConfig listen, Options options,
                       std::shared_ptr<const TlsAlpn01CertIssuer> issuer,
                       RequestHandler handler) {
  if (listen.bind.empty()) {
    return StartResult::Err(monad::make_error(
        my_errors::GENERAL::MISSING_FIELD, "tlsalpn01.listen bind is required"));
  }

  if (!issuer) {
    return StartResult::Err(
        monad::make_error(my_errors::GENERAL::POINTER_IS_NULL,
                          "tlsalpn01 server requires a certificate issuer"));
  }

  if (options.threads == 0) {
    options.threads = 1;
  }
  if (options.read_timeout.count() <= 0) {
    options.read_timeout = std::chrono::seconds(5);
  }
  if (options.write_timeout.count() <= 0) {
    options.write_timeout = std::chrono::seconds(5);
  }

  auto srv = std::shared_ptr<TlsAlpn01Server>(
      new TlsAlpn01Server(std::move(listen), options, std::move(issuer),
                          std::move(handler)));

  if (auto r = srv->make_ssl_context(); r.is_err()) {
    return StartResult::Err(std::move(r.error()));
  }

  if (auto r = srv->start_listening(); r.is_err()) {
    return StartResult::Err(std::move(r.error()));
  }

  srv->start_threads();
  return StartResult::Ok(std::move(srv));
}

TlsAlpn01Server::TlsAlpn01Server(
    ListenConfig listen, Options options,
    std::shared_ptr<const TlsAlpn01CertIssuer> issuer, RequestHandler handler)
    : listen_(std::move(listen)), options_(options),
      issuer_(std::move(issuer)),
      handler_(std::make_shared<const RequestHandler>(std::move(handler))),
      ioc_(static_cast<int>(options.threads)),
      acceptor_(net::make_strand(ioc_)), lg_() {
  work_guard_ = std::make_unique<
      net::executor_work_guard<net::io_context::executor_type>>(
      ioc_.get_executor());
}

TlsAlpn01Server::~TlsAlpn01Server() {
  stopped_.store(true);
  ioc_.stop();
  join_threads();

  boost::system::error_code ignored;
  [[maybe_unused]] const auto close_rc = acceptor_.close(ignored);
}

TlsAlpn01Server::Response TlsAlpn01Server::not_found(const Request &req) {
  Response res{http::status::not_found, req.version()};
  res.set(http::field::content_type, "text/plain");
  res.body() = "not found";
  return res;
}

void TlsAlpn01Server::shutdown() { (void)wait_threads(nullptr); }

bool TlsAlpn01Server::shutdown(std::chrono::steady_clock::duration deadline) {
  return wait_threads(&deadline);
}

void TlsAlpn01Server::begin_stop() {
  if (stopped_.exchange(true)) {
    return;
  }

  BOOST_LOG_SEV(lg_, trivial::info)
      << "TLS-ALPN-01 server " << listen_.bind << ':' << actual_port_.load()
      << " shutting down";

  // Once the acceptor is closed and the guard released, the io threads
  // return as soon as the last in-flight connection finishes.
  net::post(acceptor_.get_executor(), [this]() {
    boost::system::error_code ignored;
    [[maybe_unused]] const auto cancel_rc = acceptor_.cancel(ignored);
    [[maybe_unused]] const auto close_rc = acceptor_.close(ignored);
    work_guard_.reset();
  });
}

bool TlsAlpn01Server::wait_threads(
    std::chrono::steady_clock::duration *deadline) {
  begin_stop();

  for (const auto &t : threads_) {
    if (t.get_id() == std::this_thread::get_id()) {
      // Called from a handler; the remaining threads drain on their own.
      return true;
    }
  }

  bool drained = true;
  {
    std::unique_lock<std::mutex> lock(threads_mu_);
    auto all_done = [this]() { return running_threads_ == 0; };
    if (deadline) {
      drained = threads_cv_.wait_for(lock, *deadline, all_done);
    } else {
      threads_cv_.wait(lock, all_done);
    }
  }

  if (!drained) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "TLS-ALPN-01 server " << listen_.bind << ':' << actual_port_.load()
        << " shutdown deadline passed; closing remaining connections";
    ioc_.stop();
  }

  join_threads();
  if (!drained) {
    close_sessions();
  }
  return drained;
}

void TlsAlpn01Server::close_sessions() {
  boost::system::error_code ignored;
  [[maybe_unused]] const auto close_rc = acceptor_.close(ignored);

  std::size_t closed = 0;
  std::lock_guard<std::mutex> lock(sessions_mu_);
  for (auto &weak : sessions_) {
    if (auto session = weak.lock()) {
      session->force_close();
      ++closed;
    }
  }
  sessions_.clear();

  BOOST_LOG_SEV(lg_, trivial::debug)
      << "TLS-ALPN-01 server " << listen_.bind << ':' << actual_port_.load()
      << " closed " << closed << " connection(s)";
}

void TlsAlpn01Server::join_threads() {
  std::lock_guard<std::mutex> join_lock(join_mu_);
  for (auto &t : threads_) {
    if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
      t.join();
    }
  }
}

monad::MyVoidResult TlsAlpn01Server::make_ssl_context() {
  try {
    ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_server);
    ssl_ctx_->set_options(ssl::context::default_workarounds |
                          ssl::context::no_sslv2 | ssl::context::no_sslv3);

    SSL_CTX *native = ssl_ctx_->native_handle();
    if (SSL_CTX_set_min_proto_version(native, TLS1_2_VERSION) != 1) {
      return monad::MyVoidResult::Err(
          monad::make_error(my_errors::OPENSSL::UNEXPECTED_RESULT,
                            "SSL_CTX_set_min_proto_version failed"));
    }

    // No certificate is configured on the context: every handshake gets
    // its certificate from the issuer.
    SSL_CTX_set_client_hello_cb(native, &TlsAlpn01Server::client_hello_cb,
                                const_cast<TlsAlpn01CertIssuer *>(
                                    issuer_.get()));
    SSL_CTX_set_alpn_select_cb(native, &TlsAlpn01Server::alpn_select_cb,
                               nullptr);
    return monad::MyVoidResult::Ok();
  } catch (const boost::system::system_error &e) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::NETWORK::SSL_ERROR,
                          std::string("failed to create TLS context: ") +
                              e.what()));
  }
}

int TlsAlpn01Server::client_hello_cb(SSL *ssl, int *al, void *arg) {
  const auto *issuer = static_cast<const TlsAlpn01CertIssuer *>(arg);
  if (!issuer) {
    *al = SSL_AD_INTERNAL_ERROR;
    return SSL_CLIENT_HELLO_ERROR;
  }

  try {
    const ClientHelloInfo hello = client_hello_info(ssl);
    auto r = issuer->select(hello);
    if (r.is_err()) {
      *al = r.error().code == my_errors::TLSALPN::UNKNOWN_SERVER_NAME
                ? SSL_AD_UNRECOGNIZED_NAME
                : SSL_AD_INTERNAL_ERROR;
      return SSL_CLIENT_HELLO_ERROR;
    }

    const auto &identity = r.value();
    if (SSL_use_certificate(ssl, identity.cert.get()) != 1 ||
        SSL_use_PrivateKey(ssl, identity.key.get()) != 1) {
      *al = SSL_AD_INTERNAL_ERROR;
      return SSL_CLIENT_HELLO_ERROR;
    }
    return SSL_CLIENT_HELLO_SUCCESS;
  } catch (const std::exception &) {
    // Never let an exception unwind through OpenSSL.
    *al = SSL_AD_INTERNAL_ERROR;
    return SSL_CLIENT_HELLO_ERROR;
  }
}

int TlsAlpn01Server::alpn_select_cb(SSL *, const unsigned char **out,
                                    unsigned char *outlen,
                                    const unsigned char *in,
                                    unsigned int inlen, void *) {
  // Client ALPN list is encoded as repeated: <len><bytes...>
  const unsigned char *p = in;
  unsigned int remaining = inlen;
  while (remaining > 0) {
    const unsigned int len = *p;
    ++p;
    --remaining;
    if (len > remaining) {
      return SSL_TLSEXT_ERR_NOACK;
    }
    if (len == kAcmeTls1Protocol.size() &&
        std::memcmp(p, kAcmeTls1Protocol.data(), kAcmeTls1Protocol.size()) ==
            0) {
      *out = p;
      *outlen = static_cast<unsigned char>(len);
      return SSL_TLSEXT_ERR_OK;
    }
    p += len;
    remaining -= len;
  }

  // Ordinary clients proceed without ALPN and get the fallback identity.
  return SSL_TLSEXT_ERR_NOACK;
}

monad::MyVoidResult TlsAlpn01Server::start_listening() {
  boost::system::error_code ec;
  const auto addr = net::ip::make_address(listen_.bind, ec);
  if (ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        std::string("invalid bind address: ") + ec.message()));
  }

  tcp::endpoint ep{addr, listen_.port};
  [[maybe_unused]] const auto open_rc = acceptor_.open(ep.protocol(), ec);
  if (ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::CREATE_FAILED,
        std::string("failed to open acceptor: ") + ec.message()));
  }

  [[maybe_unused]] const auto setopt_rc =
      acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::CREATE_FAILED,
        std::string("failed to set reuse_address: ") + ec.message()));
  }

  [[maybe_unused]] const auto bind_rc = acceptor_.bind(ep, ec);
  if (ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::CREATE_FAILED,
        std::string("failed to bind ") + listen_.bind + ":" +
            std::to_string(listen_.port) + ": " + ec.message()));
  }

  [[maybe_unused]] const auto listen_rc =
      acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::CREATE_FAILED,
        std::string("failed to listen: ") + ec.message()));
  }

  const auto local = acceptor_.local_endpoint(ec);
  actual_port_.store(ec ? listen_.port : local.port());

  do_accept();

  BOOST_LOG_SEV(lg_, trivial::info)
      << "TLS-ALPN-01 server listening on " << listen_.bind << ':'
      << actual_port_.load();
  return monad::MyVoidResult::Ok();
}

void TlsAlpn01Server::start_threads() {
  {
    std::lock_guard<std::mutex> lock(threads_mu_);
    running_threads_ = options_.threads;
  }
  threads_.reserve(options_.threads);
  for (std::size_t i = 0; i < options_.threads; ++i) {
    threads_.emplace_back([this]() {
      try {
        ioc_.run();
      } catch (const std::exception &e) {
        BOOST_LOG_SEV(lg_, trivial::error)
            << "TLS-ALPN-01 server io_context exception: " << e.what();
      }
      {
        std::lock_guard<std::mutex> lock(threads_mu_);
        --running_threads_;
      }
      threads_cv_.notify_all();
    });
  }
}

void TlsAlpn01Server::do_accept() {
  if (stopped_.load()) {
    return;
  }

  acceptor_.async_accept(
      net::make_strand(ioc_),
      [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
          if (ec == net::error::operation_aborted || stopped_.load()) {
            return;
          }
          BOOST_LOG_SEV(lg_, trivial::warning)
              << "TLS-ALPN-01 accept failed: " << ec.message();
        } else {
          auto session = std::make_shared<Session>(
              std::move(socket), *ssl_ctx_, options_, handler_);
          {
            std::lock_guard<std::mutex> lock(sessions_mu_);
            std::erase_if(sessions_,
                          [](const auto &weak) { return weak.expired(); });
            sessions_.emplace_back(session);
          }
          session->run();
        }

        do_accept();
      });
}

} // namespace challtestsrv::acme
