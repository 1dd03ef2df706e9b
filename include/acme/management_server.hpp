#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include "acme/challenge_registry.hpp"
#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace challtestsrv::acme {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
namespace src = boost::log::sources;
namespace trivial = boost::log::trivial;

// Plain HTTP API used by test orchestration to register challenges:
//   POST /add-tlsalpn01  {"host": "...", "content": "..."}
//   POST /del-tlsalpn01  {"host": "..."}
//   GET  /tlsalpn01      -> {"hosts": [...]}
class ManagementServer : public std::enable_shared_from_this<ManagementServer> {
public:
  struct ListenConfig {
    std::string bind;
    std::uint16_t port{};
  };

  using Request = http::request<http::string_body>;
  using Response = http::response<http::string_body>;
  using StartResult =
      monad::Result<std::shared_ptr<ManagementServer>, monad::Error>;

  static StartResult start(ListenConfig listen,
                           std::shared_ptr<ChallengeRegistry> registry);

  ~ManagementServer();

  std::uint16_t port() const { return actual_port_.load(); }

  bool is_stopped() const { return stopped_.load(); }

  void stop();

  // Routing without any I/O.
  static Response handle_request(ChallengeRegistry &registry,
                                 const Request &req);

private:
  class Session;

  ManagementServer(ListenConfig listen,
                   std::shared_ptr<ChallengeRegistry> registry);

  monad::MyVoidResult start_listening();
  void start_thread();
  void do_accept();

  ListenConfig listen_;
  std::shared_ptr<ChallengeRegistry> registry_;

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
  std::thread thread_;

  std::atomic<bool> stopped_{false};
  std::atomic<std::uint16_t> actual_port_{0};

  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace challtestsrv::acme
