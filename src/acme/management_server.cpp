#include "acme/management_server.hpp"

#include <boost/json.hpp>

#include <algorithm>

namespace challtestsrv::acme {

namespace json = boost::json;

namespace {

ManagementServer::Response make_response(const ManagementServer::Request &req,
                                         http::status status,
                                         std::string body,
                                         const char *content_type =
                                             "text/plain") {
  ManagementServer::Response res{status, req.version()};
  res.set(http::field::server, "challtestsrv");
  res.set(http::field::content_type, content_type);
  res.body() = std::move(body);
  res.keep_alive(false);
  res.prepare_payload();
  return res;
}

// Returns the string member `name`, or an empty string if absent / not a
// string.
std::string string_member(const json::object &jo, const char *name) {
  if (const auto *v = jo.if_contains(name); v && v->is_string()) {
    return std::string(v->as_string().c_str());
  }
  return {};
}

} // namespace

class ManagementServer::Session
    : public std::enable_shared_from_this<ManagementServer::Session> {
public:
  Session(tcp::socket socket, std::shared_ptr<ChallengeRegistry> registry)
      : stream_(std::move(socket)), registry_(std::move(registry)) {
    parser_.body_limit(64 * 1024);
    parser_.header_limit(8 * 1024);
  }

  void run() { do_read(); }

private:
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request_parser<http::string_body> parser_;
  std::shared_ptr<ChallengeRegistry> registry_;

  void do_read() {
    auto self = shared_from_this();
    stream_.expires_after(std::chrono::seconds(30));
    http::async_read(stream_, buffer_, parser_,
                     [self](boost::system::error_code ec, std::size_t) {
                       self->on_read(ec);
                     });
  }

  void on_read(const boost::system::error_code &ec) {
    if (ec) {
      self_close();
      return;
    }

    auto req = parser_.release();

    // Response must outlive the async_write.
    auto res = std::make_shared<Response>(handle_request(*registry_, req));

    auto self = shared_from_this();
    http::async_write(stream_, *res,
                      [self, res](boost::system::error_code, std::size_t) {
                        self->self_close();
                      });
  }

  void self_close() {
    boost::system::error_code ignored;
    [[maybe_unused]] const auto shutdown_rc =
        stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    [[maybe_unused]] const auto close_rc = stream_.socket().close(ignored);
  }
};

ManagementServer::Response
ManagementServer::handle_request(ChallengeRegistry &registry,
                                 const Request &req) {
  const std::string target(req.target());

  if (target == "/tlsalpn01") {
    if (req.method() != http::verb::get) {
      return make_response(req, http::status::method_not_allowed,
                           "method not allowed");
    }
    auto hosts = registry.hosts();
    std::sort(hosts.begin(), hosts.end());
    json::array arr;
    for (auto &host : hosts) {
      arr.emplace_back(json::string(host));
    }
    return make_response(req, http::status::ok,
                         json::serialize(json::object{{"hosts", arr}}),
                         "application/json");
  }

  const bool is_add = target == "/add-tlsalpn01";
  const bool is_del = target == "/del-tlsalpn01";
  if (!is_add && !is_del) {
    return make_response(req, http::status::not_found, "not found");
  }
  if (req.method() != http::verb::post) {
    return make_response(req, http::status::method_not_allowed,
                         "method not allowed");
  }

  boost::system::error_code ec;
  json::value jv = json::parse(req.body(), ec);
  if (ec || !jv.is_object()) {
    return make_response(req, http::status::bad_request,
                         "request body must be a JSON object");
  }
  const auto &jo = jv.as_object();

  const std::string host = string_member(jo, "host");
  if (host.empty()) {
    return make_response(req, http::status::bad_request,
                         "host is required");
  }

  if (is_del) {
    registry.remove(host);
    return make_response(req, http::status::ok, "");
  }

  std::string content = string_member(jo, "content");
  if (content.empty()) {
    return make_response(req, http::status::bad_request,
                         "content is required");
  }
  registry.add(host, std::move(content));
  return make_response(req, http::status::ok, "");
}

ManagementServer::StartResult
ManagementServer::start(ListenConfig listen,
                        std::shared_ptr<ChallengeRegistry> registry) {
  if (listen.bind.empty()) {
    return StartResult::Err(monad::make_error(
        my_errors::GENERAL::MISSING_FIELD, "management.listen is required"));
  }
  if (!registry) {
    return StartResult::Err(
        monad::make_error(my_errors::GENERAL::POINTER_IS_NULL,
                          "management server requires a registry"));
  }

  auto srv = std::shared_ptr<ManagementServer>(
      new ManagementServer(std::move(listen), std::move(registry)));

  if (auto r = srv->start_listening(); r.is_err()) {
    return StartResult::Err(std::move(r.error()));
  }

  srv->start_thread();
  return StartResult::Ok(std::move(srv));
}

ManagementServer::ManagementServer(ListenConfig listen,
                                   std::shared_ptr<ChallengeRegistry> registry)
    : listen_(std::move(listen)), registry_(std::move(registry)), ioc_(1),
      acceptor_(net::make_strand(ioc_)), lg_() {
  work_guard_ = std::make_unique<
      net::executor_work_guard<net::io_context::executor_type>>(
      net::make_work_guard(ioc_));
}

ManagementServer::~ManagementServer() { stop(); }

void ManagementServer::stop() {
  if (!stopped_.exchange(true)) {
    ioc_.stop();
  }

  if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
    thread_.join();
  }

  if (!thread_.joinable()) {
    boost::system::error_code ignored;
    [[maybe_unused]] const auto close_rc = acceptor_.close(ignored);
  }
}

monad::MyVoidResult ManagementServer::start_listening() {
  boost::system::error_code ec;
  auto addr = net::ip::make_address(listen_.bind, ec);
  if (ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        std::string("Invalid bind address: ") + ec.message()));
  }

  try {
    tcp::endpoint ep{addr, listen_.port};
    acceptor_.open(ep.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen(net::socket_base::max_listen_connections);
  } catch (const boost::system::system_error &se) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::CREATE_FAILED,
        std::string("Failed to bind/listen ") + listen_.bind + ":" +
            std::to_string(listen_.port) + ": " + se.code().message()));
  }

  actual_port_.store(acceptor_.local_endpoint(ec).port());
  if (ec) {
    actual_port_.store(listen_.port);
  }

  do_accept();

  BOOST_LOG_SEV(lg_, trivial::info)
      << "management API listening on " << listen_.bind << ':'
      << actual_port_.load();

  return monad::MyVoidResult::Ok();
}

void ManagementServer::start_thread() {
  thread_ = std::thread([this]() {
    try {
      ioc_.run();
    } catch (const std::exception &e) {
      BOOST_LOG_SEV(lg_, trivial::error)
          << "management API io_context exception: " << e.what();
    }
  });
}

void ManagementServer::do_accept() {
  acceptor_.async_accept(
      net::make_strand(ioc_),
      [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
          if (ec != net::error::operation_aborted) {
            BOOST_LOG_SEV(lg_, trivial::warning)
                << "management API accept failed: " << ec.message();
          }
          return;
        }

        std::make_shared<Session>(std::move(socket), registry_)->run();

        if (!stopped_.load()) {
          do_accept();
        }
      });
}

} // namespace challtestsrv::acme
