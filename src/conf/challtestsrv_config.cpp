#include "conf/challtestsrv_config.hpp"

#include <charconv>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>

namespace challtestsrv {

namespace {

std::string string_field(const json::value &v, const char *name) {
  if (!v.is_string()) {
    throw std::runtime_error(std::string(name) + " must be a string");
  }
  return std::string(v.as_string().c_str());
}

} // namespace

LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                         const json::value &jv) {
  const auto *jo_p = jv.if_object();
  if (!jo_p) {
    throw std::runtime_error("log is not an object");
  }
  LoggingConfig lc{};
  if (auto *p = jo_p->if_contains("level"))
    lc.level = string_field(*p, "log.level");
  if (auto *p = jo_p->if_contains("log_dir"))
    lc.log_dir = string_field(*p, "log.log_dir");
  if (auto *p = jo_p->if_contains("log_file"))
    lc.log_file = string_field(*p, "log.log_file");
  if (auto *p = jo_p->if_contains("rotation_size"))
    lc.rotation_size = p->to_number<std::uint64_t>();
  return lc;
}

TlsAlpn01Config tag_invoke(const json::value_to_tag<TlsAlpn01Config> &,
                           const json::value &jv) {
  const auto *jo_p = jv.if_object();
  if (!jo_p) {
    throw std::runtime_error("tlsalpn01 is not an object");
  }
  TlsAlpn01Config tc{};
  if (auto *p = jo_p->if_contains("listen")) {
    tc.listen.clear();
    if (p->is_string()) {
      tc.listen.push_back(string_field(*p, "tlsalpn01.listen"));
    } else if (p->is_array()) {
      for (const auto &item : p->as_array()) {
        tc.listen.push_back(string_field(item, "tlsalpn01.listen[]"));
      }
    } else {
      throw std::runtime_error("tlsalpn01.listen must be a string or array");
    }
  }
  if (auto *p = jo_p->if_contains("read_timeout_seconds"))
    tc.read_timeout_seconds = p->to_number<int>();
  if (auto *p = jo_p->if_contains("write_timeout_seconds"))
    tc.write_timeout_seconds = p->to_number<int>();
  return tc;
}

ManagementConfig tag_invoke(const json::value_to_tag<ManagementConfig> &,
                            const json::value &jv) {
  const auto *jo_p = jv.if_object();
  if (!jo_p) {
    throw std::runtime_error("management is not an object");
  }
  ManagementConfig mc{};
  if (auto *p = jo_p->if_contains("listen"))
    mc.listen = string_field(*p, "management.listen");
  return mc;
}

ChallTestSrvConfig tag_invoke(const json::value_to_tag<ChallTestSrvConfig> &,
                              const json::value &jv) {
  const auto *jo_p = jv.if_object();
  if (!jo_p) {
    throw std::runtime_error("ChallTestSrvConfig is not an object");
  }
  ChallTestSrvConfig cc{};
  if (auto *p = jo_p->if_contains("tlsalpn01"))
    cc.tlsalpn01 = json::value_to<TlsAlpn01Config>(*p);
  if (auto *p = jo_p->if_contains("management"))
    cc.management = json::value_to<ManagementConfig>(*p);
  if (auto *p = jo_p->if_contains("threads_num"))
    cc.threads_num = p->to_number<std::size_t>();
  if (auto *p = jo_p->if_contains("log"))
    cc.log = json::value_to<LoggingConfig>(*p);
  return cc;
}

std::size_t ChallTestSrvConfig::effective_threads() const {
  if (threads_num > 0) {
    return threads_num;
  }
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? hw : 1;
}

monad::MyResult<ListenAddress> parse_listen_address(std::string_view addr) {
  auto e = [&addr](const std::string &why) {
    return monad::MyResult<ListenAddress>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        "invalid listen address '" + std::string(addr) + "': " + why));
  };

  const auto colon = addr.rfind(':');
  if (colon == std::string_view::npos) {
    return e("expected host:port");
  }

  std::string_view host = addr.substr(0, colon);
  const std::string_view port_str = addr.substr(colon + 1);

  if (!host.empty() && host.front() == '[') {
    if (host.size() < 2 || host.back() != ']') {
      return e("unterminated IPv6 literal");
    }
    host = host.substr(1, host.size() - 2);
  } else if (host.find(':') != std::string_view::npos) {
    return e("IPv6 hosts must be bracketed");
  }

  unsigned int port = 0;
  const auto [ptr, ec] =
      std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
  if (port_str.empty() || ec != std::errc{} ||
      ptr != port_str.data() + port_str.size() || port > 65535) {
    return e("invalid port");
  }

  ListenAddress out;
  out.host = host.empty() ? "0.0.0.0" : std::string(host);
  out.port = static_cast<std::uint16_t>(port);
  return monad::MyResult<ListenAddress>::Ok(std::move(out));
}

monad::MyResult<ChallTestSrvConfig> parse_config(std::string_view json_text) {
  boost::system::error_code ec;
  json::value jv = json::parse(json_text, ec);
  if (ec) {
    return monad::MyResult<ChallTestSrvConfig>::Err(monad::make_error(
        my_errors::JSON::MALFORMED,
        "failed to parse configuration: " + ec.message()));
  }

  try {
    auto config = json::value_to<ChallTestSrvConfig>(jv);
    for (const auto &listen : config.tlsalpn01.listen) {
      if (auto r = parse_listen_address(listen); r.is_err()) {
        return monad::MyResult<ChallTestSrvConfig>::Err(
            std::move(r.error()));
      }
    }
    if (!config.management.listen.empty()) {
      if (auto r = parse_listen_address(config.management.listen);
          r.is_err()) {
        return monad::MyResult<ChallTestSrvConfig>::Err(
            std::move(r.error()));
      }
    }
    return monad::MyResult<ChallTestSrvConfig>::Ok(std::move(config));
  } catch (const std::exception &ex) {
    return monad::MyResult<ChallTestSrvConfig>::Err(
        monad::make_error(my_errors::JSON::TYPE_MISMATCH,
                          std::string("invalid configuration: ") + ex.what()));
  }
}

monad::MyResult<ChallTestSrvConfig> load_config_file(const fs::path &path) {
  if (!fs::exists(path)) {
    return monad::MyResult<ChallTestSrvConfig>::Err(monad::make_error(
        my_errors::GENERAL::FILE_NOT_FOUND,
        "configuration file not found: " + path.string()));
  }
  std::ifstream ifs(path);
  if (!ifs) {
    return monad::MyResult<ChallTestSrvConfig>::Err(monad::make_error(
        my_errors::GENERAL::FILE_READ_WRITE,
        "unable to open configuration file: " + path.string()));
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  return parse_config(content);
}

} // namespace challtestsrv
