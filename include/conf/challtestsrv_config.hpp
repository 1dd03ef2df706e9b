#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace challtestsrv {

namespace fs = std::filesystem;
namespace json = boost::json;

struct LoggingConfig {
  std::string level{"info"};
  // Empty log_dir logs to the console instead of rotating files.
  std::string log_dir{};
  std::string log_file{"challtestsrv"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                                  const json::value &jv);
};

struct TlsAlpn01Config {
  std::vector<std::string> listen{"0.0.0.0:5001"};
  int read_timeout_seconds{5};
  int write_timeout_seconds{5};

  friend TlsAlpn01Config tag_invoke(const json::value_to_tag<TlsAlpn01Config> &,
                                    const json::value &jv);
};

struct ManagementConfig {
  // Empty disables the management API.
  std::string listen{"127.0.0.1:8055"};

  friend ManagementConfig
  tag_invoke(const json::value_to_tag<ManagementConfig> &,
             const json::value &jv);
};

struct ChallTestSrvConfig {
  TlsAlpn01Config tlsalpn01{};
  ManagementConfig management{};
  // 0 means one thread per hardware core.
  std::size_t threads_num{0};
  LoggingConfig log{};

  std::size_t effective_threads() const;

  friend ChallTestSrvConfig
  tag_invoke(const json::value_to_tag<ChallTestSrvConfig> &,
             const json::value &jv);
};

struct ListenAddress {
  std::string host;
  std::uint16_t port{};
};

// Accepts "host:port", ":port" (all IPv4 interfaces) and "[v6]:port".
monad::MyResult<ListenAddress> parse_listen_address(std::string_view addr);

monad::MyResult<ChallTestSrvConfig> parse_config(std::string_view json_text);

monad::MyResult<ChallTestSrvConfig> load_config_file(const fs::path &path);

} // namespace challtestsrv
