#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "conf/challtestsrv_config.hpp"
#include "my_error_codes.hpp"

namespace {

using namespace challtestsrv;

fs::path write_temp_config(const std::string &content) {
  const auto stamp =
      std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path p = fs::temp_directory_path() /
               ("challtestsrv_config_" + std::to_string(stamp) + ".json");
  std::ofstream ofs(p);
  ofs << content;
  return p;
}

} // namespace

TEST(ChallTestSrvConfig, EmptyObjectGivesDefaults) {
  auto r = parse_config("{}");
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  const auto &c = r.value();

  ASSERT_EQ(c.tlsalpn01.listen.size(), 1u);
  EXPECT_EQ(c.tlsalpn01.listen.front(), "0.0.0.0:5001");
  EXPECT_EQ(c.tlsalpn01.read_timeout_seconds, 5);
  EXPECT_EQ(c.tlsalpn01.write_timeout_seconds, 5);
  EXPECT_EQ(c.management.listen, "127.0.0.1:8055");
  EXPECT_EQ(c.threads_num, 0u);
  EXPECT_GE(c.effective_threads(), 1u);
  EXPECT_EQ(c.log.level, "info");
  EXPECT_TRUE(c.log.log_dir.empty());
}

TEST(ChallTestSrvConfig, ParsesEveryField) {
  auto r = parse_config(R"({
    "tlsalpn01": {
      "listen": ["127.0.0.1:5001", "[::1]:5002"],
      "read_timeout_seconds": 3,
      "write_timeout_seconds": 4
    },
    "management": {"listen": ""},
    "threads_num": 2,
    "log": {"level": "debug", "log_dir": "/tmp/logs", "log_file": "srv",
            "rotation_size": 1024}
  })");
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  const auto &c = r.value();

  ASSERT_EQ(c.tlsalpn01.listen.size(), 2u);
  EXPECT_EQ(c.tlsalpn01.listen[1], "[::1]:5002");
  EXPECT_EQ(c.tlsalpn01.read_timeout_seconds, 3);
  EXPECT_EQ(c.tlsalpn01.write_timeout_seconds, 4);
  EXPECT_TRUE(c.management.listen.empty());
  EXPECT_EQ(c.effective_threads(), 2u);
  EXPECT_EQ(c.log.level, "debug");
  EXPECT_EQ(c.log.log_dir, "/tmp/logs");
  EXPECT_EQ(c.log.log_file, "srv");
  EXPECT_EQ(c.log.rotation_size, 1024u);
}

TEST(ChallTestSrvConfig, ListenMayBeASingleString) {
  auto r = parse_config(R"({"tlsalpn01": {"listen": ":5001"}})");
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  ASSERT_EQ(r.value().tlsalpn01.listen.size(), 1u);
  EXPECT_EQ(r.value().tlsalpn01.listen.front(), ":5001");
}

TEST(ChallTestSrvConfig, ReportsErrors) {
  auto malformed = parse_config("{not json");
  ASSERT_TRUE(malformed.is_err());
  EXPECT_EQ(malformed.error().code, my_errors::JSON::MALFORMED);

  auto wrong_type = parse_config(R"({"tlsalpn01": {"listen": 5001}})");
  ASSERT_TRUE(wrong_type.is_err());
  EXPECT_EQ(wrong_type.error().code, my_errors::JSON::TYPE_MISMATCH);

  auto bad_addr = parse_config(R"({"management": {"listen": "localhost"}})");
  ASSERT_TRUE(bad_addr.is_err());
  EXPECT_EQ(bad_addr.error().code, my_errors::GENERAL::INVALID_ARGUMENT);
}

TEST(ChallTestSrvConfig, ParseListenAddress) {
  auto v4 = parse_listen_address("127.0.0.1:5001");
  ASSERT_TRUE(v4.is_ok());
  EXPECT_EQ(v4.value().host, "127.0.0.1");
  EXPECT_EQ(v4.value().port, 5001);

  auto any = parse_listen_address(":5001");
  ASSERT_TRUE(any.is_ok());
  EXPECT_EQ(any.value().host, "0.0.0.0");

  auto v6 = parse_listen_address("[::1]:443");
  ASSERT_TRUE(v6.is_ok());
  EXPECT_EQ(v6.value().host, "::1");
  EXPECT_EQ(v6.value().port, 443);

  EXPECT_TRUE(parse_listen_address("::1:443").is_err());
  EXPECT_TRUE(parse_listen_address("127.0.0.1").is_err());
  EXPECT_TRUE(parse_listen_address("127.0.0.1:").is_err());
  EXPECT_TRUE(parse_listen_address("127.0.0.1:70000").is_err());
  EXPECT_TRUE(parse_listen_address("127.0.0.1:50x").is_err());
  EXPECT_TRUE(parse_listen_address("[::1:443").is_err());
}

TEST(ChallTestSrvConfig, LoadConfigFile) {
  auto missing = load_config_file("/nonexistent/challtestsrv.json");
  ASSERT_TRUE(missing.is_err());
  EXPECT_EQ(missing.error().code, my_errors::GENERAL::FILE_NOT_FOUND);

  const auto path = write_temp_config(R"({"threads_num": 3})");
  auto loaded = load_config_file(path);
  fs::remove(path);
  ASSERT_TRUE(loaded.is_ok()) << loaded.error().what;
  EXPECT_EQ(loaded.value().threads_num, 3u);
}
