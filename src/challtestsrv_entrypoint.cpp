#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "acme/chall_test_server.hpp"
#include "conf/challtestsrv_config.hpp"
#include "util/my_logging.hpp"

#ifndef CHALLTESTSRV_VERSION
#define CHALLTESTSRV_VERSION "0.0.0"
#endif

namespace po = boost::program_options;

namespace {

struct CliParams {
  std::string config_file;
  std::vector<std::string> tlsalpn01;
  std::string management;
  std::size_t threads{0};
  std::string verbose;
};

} // namespace

int RunChallTestSrv(int argc, char *argv[]) {
  try {
    CliParams cli_params;
    po::options_description generic_desc("A TLS-ALPN-01 challenge test server");

    generic_desc.add_options() //
        ("config,c", po::value<std::string>(&cli_params.config_file),
         "path of the JSON configuration file.") //
        ("tlsalpn01",
         po::value<std::vector<std::string>>(&cli_params.tlsalpn01)
             ->composing(),
         "TLS-ALPN-01 listen address host:port, may be repeated.") //
        ("management", po::value<std::string>(&cli_params.management),
         "management API listen address host:port, \"off\" disables.") //
        ("threads", po::value<std::size_t>(&cli_params.threads),
         "number of io worker threads.") //
        ("verbose", po::value<std::string>(&cli_params.verbose),
         "log level: trace|debug|info|warning|error|fatal.") //
        ("version,v", "Print version") //
        ("help,h", "Print help");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, generic_desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
      std::cerr << generic_desc << std::endl;
      return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
      std::cout << CHALLTESTSRV_VERSION << std::endl;
      return EXIT_SUCCESS;
    }

    challtestsrv::ChallTestSrvConfig config{};
    if (!cli_params.config_file.empty()) {
      auto config_r = challtestsrv::load_config_file(cli_params.config_file);
      if (config_r.is_err()) {
        std::cerr << config_r.error().what << std::endl;
        return EXIT_FAILURE;
      }
      config = std::move(config_r.value());
    }

    // Command line wins over the configuration file.
    if (!cli_params.tlsalpn01.empty()) {
      config.tlsalpn01.listen = cli_params.tlsalpn01;
    }
    if (vm.count("management")) {
      config.management.listen =
          cli_params.management == "off" ? std::string{} : cli_params.management;
    }
    if (vm.count("threads")) {
      config.threads_num = cli_params.threads;
    }
    if (!cli_params.verbose.empty()) {
      config.log.level = cli_params.verbose;
    }

    challtestsrv::init_my_log(config.log);
    src::severity_logger<trivial::severity_level> lg;

    auto options_r =
        challtestsrv::acme::ChallTestServer::options_from_config(config);
    if (options_r.is_err()) {
      BOOST_LOG_SEV(lg, trivial::fatal) << options_r.error().what;
      return EXIT_FAILURE;
    }

    auto server_r = challtestsrv::acme::ChallTestServer::create(
        std::move(options_r.value()));
    if (server_r.is_err()) {
      BOOST_LOG_SEV(lg, trivial::fatal)
          << "unable to start challenge test server: "
          << server_r.error().what;
      return EXIT_FAILURE;
    }
    auto server = std::move(server_r.value());

    boost::asio::io_context signal_ioc(1);
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int signo) {
      if (ec) {
        return;
      }
      BOOST_LOG_SEV(lg, trivial::info)
          << "received signal " << signo << ", shutting down";
      server->shutdown();
    });
    signal_ioc.run();

    return EXIT_SUCCESS;
  } catch (const po::error &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  } catch (const std::exception &e) {
    std::cerr << "Unhandled exception: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunChallTestSrv(argc, argv); }
