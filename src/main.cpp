#include "config.hpp"
#include "log.hpp"
#include "proxy_server.hpp"

#include <boost/asio.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace net = boost::asio;

int main(int argc, char* argv[]) {
  relay::ProxyConfig config;
  try {
    auto command_line = relay::parse_command_line(argc, argv);
    if (command_line.show_help) {
      std::cout << relay::usage(argv[0]);
      return 0;
    }
    config = relay::load_config(command_line);
  } catch (relay::ConfigError& e) {
    RELAY_LOG_ERROR << e.what();
    std::cerr << relay::usage(argv[0]);
    return 1;
  }
  relay::Logger::instance().set_level(config.log_level);

  try {
    net::io_context ioc(static_cast<int>(config.threads));
    std::unique_ptr<relay::ProxyServer> server;
    try {
      server = std::make_unique<relay::ProxyServer>(ioc, config);
    } catch (boost::system::system_error& e) {
      RELAY_LOG_ERROR << "Could not bind to " << config.bind << ": "
                      << e.what();
      return 1;
    }

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
      if (ec)
        return;
      RELAY_LOG_INFO << "Received signal " << signo << ", shutting down";
      ioc.stop();
    });

    server->start();

    std::vector<std::thread> workers;
    for (std::size_t i = 1; i < config.threads; ++i)
      workers.emplace_back([&ioc] { ioc.run(); });
    ioc.run();
    for (auto& worker : workers)
      worker.join();
  } catch (std::exception& e) {
    RELAY_LOG_ERROR << "Fatal error: " << e.what();
    return 1;
  }
}
