#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "landledger/net/api.hpp"

namespace landledger::net {

  // Blocking HTTP/1.1 server (Boost.Beast); each accepted connection is
  // served on its own thread until the client stops keeping it alive or
  // sits idle past `idle_timeout`.
  class HttpServer {
    public:
      struct Options {
        std::chrono::milliseconds idle_timeout{30000};
      };

      explicit HttpServer(Api& api);
      HttpServer(Api& api, Options options);

      // Binds and listens; throws boost::system::system_error on failure.
      void listen(const std::string& host, uint16_t port);

      // Accept loop; returns after stop().
      void serve_forever();

      // Ends serve_forever(), closes every open connection and waits for
      // their threads to finish.
      void stop();

      uint16_t local_port() const;

    private:
      struct Connection;

      void serve_connection(Connection& connection);

      Api& api_;
      Options options_;
      boost::asio::io_context ioc_;
      std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
      std::atomic<bool> stopping_{false};
      std::mutex connections_mutex_;
      std::condition_variable connections_done_;
      std::set<std::shared_ptr<Connection>> connections_;
  };
}
