#include "landledger/net/http_server.hpp"

#include <stdexcept>
#include <thread>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace landledger::net {

  static constexpr const char* SERVER_NAME = "landledger-node";

  // One accepted client. The stream runs on its own io_context so its
  // deadlines fire on the serving thread, and stop() can post a close to it.
  struct HttpServer::Connection {
    asio::io_context ioc;
    beast::tcp_stream stream{ioc};
    beast::flat_buffer buffer;
  };

  // Starts one async operation on `stream` and runs `ioc` until it completes
  // or the stream deadline closes the socket (beast::error::timeout).
  template <class Initiate>
  static beast::error_code run_with_deadline(asio::io_context& ioc, beast::tcp_stream& stream,
                                             std::chrono::milliseconds timeout, Initiate&& initiate) {
    beast::error_code result;
    stream.expires_after(timeout);
    initiate([&result](beast::error_code ec, std::size_t) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
  }

  HttpServer::HttpServer(Api& api) : HttpServer(api, Options{}) {}

  HttpServer::HttpServer(Api& api, Options options) : api_(api), options_(options) {}

  void HttpServer::listen(const std::string& host, uint16_t port) {
    tcp::endpoint endpoint{asio::ip::make_address(host), port};
    acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(asio::socket_base::max_listen_connections);
    spdlog::info("listening on http://{}:{}", host, local_port());
  }

  uint16_t HttpServer::local_port() const {
    return acceptor_ ? acceptor_->local_endpoint().port() : 0;
  }

  void HttpServer::serve_forever() {
    if (!acceptor_) throw std::logic_error("HttpServer::serve_forever called before listen");
    while (!stopping_) {
      auto connection = std::make_shared<Connection>();
      beast::error_code ec;
      acceptor_->accept(connection->stream.socket(), ec);
      if (stopping_) break;
      if (ec) {
        spdlog::warn("accept failed: {}", ec.message());
        continue;
      }
      {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.insert(connection);
      }
      std::thread([this, connection]() mutable {
        serve_connection(*connection);
        // The connection (socket and io_context) is gone before stop() can return
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(connection);
        connection.reset();
        if (connections_.empty()) connections_done_.notify_all();
      }).detach();
    }
  }

  void HttpServer::stop() {
    if (!acceptor_ || stopping_.exchange(true)) return;

    // Wake the blocking accept with a throwaway connection
    auto endpoint = acceptor_->local_endpoint();
    if (endpoint.address().is_unspecified()) {
      endpoint.address(endpoint.protocol() == tcp::v6() ? asio::ip::address(asio::ip::address_v6::loopback())
                                                        : asio::ip::address(asio::ip::address_v4::loopback()));
    }
    asio::io_context ioc;
    tcp::socket waker{ioc};
    beast::error_code ec;
    waker.connect(endpoint, ec);

    std::unique_lock<std::mutex> lock(connections_mutex_);
    for (const auto& connection : connections_) {
      // Runs on the connection's own thread; aborts a pending read or write
      Connection* raw = connection.get();
      asio::post(raw->ioc, [raw] {
        beast::error_code ignored;
        raw->stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        raw->stream.close();
      });
    }
    connections_done_.wait(lock, [this] { return connections_.empty(); });
  }

  void HttpServer::serve_connection(Connection& connection) {
    auto& stream = connection.stream;
    beast::error_code ec;
    auto remote = stream.socket().remote_endpoint(ec);

    while (!stopping_) {
      http::request<http::string_body> req;
      ec = run_with_deadline(connection.ioc, stream, options_.idle_timeout, [&](auto handler) {
        http::async_read(stream, connection.buffer, req, std::move(handler));
      });
      if (ec == http::error::end_of_stream) break;
      if (ec == beast::error::timeout) {
        spdlog::debug("closing idle connection from {}", remote.address().to_string());
        break;
      }
      if (ec) {
        spdlog::debug("read from {} failed: {}", remote.address().to_string(), ec.message());
        break;
      }

      std::string method(req.method_string().data(), req.method_string().size());
      std::string target(req.target().data(), req.target().size());

      ApiResponse result;
      try {
        result = api_.handle(method, target, req.body());
      } catch (const std::exception& e) {
        spdlog::error("{} {} failed: {}", method, target, e.what());
        result = {500, nlohmann::json{{"error", e.what()}}};
      }

      http::response<http::string_body> res{static_cast<http::status>(result.status), req.version()};
      res.set(http::field::server, SERVER_NAME);
      res.set(http::field::content_type, "application/json");
      res.keep_alive(req.keep_alive());
      res.body() = result.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
      res.prepare_payload();

      ec = run_with_deadline(connection.ioc, stream, options_.idle_timeout, [&](auto handler) {
        http::async_write(stream, res, std::move(handler));
      });
      if (ec) {
        spdlog::debug("write to {} failed: {}", remote.address().to_string(), ec.message());
        break;
      }
      if (!res.keep_alive()) break;
    }

    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
  }
}
