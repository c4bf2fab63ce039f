#include "landledger/net/http_peer_client.hpp"
#include "landledger/net/json_codec.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace landledger::net {

  static constexpr const char* USER_AGENT = "landledger-node";

  std::pair<std::string, std::string> split_host_port(const std::string& peer) {
    if (!peer.empty() && peer.front() == '[') {
      auto close = peer.find(']');
      if (close == std::string::npos) throw PeerError("bad peer address: " + peer);
      auto host = peer.substr(1, close - 1);
      auto port = (close + 1 < peer.size() && peer[close + 1] == ':') ? peer.substr(close + 2) : std::string("80");
      return {host, port};
    }
    auto colon = peer.rfind(':');
    if (colon == std::string::npos) return {peer, "80"};
    return {peer.substr(0, colon), peer.substr(colon + 1)};
  }

  HttpPeerClient::HttpPeerClient() : HttpPeerClient(Options{}) {}

  HttpPeerClient::HttpPeerClient(Options options) : options_(options) {}

  std::string HttpPeerClient::get(const std::string& peer, const std::string& target) {
    auto [host, port] = split_host_port(peer);

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, peer);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::accept, "application/json");
    http::response_parser<http::string_body> parser;
    parser.body_limit(options_.body_limit);

    beast::error_code failure;
    const char* stage = "resolve";
    bool done = false;

    stream.expires_after(options_.timeout);
    resolver.async_resolve(host, port, [&](beast::error_code ec, tcp::resolver::results_type results) {
      if (ec) { failure = ec; done = true; return; }
      stage = "connect";
      stream.async_connect(results, [&](beast::error_code ec, const tcp::endpoint&) {
        if (ec) { failure = ec; done = true; return; }
        stage = "write";
        http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
          if (ec) { failure = ec; done = true; return; }
          stage = "read";
          http::async_read(stream, buffer, parser, [&](beast::error_code ec, std::size_t) {
            failure = ec;
            done = true;
          });
        });
      });
    });

    // The stream deadline does not cover name resolution; bound the whole run.
    ioc.run_for(options_.timeout);
    if (!done) throw PeerError("GET http://" + peer + target + ": timed out during " + stage);
    if (failure) throw PeerError("GET http://" + peer + target + ": " + stage + ": " + failure.message());

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    auto res = parser.release();

    if (res.result() != http::status::ok) {
      throw PeerError("GET http://" + peer + target + ": HTTP " + std::to_string(res.result_int()));
    }
    spdlog::debug("GET http://{}{} -> {} bytes", peer, target, res.body().size());
    return std::move(res.body());
  }

  std::vector<core::Block> HttpPeerClient::fetch_chain(const std::string& peer) {
    return chain_from_json(parse_json(get(peer, "/chain")));
  }

  std::vector<core::Transaction> HttpPeerClient::fetch_mempool(const std::string& peer) {
    return mempool_from_json(parse_json(get(peer, "/mempool")));
  }
}
