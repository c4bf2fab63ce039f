#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "landledger/node/consensus.hpp"
#include "landledger/node/node.hpp"

namespace landledger::net {

  struct ApiResponse {
    unsigned status = 200;
    nlohmann::json body;
  };

  /**
   * Route table of the node's HTTP API, independent of the transport:
   *
   *   GET  /chain              {"chain":[...],"length":N}
   *   GET  /mempool            [Transaction...]
   *   POST /transactions/new   201 {"message","transaction"}
   *   GET|POST /mine           200 {"message","block"}; 400 empty pool; 409 stale head
   *   POST /nodes/register     201 {"message","total_nodes"}
   *   GET  /nodes              {"nodes":[...]}
   *   GET  /nodes/resolve      {"message","replaced","chain","length"}
   *
   * Failures answer {"error": "..."}.
   */
  class Api {
    public:
      Api(node::Node& node, node::ConsensusResolver& resolver);

      // `target` may carry a query string; it is ignored.
      ApiResponse handle(const std::string& method, const std::string& target, const std::string& body);

    private:
      ApiResponse get_chain();
      ApiResponse get_mempool();
      ApiResponse new_transaction(const std::string& body);
      ApiResponse mine();
      ApiResponse register_nodes(const std::string& body);
      ApiResponse list_nodes();
      ApiResponse resolve();

      node::Node& node_;
      node::ConsensusResolver& resolver_;
  };
}
