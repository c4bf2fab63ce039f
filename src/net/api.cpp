#include "landledger/net/api.hpp"
#include "landledger/net/json_codec.hpp"
#include "landledger/storage/record_log.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace landledger::net {

  namespace {
    ApiResponse error(unsigned status, const std::string& message) {
      return {status, json{{"error", message}}};
    }
  }

  Api::Api(node::Node& node, node::ConsensusResolver& resolver) : node_(node), resolver_(resolver) {}

  ApiResponse Api::handle(const std::string& method, const std::string& target, const std::string& body) {
    auto path = target.substr(0, target.find('?'));
    if (path.size() > 1 && path.back() == '/') path.pop_back();

    spdlog::debug("{} {}", method, path);

    bool get = method == "GET";
    bool post = method == "POST";

    try {
      if (path == "/chain") return get ? get_chain() : error(405, "method not allowed");
      if (path == "/mempool") return get ? get_mempool() : error(405, "method not allowed");
      if (path == "/transactions/new") return post ? new_transaction(body) : error(405, "method not allowed");
      if (path == "/mine") return (get || post) ? mine() : error(405, "method not allowed");
      if (path == "/nodes/register") return post ? register_nodes(body) : error(405, "method not allowed");
      if (path == "/nodes") return get ? list_nodes() : error(405, "method not allowed");
      if (path == "/nodes/resolve") return get ? resolve() : error(405, "method not allowed");
      return error(404, "no route for " + path);
    } catch (const storage::StoreError& e) {
      spdlog::error("{} {}: {}", method, path, e.what());
      return error(500, std::string("persistence failure: ") + e.what());
    } catch (const std::system_error& e) {
      spdlog::error("{} {}: {}", method, path, e.what());
      return error(500, std::string("persistence failure: ") + e.what());
    }
  }

  ApiResponse Api::get_chain() {
    return {200, chain_to_json(node_.chain_snapshot())};
  }

  ApiResponse Api::get_mempool() {
    return {200, mempool_to_json(node_.mempool_snapshot())};
  }

  ApiResponse Api::new_transaction(const std::string& body) {
    try {
      auto fields = certificate_fields_from_json(parse_json(body));
      auto tx = node_.submit_transaction(std::move(fields));
      return {201, json{{"message", "transaction " + tx.txid + " will be added to the next mined block"},
                        {"transaction", transaction_to_json(tx)}}};
    } catch (const CodecError& e) {
      return error(400, e.what());
    } catch (const core::InvalidTransactionError& e) {
      return error(400, e.what());
    }
  }

  ApiResponse Api::mine() {
    auto outcome = node_.mine();
    switch (outcome.status) {
      case node::MineStatus::EmptyMempool:
        return error(400, "no pending transactions to mine");
      case node::MineStatus::Stale:
        return error(409, std::string("chain head moved while mining: ") + core::to_string(outcome.validation.error));
      case node::MineStatus::Mined:
        break;
    }
    return {200, json{{"message", "new block " + std::to_string(outcome.block.index) + " forged"},
                      {"block", block_to_json(outcome.block)}}};
  }

  ApiResponse Api::register_nodes(const std::string& body) {
    json request;
    try {
      request = parse_json(body);
    } catch (const CodecError& e) {
      return error(400, e.what());
    }

    auto nodes = request.is_object() ? request.find("nodes") : request.end();
    if (!request.is_object() || nodes == request.end() || !nodes->is_array() || nodes->empty()) {
      return error(400, "please supply a valid list of nodes");
    }

    std::vector<std::string> canonical;
    for (const auto& entry : *nodes) {
      if (!entry.is_string()) return error(400, "node addresses must be strings");
      try {
        canonical.push_back(node::normalize_address(entry.get<std::string>()));
      } catch (const node::InvalidAddressError& e) {
        return error(400, e.what());
      }
    }
    for (const auto& address : canonical) node_.peers().register_peer(address);

    return {201, json{{"message", "new nodes have been added"}, {"total_nodes", node_.peers().list()}}};
  }

  ApiResponse Api::list_nodes() {
    return {200, json{{"nodes", node_.peers().list()}}};
  }

  ApiResponse Api::resolve() {
    bool replaced = resolver_.resolve();
    auto chain = chain_to_json(node_.chain_snapshot());
    return {200, json{{"message", replaced ? "our chain was replaced" : "our chain is authoritative"},
                      {"replaced", replaced},
                      {"chain", std::move(chain["chain"])},
                      {"length", chain["length"]}}};
  }
}
