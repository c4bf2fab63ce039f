#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "landledger/core/block.hpp"
#include "landledger/core/transaction.hpp"

namespace landledger::net {

  struct CodecError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // Wire shapes shared by every node:
  //   Transaction {"txid","nama","nomor_sertifikat","lokasi","luas","file_hash"|null,"timestamp"}
  //   Block       {"index","timestamp","transactions","proof","previous_hash","hash"}
  //   Chain       {"chain":[Block...],"length":N}
  //   Mempool     [Transaction...]
  // Decoders throw CodecError on any missing or mistyped field.

  nlohmann::json transaction_to_json(const core::Transaction& tx);
  core::Transaction transaction_from_json(const nlohmann::json& j);

  nlohmann::json block_to_json(const core::Block& block);
  core::Block block_from_json(const nlohmann::json& j);

  nlohmann::json chain_to_json(const std::vector<core::Block>& blocks);
  // Also rejects a body whose "length" disagrees with its block count.
  std::vector<core::Block> chain_from_json(const nlohmann::json& j);

  nlohmann::json mempool_to_json(const std::vector<core::Transaction>& transactions);
  std::vector<core::Transaction> mempool_from_json(const nlohmann::json& j);

  // Submission body; empty/absent optional fields become nullopt. Field
  // presence is enforced later by make_transaction().
  core::CertificateFields certificate_fields_from_json(const nlohmann::json& j);

  nlohmann::json parse_json(const std::string& body);
}
