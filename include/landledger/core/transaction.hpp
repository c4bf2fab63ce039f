#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace landledger::core {

  struct InvalidTransactionError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // Fields a client submits for one land certificate.
  struct CertificateFields {
    std::string nama;
    std::string nomor_sertifikat;
    std::string lokasi;
    std::string luas;
    std::optional<std::string> file_hash;
  };

  struct Transaction {
    std::string txid;
    std::string nama;
    std::string nomor_sertifikat;
    std::string lokasi;
    std::string luas;
    // SHA-256 hex of the uploaded certificate file, when one was attached.
    std::optional<std::string> file_hash;
    uint64_t timestamp = 0;

    std::vector<uint8_t> serialize() const;
    static Transaction deserialize(std::span<const uint8_t> bytes);

    bool operator==(const Transaction&) const = default;
  };

  uint64_t unix_now();

  std::string new_txid();

  /**
   * Build a transaction from submitted fields, stamping it with a fresh txid
   * and `unix_time`. Throws InvalidTransactionError if a required field is empty.
   */
  Transaction make_transaction(CertificateFields fields, uint64_t unix_time);
}
