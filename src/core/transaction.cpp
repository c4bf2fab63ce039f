#include "landledger/core/transaction.hpp"
#include "landledger/core/serializer.hpp"
#include "landledger/core/hash.hpp"
#include <chrono>

namespace landledger::core {

  static constexpr uint8_t TX_TAG = 0xC1;
  static constexpr uint8_t TX_SCHEMA = 0x01;

  std::vector<uint8_t> Transaction::serialize() const {
    ByteWriter writer;

    writer.write_u8(TX_TAG);
    writer.write_u8(TX_SCHEMA);

    writer.write_string(txid);
    writer.write_string(nama);
    writer.write_string(nomor_sertifikat);
    writer.write_string(lokasi);
    writer.write_string(luas);
    writer.write_optional_string(file_hash);
    writer.write_u64(timestamp);
    return writer.take();
  }

  Transaction Transaction::deserialize(std::span<const uint8_t> bytes) {
    ByteReader reader(bytes);
    if (reader.read_u8() != TX_TAG || reader.read_u8() != TX_SCHEMA)
      throw SerializeError("deserialize: unknown transaction schema");

    Transaction tx;
    tx.txid = reader.read_string();
    tx.nama = reader.read_string();
    tx.nomor_sertifikat = reader.read_string();
    tx.lokasi = reader.read_string();
    tx.luas = reader.read_string();
    tx.file_hash = reader.read_optional_string();
    tx.timestamp = reader.read_u64();
    reader.expect_end();
    return tx;
  }

  uint64_t unix_now() {
    return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count()
    );
  }

  std::string new_txid() { return random_hex(16); }

  static void require_field(const std::string& value, const char* name) {
    if (value.empty()) throw InvalidTransactionError(std::string("missing required field: ") + name);
  }

  Transaction make_transaction(CertificateFields fields, uint64_t unix_time) {
    require_field(fields.nama, "nama");
    require_field(fields.nomor_sertifikat, "nomor_sertifikat");
    require_field(fields.lokasi, "lokasi");
    require_field(fields.luas, "luas");
    if (fields.file_hash && fields.file_hash->empty()) fields.file_hash.reset();

    Transaction tx;
    tx.txid = new_txid();
    tx.nama = std::move(fields.nama);
    tx.nomor_sertifikat = std::move(fields.nomor_sertifikat);
    tx.lokasi = std::move(fields.lokasi);
    tx.luas = std::move(fields.luas);
    tx.file_hash = std::move(fields.file_hash);
    tx.timestamp = unix_time;
    return tx;
  }
}
