#include <gtest/gtest.h>
#include "landledger/core/transaction.hpp"
#include "landledger/core/serializer.hpp"

using namespace landledger::core;

static CertificateFields sample_fields() {
  return {"Siti Aminah", "SHM-00123", "Desa Sukamaju, Bogor", "250", std::nullopt};
}

TEST(Transaction, MakeStampsTxidAndTimestamp) {
  auto tx = make_transaction(sample_fields(), 1700000500ULL);
  EXPECT_EQ(tx.txid.size(), 32u);
  EXPECT_EQ(tx.nama, "Siti Aminah");
  EXPECT_EQ(tx.nomor_sertifikat, "SHM-00123");
  EXPECT_EQ(tx.lokasi, "Desa Sukamaju, Bogor");
  EXPECT_EQ(tx.luas, "250");
  EXPECT_FALSE(tx.file_hash.has_value());
  EXPECT_EQ(tx.timestamp, 1700000500ULL);

  auto other = make_transaction(sample_fields(), 1700000500ULL);
  EXPECT_NE(tx.txid, other.txid);
}

TEST(Transaction, MissingRequiredFieldThrows) {
  auto fields = sample_fields();
  fields.nama.clear();
  EXPECT_THROW(make_transaction(fields, 1), InvalidTransactionError);

  fields = sample_fields();
  fields.nomor_sertifikat.clear();
  EXPECT_THROW(make_transaction(fields, 1), InvalidTransactionError);

  fields = sample_fields();
  fields.lokasi.clear();
  EXPECT_THROW(make_transaction(fields, 1), InvalidTransactionError);

  fields = sample_fields();
  fields.luas.clear();
  EXPECT_THROW(make_transaction(fields, 1), InvalidTransactionError);
}

TEST(Transaction, EmptyFileHashBecomesAbsent) {
  auto fields = sample_fields();
  fields.file_hash = "";
  EXPECT_FALSE(make_transaction(fields, 1).file_hash.has_value());

  fields.file_hash = "ab12";
  EXPECT_EQ(make_transaction(fields, 1).file_hash.value(), "ab12");
}

TEST(Transaction, SerializeRoundTrip) {
  auto fields = sample_fields();
  fields.file_hash = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
  auto tx = make_transaction(fields, 1700000500ULL);

  auto bytes = tx.serialize();
  auto decoded = Transaction::deserialize(std::span<const uint8_t>(bytes.data(), bytes.size()));
  EXPECT_EQ(decoded, tx);
}

TEST(Transaction, DeserializeRejectsUnknownSchemaAndTrailingBytes) {
  auto tx = make_transaction(sample_fields(), 1);
  auto bytes = tx.serialize();

  auto wrong_tag = bytes;
  wrong_tag[0] = 0x00;
  EXPECT_THROW(Transaction::deserialize(std::span<const uint8_t>(wrong_tag.data(), wrong_tag.size())), SerializeError);

  auto trailing = bytes;
  trailing.push_back(0x00);
  EXPECT_THROW(Transaction::deserialize(std::span<const uint8_t>(trailing.data(), trailing.size())), SerializeError);
}
