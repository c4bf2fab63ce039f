#include <gtest/gtest.h>
#include "landledger/net/json_codec.hpp"
#include "test_util.hpp"

using namespace landledger::core;
using namespace landledger::net;
using json = nlohmann::json;
using landledger::test::certificate;
using landledger::test::grow;

TEST(JsonCodec, TransactionKeepsEveryField) {
  auto tx = certificate("json");
  auto j = transaction_to_json(tx);
  EXPECT_TRUE(j.at("file_hash").is_null());
  EXPECT_EQ(j.at("nomor_sertifikat"), "SHM-json");
  EXPECT_EQ(transaction_from_json(j), tx);

  tx.file_hash = std::string(64, 'd');
  EXPECT_EQ(transaction_from_json(transaction_to_json(tx)), tx);
}

TEST(JsonCodec, ChainBodyMatchesWireShape) {
  Chain c(ChainConfig{.difficulty = 1});
  grow(c, 2, "wire");

  auto body = chain_to_json(c.blocks());
  EXPECT_EQ(body.at("length"), 3);
  const auto& second = body.at("chain").at(1);
  EXPECT_TRUE(second.at("index").is_number_unsigned());
  EXPECT_TRUE(second.at("proof").is_number_unsigned());
  EXPECT_EQ(second.at("previous_hash"), c.genesis().hash);
  EXPECT_EQ(second.at("hash"), c.blocks()[1].hash);

  // Through text, as a peer would see it
  auto decoded = chain_from_json(parse_json(body.dump()));
  EXPECT_EQ(decoded, c.blocks());
}

TEST(JsonCodec, LengthMustMatchBlockCount) {
  Chain c(ChainConfig{.difficulty = 1});
  grow(c, 1, "len");
  auto body = chain_to_json(c.blocks());
  body["length"] = 5;
  EXPECT_THROW(chain_from_json(body), CodecError);
}

TEST(JsonCodec, MalformedInputThrowsCodecError) {
  EXPECT_THROW(parse_json("{not json"), CodecError);
  EXPECT_THROW(chain_from_json(json::array()), CodecError);
  EXPECT_THROW(mempool_from_json(json::object()), CodecError);
  EXPECT_THROW(block_from_json(json{{"index", "one"}}), CodecError);

  auto tx = transaction_to_json(certificate("bad"));
  tx["timestamp"] = "yesterday";
  EXPECT_THROW(transaction_from_json(tx), CodecError);

  tx = transaction_to_json(certificate("bad"));
  tx.erase("txid");
  EXPECT_THROW(transaction_from_json(tx), CodecError);

  tx = transaction_to_json(certificate("bad"));
  tx["file_hash"] = 12;
  EXPECT_THROW(transaction_from_json(tx), CodecError);
}

TEST(JsonCodec, CertificateFieldsAcceptNumbersAndMissingHash) {
  auto fields = certificate_fields_from_json(
      json{{"nama", "Budi"}, {"nomor_sertifikat", "SHM-9"}, {"lokasi", "Depok"}, {"luas", 120}});
  EXPECT_EQ(fields.nama, "Budi");
  EXPECT_EQ(fields.luas, "120");
  EXPECT_FALSE(fields.file_hash.has_value());

  auto missing = certificate_fields_from_json(json{{"nama", "Budi"}});
  EXPECT_TRUE(missing.lokasi.empty());
  EXPECT_THROW(make_transaction(missing, 1), InvalidTransactionError);

  EXPECT_THROW(certificate_fields_from_json(json{{"nama", json::array()}}), CodecError);
}
