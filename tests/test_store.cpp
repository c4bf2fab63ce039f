#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "landledger/storage/block_store.hpp"
#include "landledger/storage/mempool_store.hpp"
#include "landledger/storage/record_log.hpp"
#include "landledger/core/chain.hpp"
#include "test_util.hpp"

using namespace landledger::core;
using landledger::storage::BlockStore;
using landledger::storage::MempoolStore;
using landledger::storage::RecordKind;
using landledger::storage::RecordLog;
using landledger::test::certificate;
using landledger::test::grow;
using landledger::test::tmpdir;
namespace fs = std::filesystem;

static ChainConfig easy() {
  return ChainConfig{.difficulty = 2, .genesis_timestamp = 1700000000ULL};
}

TEST(Store, AppendRestoreRoundTrip) {
  auto dir = tmpdir("store");
  BlockStore store(dir, 5000);

  Chain c(easy());
  store.append_block(c.genesis());
  grow(c, 2, "rt");
  for (size_t i = 1; i < c.length(); ++i) store.append_block(c.blocks()[i]);

  EXPECT_EQ(store.log_path(), dir / "chain_5000.log");

  Chain c2(easy());
  EXPECT_TRUE(c2.restore_from_store(store));
  EXPECT_EQ(c2.length(), 3u);
  EXPECT_EQ(c2.blocks(), c.blocks());
}

TEST(Store, PortsUseSeparateLogs) {
  auto dir = tmpdir("store_ports");
  BlockStore a(dir, 5001);
  BlockStore b(dir, 5002);
  a.append_block(make_genesis_block(1700000000ULL));

  EXPECT_EQ(a.load_all_blocks().size(), 1u);
  EXPECT_TRUE(b.load_all_blocks().empty());
}

TEST(Store, EmptyDirectoryRestoresGenesisOnly) {
  auto dir = tmpdir("store_empty");
  BlockStore store(dir, 5000);

  Chain c(easy());
  EXPECT_FALSE(c.restore_from_store(store));
  EXPECT_EQ(c.length(), 1u);
  EXPECT_EQ(c.genesis(), make_genesis_block(1700000000ULL));
}

TEST(Store, CorruptTailIsIgnored) {
  auto dir = tmpdir("store_tail");
  BlockStore store(dir, 5000);

  Chain c(easy());
  grow(c, 2, "tail");
  store.rewrite(c.blocks());

  // Half-written record after the last good one
  {
    std::ofstream out(store.log_path(), std::ios::binary | std::ios::app);
    const char junk[] = {0x47, 0x44, 0x4C, 0x4C, 0x01, 0x00, 0x00};
    out.write(junk, sizeof(junk));
  }
  EXPECT_EQ(store.load_all_blocks().size(), 3u);

  // A flipped byte inside the last record drops that record only
  auto size = fs::file_size(store.log_path());
  {
    std::fstream io(store.log_path(), std::ios::binary | std::ios::in | std::ios::out);
    io.seekp(static_cast<std::streamoff>(size - 60));
    io.put('\x7f');
  }
  auto blocks = store.load_all_blocks();
  EXPECT_EQ(blocks.size(), 2u);
  EXPECT_EQ(blocks.back(), c.blocks()[1]);
}

TEST(Store, RewriteReplacesContents) {
  auto dir = tmpdir("store_rewrite");
  RecordLog log(dir / "records.log", RecordKind::Block);
  std::vector<uint8_t> one{1, 2, 3};
  log.append(std::span<const uint8_t>(one.data(), one.size()));
  log.append(std::span<const uint8_t>(one.data(), one.size()));
  EXPECT_EQ(log.read_all().size(), 2u);

  log.rewrite({{9}, {8, 7}, {}});
  auto records = log.read_all();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[1], (std::vector<uint8_t>{8, 7}));
  EXPECT_TRUE(records[2].empty());
  EXPECT_FALSE(fs::exists(dir / "records.log.tmp"));
}

TEST(Store, RecordKindMustMatch) {
  auto dir = tmpdir("store_kind");
  RecordLog blocks(dir / "mixed.log", RecordKind::Block);
  std::vector<uint8_t> payload{1};
  blocks.append(std::span<const uint8_t>(payload.data(), payload.size()));

  RecordLog transactions(dir / "mixed.log", RecordKind::Transaction);
  EXPECT_TRUE(transactions.read_all().empty());
}

TEST(Store, TamperedBlockInStorageKeepsValidPrefix) {
  auto dir = tmpdir("store_tamper");
  BlockStore store(dir, 5000);

  Chain c(easy());
  grow(c, 4, "tamper");
  auto blocks = c.blocks();
  blocks[2].transactions[0].luas = "99999";  // recorded hash left as-is
  store.rewrite(blocks);

  auto loaded = store.load_all_blocks();
  ASSERT_EQ(loaded.size(), 5u);
  auto report = audit_chain(loaded, 2);
  EXPECT_TRUE(report[1].is_valid);
  EXPECT_EQ(report[2].error, ValidationError::HashMismatch);
  EXPECT_EQ(report[2].block_index, 3u);
  EXPECT_TRUE(report[3].is_valid);

  Chain restored(easy());
  EXPECT_FALSE(restored.restore_from_store(store));
  EXPECT_EQ(restored.length(), 2u);
}

TEST(Store, MempoolSaveLoad) {
  auto dir = tmpdir("store_mempool");
  MempoolStore store(dir, 5000);
  EXPECT_TRUE(store.load().empty());

  auto withFile = certificate("f");
  withFile.file_hash = std::string(64, 'c');
  std::vector<Transaction> txs{certificate("a"), withFile};
  store.save(txs);
  EXPECT_EQ(store.log_path(), dir / "mempool_5000.log");
  EXPECT_EQ(store.load(), txs);

  store.save({});
  EXPECT_TRUE(store.load().empty());
}
