#pragma once
#include <cstdint>
#include <vector>
#include <filesystem>
#include <landledger/core/block.hpp>
#include <landledger/storage/record_log.hpp>

namespace landledger::storage {

  // Durable chain log, one record per block, keyed to the node's listening
  // port so several local nodes can share a data directory.
  class BlockStore {
    public:
      BlockStore(std::filesystem::path root_path, uint16_t port);

      void append_block(const landledger::core::Block& block);

      // Replace the whole log with `blocks` (chain replacement or repair).
      void rewrite(const std::vector<landledger::core::Block>& blocks);

      // Blocks up to the first unreadable record.
      std::vector<landledger::core::Block> load_all_blocks();

      const std::filesystem::path& directory() const { return root_path_; }
      const std::filesystem::path& log_path() const { return log_.path(); }

    private:
      std::filesystem::path root_path_;
      RecordLog log_;
  };
}
