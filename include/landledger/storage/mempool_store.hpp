#pragma once
#include <cstdint>
#include <filesystem>
#include <vector>
#include <landledger/core/transaction.hpp>
#include <landledger/storage/record_log.hpp>

namespace landledger::storage {

  // Durable snapshot of the pending pool; every save rewrites the file.
  class MempoolStore {
    public:
      MempoolStore(std::filesystem::path root_path, uint16_t port);

      void save(const std::vector<landledger::core::Transaction>& transactions);

      std::vector<landledger::core::Transaction> load();

      const std::filesystem::path& log_path() const { return log_.path(); }

    private:
      RecordLog log_;
  };
}
