#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <vector>

namespace landledger::storage {

  struct StoreError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  enum class RecordKind : uint16_t {
    Block = 1,
    Transaction = 2,
  };

  struct RecordHeader {
    uint32_t magic;
    uint64_t version;
    uint16_t kind;
    uint64_t length;
  };

  /**
   * Append-only file of framed records:
   *   magic u32 | version u64 | kind u16 | length u64 | payload | sha256(payload)
   * Readers stop at the first truncated, foreign or corrupt record, so a torn
   * tail from a crash is dropped instead of poisoning the whole file.
   */
  class RecordLog {
    public:
      RecordLog(std::filesystem::path path, RecordKind kind);

      // Append one record and fsync. Throws StoreError/std::system_error.
      void append(std::span<const uint8_t> payload);

      // Replace the whole file (temp file + fsync + rename).
      void rewrite(const std::vector<std::vector<uint8_t>>& payloads);

      std::vector<std::vector<uint8_t>> read_all() const;

      const std::filesystem::path& path() const { return path_; }

    private:
      std::vector<uint8_t> frame(std::span<const uint8_t> payload) const;

      std::filesystem::path path_;
      RecordKind kind_;
  };
}
