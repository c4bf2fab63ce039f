#include "landledger/storage/record_log.hpp"
#include "landledger/core/serializer.hpp"
#include "landledger/core/hash.hpp"
#include <cerrno>
#include <fstream>
#include <system_error>

#include <unistd.h>
#include <fcntl.h>

namespace fs = std::filesystem;
using namespace landledger::core;

namespace landledger::storage {
  static constexpr uint32_t MAGIC = 0x4C4C4447; // "LLDG"
  static constexpr uint64_t VER = 1;
  static constexpr size_t HEADER_SIZE = sizeof(uint32_t) + sizeof(uint64_t) + sizeof(uint16_t) + sizeof(uint64_t);
  static constexpr size_t CHECK_SIZE = 32;
  static constexpr uint64_t MAX_PAYLOAD = 64ULL << 20;

  namespace {
    class FileDescriptor {
      public:
        FileDescriptor(const fs::path& path, int flags) {
          fd_ = ::open(path.c_str(), flags, 0644);
          if (fd_ < 0) throw std::system_error(errno, std::generic_category(), "open " + path.string());
        }
        ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }
        FileDescriptor(const FileDescriptor&) = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        void write_all(std::span<const uint8_t> bytes) {
          size_t written = 0;
          while (written < bytes.size()) {
            auto n = ::write(fd_, bytes.data() + written, bytes.size() - written);
            if (n < 0) {
              if (errno == EINTR) continue;
              throw std::system_error(errno, std::generic_category(), "write");
            }
            written += static_cast<size_t>(n);
          }
        }

        void sync() {
          if (::fsync(fd_) != 0) throw std::system_error(errno, std::generic_category(), "fsync");
        }

      private:
        int fd_ = -1;
    };
  }

  RecordLog::RecordLog(fs::path path, RecordKind kind) : path_(std::move(path)), kind_(kind) {
    auto parent = path_.parent_path();
    if (!parent.empty() && !fs::exists(parent)) fs::create_directories(parent);
  }

  std::vector<uint8_t> RecordLog::frame(std::span<const uint8_t> payload) const {
    ByteWriter writer;
    writer.write_u32(MAGIC);
    writer.write_u64(VER);
    writer.write_u16(static_cast<uint16_t>(kind_));
    writer.write_u64(static_cast<uint64_t>(payload.size()));
    writer.write_raw(payload);
    auto check = sha256(payload);
    writer.write_raw(std::span<const uint8_t>(check.data(), check.size()));
    return writer.take();
  }

  void RecordLog::append(std::span<const uint8_t> payload) {
    auto record = frame(payload);
    FileDescriptor file(path_, O_CREAT | O_APPEND | O_WRONLY);
    file.write_all(std::span<const uint8_t>(record.data(), record.size()));
    file.sync();
  }

  void RecordLog::rewrite(const std::vector<std::vector<uint8_t>>& payloads) {
    auto tmp_path = path_;
    tmp_path += ".tmp";
    {
      FileDescriptor file(tmp_path, O_CREAT | O_TRUNC | O_WRONLY);
      for (const auto& payload : payloads) {
        auto record = frame(std::span<const uint8_t>(payload.data(), payload.size()));
        file.write_all(std::span<const uint8_t>(record.data(), record.size()));
      }
      file.sync();
    }
    std::error_code ec;
    fs::rename(tmp_path, path_, ec);
    if (ec) throw StoreError("RecordLog: rename " + tmp_path.string() + " failed: " + ec.message());
  }

  std::vector<std::vector<uint8_t>> RecordLog::read_all() const {
    std::vector<std::vector<uint8_t>> out;
    if (!fs::exists(path_)) return out;

    std::ifstream in(path_, std::ios::binary);
    if (!in) throw StoreError("RecordLog: open read failed: " + path_.string());

    while (in.peek() != std::char_traits<char>::eof()) {
      std::vector<uint8_t> header_bytes(HEADER_SIZE);
      in.read(reinterpret_cast<char*>(header_bytes.data()), header_bytes.size());
      if (!in) break;

      ByteReader reader(std::span<const uint8_t>(header_bytes.data(), header_bytes.size()));
      RecordHeader header{};
      header.magic = reader.read_u32();
      header.version = reader.read_u64();
      header.kind = reader.read_u16();
      header.length = reader.read_u64();

      if (header.magic != MAGIC || header.version != VER || header.kind != static_cast<uint16_t>(kind_) ||
          header.length > MAX_PAYLOAD) {
        break;
      }

      std::vector<uint8_t> payload(header.length);
      in.read(reinterpret_cast<char*>(payload.data()), payload.size());
      if (!in) break;

      Hash256 check{};
      in.read(reinterpret_cast<char*>(check.data()), CHECK_SIZE);
      if (!in) break;

      if (sha256(std::span<const uint8_t>(payload.data(), payload.size())) != check) {
        break;
      }
      out.push_back(std::move(payload));
    }
    return out;
  }
}
