#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace perpcore {
namespace wal {

struct RecordHeader {
  std::uint32_t magic{0x50434a4c};  // 'PCJL'
  std::uint16_t version{1};
  std::uint16_t reserved{0};
  std::uint64_t sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

// Append-only journal of accepted command frames. Records are buffered and
// written once flush_threshold_bytes accumulate, or on flush()/sync().
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path,
                  std::size_t flush_threshold_bytes = 1 << 16);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  // Best-effort flush; call flush() first to observe write errors.
  ~Writer();

  // Returns the sequence assigned to the record.
  std::uint64_t append(std::span<const std::byte> payload);
  void flush();
  void sync();
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  std::uint64_t next_sequence_{1};

  void ensure_open(const std::filesystem::path& path);
  bool write_buffer() noexcept;
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  // False at end of file. Throws std::runtime_error on a corrupt record.
  bool next(Record& out_record);
  // Positions the reader at the first record with sequence >= `sequence`.
  void seek_sequence(std::uint64_t sequence);

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
};

}  // namespace wal
}  // namespace perpcore
