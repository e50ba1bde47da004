#include "perpcore/wal/journal.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace perpcore {
namespace wal {

namespace {
constexpr std::uint32_t kMagic = 0x50434a4c;  // 'PCJL'

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

void fsync_file(std::FILE* file) {
  if (::fsync(::fileno(file)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
}

}  // namespace

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : buffer_(), flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);
  ensure_open(path);
}

Writer::~Writer() {
  if (file_) {
    static_cast<void>(write_buffer());
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::ensure_open(const std::filesystem::path& path) {
  // Recover the sequence from records already on disk.
  if (std::filesystem::exists(path)) {
    Reader reader(path);
    Record record;
    while (reader.next(record)) {
      next_sequence_ = record.header.sequence + 1;
    }
  }
  file_ = std::fopen(path.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open journal: " + path.string());
  }
}

std::uint64_t Writer::append(std::span<const std::byte> payload) {
  if (!file_) {
    throw std::runtime_error("journal writer not open");
  }

  RecordHeader header{};
  header.magic = kMagic;
  header.version = 1;
  header.sequence = next_sequence_++;
  header.payload_size = static_cast<std::uint32_t>(payload.size());
  header.checksum = checksum32(payload);

  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), payload.begin(), payload.end());

  if (buffer_.size() >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

bool Writer::write_buffer() noexcept {
  if (buffer_.empty()) {
    return true;
  }
  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    return false;
  }
  buffer_.clear();
  return std::fflush(file_) == 0;
}

void Writer::flush() {
  if (!file_) {
    return;
  }
  if (!write_buffer()) {
    throw std::runtime_error("failed to write journal buffer");
  }
}

void Writer::sync() {
  flush();
  if (!file_) {
    return;
  }
  fsync_file(file_);
}

Reader::Reader(const std::filesystem::path& path)
    : path_(path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open journal for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_) {
    return false;
  }

  RecordHeader header;
  const auto read_header = std::fread(&header, sizeof(RecordHeader), 1, file_);
  if (read_header != 1) {
    return false;
  }

  if (header.magic != kMagic) {
    throw std::runtime_error("invalid journal magic");
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    const auto read_payload = std::fread(out_record.payload.data(), 1, header.payload_size, file_);
    if (read_payload != header.payload_size) {
      throw std::runtime_error("truncated journal record");
    }
  }
  if (header.checksum != checksum32(out_record.payload)) {
    throw std::runtime_error("journal checksum mismatch");
  }

  return true;
}

void Reader::seek_sequence(std::uint64_t sequence) {
  if (!file_) {
    return;
  }
  std::rewind(file_);
  Record record;
  while (next(record)) {
    if (record.header.sequence >= sequence) {
      const auto offset = static_cast<long>(sizeof(RecordHeader) + record.header.payload_size);
      if (std::fseek(file_, -offset, SEEK_CUR) != 0) {
        throw std::runtime_error("failed to seek in journal");
      }
      break;
    }
  }
}

}  // namespace wal
}  // namespace perpcore
