#ifndef BLOCKIO_HPP
#define BLOCKIO_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <sodium.h>
#include <string>
#include <zstd.h>

struct DigestResult {
  std::array<uint8_t, crypto_hash_sha256_BYTES> digest; // SHA-256
  std::string hex; // Lower-case hex rendering of digest
};

/**
 * @brief Block processing: SHA-256 hashing and zstd stream compression.
 *
 * Data fed with ingest() only updates the running hash; nothing is kept.
 * Artifacts are compressed as streams so they never have to be resident.
 */
class BlockIO {
public:
  /**
   * @brief Construct a new BlockIO processor.
   * @param compression_level Zstd compression level to use.
   * @throw std::runtime_error If libsodium cannot be initialised.
   */
  explicit BlockIO(int compression_level = 3);

  // Feeds data into the running hash.
  void ingest(const std::byte *data, size_t size);

  /**
   * @brief Finalize the running hash.
   * @throw std::logic_error If called twice.
   */
  DigestResult finalize_hashed();

  /**
   * @brief Compress everything readable from @p in into @p out.
   * @return Number of compressed bytes written.
   * @throw std::runtime_error On codec or stream failure.
   */
  uint64_t compress_stream(std::istream &in, std::ostream &out) const;

  /**
   * @brief Inverse of compress_stream().
   * @return Number of decompressed bytes written.
   */
  uint64_t decompress_stream(std::istream &in, std::ostream &out) const;

  int compression_level() const { return compression_level_; }

private:
  crypto_hash_sha256_state hash_state_;
  bool finalized_ = false;
  int compression_level_ = 3;
};

#endif // BLOCKIO_HPP
