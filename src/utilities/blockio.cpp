#include "utilities/blockio.hpp"

#include <memory>
#include <stdexcept>

namespace {

struct CCtxDeleter {
  void operator()(ZSTD_CCtx *ctx) const { ZSTD_freeCCtx(ctx); }
};
struct DCtxDeleter {
  void operator()(ZSTD_DCtx *ctx) const { ZSTD_freeDCtx(ctx); }
};

void check_zstd(size_t code, const char *what) {
  if (ZSTD_isError(code)) {
    throw std::runtime_error(std::string(what) + " failed: " +
                             ZSTD_getErrorName(code));
  }
}

} // namespace

BlockIO::BlockIO(int compression_level)
    : compression_level_(compression_level) {
  // 0 on success, 1 if already initialised, -1 on failure.
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  crypto_hash_sha256_init(&hash_state_);
}

void BlockIO::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(
        &hash_state_, reinterpret_cast<const unsigned char *>(data), size);
  }
}

DigestResult BlockIO::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }
  DigestResult result;
  crypto_hash_sha256_final(&hash_state_, result.digest.data());

  char hex[crypto_hash_sha256_BYTES * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), result.digest.data(), result.digest.size());
  result.hex = hex;

  finalized_ = true;
  return result;
}

uint64_t BlockIO::compress_stream(std::istream &in, std::ostream &out) const {
  std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx(ZSTD_createCCtx());
  if (!cctx) {
    throw std::runtime_error("ZSTD_createCCtx failed");
  }
  check_zstd(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel,
                                    compression_level_),
             "ZSTD_CCtx_setParameter");

  std::vector<char> inBuf(ZSTD_CStreamInSize());
  std::vector<char> outBuf(ZSTD_CStreamOutSize());
  uint64_t written = 0;

  bool lastChunk = false;
  while (!lastChunk) {
    in.read(inBuf.data(), static_cast<std::streamsize>(inBuf.size()));
    size_t const readBytes = static_cast<size_t>(in.gcount());
    if (in.bad()) {
      throw std::runtime_error("compress_stream: read failed");
    }
    lastChunk = in.eof() || readBytes < inBuf.size();
    ZSTD_EndDirective const mode = lastChunk ? ZSTD_e_end : ZSTD_e_continue;
    ZSTD_inBuffer input{inBuf.data(), readBytes, 0};

    // Drain until the input is consumed, or the frame is flushed on the
    // last chunk.
    bool finished = false;
    while (!finished) {
      ZSTD_outBuffer output{outBuf.data(), outBuf.size(), 0};
      size_t const remaining =
          ZSTD_compressStream2(cctx.get(), &output, &input, mode);
      check_zstd(remaining, "ZSTD_compressStream2");
      out.write(outBuf.data(), static_cast<std::streamsize>(output.pos));
      if (!out) {
        throw std::runtime_error("compress_stream: write failed");
      }
      written += output.pos;
      finished = lastChunk ? (remaining == 0) : (input.pos == input.size);
    }
  }
  return written;
}

uint64_t BlockIO::decompress_stream(std::istream &in, std::ostream &out) const {
  std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
  if (!dctx) {
    throw std::runtime_error("ZSTD_createDCtx failed");
  }
  std::vector<char> inBuf(ZSTD_DStreamInSize());
  std::vector<char> outBuf(ZSTD_DStreamOutSize());
  uint64_t written = 0;
  size_t lastRet = 0;

  while (in) {
    in.read(inBuf.data(), static_cast<std::streamsize>(inBuf.size()));
    size_t const readBytes = static_cast<size_t>(in.gcount());
    if (readBytes == 0) {
      break;
    }
    ZSTD_inBuffer input{inBuf.data(), readBytes, 0};
    while (input.pos < input.size) {
      ZSTD_outBuffer output{outBuf.data(), outBuf.size(), 0};
      lastRet = ZSTD_decompressStream(dctx.get(), &output, &input);
      check_zstd(lastRet, "ZSTD_decompressStream");
      out.write(outBuf.data(), static_cast<std::streamsize>(output.pos));
      if (!out) {
        throw std::runtime_error("decompress_stream: write failed");
      }
      written += output.pos;
    }
  }
  if (lastRet != 0) {
    throw std::runtime_error("decompress_stream: truncated zstd frame");
  }
  return written;
}
