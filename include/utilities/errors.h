#pragma once
#ifndef XFERPRESS_ERRORS_H
#define XFERPRESS_ERRORS_H

#include <stdexcept>
#include <string>

namespace xferpress {

/**
 * @brief Base class for every error raised by the transfer pipeline.
 */
class TransferError : public std::runtime_error {
public:
  explicit TransferError(const std::string &what) : std::runtime_error(what) {}
};

/// Persisting a chunk or an artifact failed. The client may retry the chunk.
class StorageWriteError : public TransferError {
public:
  explicit StorageWriteError(const std::string &what) : TransferError(what) {}
};

/**
 * @brief Finalize was requested for an upload whose chunks do not cover
 * [0,total), or whose session is unknown.
 *
 * The client has to restart the whole upload.
 */
class CompletenessError : public TransferError {
public:
  explicit CompletenessError(const std::string &what) : TransferError(what) {}
};

/// Retrieval of an unknown artifact id.
class NotFoundError : public TransferError {
public:
  explicit NotFoundError(const std::string &what) : TransferError(what) {}
};

/// External transcoder failed. Recovered inside the video engine.
class TranscodeFailure : public TransferError {
public:
  explicit TranscodeFailure(const std::string &what) : TransferError(what) {}
};

/// Chunk admission parameters are invalid (bad index, total mismatch, ...).
class ChunkRejectedError : public TransferError {
public:
  explicit ChunkRejectedError(const std::string &what) : TransferError(what) {}
};

/// Configuration file exists but cannot be parsed.
class ConfigError : public TransferError {
public:
  explicit ConfigError(const std::string &what) : TransferError(what) {}
};

} // namespace xferpress

#endif // XFERPRESS_ERRORS_H
