#include "transfer/artifact_catalog.h"
#include "transfer/compression_engine.h"
#include "transfer/quality_model.h"
#include "transfer/reassembler.h"
#include "transfer/transcoder.h"
#include "transfer/transfer_service.h"
#include "utilities/blockio.hpp"
#include "utilities/chunk_store.hpp"
#include "utilities/config.h"
#include "utilities/errors.h"
#include "utilities/ids.h"
#include "utilities/kv_store.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace xferpress;

namespace {

/// Every component of one CLI invocation, built from the config.
struct Pipeline {
  explicit Pipeline(const ServiceConfig &cfg)
      : config(cfg), chunks(cfg.stagingDir()),
        reassembler(chunks, cfg.artifactsDir()),
        qualityStore(cfg.qualityStorePath()), model(qualityStore),
        transcoder(cfg.transcodeCommand),
        compressors(CompressorRegistry::withDefaults(model, transcoder,
                                                     cfg.compressionLevel)),
        catalog(cfg.baseUrl),
        service(chunks, reassembler, compressors, catalog) {
    catalog.load(cfg.catalogPath());
    model.history().attachJournal(cfg.adjustmentsPath());
  }

  void persist() { catalog.save(config.catalogPath()); }

  ServiceConfig config;
  DiskChunkStore chunks;
  Reassembler reassembler;
  FileKeyValueStore qualityStore;
  AdaptiveQualityModel model;
  ShellTranscoder transcoder;
  CompressorRegistry compressors;
  ArtifactCatalog catalog;
  TransferService service;
};

std::string formatTime(std::time_t t) {
  char buf[32];
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

int upload_command(Pipeline &p, const std::string &file, size_t chunkSize,
                   bool reverse) {
  namespace fs = std::filesystem;
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    std::cerr << "Cannot open " << file << std::endl;
    return 1;
  }
  std::vector<std::vector<std::byte>> pieces;
  std::vector<char> buf(chunkSize);
  while (in.read(buf.data(), static_cast<std::streamsize>(buf.size())) ||
         in.gcount() > 0) {
    const auto n = static_cast<size_t>(in.gcount());
    std::vector<std::byte> piece(n);
    std::transform(buf.begin(), buf.begin() + static_cast<long>(n),
                   piece.begin(), [](char c) { return std::byte(c); });
    pieces.push_back(std::move(piece));
  }
  if (pieces.empty())
    pieces.emplace_back();

  const std::string uploadId = randomHex(8);
  const std::string name = fs::path(file).filename().string();
  const auto total = static_cast<uint32_t>(pieces.size());
  for (uint32_t k = 0; k < total; ++k) {
    const uint32_t i = reverse ? total - 1 - k : k;
    p.service.receiveChunk(uploadId, i, total, name, pieces[i]);
  }

  FinalizeResult result = p.service.finalizeAsync(uploadId, name).get();
  p.persist();
  std::cout << "id:       " << result.id << "\n"
            << "link:     " << result.downloadLink << "\n"
            << "category: " << toString(result.category) << "\n"
            << "size:     " << result.sizeBytes << " bytes (" << total
            << " chunks)" << std::endl;
  return 0;
}

int fetch_command(Pipeline &p, const std::string &id, const std::string &out,
                  bool decompress) {
  Retrieval r = p.service.retrieve(id);
  std::ofstream dst(out, std::ios::binary | std::ios::trunc);
  if (!dst.is_open()) {
    std::cerr << "Cannot write " << out << std::endl;
    return 1;
  }
  if (decompress && r.category == ContentCategory::Document) {
    try {
      BlockIO(p.config.compressionLevel).decompress_stream(*r.stream, dst);
    } catch (const std::runtime_error &e) {
      Logger::getInstance().log(LogLevel::ERROR, "[xferpress] Decompressing " +
                                                     id + " failed: " + e.what());
      std::cerr << "Decompression failed: " << e.what() << std::endl;
      return 2;
    }
  } else {
    dst << r.stream->rdbuf();
  }
  dst.close();
  if (!dst) {
    std::cerr << "Write to " << out << " failed" << std::endl;
    return 1;
  }
  p.persist();
  std::cout << "Saved " << r.filename << " (" << r.sizeBytes << " bytes) to "
            << out << std::endl;
  return 0;
}

int recent_command(Pipeline &p, size_t limit) {
  std::cout << "ID\tFilename\tSize\tCreated\tDownloads" << std::endl;
  for (const auto &u : p.service.recentUploads(limit)) {
    std::cout << u.id << '\t' << u.filename << '\t' << u.sizeBytes << '\t'
              << formatTime(u.createdAt) << '\t' << u.downloadCount
              << std::endl;
  }
  return 0;
}

int params_command(Pipeline &p, size_t historyLimit) {
  for (const char *name :
       {AdaptiveQualityModel::IMAGE_QUALITY, AdaptiveQualityModel::VIDEO_CRF}) {
    std::cout << name << '\t' << p.model.get(name) << std::endl;
  }
  const auto events = p.model.history().events();
  const size_t first =
      events.size() > historyLimit ? events.size() - historyLimit : 0;
  std::cout << "\nAdjustments (" << events.size() << " total, chain "
            << (p.model.history().verify() ? "ok" : "BROKEN") << ")"
            << std::endl;
  for (size_t i = first; i < events.size(); ++i) {
    const auto &e = events[i];
    std::cout << formatTime(e.ts) << '\t' << e.parameter << '\t'
              << e.transition << '\t' << e.ratio << std::endl;
  }
  return 0;
}

void usage() {
  std::cout
      << "Usage: xferpress upload <file> [--chunk-size BYTES] [--reverse]\n"
      << "       xferpress fetch <id> <output> [--decompress]\n"
      << "       xferpress recent [limit]\n"
      << "       xferpress params [history]\n"
      << "       xferpress metrics\n";
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];

  ServiceConfig cfg;
  try {
    cfg = loadServiceConfig();
    std::filesystem::create_directories(cfg.logsDir());
    Logger::init(cfg.logsDir() + "/xferpress.log",
                 Logger::levelFromString(cfg.logLevel), cfg.logMaxBytes,
                 cfg.logBackups);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: initialization failed: " << e.what() << std::endl;
    return 1;
  }

  try {
    Pipeline pipeline(cfg);
    if (cmd == "upload" && argc >= 3) {
      size_t chunkSize = 64 * 1024;
      bool reverse = false;
      for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--chunk-size" && i + 1 < argc) {
          chunkSize = std::stoul(argv[++i]);
        } else if (arg == "--reverse") {
          reverse = true;
        } else {
          usage();
          return 1;
        }
      }
      if (chunkSize == 0) {
        std::cerr << "--chunk-size must be positive" << std::endl;
        return 1;
      }
      return upload_command(pipeline, argv[2], chunkSize, reverse);
    } else if (cmd == "fetch" && argc >= 4) {
      bool decompress = false;
      for (int i = 4; i < argc; ++i) {
        if (std::string(argv[i]) == "--decompress") {
          decompress = true;
        } else {
          usage();
          return 1;
        }
      }
      return fetch_command(pipeline, argv[2], argv[3], decompress);
    } else if (cmd == "recent") {
      size_t limit = argc >= 3 ? std::stoul(argv[2]) : 20;
      return recent_command(pipeline, limit);
    } else if (cmd == "params") {
      size_t history = argc >= 3 ? std::stoul(argv[2]) : 10;
      return params_command(pipeline, history);
    } else if (cmd == "metrics") {
      for (const char *name : {AdaptiveQualityModel::IMAGE_QUALITY,
                               AdaptiveQualityModel::VIDEO_CRF}) {
        MetricsRegistry::instance().setGauge("xferpress_quality_parameter",
                                             pipeline.model.get(name),
                                             {{"name", name}});
      }
      MetricsRegistry::instance().setGauge(
          "xferpress_catalog_entries",
          static_cast<double>(pipeline.catalog.size()));
      std::cout << MetricsRegistry::instance().toPrometheus();
      return 0;
    }
  } catch (const TransferError &e) {
    Logger::getInstance().log(LogLevel::ERROR, std::string("[xferpress] ") +
                                                   e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const std::invalid_argument &e) {
    std::cerr << "Invalid number: " << e.what() << std::endl;
    return 1;
  } catch (const std::out_of_range &e) {
    std::cerr << "Out of range: " << e.what() << std::endl;
    return 1;
  }
  usage();
  return 1;
}
