#include "utilities/audit_log.hpp"
#include "utilities/blockio.hpp"
#include "utilities/logger.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace xferpress {

namespace {

nlohmann::json toJson(const AdjustmentHistory::Event& e) {
    return nlohmann::json{{"parameter", e.parameter},
                          {"transition", e.transition},
                          {"ratio", e.ratio},
                          {"ts", static_cast<long long>(e.ts)},
                          {"prev_hash", e.prevHash},
                          {"hash", e.hash}};
}

AdjustmentHistory::Event fromJson(const nlohmann::json& j) {
    AdjustmentHistory::Event e;
    e.parameter = j.at("parameter").get<std::string>();
    e.transition = j.at("transition").get<std::string>();
    e.ratio = j.at("ratio").get<double>();
    e.ts = static_cast<std::time_t>(j.at("ts").get<long long>());
    e.prevHash = j.at("prev_hash").get<std::string>();
    e.hash = j.at("hash").get<std::string>();
    return e;
}

} // namespace

static std::string formatNumber(double v) {
    std::ostringstream oss;
    oss << std::setprecision(6) << std::noshowpoint << v;
    return oss.str();
}

std::string AdjustmentHistory::formatTransition(double previous, double next) {
    return formatNumber(previous) + "->" + formatNumber(next);
}

std::string AdjustmentHistory::chainHash(const std::string& prev, const Event& e) {
    std::ostringstream oss;
    oss << e.ts << '|' << std::setprecision(17) << e.ratio;
    const std::string tail = oss.str();

    BlockIO b;
    if (!prev.empty())
        b.ingest(reinterpret_cast<const std::byte*>(prev.data()), prev.size());
    b.ingest(reinterpret_cast<const std::byte*>(e.parameter.data()), e.parameter.size());
    b.ingest(reinterpret_cast<const std::byte*>(e.transition.data()), e.transition.size());
    b.ingest(reinterpret_cast<const std::byte*>(tail.data()), tail.size());
    return b.finalize_hashed().hex;
}

AdjustmentHistory::Event AdjustmentHistory::record(const std::string& parameter,
                                                   double previous, double next,
                                                   double ratio) {
    std::lock_guard<std::mutex> lock(mutex_);
    Event e;
    e.parameter = parameter;
    e.transition = formatTransition(previous, next);
    e.ratio = ratio;
    e.ts = std::time(nullptr);
    e.prevHash = log_.empty() ? std::string() : log_.back().hash;
    e.hash = chainHash(e.prevHash, e);
    log_.push_back(e);
    appendToJournal(e);
    return e;
}

size_t AdjustmentHistory::attachJournal(const std::string& path) {
    std::vector<Event> loaded;
    std::ifstream in(path);
    if (in.is_open()) {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (line.empty()) continue;
            try {
                loaded.push_back(fromJson(nlohmann::json::parse(line)));
            } catch (const nlohmann::json::exception& ex) {
                Logger::getInstance().log(LogLevel::WARN,
                    "[AdjustmentHistory] Skipping line " + std::to_string(lineNo) +
                    " of " + path + ": " + ex.what());
            }
        }
    } else {
        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    log_ = std::move(loaded);
    journalPath_ = path;
    Logger::getInstance().log(LogLevel::DEBUG,
        "[AdjustmentHistory] Loaded " + std::to_string(log_.size()) +
        " records from " + path);
    return log_.size();
}

// Caller holds mutex_.
void AdjustmentHistory::appendToJournal(const Event& e) {
    if (journalPath_.empty()) return;
    std::ofstream out(journalPath_, std::ios::app);
    if (out.is_open()) {
        out << toJson(e).dump() << '\n';
        out.flush();
    }
    if (!out) {
        Logger::getInstance().log(LogLevel::ERROR,
            "[AdjustmentHistory] Could not append to " + journalPath_);
    }
}

std::vector<AdjustmentHistory::Event> AdjustmentHistory::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

size_t AdjustmentHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.size();
}

bool AdjustmentHistory::verify() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string prev;
    for (const auto& e : log_) {
        if (e.prevHash != prev) return false;
        if (chainHash(prev, e) != e.hash) return false;
        prev = e.hash;
    }
    return true;
}

} // namespace xferpress
