#ifndef AUDIT_LOG_HPP
#define AUDIT_LOG_HPP

#include <ctime>
#include <mutex>
#include <string>
#include <vector>

namespace xferpress {

/**
 * @brief Append-only history of quality parameter adjustments.
 *
 * Each record is hashed together with the previous record's hash so that
 * edits to earlier entries are detectable with verify(). With a journal
 * attached, every record is also appended to it as one JSON line.
 */
class AdjustmentHistory {
public:
    struct Event {
        std::string parameter;   ///< e.g. image_quality
        std::string transition;  ///< "prev->next"
        double ratio{0.0};       ///< compressed / original
        std::time_t ts{0};
        std::string prevHash;
        std::string hash;
    };

    AdjustmentHistory() = default;
    AdjustmentHistory(const AdjustmentHistory&) = delete;
    AdjustmentHistory& operator=(const AdjustmentHistory&) = delete;

    /**
     * @brief Load an existing journal and append future records to it.
     *
     * Malformed lines are logged and skipped. Loaded records replace the
     * in-memory history so the chain continues from the journal's tail.
     * @return Number of records loaded.
     */
    size_t attachJournal(const std::string& path);

    /** Append a record and return it. A failed journal write is logged. */
    Event record(const std::string& parameter, double previous, double next,
                 double ratio);

    /** Snapshot of every record, oldest first. */
    std::vector<Event> events() const;

    /** Number of records. */
    size_t size() const;

    /** Recompute the hash chain. */
    bool verify() const;

    /** "80->75" style rendering used in records and logs. */
    static std::string formatTransition(double previous, double next);

private:
    static std::string chainHash(const std::string& prev, const Event& e);
    void appendToJournal(const Event& e);

    mutable std::mutex mutex_;
    std::vector<Event> log_;
    std::string journalPath_;
};

} // namespace xferpress

#endif // AUDIT_LOG_HPP
