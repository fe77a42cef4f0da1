#pragma once
/**
 * @file stats.hpp
 * @brief Link statistics: lock-free counters shared by the caller and the receive loop.
 *
 * `Stats` is written from two threads (sends from the caller, everything else
 * from the receive loop), so each counter is a relaxed atomic. Counters only
 * ever go up; the only way to reset them is a new Protocol instance.
 *
 * `snapshot()` copies the counters into a plain `StatsSnapshot`. Each field is
 * read atomically; the set as a whole is not a transaction, which is fine for
 * monitoring.
 */

#include <atomic>
#include <cstdint>

namespace zetta {

/// Plain copy of the counters, safe to pass around and print.
struct StatsSnapshot {
    uint64_t packets_sent{0};      ///< Frames fully written to the transport
    uint64_t packets_received{0};  ///< Frames that passed STOP and CRC checks
    uint64_t crc_errors{0};        ///< Candidates dropped for a CRC mismatch
    uint64_t frame_errors{0};      ///< Candidates dropped for a bad STOP byte or LENGTH
    uint64_t bytes_received{0};    ///< Raw bytes read from the transport
    uint64_t queue_overflows{0};   ///< Packets evicted because the delivery queue was full
    uint64_t resync_bytes{0};      ///< Non-START bytes skipped while hunting for a frame
    uint64_t send_errors{0};       ///< Transport write failures
};

struct Stats {
    std::atomic<uint64_t> packets_sent{0};
    std::atomic<uint64_t> packets_received{0};
    std::atomic<uint64_t> crc_errors{0};
    std::atomic<uint64_t> frame_errors{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> queue_overflows{0};
    std::atomic<uint64_t> resync_bytes{0};
    std::atomic<uint64_t> send_errors{0};

    static void bump(std::atomic<uint64_t>& c, uint64_t n = 1) {
        c.fetch_add(n, std::memory_order_relaxed);
    }

    StatsSnapshot snapshot() const {
        StatsSnapshot s;
        s.packets_sent     = packets_sent.load(std::memory_order_relaxed);
        s.packets_received = packets_received.load(std::memory_order_relaxed);
        s.crc_errors       = crc_errors.load(std::memory_order_relaxed);
        s.frame_errors     = frame_errors.load(std::memory_order_relaxed);
        s.bytes_received   = bytes_received.load(std::memory_order_relaxed);
        s.queue_overflows  = queue_overflows.load(std::memory_order_relaxed);
        s.resync_bytes     = resync_bytes.load(std::memory_order_relaxed);
        s.send_errors      = send_errors.load(std::memory_order_relaxed);
        return s;
    }
};

} // namespace zetta
