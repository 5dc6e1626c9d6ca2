#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace roto {

// Tracks tagged working-set reservations against a fixed limit.
// One instance per worker process, passed explicitly to the pipeline.
class MemoryBudget {
public:
    explicit MemoryBudget(size_t limit_bytes);

    MemoryBudget(const MemoryBudget&) = delete;
    MemoryBudget& operator=(const MemoryBudget&) = delete;

    // Memory tracking
    void track_allocation(const std::string& tag, size_t bytes);
    void track_deallocation(const std::string& tag, size_t bytes);

    // Memory statistics
    size_t get_total_allocated() const;
    size_t get_peak_usage() const;
    size_t get_memory_limit() const;
    std::unordered_map<std::string, size_t> get_allocation_stats() const;

    bool is_memory_available(size_t required_bytes) const;
    void set_memory_limit(size_t limit_bytes);
    void log_usage() const;

    // Scoped reservation, released on destruction.
    class Reservation {
    public:
        Reservation(MemoryBudget& budget, std::string tag, size_t bytes);
        ~Reservation();

        Reservation(Reservation&& other) noexcept;
        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;
        Reservation& operator=(Reservation&&) = delete;

        size_t bytes() const { return bytes_; }

    private:
        MemoryBudget* budget_;
        std::string tag_;
        size_t bytes_;
    };

    // Throws ResourceExhaustedError (with `context` in the message) when the
    // reservation would exceed the limit.
    Reservation reserve(const std::string& tag, size_t bytes, const std::string& context);

private:
    mutable std::mutex mutex_;
    std::atomic<size_t> total_allocated_{0};
    std::atomic<size_t> peak_usage_{0};
    std::atomic<size_t> memory_limit_;
    std::unordered_map<std::string, size_t> allocations_;
};

} // namespace roto
