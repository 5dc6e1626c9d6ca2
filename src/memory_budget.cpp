#include "memory_budget.hpp"
#include "errors.hpp"
#include <iostream>
#include <utility>

namespace roto {

MemoryBudget::MemoryBudget(size_t limit_bytes) : memory_limit_(limit_bytes) {}

void MemoryBudget::track_allocation(const std::string& tag, size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    allocations_[tag] += bytes;
    total_allocated_ += bytes;

    size_t current_total = total_allocated_.load();
    size_t current_peak = peak_usage_.load();

    while (current_total > current_peak &&
           !peak_usage_.compare_exchange_weak(current_peak, current_total)) {
        current_peak = peak_usage_.load();
    }
}

void MemoryBudget::track_deallocation(const std::string& tag, size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = allocations_.find(tag);
    if (it != allocations_.end()) {
        it->second = (it->second >= bytes) ? it->second - bytes : 0;
        if (it->second == 0) {
            allocations_.erase(it);
        }
    }

    total_allocated_ = (total_allocated_ >= bytes) ? total_allocated_ - bytes : 0;
}

size_t MemoryBudget::get_total_allocated() const {
    return total_allocated_.load();
}

size_t MemoryBudget::get_peak_usage() const {
    return peak_usage_.load();
}

size_t MemoryBudget::get_memory_limit() const {
    return memory_limit_.load();
}

std::unordered_map<std::string, size_t> MemoryBudget::get_allocation_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocations_;
}

bool MemoryBudget::is_memory_available(size_t required_bytes) const {
    size_t current_usage = total_allocated_.load();
    size_t limit = memory_limit_.load();

    return required_bytes <= limit && current_usage <= limit - required_bytes;
}

void MemoryBudget::set_memory_limit(size_t limit_bytes) {
    memory_limit_.store(limit_bytes);
    std::cout << "Memory limit set to " << (limit_bytes / (1024 * 1024)) << " MB" << std::endl;
}

void MemoryBudget::log_usage() const {
    std::cout << "Memory in use: " << (get_total_allocated() / (1024 * 1024)) << " MB (peak "
              << (get_peak_usage() / (1024 * 1024)) << " MB)" << std::endl;

    auto stats = get_allocation_stats();
    for (const auto& [tag, bytes] : stats) {
        std::cout << "  " << tag << ": " << (bytes / (1024 * 1024)) << " MB" << std::endl;
    }
}

MemoryBudget::Reservation MemoryBudget::reserve(const std::string& tag, size_t bytes,
                                                const std::string& context) {
    if (!is_memory_available(bytes)) {
        log_usage();
        throw ResourceExhaustedError(
            "Memory budget exceeded for " + tag + ": need " + std::to_string(bytes / (1024 * 1024)) +
            " MB, " + std::to_string(get_total_allocated() / (1024 * 1024)) + " MB of " +
            std::to_string(get_memory_limit() / (1024 * 1024)) + " MB in use (" + context + ")");
    }
    return Reservation(*this, tag, bytes);
}

MemoryBudget::Reservation::Reservation(MemoryBudget& budget, std::string tag, size_t bytes)
    : budget_(&budget), tag_(std::move(tag)), bytes_(bytes) {
    budget_->track_allocation(tag_, bytes_);
}

MemoryBudget::Reservation::Reservation(Reservation&& other) noexcept
    : budget_(other.budget_), tag_(std::move(other.tag_)), bytes_(other.bytes_) {
    other.budget_ = nullptr;
    other.bytes_ = 0;
}

MemoryBudget::Reservation::~Reservation() {
    if (budget_) {
        budget_->track_deallocation(tag_, bytes_);
    }
}

} // namespace roto
