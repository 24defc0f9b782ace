#pragma once
#include "icontrol_system.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>

/**
 * @brief In-process point store
 *
 * Serves as the control system for simulations, bench setups behind a
 * PointServer, and tests. Reading an undefined point fails like a
 * disconnected channel would.
 */
class MemoryControlSystem : public IControlSystem {
public:
    /**
     * @brief Define or overwrite a point
     * @param readonly Reject writes through set_single
     */
    void define(const std::string& pv, double value, bool readonly = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        points_[pv] = value;
        if (readonly) {
            readonly_.insert(pv);
        } else {
            readonly_.erase(pv);
        }
    }

    double get_single(const std::string& pv) override {
        std::lock_guard<std::mutex> lock(mutex_);
        reads_.fetch_add(1, std::memory_order_relaxed);
        auto it = points_.find(pv);
        if (it == points_.end()) {
            throw AccessError(AccessErrorKind::CONTROL_SYSTEM_ERROR, "cannot connect to " + pv);
        }
        return it->second;
    }

    void set_single(const std::string& pv, double value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = points_.find(pv);
        if (it == points_.end()) {
            throw AccessError(AccessErrorKind::CONTROL_SYSTEM_ERROR, "cannot connect to " + pv);
        }
        if (readonly_.count(pv)) {
            throw AccessError(AccessErrorKind::READ_ONLY, pv + " is read-only");
        }
        writes_.fetch_add(1, std::memory_order_relaxed);
        it->second = value;
    }

    bool contains(const std::string& pv) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return points_.count(pv) > 0;
    }

    std::uint64_t read_count() const { return reads_.load(std::memory_order_relaxed); }
    std::uint64_t write_count() const { return writes_.load(std::memory_order_relaxed); }

    std::string get_type_name() const override { return "MemoryControlSystem"; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, double> points_;
    std::set<std::string> readonly_;
    std::atomic<std::uint64_t> reads_{0};
    std::atomic<std::uint64_t> writes_{0};
};
