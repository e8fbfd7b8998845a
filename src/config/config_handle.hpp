#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace evo::config {

    // Process-wide holder for the current configuration. Updates never
    // touch a published value: replace() builds a new snapshot and swaps it
    // in, so a reader holding an older snapshot keeps a consistent view.
    template <typename Config>
    class ConfigHandle {
    public:
        explicit ConfigHandle(Config initial, std::string name = "config")
            : name_(std::move(name)),
              current_(std::make_shared<const Config>(std::move(initial))) {}

        ConfigHandle(const ConfigHandle&) = delete;
        ConfigHandle& operator=(const ConfigHandle&) = delete;

        std::shared_ptr<const Config> snapshot() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return current_;
        }

        // Returns the new generation number.
        std::uint64_t replace(Config next) {
            auto fresh = std::make_shared<const Config>(std::move(next));
            std::uint64_t generation = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                current_ = std::move(fresh);
                generation = ++generation_;
            }
            EVO_LOG_INFO(name_ + " replaced, generation " + std::to_string(generation));
            return generation;
        }

        std::uint64_t generation() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return generation_;
        }

    private:
        std::string name_;
        mutable std::mutex mutex_;
        std::shared_ptr<const Config> current_;
        std::uint64_t generation_ = 0;
    };

}  // namespace evo::config
