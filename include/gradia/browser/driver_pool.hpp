#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "gradia/browser/engine.hpp"
#include "gradia/core/error.hpp"

namespace gradia::browser {

enum class LeaseState {
    Free,
    Leased,
    Doomed,
};

auto to_string(LeaseState state) -> std::string_view;

/// One live engine instance owned by the pool.
struct Handle {
    std::string id;
    int64_t created_at_ms = 0;
    LeaseState state = LeaseState::Free;
    std::chrono::milliseconds navigation_timeout{10000};
    std::unique_ptr<Driver> driver;
};

struct PoolOptions {
    size_t max_handles = 5;
    std::chrono::milliseconds navigation_timeout{10000};
    LaunchOptions launch;
};

struct PoolStats {
    uint64_t created = 0;
    uint64_t destroyed = 0;
    uint64_t launch_failures = 0;
    size_t peak_active = 0;
};

class DriverPool;

/// Exclusive ownership of one leased handle. Releasing (explicitly or on
/// destruction) always destroys the underlying engine instance.
/// A lease must not outlive the pool that issued it.
class Lease {
public:
    Lease() = default;
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    [[nodiscard]] auto valid() const -> bool { return handle_ != nullptr; }
    [[nodiscard]] auto id() const -> std::string_view;
    [[nodiscard]] auto navigation_timeout() const -> std::chrono::milliseconds;
    [[nodiscard]] auto driver() -> Driver&;

    /// Hand the handle back now instead of at scope exit.
    void release();

private:
    friend class DriverPool;
    Lease(DriverPool* pool, std::shared_ptr<Handle> handle);

    DriverPool* pool_ = nullptr;
    std::shared_ptr<Handle> handle_;
};

/// Bounded owner of engine instances.
///
/// acquire() never blocks on capacity: at the cap it fails with
/// PoolExhausted. Handles are never reused; each lease gets a freshly
/// launched instance that is destroyed when the lease ends.
class DriverPool {
public:
    DriverPool(std::shared_ptr<Engine> engine, PoolOptions options);
    ~DriverPool();

    DriverPool(const DriverPool&) = delete;
    DriverPool& operator=(const DriverPool&) = delete;

    /// Lease a fresh handle. Blocks only for the engine launch itself.
    auto acquire() -> Result<Lease>;

    /// Destroy the leased handle and free its slot. Safe to call twice.
    void release(Lease& lease);

    /// Refuse further leases and force-terminate every tracked handle.
    void shutdown_all();

    [[nodiscard]] auto active_count() const -> size_t;
    [[nodiscard]] auto max_size() const -> size_t;
    [[nodiscard]] auto is_closed() const -> bool;
    [[nodiscard]] auto stats() const -> PoolStats;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gradia::browser
