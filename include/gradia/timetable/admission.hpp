#pragma once

#include <cstddef>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace gradia::timetable {

using boost::asio::awaitable;

struct AdmissionState;

/// One of N process-wide scrape slots. Released on destruction. A slot that
/// outlives its controller (an abandoned coroutine frame torn down with its
/// io_context) releases nothing.
class AdmissionSlot {
public:
    AdmissionSlot() = default;
    ~AdmissionSlot();

    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;
    AdmissionSlot(AdmissionSlot&& other) noexcept;
    AdmissionSlot& operator=(AdmissionSlot&& other) noexcept;

    [[nodiscard]] auto held() const -> bool { return !state_.expired(); }
    void release() noexcept;

private:
    friend class AdmissionController;
    explicit AdmissionSlot(std::weak_ptr<AdmissionState> state) : state_(std::move(state)) {}

    std::weak_ptr<AdmissionState> state_;
};

/// Counting gate in front of the scrape pipeline. Callers beyond the
/// capacity suspend (in arrival order) until a slot is handed back.
class AdmissionController {
public:
    AdmissionController(boost::asio::any_io_executor executor, size_t slots);
    ~AdmissionController();

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    auto acquire() -> awaitable<AdmissionSlot>;

    [[nodiscard]] auto capacity() const -> size_t;
    [[nodiscard]] auto in_flight() const -> size_t;
    [[nodiscard]] auto waiting() const -> size_t;
    [[nodiscard]] auto peak_in_flight() const -> size_t;

private:
    std::shared_ptr<AdmissionState> state_;
};

} // namespace gradia::timetable
