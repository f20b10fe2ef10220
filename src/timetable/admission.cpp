#include "gradia/timetable/admission.hpp"
#include "gradia/core/logger.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <atomic>
#include <utility>

namespace gradia::timetable {

namespace net = boost::asio;

// A buffered channel of capacity N acts as the semaphore: a send takes a
// slot (and waits while the buffer is full), a receive gives one back.
struct AdmissionState {
    size_t capacity;
    net::experimental::concurrent_channel<void(boost::system::error_code)> channel;
    std::atomic<size_t> in_flight{0};
    std::atomic<size_t> waiting{0};
    std::atomic<size_t> peak{0};

    AdmissionState(net::any_io_executor executor, size_t slots)
        : capacity(slots), channel(executor, slots) {}

    void record_admitted() {
        auto now = in_flight.fetch_add(1) + 1;
        auto prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
    }

    void give_back() noexcept {
        channel.try_receive([](boost::system::error_code) {});
        in_flight.fetch_sub(1);
    }
};

// ---------------------------------------------------------------------------
// AdmissionSlot
// ---------------------------------------------------------------------------

AdmissionSlot::~AdmissionSlot() {
    release();
}

AdmissionSlot::AdmissionSlot(AdmissionSlot&& other) noexcept
    : state_(std::exchange(other.state_, {})) {}

AdmissionSlot& AdmissionSlot::operator=(AdmissionSlot&& other) noexcept {
    if (this != &other) {
        release();
        state_ = std::exchange(other.state_, {});
    }
    return *this;
}

void AdmissionSlot::release() noexcept {
    if (auto state = std::exchange(state_, {}).lock()) {
        state->give_back();
    }
}

// ---------------------------------------------------------------------------
// AdmissionController
// ---------------------------------------------------------------------------

AdmissionController::AdmissionController(net::any_io_executor executor, size_t slots)
    : state_(std::make_shared<AdmissionState>(std::move(executor), slots)) {
    LOG_DEBUG("AdmissionController created (slots={})", slots);
}

AdmissionController::~AdmissionController() = default;

auto AdmissionController::acquire() -> awaitable<AdmissionSlot> {
    state_->waiting.fetch_add(1);
    try {
        co_await state_->channel.async_send(boost::system::error_code{}, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        state_->waiting.fetch_sub(1);
        LOG_DEBUG("Admission wait aborted: {}", e.what());
        throw;
    }
    state_->waiting.fetch_sub(1);
    state_->record_admitted();
    co_return AdmissionSlot(state_);
}

auto AdmissionController::capacity() const -> size_t {
    return state_->capacity;
}

auto AdmissionController::in_flight() const -> size_t {
    return state_->in_flight.load();
}

auto AdmissionController::waiting() const -> size_t {
    return state_->waiting.load();
}

auto AdmissionController::peak_in_flight() const -> size_t {
    return state_->peak.load();
}

} // namespace gradia::timetable
