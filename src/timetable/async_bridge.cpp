#include "gradia/timetable/async_bridge.hpp"
#include "gradia/core/logger.hpp"

namespace gradia::timetable {

AsyncBridge::AsyncBridge(size_t threads)
    : threads_(threads), pool_(threads) {
    LOG_DEBUG("AsyncBridge started ({} worker threads)", threads);
}

AsyncBridge::~AsyncBridge() {
    join();
}

void AsyncBridge::join() {
    pool_.join();
}

} // namespace gradia::timetable
