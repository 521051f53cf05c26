#include <lanwatch/cancel.hpp>

#include <spdlog/spdlog.h>

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

CancelSignal::CancelSignal() : event_(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
    if (event_ < 0) {
        spdlog::warn("failed to create cancel event, cancellation only takes effect at phase boundaries: {}",
            strerror(errno));
    }
}

CancelSignal::~CancelSignal() {
    if (event_ >= 0) {
        close(event_);
        event_ = -1;
    }
}

void CancelSignal::cancel() noexcept {
    flag_.store(true, std::memory_order_relaxed);
    if (event_ >= 0) {
        const uint64_t value = 1;
        // nothing useful can be done about a failed write from a signal handler
        auto rc = write(event_, &value, sizeof(value));
        static_cast<void>(rc);
    }
}

bool CancelSignal::cancelled() const noexcept {
    return flag_.load(std::memory_order_relaxed);
}

int CancelSignal::fd() const noexcept {
    return event_;
}

void CancelSignal::reset() noexcept {
    flag_.store(false, std::memory_order_relaxed);
    if (event_ >= 0) {
        uint64_t value = 0;
        auto rc = read(event_, &value, sizeof(value));
        static_cast<void>(rc);
    }
}
