#ifndef LANWATCH_CANCEL_HPP
#define LANWATCH_CANCEL_HPP

#include <atomic>

// Cancellation request shared between a scan and whoever may interrupt it.
// fd() becomes readable once cancel() has been called so that blocking
// phases can include it in a poll set.
class CancelSignal {
  private:
    int event_{-1};
    std::atomic<bool> flag_{false};

  public:
    CancelSignal();
    CancelSignal(const CancelSignal&) = delete;
    CancelSignal(CancelSignal&&) = delete;
    ~CancelSignal();
    CancelSignal& operator=(const CancelSignal&) = delete;
    CancelSignal& operator=(CancelSignal&&) = delete;

    // async-signal-safe
    void cancel() noexcept;

    bool cancelled() const noexcept;
    int fd() const noexcept;

    // clears a previous request so the signal can guard another run
    void reset() noexcept;
};

#endif
