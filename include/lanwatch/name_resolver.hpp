#ifndef LANWATCH_NAME_RESOLVER_HPP
#define LANWATCH_NAME_RESOLVER_HPP

#include <lanwatch/cancel.hpp>
#include <lanwatch/snapshot.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// A single blocking reverse lookup. Implementations may block indefinitely;
// the caller enforces the time limit.
class HostLookup {
  public:
    virtual ~HostLookup() = default;

    virtual std::optional<std::string> reverse(const IPv4& addr) = 0;
};

// reverse DNS through the system resolver (getnameinfo). A missing PTR
// record is nullopt; any other resolver error throws std::runtime_error.
class DnsLookup : public HostLookup {
  public:
    std::optional<std::string> reverse(const IPv4& addr) override;
};

// Counts the lookup threads alive, abandoned ones included, against a
// fixed limit. Shared with every lookup thread so it outlives the resolver.
class LookupSlots {
  private:
    std::mutex mut_;
    std::condition_variable freed_;
    size_t used_{0};
    size_t limit_;

  public:
    explicit LookupSlots(size_t limit) : limit_(limit) {}

    bool acquire_until(std::chrono::steady_clock::time_point deadline);
    void release() noexcept;
    size_t in_flight();

    // returns true if every slot was released before the timeout
    bool wait_idle(std::chrono::milliseconds timeout);
};

// Annotates hosts with names using a bounded pool of workers. Every lookup
// gets its own time budget; a lookup that fails or runs out of time is
// abandoned and the host is named UNRESOLVED_NAME. No more than `workers`
// lookups are ever alive at once; an abandoned lookup holds its slot until it
// returns, and a host that cannot get a slot within its budget is unresolved.
class NameResolver {
  private:
    std::shared_ptr<HostLookup> lookup_;
    size_t workers_;
    std::shared_ptr<LookupSlots> slots_;

    std::optional<std::string> lookup_one(const IPv4& addr,
                                          std::chrono::steady_clock::time_point deadline) const;

  public:
    NameResolver(std::shared_ptr<HostLookup> lookup, size_t workers);

    // hosts are returned in the order given
    std::vector<WiredHost> enrich_all(std::vector<WiredHost> hosts,
                                      std::chrono::milliseconds per_lookup_timeout,
                                      const CancelSignal* cancel = nullptr) const;

    // lookups still running, including ones abandoned by an earlier batch
    size_t in_flight() const { return slots_->in_flight(); }

    // waits up to `timeout` for abandoned lookups to return
    bool wait_idle(std::chrono::milliseconds timeout) const { return slots_->wait_idle(timeout); }
};

#endif
