#include <lanwatch/name_resolver.hpp>
#include <lanwatch/utils.hpp>

#include <spdlog/spdlog.h>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <exception>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>

std::optional<std::string> DnsLookup::reverse(const IPv4& addr) {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    std::memcpy(&sa.sin_addr.s_addr, addr.data(), addr.size());

    // runs on a lookup thread that may outlive the logger, so errors are
    // reported to the waiting side instead of logged here
    char host[NI_MAXHOST];
    auto rc = getnameinfo(reinterpret_cast<const sockaddr*>(&sa), sizeof(sa),
        host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    if (rc == EAI_NONAME) {
        return std::nullopt;
    } else if (rc != 0) {
        throw std::runtime_error(gai_strerror(rc));
    }
    return std::string(host);
}

bool LookupSlots::acquire_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock{mut_};
    if (!freed_.wait_until(lock, deadline, [this] { return used_ < limit_; })) {
        return false;
    }
    ++used_;
    return true;
}

void LookupSlots::release() noexcept {
    {
        std::lock_guard<std::mutex> lock{mut_};
        --used_;
    }
    freed_.notify_all();
}

size_t LookupSlots::in_flight() {
    std::lock_guard<std::mutex> lock{mut_};
    return used_;
}

bool LookupSlots::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock{mut_};
    return freed_.wait_for(lock, timeout, [this] { return used_ == 0; });
}

NameResolver::NameResolver(std::shared_ptr<HostLookup> lookup, size_t workers)
    : lookup_(std::move(lookup)),
      workers_(std::max<size_t>(workers, 1)),
      slots_(std::make_shared<LookupSlots>(workers_)) {}

std::optional<std::string> NameResolver::lookup_one(const IPv4& addr,
                                                    std::chrono::steady_clock::time_point deadline) const {
    if (!slots_->acquire_until(deadline)) {
        spdlog::debug("no free lookup slot for {}, {} lookups still running",
            to_string(addr), slots_->in_flight());
        return std::nullopt;
    }

    auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
    auto result = promise->get_future();
    try {
        // the lookup owns its state, so it can outlive an abandoned wait.
        // Nothing in here may log.
        std::thread{[lookup = lookup_, slots = slots_, promise, addr] {
            auto done = finally([&slots] { slots->release(); });
            try {
                promise->set_value(lookup->reverse(addr));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }}.detach();
    } catch (const std::system_error& e) {
        slots_->release();
        spdlog::warn("cannot start lookup of {}: {}", to_string(addr), e.what());
        return std::nullopt;
    }

    if (result.wait_until(deadline) != std::future_status::ready) {
        spdlog::debug("reverse lookup of {} timed out", to_string(addr));
        return std::nullopt;
    }
    try {
        return result.get();
    } catch (const std::exception& e) {
        spdlog::debug("reverse lookup of {} failed: {}", to_string(addr), e.what());
        return std::nullopt;
    }
}

std::vector<WiredHost> NameResolver::enrich_all(std::vector<WiredHost> hosts,
                                                std::chrono::milliseconds per_lookup_timeout,
                                                const CancelSignal* cancel) const {
    if (hosts.empty()) {
        return hosts;
    }

    std::vector<std::optional<std::string>> names(hosts.size());
    std::atomic<size_t> next{0};
    auto work = [&] {
        for (;;) {
            if (cancel != nullptr && cancel->cancelled()) {
                return;
            }
            auto idx = next.fetch_add(1, std::memory_order_relaxed);
            if (idx >= hosts.size()) {
                return;
            }
            // the budget covers waiting for a slot as well as the lookup
            auto deadline = std::chrono::steady_clock::now() + per_lookup_timeout;
            names[idx] = lookup_one(hosts[idx].addr, deadline);
        }
    };

    const auto count = std::min(workers_, hosts.size());
    spdlog::debug("resolving {} hostnames with {} workers", hosts.size(), count);
    std::vector<std::thread> pool;
    pool.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        try {
            pool.emplace_back(work);
        } catch (const std::system_error& e) {
            spdlog::warn("resolver pool limited to {} workers: {}", pool.size(), e.what());
            break;
        }
    }
    if (pool.empty()) {
        work();
    }
    for (auto& worker : pool) {
        worker.join();
    }

    size_t resolved = 0;
    for (size_t i = 0; i < hosts.size(); ++i) {
        if (names[i] && !names[i]->empty()) {
            hosts[i].name = std::move(*names[i]);
            ++resolved;
        } else {
            hosts[i].name = UNRESOLVED_NAME;
        }
    }
    spdlog::info("hostname lookup complete, {} of {} resolved", resolved, hosts.size());
    return hosts;
}
