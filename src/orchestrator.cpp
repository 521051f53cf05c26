#include <lanwatch/orchestrator.hpp>
#include <lanwatch/range_resolver.hpp>
#include <lanwatch/utils.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>
#include <thread>

static std::chrono::milliseconds to_millis(float seconds) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<float>(seconds));
}

const char* state_name(ScanState state) noexcept {
    switch (state) {
        case ScanState::idle:
            return "idle";
        case ScanState::range_resolving:
            return "range resolving";
        case ScanState::probing:
            return "probing";
        case ScanState::name_enriching:
            return "name enriching";
        case ScanState::short_range_scanning:
            return "short-range scanning";
        case ScanState::complete:
            return "complete";
        case ScanState::failed:
            return "failed";
    }
    return "unknown";
}

const char* describe(ScanError error) noexcept {
    switch (error) {
        case ScanError::not_elevated:
            return "administrator/root privileges are required";
        case ScanError::range_not_found:
            return "could not determine the local network range";
        case ScanError::cancelled:
            return "scan cancelled";
    }
    return "unknown error";
}

ScanOrchestrator::ScanOrchestrator(const Config& config, Collaborators collaborators)
    : config_(config),
      privilege_gate_(std::move(collaborators.privilege_gate)),
      config_text_(std::move(collaborators.config_text)),
      prober_(std::move(collaborators.prober)),
      names_(std::move(collaborators.lookup), static_cast<size_t>(std::max(config.lookup_workers, 1))) {
    if (collaborators.ble && config_.ble) {
        short_range_ = std::make_unique<ShortRangeScanner>(std::move(collaborators.ble));
    }
}

void ScanOrchestrator::transition(ScanState state) {
    auto prev = state_.exchange(state, std::memory_order_relaxed);
    spdlog::debug("scan state: {} -> {}", state_name(prev), state_name(state));
}

ScanFailure ScanOrchestrator::fail(ScanError error, std::string reason) {
    transition(ScanState::failed);
    if (error == ScanError::cancelled) {
        spdlog::warn("{}", reason);
    } else {
        spdlog::error("{}", reason);
    }
    return ScanFailure{error, std::move(reason)};
}

std::optional<NetworkRange> ScanOrchestrator::resolve_range() {
    if (!config_.range.empty()) {
        auto range = NetworkRange::parse(config_.range);
        if (!range) {
            spdlog::error("invalid network range '{}'", config_.range);
        }
        return range;
    }
    if (!config_text_) {
        return std::nullopt;
    }
    auto text = config_text_();
    auto resolver = make_range_resolver(text);
    spdlog::debug("parsing interface configuration as {}", resolver->dialect());
    return resolver->resolve(text);
}

std::optional<std::vector<ShortRangeDevice>> ScanOrchestrator::scan_short_range() {
    try {
        return short_range_->scan(to_millis(config_.ble_timeout), &cancel_);
    } catch (const std::exception& e) {
        spdlog::warn("bluetooth scan failed: {}", e.what());
        return std::nullopt;
    }
}

ScanOutcome ScanOrchestrator::run_scan() {
    cancel_.reset();
    transition(ScanState::idle);
    std::vector<std::string> warnings;

    transition(ScanState::range_resolving);
    spdlog::info("finding network range");
    auto range = resolve_range();
    if (!range) {
        return fail(ScanError::range_not_found, describe(ScanError::range_not_found));
    }
    spdlog::info("network range: {}", range->to_string());
    if (cancel_.cancelled()) {
        return fail(ScanError::cancelled, describe(ScanError::cancelled));
    }

    if (!privilege_gate_ || !privilege_gate_()) {
        return fail(ScanError::not_elevated, describe(ScanError::not_elevated));
    }
    transition(ScanState::probing);

    // the short-range scan has no data dependency on the wired phases
    std::optional<std::vector<ShortRangeDevice>> devices;
    std::thread short_range_worker;
    if (short_range_ && !config_.sequential) {
        try {
            short_range_worker = std::thread{[this, &devices] { devices = scan_short_range(); }};
        } catch (const std::system_error& e) {
            spdlog::warn("running the bluetooth scan after the network scan: {}", e.what());
        }
    }
    auto join = finally([&short_range_worker] {
        if (short_range_worker.joinable()) {
            short_range_worker.join();
        }
    });

    std::vector<WiredHost> hosts;
    if (prober_) {
        auto probed = prober_->probe(*range, to_millis(config_.probe_timeout), &cancel_);
        for (auto& warning : probed.warnings) {
            spdlog::warn("link-layer probe: {}", warning);
            warnings.push_back(fmt::format("link-layer probe: {}", warning));
        }
        hosts = std::move(probed.hosts);
    }
    if (cancel_.cancelled()) {
        return fail(ScanError::cancelled, describe(ScanError::cancelled));
    }

    transition(ScanState::name_enriching);
    hosts = names_.enrich_all(std::move(hosts), to_millis(config_.lookup_timeout), &cancel_);
    if (cancel_.cancelled()) {
        return fail(ScanError::cancelled, describe(ScanError::cancelled));
    }

    transition(ScanState::short_range_scanning);
    if (short_range_) {
        if (short_range_worker.joinable()) {
            short_range_worker.join();
        } else {
            devices = scan_short_range();
        }
        if (!devices) {
            spdlog::warn("bluetooth adapter unavailable, is bluetooth turned on?");
            warnings.push_back("short-range scan: adapter unavailable");
        }
    }
    if (cancel_.cancelled()) {
        return fail(ScanError::cancelled, describe(ScanError::cancelled));
    }

    transition(ScanState::complete);
    return ResultSnapshot{
        std::move(hosts),
        devices ? std::move(*devices) : std::vector<ShortRangeDevice>{},
        *range,
        std::chrono::system_clock::now(),
        std::move(warnings)
    };
}

void ScanOrchestrator::cancel() noexcept {
    cancel_.cancel();
}

ScanState ScanOrchestrator::state() const noexcept {
    return state_.load(std::memory_order_relaxed);
}

bool ScanOrchestrator::wait_for_lookups(std::chrono::milliseconds timeout) const {
    return names_.wait_idle(timeout);
}

static ScanOrchestrator* const DETACHED = reinterpret_cast<ScanOrchestrator*>(1);

bool CancelRelay::attach(ScanOrchestrator& orchestrator) noexcept {
    ScanOrchestrator* tmp = nullptr;
    return target_.compare_exchange_strong(tmp, &orchestrator);
}

void CancelRelay::deliver() noexcept {
    auto orchestrator = target_.exchange(DETACHED);
    if (orchestrator != nullptr && orchestrator != DETACHED) {
        orchestrator->cancel();
        delivered_.store(true);
    }
}

void CancelRelay::detach() noexcept {
    if (target_.exchange(DETACHED) == DETACHED) {
        // a handler took the pointer and may still be using it
        while (!delivered_.load()) {
            std::this_thread::yield();
        }
    }
}
