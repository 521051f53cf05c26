#ifndef LANWATCH_ORCHESTRATOR_HPP
#define LANWATCH_ORCHESTRATOR_HPP

#include <lanwatch/ble_scanner.hpp>
#include <lanwatch/cancel.hpp>
#include <lanwatch/config.hpp>
#include <lanwatch/name_resolver.hpp>
#include <lanwatch/prober.hpp>
#include <lanwatch/snapshot.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

enum class ScanState {
    idle,
    range_resolving,
    probing,
    name_enriching,
    short_range_scanning,
    complete,
    failed
};

enum class ScanError {
    not_elevated,
    range_not_found,
    cancelled
};

const char* state_name(ScanState state) noexcept;
const char* describe(ScanError error) noexcept;

struct ScanFailure {
    ScanError error;
    std::string reason;
};

using ScanOutcome = std::variant<ResultSnapshot, ScanFailure>;

struct Collaborators {
    std::function<bool()> privilege_gate;
    std::function<std::string()> config_text;
    std::unique_ptr<Prober> prober;
    std::shared_ptr<HostLookup> lookup;
    // null disables short-range scanning
    std::unique_ptr<BleScanner> ble;
};

// Runs one discovery pass: range detection, link-layer probing, hostname
// enrichment and the short-range scan, then assembles a snapshot. Only a
// missing privilege, an undetectable range or cancellation fail a run;
// everything else degrades into the snapshot. Runs are independent of each
// other and must not overlap.
class ScanOrchestrator {
  private:
    Config config_;
    std::function<bool()> privilege_gate_;
    std::function<std::string()> config_text_;
    std::unique_ptr<Prober> prober_;
    NameResolver names_;
    std::unique_ptr<ShortRangeScanner> short_range_;
    CancelSignal cancel_;
    std::atomic<ScanState> state_{ScanState::idle};

    void transition(ScanState state);
    ScanFailure fail(ScanError error, std::string reason);
    std::optional<NetworkRange> resolve_range();
    std::optional<std::vector<ShortRangeDevice>> scan_short_range();

  public:
    ScanOrchestrator(const Config& config, Collaborators collaborators);
    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator(ScanOrchestrator&&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(ScanOrchestrator&&) = delete;

    ScanOutcome run_scan();

    // async-signal-safe; the running scan stops at its next phase boundary
    void cancel() noexcept;

    ScanState state() const noexcept;

    // waits up to `timeout` for hostname lookups abandoned by earlier runs
    bool wait_for_lookups(std::chrono::milliseconds timeout) const;
};

// Hands a signal handler the orchestrator of the running scan. Whoever swaps
// in the detached marker first owns the pointer: either the handler, which
// cancels the scan, or detach(), after which the orchestrator may be
// destroyed. attach() fails if a signal arrived before the scan started.
class CancelRelay {
  private:
    std::atomic<ScanOrchestrator*> target_{nullptr};
    std::atomic<bool> delivered_{false};

  public:
    bool attach(ScanOrchestrator& orchestrator) noexcept;

    // async-signal-safe
    void deliver() noexcept;

    // returns once no delivery can still reach the attached orchestrator
    void detach() noexcept;
};

#endif
