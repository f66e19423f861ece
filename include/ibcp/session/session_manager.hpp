#pragma once

#include "ibcp/session/keep_alive.hpp"
#include "ibcp/transport/gateway_transport.hpp"
#include "ibcp/transport/transport_error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace ibcp {

// ─────────────────────────────────────────────────────────────────────────────
// Session State
// ─────────────────────────────────────────────────────────────────────────────
///
///   ┌───────────┐  ensure_live()   ┌──────────┐   authenticated   ┌───────┐
///   │ Unchecked │ ───────────────▶ │ Checking │ ────────────────▶ │ Fresh │
///   └───────────┘                  └──────────┘                   └───┬───┘
///         ▲                         │  ▲    │                         │
///         │                     401 │  │ ok │ error          interval │
///         │                         ▼  │    ▼                 elapsed │
///         │              ┌──────────────────┐ ┌────────┐              │
///         │              │ Reauthenticating │▶│ Failed │              │
///         │              └──────────────────┘ └───┬────┘              │
///         └───────────────────────────────────────┘   Checking ◀──────┘
///
/// Failed is reported for the failing call only. The cached status is dropped
/// and the session falls back to Unchecked right after.
enum class SessionState {
    Unchecked,
    Fresh,
    Checking,
    Reauthenticating,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Unchecked:        return "Unchecked";
        case SessionState::Fresh:            return "Fresh";
        case SessionState::Checking:         return "Checking";
        case SessionState::Reauthenticating: return "Reauthenticating";
        case SessionState::Failed:           return "Failed";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// AuthStatus
// ─────────────────────────────────────────────────────────────────────────────
// Snapshot of /iserver/auth/status. Replaced wholesale by each check.

struct AuthStatus {
    bool authenticated{false};
    Json raw = Json::object();
    std::chrono::steady_clock::time_point checked_at{};
};

// ─────────────────────────────────────────────────────────────────────────────
// SessionManager
// ─────────────────────────────────────────────────────────────────────────────

/// Owns the authentication state of one gateway session.
///
/// One instance per gateway, shared by every adapter. ensure_live() is
/// single-flight: concurrent callers serialise on one lock and re-test the
/// cache after acquiring it, so a burst of callers costs one status request.
/// After the first successful check a keep-alive thread pings /tickle every
/// keep_alive_interval until logout() or destruction. A tickle that is
/// waiting between retries is abandoned as soon as the keep-alive stops.
///
/// State-change callbacks run on the calling thread, outside the state lock
/// but possibly while a check is in progress; they must not call
/// ensure_live(), get_session_info() or logout().
///
/// Usage:
///   auto transport = std::make_shared<GatewayTransport>(config);
///   auto session = std::make_shared<SessionManager>(transport);
///
///   if (auto live = session->ensure_live(); !live) {
///       // live.error().code == AuthenticationRequired / ReauthenticationFailed
///   }
///   ...
///   session->logout();
class SessionManager {
public:
    using StateChangeCallback = std::function<void(SessionState old_state, SessionState new_state)>;

    // Gateway endpoints
    static constexpr const char* kAuthStatusPath = "/iserver/auth/status";
    static constexpr const char* kReauthenticatePath = "/iserver/reauthenticate";
    static constexpr const char* kTicklePath = "/tickle";
    static constexpr const char* kLogoutPath = "/logout";

    /// Intervals come from transport->config().
    explicit SessionManager(std::shared_ptr<GatewayTransport> transport);

    /// Throws std::invalid_argument for a null transport, a check interval
    /// outside [0, 24h] or a keep-alive interval outside (0, 24h].
    SessionManager(
        std::shared_ptr<GatewayTransport> transport,
        std::chrono::milliseconds check_interval,
        std::chrono::milliseconds keep_alive_interval
    );

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) = delete;
    SessionManager& operator=(SessionManager&&) = delete;

    /// Stops the keep-alive thread. Does not call /logout.
    ~SessionManager();

    // ─────────────────────────────────────────────────────────────────────────
    // Adapter interface
    // ─────────────────────────────────────────────────────────────────────────

    /// Make sure the session was confirmed authenticated within
    /// check_interval, checking (and re-authenticating once) if not.
    [[nodiscard]] GatewayResult<void> ensure_live();

    /// ensure_live(), then the cached status payload ({} if none).
    [[nodiscard]] GatewayResult<Json> get_session_info();

    /// Cancel keep-alive and wait for it, tell the gateway (best effort),
    /// then drop the cached status. Never fails; safe to call repeatedly.
    void logout();

    /// Explicit POST /iserver/reauthenticate. Any failure is
    /// ReauthenticationFailed. Drops the cached status either way, so the
    /// next ensure_live() re-checks.
    [[nodiscard]] GatewayResult<void> reauthenticate();

    // ─────────────────────────────────────────────────────────────────────────
    // Observation
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] SessionState state() const;

    [[nodiscard]] std::optional<AuthStatus> cached_status() const;

    [[nodiscard]] bool keep_alive_running() const;

    /// Pings sent by the current keep-alive task (0 if none).
    [[nodiscard]] std::size_t keep_alive_pings() const;

    [[nodiscard]] std::chrono::milliseconds check_interval() const noexcept { return check_interval_; }
    [[nodiscard]] std::chrono::milliseconds keep_alive_interval() const noexcept { return keep_alive_interval_; }

    void on_state_change(StateChangeCallback callback);

private:
    // All *_locked helpers require session_mutex_
    [[nodiscard]] bool is_stale_locked(std::chrono::steady_clock::time_point now) const;
    [[nodiscard]] GatewayResult<void> check_auth_status_locked();
    [[nodiscard]] GatewayResult<void> reauthenticate_locked();
    [[nodiscard]] GatewayResult<AuthStatus> fetch_auth_status();
    void store_status_locked(AuthStatus status);
    void start_keep_alive_locked();
    void stop_keep_alive_locked();
    void tickle(KeepAliveTask& task);

    void transition_to(SessionState new_state);

    std::shared_ptr<GatewayTransport> transport_;
    const std::chrono::milliseconds check_interval_;
    const std::chrono::milliseconds keep_alive_interval_;

    // Serialises checks, re-authentication and logout; guards the cache and
    // the keep-alive handle.
    mutable std::mutex session_mutex_;
    std::optional<AuthStatus> cached_status_;
    std::unique_ptr<KeepAliveTask> keep_alive_;

    // Guards state_ and callbacks only, never held across I/O
    mutable std::mutex state_mutex_;
    SessionState state_{SessionState::Unchecked};
    std::vector<StateChangeCallback> state_callbacks_;
};

}  // namespace ibcp
