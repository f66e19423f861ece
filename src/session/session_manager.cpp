#include "ibcp/session/session_manager.hpp"
#include "ibcp/log/logger.hpp"

#include <stdexcept>

namespace ibcp {

namespace {

const GatewayConfig& config_of(const std::shared_ptr<GatewayTransport>& transport) {
    if (transport == nullptr) {
        throw std::invalid_argument("SessionManager: transport cannot be null");
    }
    return transport->config();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SessionManager::SessionManager(std::shared_ptr<GatewayTransport> transport)
    : SessionManager(
          transport,
          config_of(transport).auth_check_interval,
          config_of(transport).keep_alive_interval)
{}

SessionManager::SessionManager(
    std::shared_ptr<GatewayTransport> transport,
    std::chrono::milliseconds check_interval,
    std::chrono::milliseconds keep_alive_interval
)
    : transport_(std::move(transport))
    , check_interval_(check_interval)
    , keep_alive_interval_(keep_alive_interval)
{
    if (transport_ == nullptr) {
        throw std::invalid_argument("SessionManager: transport cannot be null");
    }
    if (check_interval_.count() < 0 || check_interval_ > kMaxGatewayInterval) {
        throw std::invalid_argument("SessionManager: check_interval must be between 0 and 24h");
    }
    if (keep_alive_interval_.count() <= 0 || keep_alive_interval_ > kMaxGatewayInterval) {
        throw std::invalid_argument("SessionManager: keep_alive_interval must be positive and at most 24h");
    }
}

SessionManager::~SessionManager() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    stop_keep_alive_locked();
}

// ─────────────────────────────────────────────────────────────────────────────
// Adapter Interface
// ─────────────────────────────────────────────────────────────────────────────

GatewayResult<void> SessionManager::ensure_live() {
    std::lock_guard<std::mutex> lock(session_mutex_);

    // Re-tested under the lock: a caller that queued behind another caller's
    // check sees the fresh cache here and does no I/O.
    if (is_stale_locked(std::chrono::steady_clock::now()) == false) {
        return {};
    }
    return check_auth_status_locked();
}

GatewayResult<Json> SessionManager::get_session_info() {
    auto live = ensure_live();
    if (live.has_value() == false) {
        return tl::unexpected(live.error());
    }

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (cached_status_.has_value() == false) {
        return Json::object();
    }
    return cached_status_->raw;
}

void SessionManager::logout() {
    std::lock_guard<std::mutex> lock(session_mutex_);

    stop_keep_alive_locked();

    auto result = transport_->post(kLogoutPath);
    if (result.has_value()) {
        get_logger().info("Session logged out");
    } else {
        get_logger().warn("Logout failed: {}", result.error().message);
    }

    cached_status_.reset();
    transition_to(SessionState::Unchecked);
}

GatewayResult<void> SessionManager::reauthenticate() {
    std::lock_guard<std::mutex> lock(session_mutex_);

    transition_to(SessionState::Reauthenticating);
    auto result = reauthenticate_locked();

    // Whatever happened, the next ensure_live() asks the gateway again
    cached_status_.reset();
    if (result.has_value() == false) {
        transition_to(SessionState::Failed);
    }
    transition_to(SessionState::Unchecked);
    return result;
}

GatewayResult<void> SessionManager::reauthenticate_locked() {
    auto result = transport_->post(kReauthenticatePath);
    if (result.has_value() == false) {
        get_logger().error("Reauthentication failed: {}", result.error().message);
        return tl::unexpected(GatewayError::reauthentication_failed(result.error().message));
    }

    get_logger().info("Reauthentication result: {}", result->dump());
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Observation
// ─────────────────────────────────────────────────────────────────────────────

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<AuthStatus> SessionManager::cached_status() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return cached_status_;
}

bool SessionManager::keep_alive_running() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return (keep_alive_ != nullptr) && keep_alive_->is_running();
}

std::size_t SessionManager::keep_alive_pings() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (keep_alive_ == nullptr) {
        return 0;
    }
    return keep_alive_->ping_count();
}

void SessionManager::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_callbacks_.push_back(std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// Status Check
// ─────────────────────────────────────────────────────────────────────────────

bool SessionManager::is_stale_locked(std::chrono::steady_clock::time_point now) const {
    if (cached_status_.has_value() == false) {
        return true;
    }
    return (now - cached_status_->checked_at) >= check_interval_;
}

GatewayResult<void> SessionManager::check_auth_status_locked() {
    transition_to(SessionState::Checking);

    auto status = fetch_auth_status();

    // Only a transport-level 401 earns a re-authentication, and only one:
    // the status check after it is final whatever it returns.
    const bool got_401 = (status.has_value() == false) &&
                         (status.error().code == GatewayError::Code::AuthenticationRequired) &&
                         (status.error().http_status == 401);
    if (got_401) {
        get_logger().info("Auth status returned 401, attempting to reauthenticate");
        transition_to(SessionState::Reauthenticating);

        auto reauth = reauthenticate_locked();
        if (reauth.has_value() == false) {
            cached_status_.reset();
            transition_to(SessionState::Failed);
            transition_to(SessionState::Unchecked);
            return tl::unexpected(reauth.error());
        }

        transition_to(SessionState::Checking);
        status = fetch_auth_status();
        if (status.has_value() == false) {
            get_logger().error("Auth status still failing after reauthentication: {}",
                status.error().message);
            status = tl::unexpected(GatewayError::reauthentication_failed(status.error().message));
        }
    }

    if (status.has_value() == false) {
        cached_status_.reset();
        transition_to(SessionState::Failed);
        transition_to(SessionState::Unchecked);
        return tl::unexpected(status.error());
    }

    store_status_locked(std::move(*status));
    start_keep_alive_locked();
    transition_to(SessionState::Fresh);
    return {};
}

GatewayResult<AuthStatus> SessionManager::fetch_auth_status() {
    auto payload = transport_->post(kAuthStatusPath);
    if (payload.has_value() == false) {
        return tl::unexpected(payload.error());
    }

    AuthStatus status;
    status.checked_at = std::chrono::steady_clock::now();
    status.raw = std::move(*payload);

    // A missing or non-boolean flag counts as not authenticated
    const auto flag = status.raw.is_object() ? status.raw.find("authenticated") : status.raw.end();
    status.authenticated = (flag != status.raw.end()) && flag->is_boolean() && flag->get<bool>();

    if (status.authenticated == false) {
        get_logger().warn("Session not authenticated");
        return tl::unexpected(GatewayError::authentication_required(
            "Session not authenticated. Please log in through the IB Gateway.",
            std::nullopt));
    }

    get_logger().debug("Auth status: {}", status.raw.dump());
    return status;
}

void SessionManager::store_status_locked(AuthStatus status) {
    cached_status_ = std::move(status);
}

// ─────────────────────────────────────────────────────────────────────────────
// Keep-Alive
// ─────────────────────────────────────────────────────────────────────────────

void SessionManager::start_keep_alive_locked() {
    if (keep_alive_ != nullptr) {
        return;
    }
    keep_alive_ = std::make_unique<KeepAliveTask>(keep_alive_interval_, [this](KeepAliveTask& task) {
        tickle(task);
    });
    keep_alive_->start();
}

void SessionManager::stop_keep_alive_locked() {
    if (keep_alive_ == nullptr) {
        return;
    }
    keep_alive_->stop();
    keep_alive_.reset();
}

void SessionManager::tickle(KeepAliveTask& task) {
    // Backoff waits end as soon as the task is stopped
    auto result = transport_->request(HttpMethod::Post, kTicklePath, {}, std::nullopt,
        [&task](std::chrono::milliseconds delay) {
            return task.wait_for_stop(delay) == false;
        });
    if (result.has_value() == false) {
        if (result.error().code == GatewayError::Code::Cancelled) {
            get_logger().debug("Keep-alive tickle abandoned: {}", result.error().message);
            return;
        }
        get_logger().warn("Keep-alive tickle failed: {}", result.error().message);
        return;
    }
    get_logger().debug("Keep-alive tickle sent");
}

// ─────────────────────────────────────────────────────────────────────────────
// State
// ─────────────────────────────────────────────────────────────────────────────

void SessionManager::transition_to(SessionState new_state) {
    SessionState old_state;
    std::vector<StateChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        old_state = state_;
        if (old_state == new_state) {
            return;
        }
        state_ = new_state;
        callbacks = state_callbacks_;
    }

    get_logger().debug("Session state: {} -> {}", to_string(old_state), to_string(new_state));
    for (const auto& callback : callbacks) {
        callback(old_state, new_state);
    }
}

}  // namespace ibcp
