#pragma once

#include "cloudup/auth/credential.hpp"
#include "cloudup/auth/token_exchanger.hpp"
#include "cloudup/core/result.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cloudup::auth {

/**
 * @brief Owns one backend login's credential and keeps it fresh
 *
 * THREAD SAFETY:
 * - Any number of upload sessions may share one TokenManager
 * - The credential is published as a shared_ptr<const Credential> and
 *   replaced atomically; readers holding an older snapshot keep a valid value
 * - Refreshes are single-flight: callers arriving while a refresh is running
 *   wait for that refresh and receive its result, so the exchanger is called
 *   once per refresh cycle
 *
 * A failed refresh leaves the previous credential in place. current() keeps
 * serving it; ensure_fresh() and force_refresh() report the Auth error.
 */
class TokenManager {
public:
    using NowFn = std::function<Clock::time_point()>;

    TokenManager(std::shared_ptr<TokenExchanger> exchanger,
                 std::string refresh_token,
                 std::optional<Credential> initial = std::nullopt,
                 NowFn now = [] { return Clock::now(); });

    TokenManager(const TokenManager&) = delete;
    TokenManager& operator=(const TokenManager&) = delete;

    /// Latest known credential; exchanges only when none was ever obtained
    Result<Credential> current();

    /// Credential valid for at least `margin`, refreshing if needed
    Result<Credential> ensure_fresh(Clock::duration margin);

    /**
     * @brief Refresh after the remote rejected `rejected`
     *
     * If another caller already replaced that credential, the newer one is
     * returned without a second exchange.
     */
    Result<Credential> force_refresh(const Credential& rejected);

    /// Refresh token to persist (rotated by the provider on refresh)
    [[nodiscard]] std::string refresh_token() const;

    /// Published credential, or nullptr before the first exchange
    [[nodiscard]] std::shared_ptr<const Credential> snapshot() const;

    /// Completed exchanges (successful or not)
    [[nodiscard]] std::uint64_t refresh_count() const;

private:
    using Outcome = Result<Credential>;

    /**
     * Join the running refresh or start one. `still_valid` is evaluated under
     * the lock against the published credential; when it returns true no
     * exchange is made.
     */
    Outcome refresh_single_flight(const std::function<bool(const std::shared_ptr<const Credential>&)>& still_valid);

    Outcome run_exchange(const std::string& refresh_token);

    std::shared_ptr<TokenExchanger> exchanger_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::shared_ptr<const Credential> credential_;  // read with std::atomic_load
    std::string refresh_token_;
    std::optional<std::shared_future<Outcome>> in_flight_;
    std::uint64_t refresh_count_ = 0;
};

} // namespace cloudup::auth
