#include "cloudup/auth/token_manager.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace cloudup::auth {

TokenManager::TokenManager(std::shared_ptr<TokenExchanger> exchanger,
                           std::string refresh_token,
                           std::optional<Credential> initial,
                           NowFn now)
    : exchanger_(std::move(exchanger)),
      now_(std::move(now)),
      refresh_token_(std::move(refresh_token)) {
    if (initial) {
        credential_ = std::make_shared<const Credential>(std::move(*initial));
    }
}

Result<Credential> TokenManager::current() {
    if (auto snap = std::atomic_load(&credential_)) {
        return Ok(*snap);
    }
    return refresh_single_flight([](const std::shared_ptr<const Credential>& published) {
        return published != nullptr;
    });
}

Result<Credential> TokenManager::ensure_fresh(Clock::duration margin) {
    if (auto snap = std::atomic_load(&credential_); snap && !snap->expires_within(margin, now_())) {
        return Ok(*snap);
    }
    return refresh_single_flight([this, margin](const std::shared_ptr<const Credential>& published) {
        return published && !published->expires_within(margin, now_());
    });
}

Result<Credential> TokenManager::force_refresh(const Credential& rejected) {
    return refresh_single_flight([&rejected](const std::shared_ptr<const Credential>& published) {
        return published && published->access_token != rejected.access_token;
    });
}

std::string TokenManager::refresh_token() const {
    std::lock_guard lock(mutex_);
    return refresh_token_;
}

std::shared_ptr<const Credential> TokenManager::snapshot() const {
    return std::atomic_load(&credential_);
}

std::uint64_t TokenManager::refresh_count() const {
    std::lock_guard lock(mutex_);
    return refresh_count_;
}

TokenManager::Outcome TokenManager::refresh_single_flight(
    const std::function<bool(const std::shared_ptr<const Credential>&)>& still_valid) {

    std::promise<Outcome> promise;
    std::shared_future<Outcome> waiter;
    std::string token;
    {
        std::lock_guard lock(mutex_);
        if (in_flight_) {
            waiter = *in_flight_;
        } else {
            if (still_valid(credential_)) {
                return Ok(*credential_);
            }
            in_flight_ = promise.get_future().share();
            token = refresh_token_;
        }
    }

    if (waiter.valid()) {
        return waiter.get();
    }

    Outcome outcome = run_exchange(token);
    {
        std::lock_guard lock(mutex_);
        ++refresh_count_;
        in_flight_.reset();
    }
    promise.set_value(outcome);
    return outcome;
}

TokenManager::Outcome TokenManager::run_exchange(const std::string& refresh_token) {
    std::optional<Result<TokenGrant>> grant;
    try {
        grant.emplace(exchanger_->refresh(refresh_token));
    } catch (const std::exception& e) {
        spdlog::warn("Token exchange threw: {}", e.what());
        return Err<Credential>(Error::auth(std::string("Token refresh failed: ") + e.what()));
    }

    if (grant->is_error()) {
        const Error& cause = grant->error();
        spdlog::warn("Failed to refresh access token: {}", cause.describe());
        if (cause.is(ErrorKind::Auth)) {
            return Err<Credential>(cause);
        }
        return Err<Credential>(Error::auth("Token refresh failed", cause.status_code).caused_by(cause));
    }

    TokenGrant& value = grant->value();
    auto fresh = std::make_shared<const Credential>(
        Credential{std::move(value.access_token), value.expires_at, std::move(value.scheme)});

    std::lock_guard lock(mutex_);
    if (value.refresh_token && !value.refresh_token->empty()) {
        refresh_token_ = std::move(*value.refresh_token);
    }
    std::atomic_store(&credential_, fresh);
    spdlog::debug("Access token refreshed");
    return Ok(*fresh);
}

} // namespace cloudup::auth
