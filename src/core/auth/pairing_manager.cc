#include <core/auth/pairing_manager.h>
#include <core/constant/protocol.h>
#include <core/security/random.h>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

namespace deckhand::core {

PairingError::PairingError(PairingFailure reason, const std::string& message)
    : std::runtime_error(message)
    , reason_(reason) {}

std::string PairingError::reason_string() const {
    return nlohmann::json(reason_).get<std::string>();
}

PairingManager::PairingManager(TrustStore& store, Now now)
    : store_(store)
    , now_(std::move(now)) {}

void PairingManager::SetCodeCallback(CodeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    code_callback_ = std::move(callback);
}

// mutex_ must be held
bool PairingManager::lockedOut(Clock::time_point now) const {
    return locked_until_ && now < *locked_until_;
}

// mutex_ must be held
void PairingManager::registerFailure(Clock::time_point now) {
    pending_.reset();
    if (++failed_attempts_ >= pairing::kMaxFailedAttempts) {
        locked_until_ = now + pairing::kLockoutDuration;
        failed_attempts_ = 0;
        spdlog::warn("Too many failed pairing attempts, pairing locked for {} minutes",
                     pairing::kLockoutDuration.count());
    }
}

std::string PairingManager::GenerateCode(const std::string& hub_id,
                                         const std::string& hub_name,
                                         const std::string& platform) {
    CodeCallback callback;
    std::string code;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = now_();
        if (lockedOut(now)) {
            throw PairingError(PairingFailure::kRateLimited,
                               "too many failed attempts, try again later");
        }
        code = random::NumericCode(pairing::kCodeLength);
        pending_ = Pending{hub_id, hub_name, platform, code, now + pairing::kCodeExpiry};
        callback = code_callback_;
    }
    spdlog::info("Pairing code issued for hub {} ({})", hub_name, hub_id);
    if (callback) {
        callback(code, hub_name, pairing::kCodeExpiry);
    }
    return code;
}

std::string PairingManager::ValidateCode(const std::string& hub_id, const std::string& code) {
    Pending pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = now_();
        if (lockedOut(now)) {
            throw PairingError(PairingFailure::kRateLimited,
                               "too many failed attempts, try again later");
        }
        if (!pending_ || pending_->hub_id != hub_id) {
            throw PairingError(PairingFailure::kNoPending, "no pending pairing for this hub");
        }
        if (now >= pending_->expires_at) {
            pending_.reset();
            throw PairingError(PairingFailure::kExpired, "pairing code expired");
        }
        if (code.size() != pending_->code.size()
            || CRYPTO_memcmp(code.data(), pending_->code.data(), code.size()) != 0) {
            registerFailure(now);
            throw PairingError(PairingFailure::kInvalidCode, "invalid pairing code");
        }
        pending = std::move(*pending_);
        pending_.reset();
        failed_attempts_ = 0;
    }

    auto now_s = std::chrono::duration_cast<std::chrono::seconds>(now_().time_since_epoch())
                     .count();
    AuthorizedHub hub{
        .hub_id = pending.hub_id,
        .name = pending.hub_name,
        .platform = pending.platform,
        .token = random::Token(pairing::kTokenBytes),
        .paired_at = now_s,
        .last_seen = now_s,
    };
    try {
        store_.Add(hub);
    } catch (const std::exception& e) {
        throw PairingError(PairingFailure::kStorage,
                           std::string("failed to store pairing: ") + e.what());
    }
    spdlog::info("Hub {} ({}) paired", hub.name, hub.hub_id);
    return hub.token;
}

bool PairingManager::ValidateToken(const std::string& hub_id, const std::string& token) {
    if (hub_id.empty() || token.empty()) {
        return false;
    }
    return store_.Validate(hub_id, token);
}

std::chrono::seconds PairingManager::ExpiresIn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_) {
        return std::chrono::seconds{0};
    }
    auto left = std::chrono::duration_cast<std::chrono::seconds>(pending_->expires_at - now_());
    return left.count() > 0 ? left : std::chrono::seconds{0};
}

bool PairingManager::HasPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

void PairingManager::CancelPending(const std::string& hub_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_ && pending_->hub_id == hub_id) {
        pending_.reset();
        spdlog::info("Pairing code for hub {} withdrawn", hub_id);
    }
}

} // namespace deckhand::core
