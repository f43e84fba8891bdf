#pragma once

#include <chrono>
#include <core/auth/trust_store.h>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace deckhand::core {

enum class PairingFailure {
    kExpired,
    kInvalidCode,
    kRateLimited,
    kNoPending,
    kStorage,
};

NLOHMANN_JSON_SERIALIZE_ENUM(PairingFailure,
                             {
                                 {PairingFailure::kExpired, "expired"},
                                 {PairingFailure::kInvalidCode, "invalid_code"},
                                 {PairingFailure::kRateLimited, "rate_limited"},
                                 {PairingFailure::kNoPending, "no_pending"},
                                 {PairingFailure::kStorage, "storage"},
                             });

class PairingError : public std::runtime_error {
public:
    PairingError(PairingFailure reason, const std::string& message);

    PairingFailure reason() const { return reason_; }
    // wire form of the reason, e.g. "expired"
    std::string reason_string() const;

private:
    PairingFailure reason_;
};

// Agent side of the pairing flow. One outstanding code at a time; a code is
// consumed by the first attempt, right or wrong.
class PairingManager {
public:
    using Clock = std::chrono::system_clock;
    using Now = std::function<Clock::time_point()>;
    using CodeCallback = std::function<void(const std::string& code,
                                            const std::string& hub_name,
                                            std::chrono::seconds expires_in)>;

    explicit PairingManager(TrustStore& store, Now now = &Clock::now);

    // Issues a fresh code for the hub, replacing any outstanding one
    std::string GenerateCode(const std::string& hub_id,
                             const std::string& hub_name,
                             const std::string& platform);

    // Checks a submitted code; on success stores the hub and returns its new token
    std::string ValidateCode(const std::string& hub_id, const std::string& code);

    bool ValidateToken(const std::string& hub_id, const std::string& token);

    // Seconds left on the outstanding code, 0 when there is none
    std::chrono::seconds ExpiresIn() const;
    bool HasPending() const;
    // Drops the outstanding code if it was issued to `hub_id`
    void CancelPending(const std::string& hub_id);

    // Where the code is shown to the operator
    void SetCodeCallback(CodeCallback callback);

private:
    struct Pending {
        std::string hub_id;
        std::string hub_name;
        std::string platform;
        std::string code;
        Clock::time_point expires_at;
    };

    bool lockedOut(Clock::time_point now) const;
    void registerFailure(Clock::time_point now);

    TrustStore& store_;
    Now now_;
    CodeCallback code_callback_;

    mutable std::mutex mutex_;
    std::optional<Pending> pending_;
    int failed_attempts_{0};
    std::optional<Clock::time_point> locked_until_;
};

} // namespace deckhand::core
