#include "../test_helpers.h"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <cctype>
#include <core/auth/pairing_manager.h>
#include <core/auth/trust_store.h>
#include <core/constant/protocol.h>

using namespace deckhand::core;
using namespace std::chrono_literals;
using deckhand::test::TempDir;

namespace {

struct FakeClock {
    PairingManager::Clock::time_point now = PairingManager::Clock::now();

    PairingManager::Now fn() {
        return [this] { return now; };
    }
};

std::string wrongCode(const std::string& code) {
    auto wrong = code;
    wrong[0] = wrong[0] == '0' ? '1' : '0';
    return wrong;
}

} // namespace

TEST_CASE("Pairing codes are six digits and expire within a minute", "[pairing]") {
    TempDir dir;
    TrustStore store(dir / "trusted_hubs.json");
    FakeClock clock;
    PairingManager pairing(store, clock.fn());

    auto code = pairing.GenerateCode("hub-1", "Desk", "linux");

    REQUIRE(code.size() == 6);
    REQUIRE(std::all_of(code.begin(), code.end(), [](char c) { return std::isdigit(c) != 0; }));
    REQUIRE(pairing.HasPending());
    REQUIRE(pairing.ExpiresIn() <= 60s);
    REQUIRE(pairing.ExpiresIn() > 0s);
}

TEST_CASE("A correct code issues a token and trusts the hub", "[pairing]") {
    TempDir dir;
    TrustStore store(dir / "trusted_hubs.json");
    FakeClock clock;
    PairingManager pairing(store, clock.fn());

    std::string shown;
    pairing.SetCodeCallback([&shown](const std::string& code, const std::string& hub_name, std::chrono::seconds) {
        REQUIRE(hub_name == "Desk");
        shown = code;
    });
    auto code = pairing.GenerateCode("hub-1", "Desk", "linux");
    REQUIRE(shown == code);

    clock.now += 10s;
    auto token = pairing.ValidateCode("hub-1", code);

    REQUIRE(token.size() >= 43); // 32 bytes, base64
    REQUIRE(token.find_first_of("+/=") == std::string::npos);
    REQUIRE_FALSE(pairing.HasPending());
    REQUIRE(pairing.ValidateToken("hub-1", token));
    REQUIRE_FALSE(pairing.ValidateToken("hub-1", token + "x"));
    REQUIRE_FALSE(pairing.ValidateToken("hub-2", token));
    REQUIRE(store.Get("hub-1")->name == "Desk");
}

TEST_CASE("An expired code fails and issues no token", "[pairing]") {
    TempDir dir;
    TrustStore store(dir / "trusted_hubs.json");
    FakeClock clock;
    PairingManager pairing(store, clock.fn());

    auto code = pairing.GenerateCode("hub-1", "Desk", "linux");
    clock.now += pairing::kCodeExpiry + 1s;

    try {
        pairing.ValidateCode("hub-1", code);
        FAIL("expected expiry");
    } catch (const PairingError& e) {
        REQUIRE(e.reason() == PairingFailure::kExpired);
        REQUIRE(e.reason_string() == "expired");
    }
    REQUIRE(store.List().empty());
    REQUIRE_FALSE(pairing.HasPending());
}

TEST_CASE("A wrong code consumes the pending code", "[pairing]") {
    TempDir dir;
    TrustStore store(dir / "trusted_hubs.json");
    FakeClock clock;
    PairingManager pairing(store, clock.fn());

    auto code = pairing.GenerateCode("hub-1", "Desk", "linux");

    try {
        pairing.ValidateCode("hub-1", wrongCode(code));
        FAIL("expected invalid code");
    } catch (const PairingError& e) {
        REQUIRE(e.reason() == PairingFailure::kInvalidCode);
    }

    try {
        pairing.ValidateCode("hub-1", code);
        FAIL("expected no pending code");
    } catch (const PairingError& e) {
        REQUIRE(e.reason() == PairingFailure::kNoPending);
    }
    REQUIRE(store.List().empty());
}

TEST_CASE("A code only pairs the hub it was issued to", "[pairing]") {
    TempDir dir;
    TrustStore store(dir / "trusted_hubs.json");
    FakeClock clock;
    PairingManager pairing(store, clock.fn());

    auto code = pairing.GenerateCode("hub-1", "Desk", "linux");

    REQUIRE_THROWS_AS(pairing.ValidateCode("hub-2", code), PairingError);
    REQUIRE(pairing.HasPending());
}

TEST_CASE("Repeated failures lock pairing for five minutes", "[pairing]") {
    TempDir dir;
    TrustStore store(dir / "trusted_hubs.json");
    FakeClock clock;
    PairingManager pairing(store, clock.fn());

    for (int i = 0; i < pairing::kMaxFailedAttempts; ++i) {
        auto code = pairing.GenerateCode("hub-1", "Desk", "linux");
        REQUIRE_THROWS_AS(pairing.ValidateCode("hub-1", wrongCode(code)), PairingError);
    }

    try {
        pairing.GenerateCode("hub-1", "Desk", "linux");
        FAIL("expected rate limiting");
    } catch (const PairingError& e) {
        REQUIRE(e.reason() == PairingFailure::kRateLimited);
    }

    clock.now += pairing::kLockoutDuration + 1s;
    auto code = pairing.GenerateCode("hub-1", "Desk", "linux");
    REQUIRE_FALSE(pairing.ValidateCode("hub-1", code).empty());
}

TEST_CASE("A new code replaces the outstanding one", "[pairing]") {
    TempDir dir;
    TrustStore store(dir / "trusted_hubs.json");
    FakeClock clock;
    PairingManager pairing(store, clock.fn());

    auto first = pairing.GenerateCode("hub-1", "Desk", "linux");
    auto second = pairing.GenerateCode("hub-1", "Desk", "linux");

    if (first != second) {
        REQUIRE_THROWS_AS(pairing.ValidateCode("hub-1", first), PairingError);
    } else {
        REQUIRE_NOTHROW(pairing.ValidateCode("hub-1", second));
    }

    pairing.GenerateCode("hub-1", "Desk", "linux");
    pairing.CancelPending("hub-2");
    REQUIRE(pairing.HasPending());
    pairing.CancelPending("hub-1");
    REQUIRE_FALSE(pairing.HasPending());
    REQUIRE(pairing.ExpiresIn() == 0s);
}
