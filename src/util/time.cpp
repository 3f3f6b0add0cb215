// REVGUARD - Time Utilities Implementation
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace revguard {
namespace util {

namespace {

struct MockClock {
    std::atomic<bool> enabled{false};
    std::atomic<int64_t> now{0};
};

MockClock& Mock() {
    static MockClock clock;
    return clock;
}

int64_t SystemSeconds() {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<Seconds>(since).count();
}

} // namespace

int64_t GetTime() {
    const MockClock& clock = Mock();
    return clock.enabled.load() ? clock.now.load() : SystemSeconds();
}

std::string FormatTimestamp(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

void EnableMockTime() {
    MockClock& clock = Mock();
    int64_t unset = 0;
    clock.now.compare_exchange_strong(unset, SystemSeconds());
    clock.enabled.store(true);
}

void DisableMockTime() {
    Mock().enabled.store(false);
}

bool IsMockTimeEnabled() {
    return Mock().enabled.load();
}

void SetMockTime(int64_t timestamp) {
    Mock().now.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    Mock().now.fetch_add(duration.count());
}

} // namespace util
} // namespace revguard
