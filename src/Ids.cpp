#include "clipfolio/Ids.hpp"
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <random>

namespace clipfolio {

static int64_t nowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string nextId() {
    static std::mutex mutex;
    static int64_t last = 0;

    std::lock_guard<std::mutex> lock(mutex);
    int64_t id = nowMillis();
    if (id <= last) id = last + 1;
    last = id;
    return std::to_string(id);
}

std::string generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);
    static const char* HEX = "0123456789abcdef";

    // RFC 4122 version 4 layout
    std::string uuid = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";
    for (char& c : uuid) {
        if (c == 'x') c = HEX[nibble(rng)];
        else if (c == 'y') c = HEX[(nibble(rng) & 0x3) | 0x8];
    }
    return uuid;
}

std::string currentTimeLabel() {
    std::time_t t = std::time(nullptr);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[8];
    std::strftime(buf, sizeof(buf), "%H:%M", &local);
    return buf;
}

std::string isoTimestampUtc() {
    int64_t ms = nowMillis();
    std::time_t t = static_cast<std::time_t>(ms / 1000);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms % 1000));
    return out;
}

std::string isoDateUtc() {
    return isoTimestampUtc().substr(0, 10);
}

} // namespace clipfolio
