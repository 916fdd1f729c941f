
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __UTILITIES_HPP__
#define __UTILITIES_HPP__

#include "Debug.hpp"

#include <cstdint>
#include <chrono>
#include <string>
#include <thread>

typedef unsigned long interval_t;
typedef unsigned long counter_t;

// -----------------------------------------------------------------------------------------------

inline interval_t millis() {
    return static_cast<interval_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch()).count());
}
inline void delay(const interval_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
inline int64_t timestampMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// -----------------------------------------------------------------------------------------------

class Intervalable {
    interval_t _interval, _previous;
    counter_t _exceeded = 0;

public:
    explicit Intervalable(const interval_t interval = 0, const interval_t previous = 0)
        : _interval(interval), _previous(previous) {}
    // time left until the interval next passes, counting an overrun when there is none
    interval_t remaining() {
        const interval_t current = millis();
        if (current - _previous < _interval)
            return _interval - (current - _previous);
        if (_previous > 0) _exceeded++;
        return 0;
    }
    void mark() {
        _previous = millis();
    }
    counter_t exceeded() const {
        return _exceeded;
    }
};

// -----------------------------------------------------------------------------------------------

#include <type_traits>
#include <exception>
#include <utility>

template<typename F>
bool exception_catcher(F&& f) {
    static_assert(std::is_invocable_v<F>, "F must be an invocable type");
    try {
        std::forward<F>(f)();
        return true;
    } catch (const std::exception& e) {
        DEBUG_PRINTF("exception: %s\n", e.what());
        fprintf(stderr, "error: %s\n", e.what());
    }
    return false;
}

// -----------------------------------------------------------------------------------------------

#include <cassert>

template<typename T>
class Singleton {
    static_assert(std::is_class_v<T>, "T must be a class type");
    inline static T* _instance = nullptr;

public:
    inline static T* instance() {
        return _instance;
    }
    explicit Singleton(T* t) {
        assert(_instance == nullptr && "duplicate Singleton initializer");
        _instance = t;
    }
    virtual ~Singleton() {
        _instance = nullptr;
    }
};

// -----------------------------------------------------------------------------------------------

#include <mutex>
#include <condition_variable>

// strict arrival-order lock, satisfies BasicLockable
class TicketLock {
    std::mutex _mutex;
    std::condition_variable _condition;
    uint64_t _next = 0, _serving = 0;

public:
    void lock() {
        std::unique_lock<std::mutex> guard(_mutex);
        const uint64_t ticket = _next++;
        _condition.wait(guard, [&] {
            return _serving == ticket;
        });
    }
    void unlock() {
        {
            std::lock_guard<std::mutex> guard(_mutex);
            _serving++;
        }
        _condition.notify_all();
    }
    size_t waiting() {
        std::lock_guard<std::mutex> guard(_mutex);
        return static_cast<size_t>(_next - _serving);
    }
};

// -----------------------------------------------------------------------------------------------

#include <ctime>

inline std::string getTimeString(time_t timet = 0) {
    struct tm timeinfo;
    char timeString[sizeof("yyyy-mm-ddThh:mm:ssZ") + 1] = { '\0' };
    if (timet == 0) time(&timet);
    if (gmtime_r(&timet, &timeinfo) != nullptr)
        strftime(timeString, sizeof(timeString), "%Y-%m-%dT%H:%M:%SZ", &timeinfo);
    return timeString;
}

inline std::string getTimeStringMillis(const int64_t millis) {
    char buffer[sizeof("yyyy-mm-ddThh:mm:ss.mmmZ") + 1];
    const std::string seconds = getTimeString(static_cast<time_t>(millis / 1000));
    snprintf(buffer, sizeof(buffer), "%.*s.%03dZ", static_cast<int>(seconds.size() > 0 ? seconds.size() - 1 : 0), seconds.c_str(), static_cast<int>(millis % 1000));
    return buffer;
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#endif
