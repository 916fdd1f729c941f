
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __COMPONENTS_TRAFFIC_RECORDER_HPP__
#define __COMPONENTS_TRAFFIC_RECORDER_HPP__

#include "Utilities.hpp"
#include "ComponentsHardwareJBDBMS.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace jbd_bms {

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

struct TrafficEvent {
    enum class Direction {
        TX,
        RX
    };
    Direction direction = Direction::TX;
    int64_t timestamp = 0;    // ms since epoch
    std::vector<uint8_t> bytes;

    static const char* toString(const Direction direction) {
        return direction == Direction::TX ? "TX" : "RX";
    }
    std::string hex() const {
        return BytesToHexString(bytes);
    }
    std::string ascii() const {
        std::string result;
        result.reserve(bytes.size());
        for (const uint8_t byte : bytes)
            result += (byte >= 0x20 && byte < 0x7F) ? static_cast<char>(byte) : '.';
        return result;
    }
};

// -----------------------------------------------------------------------------------------------

class TrafficRecorder {
public:
    struct Config {
        size_t capacity;
    };

    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void onTrafficEvent(const TrafficEvent& event) = 0;
    };

    explicit TrafficRecorder(const Config& conf)
        : config(conf) {}

    void registerListener(Listener* listener) {
        std::lock_guard<std::mutex> guard(_mutex);
        if (std::find(_listeners.begin(), _listeners.end(), listener) == _listeners.end())
            _listeners.push_back(listener);
    }
    // returns once no other thread is delivering, so the listener may then be destroyed
    void unregisterListener(Listener* listener) {
        std::unique_lock<std::mutex> lock(_mutex);
        auto pos = std::find(_listeners.begin(), _listeners.end(), listener);
        if (pos != _listeners.end())
            _listeners.erase(pos);
        _delivered.wait(lock, [this] {
            return _delivering <= _deliveringHere;
        });
    }

    void record(const TrafficEvent::Direction direction, const uint8_t* data, const size_t size) {
        if (_paused)
            return;
        TrafficEvent event{ .direction = direction, .timestamp = timestampMillis(), .bytes = std::vector<uint8_t>(data, data + size) };
        std::vector<Listener*> listeners;
        {
            std::lock_guard<std::mutex> guard(_mutex);
            if (config.capacity == 0)
                return;
            while (_events.size() >= config.capacity)
                _events.pop_front();
            _events.push_back(event);
            listeners = _listeners;
            _delivering++;
        }
        _deliveringHere++;
        for (auto listener : listeners)
            listener->onTrafficEvent(event);
        _deliveringHere--;
        {
            std::lock_guard<std::mutex> guard(_mutex);
            _delivering--;
        }
        _delivered.notify_all();
    }
    void record(const TrafficEvent::Direction direction, const std::vector<uint8_t>& bytes) {
        record(direction, bytes.data(), bytes.size());
    }

    void pause() {
        _paused = true;
    }
    void resume() {
        _paused = false;
    }
    bool toggle() {
        return !(_paused = !_paused);
    }
    bool paused() const {
        return _paused;
    }

    void clear() {
        std::lock_guard<std::mutex> guard(_mutex);
        _events.clear();
    }
    std::vector<TrafficEvent> entries() const {
        std::lock_guard<std::mutex> guard(_mutex);
        return std::vector<TrafficEvent>(_events.begin(), _events.end());
    }
    size_t size() const {
        std::lock_guard<std::mutex> guard(_mutex);
        return _events.size();
    }

private:
    const Config& config;
    mutable std::mutex _mutex;
    std::atomic<bool> _paused = false;
    std::deque<TrafficEvent> _events;
    std::vector<Listener*> _listeners;
    std::condition_variable _delivered;
    size_t _delivering = 0;
    inline static thread_local size_t _deliveringHere = 0;
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

}    // namespace jbd_bms

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
