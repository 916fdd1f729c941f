
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __PROGRAM_INTERFACE_SERIAL_JBDBMS_HPP__
#define __PROGRAM_INTERFACE_SERIAL_JBDBMS_HPP__

#include "ComponentsHardwareJBDBMSSession.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class ProgramInterfaceSerialJBDBMS {

public:
    struct Config {
        interval_t intervalTelemetry;
    };

    struct Handler {
        virtual ~Handler () = default;
        virtual void onTelemetry (const jbd_bms::TelemetrySnapshot &snapshot) = 0;
        virtual void onTelemetryError (const std::exception &error) = 0;
        virtual void onStopped () { }
    };

private:
    const Config &config;

    jbd_bms::Session &_session;
    Handler &_handler;
    std::thread _thread;
    std::mutex _mutex;
    std::condition_variable _condition;
    std::atomic<bool> _running = false;
    bool _stopRequested = false;
    counter_t _polls = 0, _failures = 0;
    std::optional<jbd_bms::TelemetrySnapshot> _latest;

public:
    explicit ProgramInterfaceSerialJBDBMS (const Config &conf, jbd_bms::Session &session, Handler &handler) :
        config (conf),
        _session (session),
        _handler (handler) { }
    ~ProgramInterfaceSerialJBDBMS () {
        stop ();
    }

    void start () {
        if (_running)
            return;
        if (! _session.isConnected ())
            throw jbd_bms::TransportError ("poller requires a connected session");
        if (_thread.joinable ())
            _thread.join ();
        {
            std::lock_guard<std::mutex> guard (_mutex);
            _stopRequested = false;
        }
        _running = true;
        _thread = std::thread (&ProgramInterfaceSerialJBDBMS::process, this);
        DEBUG_PRINTF ("ProgramInterfaceSerialJBDBMS::start: polling every %lu ms\n", config.intervalTelemetry);
    }
    void stop () {
        {
            std::lock_guard<std::mutex> guard (_mutex);
            _stopRequested = true;
        }
        _condition.notify_all ();
        if (_thread.joinable () && _thread.get_id () != std::this_thread::get_id ())
            _thread.join ();
    }
    bool running () const {
        return _running;
    }

    counter_t polls () {
        std::lock_guard<std::mutex> guard (_mutex);
        return _polls;
    }
    counter_t failures () {
        std::lock_guard<std::mutex> guard (_mutex);
        return _failures;
    }
    std::optional<jbd_bms::TelemetrySnapshot> latest () {
        std::lock_guard<std::mutex> guard (_mutex);
        return _latest;
    }

private:
    bool stopping () {
        std::lock_guard<std::mutex> guard (_mutex);
        return _stopRequested;
    }
    bool waitFor (const interval_t ms) {
        std::unique_lock<std::mutex> lock (_mutex);
        return ! _condition.wait_for (lock, std::chrono::milliseconds (ms), [this] {
            return _stopRequested;
        });
    }

    void process () {
        Intervalable interval (config.intervalTelemetry);
        while (! stopping () && _session.isConnected ()) {
            interval.mark ();
            try {
                const jbd_bms::TelemetrySnapshot snapshot = _session.readTelemetry ();
                {
                    std::lock_guard<std::mutex> guard (_mutex);
                    _polls++;
                    _latest = snapshot;
                }
                _handler.onTelemetry (snapshot);
            } catch (const std::exception &e) {
                {
                    std::lock_guard<std::mutex> guard (_mutex);
                    _polls++;
                    _failures++;
                }
                DEBUG_PRINTF ("ProgramInterfaceSerialJBDBMS::process: telemetry failed: %s\n", e.what ());
                _handler.onTelemetryError (e);
            }
            if (! waitFor (interval.remaining ()))
                break;
        }
        DEBUG_PRINTF ("ProgramInterfaceSerialJBDBMS::process: stopped (%s, %lu polls, %lu failures, %lu overruns)\n", _session.isConnected () ? "requested" : "session not connected", _polls, _failures, interval.exceeded ());
        _running = false;
        _handler.onStopped ();
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#endif
