
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __COMPONENTS_HARDWARE_JBDBMS_SESSION_HPP__
#define __COMPONENTS_HARDWARE_JBDBMS_SESSION_HPP__

#include "Utilities.hpp"
#include "ComponentsHardwareJBDBMS.hpp"
#include "ComponentsHardwareJBDBMSStream.hpp"
#include "ComponentsTrafficRecorder.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>

namespace jbd_bms {

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class Transport {
public:
    virtual ~Transport() = default;

    virtual void open(const unsigned long baud) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    // returns 0 on timeout
    virtual size_t read(uint8_t* buffer, const size_t size, const interval_t timeout) = 0;
    virtual void write(const uint8_t* data, const size_t size) = 0;

    virtual std::string identity() const = 0;
    virtual std::string label() const {
        return identity();
    }
    virtual std::string vendor() const {
        return std::string();
    }
};

class TransportProvider {
public:
    virtual ~TransportProvider() = default;
    virtual std::vector<std::shared_ptr<Transport>> enumerate() = 0;
    // a newly authorised endpoint, or nullptr
    virtual std::shared_ptr<Transport> requestNew() = 0;
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class Session {
public:
    struct Config {
        unsigned long baud;
        interval_t timeoutRead;
        size_t attempts;
        interval_t backoffStep;
        interval_t readSlice;
        interval_t delayEepromSettle, delayConfigRead, delayTelemetryRead;
    };

    enum class State {
        Disconnected,
        Connecting,
        Connected,
        Faulted
    };
    static const char* toString(const State state) {
        switch (state) {
            case State::Disconnected: return "disconnected";
            case State::Connecting: return "connecting";
            case State::Connected: return "connected";
            case State::Faulted: return "faulted";
        }
        return "unknown";
    }

    using StateHandler = std::function<void(State)>;

    explicit Session(const Config& conf, TrafficRecorder* recorder = nullptr)
        : config(conf), _recorder(recorder) {}
    ~Session() {
        if (_transport)
            disconnect();
    }
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void registerStateHandler(StateHandler handler) {
        _stateHandler = std::move(handler);
    }
    State state() const {
        return _state;
    }
    bool isConnected() const {
        return _state == State::Connected;
    }
    std::string identity() const {
        std::lock_guard<std::mutex> guard(_transportMutex);
        return _transport ? _transport->identity() : std::string();
    }

    void connect(std::shared_ptr<Transport> transport, const unsigned long baud = 0) {
        if (!transport)
            throw std::invalid_argument("session requires a transport");
        std::lock_guard<TicketLock> guard(_lock);
        releaseTransport();
        setState(State::Connecting);
        try {
            transport->open(baud != 0 ? baud : config.baud);
        } catch (const TransportError& e) {
            DEBUG_PRINTF("Session::connect: open of '%s' failed: %s\n", transport->identity().c_str(), e.what());
            setState(State::Faulted);
            throw;
        }
        {
            std::lock_guard<std::mutex> transportGuard(_transportMutex);
            _transport = std::move(transport);
        }
        _eepromOpen = false;
        setState(State::Connected);
        DEBUG_PRINTF("Session::connect: connected to '%s'\n", _transport->identity().c_str());
    }

    void disconnect() {
        _closing = true;
        std::lock_guard<TicketLock> guard(_lock);
        releaseTransport();
        _eepromOpen = false;
        setState(State::Disconnected);
        _closing = false;
    }

    // -------------------------------------------------------------------------------------------

    Frame execute(const Frame& request) {
        std::lock_guard<TicketLock> guard(_lock);
        requireConnected();
        return exchange(request);
    }

    HardwareInfo readHardwareInfo() {
        return HardwareInfo::decode(execute(Frame::readRequest(Registers::HARDWARE_INFO)));
    }
    CellInfo readCellInfo() {
        return CellInfo::decode(execute(Frame::readRequest(Registers::CELL_INFO)));
    }
    std::string readHardwareVersion() {
        return execute(Frame::readRequest(Registers::HARDWARE_VERSION)).getString();
    }
    uint16_t readRegisterUInt16(const uint8_t reg) {
        return execute(Frame::readRequest(reg)).getUInt16(0);
    }
    std::string readRegisterString(const uint8_t reg) {
        return execute(Frame::readRequest(reg)).getString();
    }

    TelemetrySnapshot readTelemetry() {
        std::lock_guard<TicketLock> guard(_lock);
        requireConnected();
        TelemetrySnapshot snapshot;
        snapshot.hardware = HardwareInfo::decode(exchange(Frame::readRequest(Registers::HARDWARE_INFO)));
        pause(config.delayTelemetryRead);
        snapshot.cells = CellInfo::decode(exchange(Frame::readRequest(Registers::CELL_INFO)));
        pause(config.delayTelemetryRead);
        snapshot.version = exchange(Frame::readRequest(Registers::HARDWARE_VERSION)).getString();
        snapshot.timestamp = timestampMillis();
        return snapshot;
    }

    ConfigSnapshot readConfig() {
        ConfigSnapshot snapshot;
        bracketed([&] {
            for (const auto& field : CONFIG_NUMERIC_FIELDS) {
                snapshot.*field.member = RegisterConversion::decodeValue(field.reg, exchange(Frame::readRequest(field.reg)).getUInt16(0));
                pause(config.delayConfigRead);
            }
            snapshot.manufactureDate = RegisterConversion::decodeDate(exchange(Frame::readRequest(Registers::MANUFACTURE_DATE)).getUInt16(0));
            pause(config.delayConfigRead);
            for (const auto& field : CONFIG_TEXT_FIELDS) {
                snapshot.*field.member = exchange(Frame::readRequest(field.reg)).getString();
                pause(config.delayConfigRead);
            }
        });
        return snapshot;
    }

    void writeRegister(const uint8_t reg, const uint16_t value) {
        bracketed([&] {
            exchange(Frame::writeUInt16(reg, value));
        });
    }
    void writeTemperatureRegister(const uint8_t reg, const double celsius) {
        writeRegister(reg, RegisterConversion::encodeTemperature(celsius));
    }
    void writeRegisterValue(const uint8_t reg, const double value) {
        if (kindOf(reg) == Kind::Date || kindOf(reg) == Kind::Text)
            throw std::invalid_argument("register " + nameOf(reg) + " does not take a numeric value");
        writeRegister(reg, RegisterConversion::encodeValue(reg, value));
    }
    void writeStringRegister(const uint8_t reg, const std::string& text) {
        const Frame request = Frame::writeRequest(reg, std::vector<uint8_t>(text.begin(), text.end()));
        bracketed([&] {
            exchange(request);
        });
    }
    void setMosfet(const bool chargeOn, const bool dischargeOn) {
        bracketed([&] {
            exchange(Frame::mosfetControl(chargeOn, dischargeOn));
        });
    }

private:
    const Config& config;
    TrafficRecorder* _recorder;
    StateHandler _stateHandler;

    TicketLock _lock;
    mutable std::mutex _transportMutex;
    std::shared_ptr<Transport> _transport;
    std::atomic<State> _state = State::Disconnected;
    std::atomic<bool> _closing = false;
    bool _eepromOpen = false;

    void setState(const State state) {
        const State previous = _state.exchange(state);
        if (previous != state) {
            DEBUG_PRINTF("Session::state: %s -> %s\n", toString(previous), toString(state));
            if (_stateHandler)
                _stateHandler(state);
        }
    }

    void releaseTransport() {
        std::shared_ptr<Transport> transport;
        {
            std::lock_guard<std::mutex> guard(_transportMutex);
            transport.swap(_transport);
        }
        if (transport && transport->isOpen()) {
            try {
                transport->close();
            } catch (const TransportError& e) {
                DEBUG_PRINTF("Session::disconnect: close of '%s' failed: %s\n", transport->identity().c_str(), e.what());
            }
        }
    }

    void requireConnected() const {
        if (_closing)
            throw TransportError("session is disconnecting");
        if (_state != State::Connected)
            throw TransportError(std::string("session is ") + toString(_state));
    }

    void pause(const interval_t ms) {
        for (const interval_t until = millis() + ms; !_closing && millis() < until;)
            delay(std::min<interval_t>(config.readSlice, until - millis()));
        if (_closing)
            throw TransportError("session is disconnecting");
    }

    template<typename F>
    void bracketed(F&& operation) {
        std::lock_guard<TicketLock> guard(_lock);
        requireConnected();
        if (_eepromOpen)
            throw ProtocolSequenceError("eeprom already open");
        try {
            eepromOpen();
            pause(config.delayEepromSettle);
            operation();
        } catch (...) {
            eepromClose();
            throw;
        }
        eepromClose();
    }

    // marked open before the exchange, the device may apply an open whose reply is lost
    void eepromOpen() {
        _eepromOpen = true;
        exchange(Frame::eepromOpen());
    }
    void eepromClose() {
        if (!_eepromOpen)
            throw ProtocolSequenceError("eeprom close without open");
        _eepromOpen = false;
        try {
            exchange(Frame::eepromClose());
        } catch (const Error& e) {
            DEBUG_PRINTF("Session::eepromClose: failed (ignored): %s\n", e.what());
        }
    }

    // -------------------------------------------------------------------------------------------

    Frame exchange(const Frame& request) {
        std::exception_ptr error;
        for (size_t attempt = 0; attempt < config.attempts; attempt++) {
            if (attempt > 0)
                pause(config.backoffStep * attempt);
            try {
                return attemptExchange(request);
            } catch (const TransportError&) {
                if (!_closing)
                    setState(State::Faulted);
                throw;
            } catch (const Error& e) {
                DEBUG_PRINTF("Session::exchange: register 0x%02X, attempt %zu/%zu failed: %s\n", request.getRegister(), attempt + 1, config.attempts, e.what());
                if (!error)
                    error = std::current_exception();
            }
        }
        if (error)
            std::rethrow_exception(error);
        throw TimeoutError("no attempts configured");
    }

    Frame attemptExchange(const Frame& request) {
        std::shared_ptr<Transport> transport;
        {
            std::lock_guard<std::mutex> guard(_transportMutex);
            transport = _transport;
        }
        if (!transport)
            throw TransportError("session has no transport");

        const std::vector<uint8_t> bytes = request.encode();
        transport->write(bytes.data(), bytes.size());
        if (_recorder)
            _recorder->record(TrafficEvent::Direction::TX, bytes);

        std::vector<uint8_t> received;
        const auto recordReceived = [&] {
            if (_recorder && !received.empty())
                _recorder->record(TrafficEvent::Direction::RX, received);
        };

        StreamReassembler reassembler;
        uint8_t buffer[256];
        try {
            for (const interval_t started = millis(); millis() - started < config.timeoutRead;) {
                if (_closing)
                    throw TransportError("session is disconnecting");
                const size_t size = transport->read(buffer, sizeof(buffer), std::min<interval_t>(config.readSlice, config.timeoutRead - (millis() - started)));
                if (size == 0)
                    continue;
                received.insert(received.end(), buffer, buffer + size);
                for (const auto& candidate : reassembler.feed(buffer, size)) {
                    const Frame::Decoded decoded = Frame::decode(candidate);
                    if (!decoded) {
                        recordReceived();
                        throw FramingError(decoded.error, BytesToHexString(candidate));
                    }
                    if (decoded.frame.isRequest() || decoded.frame.getRegister() != request.getRegister())
                        continue;
                    recordReceived();
                    if (!decoded.frame.isOk())
                        throw DeviceError(decoded.frame.getRegister(), decoded.frame.status());
                    return decoded.frame;
                }
            }
        } catch (const TransportError&) {
            recordReceived();
            throw;
        }
        recordReceived();
        throw TimeoutError("no response for register " + nameOf(request.getRegister()) + (received.empty() ? "" : " (incomplete: " + BytesToHexString(received) + ")"));
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

}    // namespace jbd_bms

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
