
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __COMPONENTS_HARDWARE_JBDBMS_HPP__
#define __COMPONENTS_HARDWARE_JBDBMS_HPP__

#include <cstdint>
#include <cstdio>
#include <cmath>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>

namespace jbd_bms {

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

enum class FrameError {
    None,
    TooShort,
    BadStart,
    BadEnd,
    LengthMismatch,
    ChecksumMismatch
};

inline const char* toString(const FrameError error) {
    switch (error) {
        case FrameError::None: return "ok";
        case FrameError::TooShort: return "too-short";
        case FrameError::BadStart: return "bad-start";
        case FrameError::BadEnd: return "bad-end";
        case FrameError::LengthMismatch: return "length-mismatch";
        case FrameError::ChecksumMismatch: return "checksum-mismatch";
    }
    return "unknown";
}

// -----------------------------------------------------------------------------------------------

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TransportError : public Error {
public:
    using Error::Error;
};

class FramingError : public Error {
public:
    explicit FramingError(const FrameError code, const std::string& detail = std::string())
        : Error(std::string("framing error: ") + toString(code) + (detail.empty() ? "" : " (" + detail + ")")), _code(code) {}
    FrameError code() const {
        return _code;
    }
private:
    FrameError _code;
};

class DeviceError : public Error {
public:
    DeviceError(const uint8_t reg, const uint8_t status)
        : Error(format(reg, status)), _register(reg), _status(status) {}
    uint8_t getRegister() const {
        return _register;
    }
    uint8_t status() const {
        return _status;
    }
private:
    static std::string format(const uint8_t reg, const uint8_t status) {
        char buffer[64];
        snprintf(buffer, sizeof(buffer), "device error: register 0x%02X, status 0x%02X", reg, status);
        return buffer;
    }
    uint8_t _register, _status;
};

class TimeoutError : public Error {
public:
    using Error::Error;
};

class ProtocolSequenceError : public Error {
public:
    using Error::Error;
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

/*
  JBD BMS UART/RS485 protocol
  https://gitlab.com/bms-tools/bms-tools/-/blob/master/JBD_REGISTER_MAP.md
  https://github.com/FurTrader/OverkillSolarBMS/blob/master/Comm_Protocol_Documentation

  [START][OP_OR_REG][REG_OR_STATUS][LEN][DATA x LEN][CRC_HI][CRC_LO][END]
*/

inline uint16_t calculateChecksum(const uint8_t* data, const size_t size) {
    uint16_t sum = 0;
    for (size_t i = 0; i < size; i++)
        sum = static_cast<uint16_t>(sum - data[i]);
    return sum;
}

inline std::string BytesToHexString(const uint8_t* bytes, const size_t size, const char* separator = " ") {
    static const char HEX_CHARS[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(size * 3);
    for (size_t i = 0; i < size; i++) {
        if (i > 0) result += separator;
        result += HEX_CHARS[(bytes[i] >> 4) & 0x0F];
        result += HEX_CHARS[bytes[i] & 0x0F];
    }
    return result;
}
inline std::string BytesToHexString(const std::vector<uint8_t>& bytes, const char* separator = " ") {
    return BytesToHexString(bytes.data(), bytes.size(), separator);
}

// -----------------------------------------------------------------------------------------------

class Frame {
public:
    struct Constants {
        static constexpr size_t SIZE_HEADER = 4;
        static constexpr size_t SIZE_TRAILER = 3;
        static constexpr size_t SIZE_MINIMUM = SIZE_HEADER + SIZE_TRAILER;
        static constexpr size_t SIZE_DATA_MAXIMUM = 255;

        static constexpr size_t OFFSET_BYTE_START = 0;
        static constexpr size_t OFFSET_OPERATION = 1;    // request: opcode, response: register
        static constexpr size_t OFFSET_REGISTER = 2;     // request: register, response: status
        static constexpr size_t OFFSET_SIZE = 3;
        static constexpr size_t OFFSET_DATA = 4;
        static constexpr size_t OFFSET_CHECKSUM_BEGIN = 2;

        static constexpr uint8_t VALUE_BYTE_START = 0xDD;
        static constexpr uint8_t VALUE_BYTE_END = 0x77;
        static constexpr uint8_t VALUE_OPERATION_READ = 0xA5;
        static constexpr uint8_t VALUE_OPERATION_WRITE = 0x5A;
        static constexpr uint8_t VALUE_STATUS_OK = 0x00;
    };

    enum class Direction {
        Request,
        Response
    };
    enum class Operation : uint8_t {
        Read = Constants::VALUE_OPERATION_READ,
        Write = Constants::VALUE_OPERATION_WRITE
    };

    struct Decoded;

    Frame()
        : Frame(Direction::Request, Operation::Read, 0, Constants::VALUE_STATUS_OK, {}) {}

    static Frame request(const Operation operation, const uint8_t reg, std::vector<uint8_t> data = {}) {
        return Frame(Direction::Request, operation, reg, Constants::VALUE_STATUS_OK, std::move(data));
    }
    static Frame response(const uint8_t reg, const uint8_t status, std::vector<uint8_t> data = {}) {
        return Frame(Direction::Response, Operation::Read, reg, status, std::move(data));
    }

    static Frame readRequest(const uint8_t reg) {
        return request(Operation::Read, reg);
    }
    static Frame writeRequest(const uint8_t reg, std::vector<uint8_t> data) {
        return request(Operation::Write, reg, std::move(data));
    }
    static Frame writeUInt16(const uint8_t reg, const uint16_t value) {
        return writeRequest(reg, { static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF) });
    }
    static Frame eepromOpen();
    static Frame eepromClose();
    static Frame mosfetControl(const bool chargeOn, const bool dischargeOn);

    Direction direction() const {
        return _direction;
    }
    bool isRequest() const {
        return _direction == Direction::Request;
    }
    bool isResponse() const {
        return _direction == Direction::Response;
    }
    Operation operation() const {
        return _operation;
    }
    uint8_t getRegister() const {
        return _register;
    }
    uint8_t status() const {
        return _status;
    }
    bool isOk() const {
        return _status == Constants::VALUE_STATUS_OK;
    }
    const std::vector<uint8_t>& data() const {
        return _data;
    }
    size_t size() const {
        return Constants::SIZE_MINIMUM + _data.size();
    }
    uint16_t checksum() const {
        return _checksum;
    }

    //

    inline uint8_t getUInt8(const size_t offset) const {
        validateDataOffset(offset, 1);
        return _data[offset];
    }
    inline uint16_t getUInt16(const size_t offset) const {
        validateDataOffset(offset, 2);
        return (static_cast<uint16_t>(_data[offset]) << 8) | static_cast<uint16_t>(_data[offset + 1]);
    }
    inline int16_t getInt16(const size_t offset) const {
        return static_cast<int16_t>(getUInt16(offset));
    }
    std::string getString() const {
        return std::string(_data.begin(), _data.end());
    }

    std::vector<uint8_t> encode() const {
        std::vector<uint8_t> bytes;
        bytes.reserve(size());
        bytes.push_back(Constants::VALUE_BYTE_START);
        if (_direction == Direction::Request) {
            bytes.push_back(static_cast<uint8_t>(_operation));
            bytes.push_back(_register);
        } else {
            bytes.push_back(_register);
            bytes.push_back(_status);
        }
        bytes.push_back(static_cast<uint8_t>(_data.size()));
        bytes.insert(bytes.end(), _data.begin(), _data.end());
        bytes.push_back(static_cast<uint8_t>(_checksum >> 8));
        bytes.push_back(static_cast<uint8_t>(_checksum & 0xFF));
        bytes.push_back(Constants::VALUE_BYTE_END);
        return bytes;
    }

    std::string toString() const {
        return BytesToHexString(encode());
    }

    static Decoded decode(const uint8_t* bytes, const size_t size);
    static Decoded decode(const std::vector<uint8_t>& bytes);

private:
    static FrameError decodeAt(const uint8_t* start, const size_t remaining, Frame& frame);

    Frame(const Direction direction, const Operation operation, const uint8_t reg, const uint8_t status, std::vector<uint8_t> data)
        : _direction(direction), _operation(operation), _register(reg), _status(status), _data(std::move(data)) {
        if (_data.size() > Constants::SIZE_DATA_MAXIMUM)
            throw std::length_error("frame payload exceeds 255 bytes");
        _checksum = calculateChecksum();
    }

    inline void validateDataOffset(const size_t offset, const size_t width) const {
        if (offset + width > _data.size())
            throw std::out_of_range("frame data offset out of range");
    }

    uint16_t calculateChecksum() const {
        const uint8_t header[2] = { _direction == Direction::Request ? _register : _status, static_cast<uint8_t>(_data.size()) };
        uint16_t sum = jbd_bms::calculateChecksum(header, sizeof(header));
        for (const uint8_t byte : _data)
            sum = static_cast<uint16_t>(sum - byte);
        return sum;
    }

    Direction _direction;
    Operation _operation;
    uint8_t _register, _status;
    std::vector<uint8_t> _data;
    uint16_t _checksum = 0;
};

struct Frame::Decoded {
    FrameError error = FrameError::None;
    size_t offset = 0;    // of the START byte used
    Frame frame;
    operator bool() const {
        return error == FrameError::None;
    }
};

inline FrameError Frame::decodeAt(const uint8_t* start, const size_t remaining, Frame& frame) {
    if (remaining < Constants::SIZE_MINIMUM)
        return FrameError::TooShort;
    const size_t length = start[Constants::OFFSET_SIZE];
    if (remaining < Constants::SIZE_MINIMUM + length)
        return FrameError::LengthMismatch;
    if (start[Constants::SIZE_MINIMUM + length - 1] != Constants::VALUE_BYTE_END)
        return FrameError::BadEnd;
    const size_t offsetChecksum = Constants::OFFSET_DATA + length;
    const uint16_t checksumStored = (static_cast<uint16_t>(start[offsetChecksum]) << 8) | static_cast<uint16_t>(start[offsetChecksum + 1]);
    if (jbd_bms::calculateChecksum(start + Constants::OFFSET_CHECKSUM_BEGIN, offsetChecksum - Constants::OFFSET_CHECKSUM_BEGIN) != checksumStored)
        return FrameError::ChecksumMismatch;
    std::vector<uint8_t> data(start + Constants::OFFSET_DATA, start + Constants::OFFSET_DATA + length);
    const uint8_t operation = start[Constants::OFFSET_OPERATION];
    if (operation == Constants::VALUE_OPERATION_READ || operation == Constants::VALUE_OPERATION_WRITE)
        frame = request(static_cast<Operation>(operation), start[Constants::OFFSET_REGISTER], std::move(data));
    else
        frame = response(operation, start[Constants::OFFSET_REGISTER], std::move(data));
    return FrameError::None;
}

// every START is tried in turn, the first error is reported only when none of them yields a frame
inline Frame::Decoded Frame::decode(const uint8_t* bytes, const size_t size) {
    Decoded result;
    if (size < Constants::SIZE_MINIMUM) {
        result.error = FrameError::TooShort;
        return result;
    }
    const uint8_t* const end = bytes + size;
    const uint8_t* start = std::find(bytes, end, Constants::VALUE_BYTE_START);
    if (start == end) {
        result.error = FrameError::BadStart;
        return result;
    }
    FrameError errorFirst = FrameError::None;
    size_t offsetFirst = 0;
    for (; start != end; start = std::find(start + 1, end, Constants::VALUE_BYTE_START)) {
        const FrameError error = decodeAt(start, static_cast<size_t>(end - start), result.frame);
        if (error == FrameError::None) {
            result.offset = static_cast<size_t>(start - bytes);
            return result;
        }
        if (errorFirst == FrameError::None) {
            errorFirst = error;
            offsetFirst = static_cast<size_t>(start - bytes);
        }
    }
    result.error = errorFirst;
    result.offset = offsetFirst;
    return result;
}
inline Frame::Decoded Frame::decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

struct Registers {
    static constexpr uint8_t EEPROM_OPEN = 0x00;
    static constexpr uint8_t EEPROM_CLOSE = 0x01;
    static constexpr uint8_t HARDWARE_INFO = 0x03;
    static constexpr uint8_t CELL_INFO = 0x04;
    static constexpr uint8_t HARDWARE_VERSION = 0x05;
    static constexpr uint8_t FACTORY_RESET = 0x0A;

    static constexpr uint8_t DESIGN_CAPACITY = 0x10;
    static constexpr uint8_t CYCLE_CAPACITY = 0x11;
    static constexpr uint8_t FULL_CHARGE_VOLTAGE = 0x12;
    static constexpr uint8_t CHARGE_END_VOLTAGE = 0x13;
    static constexpr uint8_t DISCHARGING_RATE = 0x14;
    static constexpr uint8_t MANUFACTURE_DATE = 0x15;
    static constexpr uint8_t SERIAL_NUMBER = 0x16;
    static constexpr uint8_t CYCLE_COUNT = 0x17;
    static constexpr uint8_t CHARGE_OVER_TEMPERATURE = 0x18;
    static constexpr uint8_t CHARGE_OVER_TEMPERATURE_RELEASE = 0x19;
    static constexpr uint8_t CHARGE_LOW_TEMPERATURE = 0x1A;
    static constexpr uint8_t CHARGE_LOW_TEMPERATURE_RELEASE = 0x1B;
    static constexpr uint8_t DISCHARGE_OVER_TEMPERATURE = 0x1C;
    static constexpr uint8_t DISCHARGE_OVER_TEMPERATURE_RELEASE = 0x1D;
    static constexpr uint8_t DISCHARGE_LOW_TEMPERATURE = 0x1E;
    static constexpr uint8_t DISCHARGE_LOW_TEMPERATURE_RELEASE = 0x1F;
    static constexpr uint8_t PACK_OVER_VOLTAGE = 0x20;
    static constexpr uint8_t PACK_OVER_VOLTAGE_RELEASE = 0x21;
    static constexpr uint8_t PACK_UNDER_VOLTAGE = 0x22;
    static constexpr uint8_t PACK_UNDER_VOLTAGE_RELEASE = 0x23;
    static constexpr uint8_t CELL_OVER_VOLTAGE = 0x24;
    static constexpr uint8_t CELL_OVER_VOLTAGE_RELEASE = 0x25;
    static constexpr uint8_t CELL_UNDER_VOLTAGE = 0x26;
    static constexpr uint8_t CELL_UNDER_VOLTAGE_RELEASE = 0x27;
    static constexpr uint8_t OVER_CHARGE_CURRENT = 0x28;
    static constexpr uint8_t OVER_DISCHARGE_CURRENT = 0x29;
    static constexpr uint8_t BALANCE_START_VOLTAGE = 0x2A;
    static constexpr uint8_t BALANCE_WINDOW = 0x2B;
    static constexpr uint8_t SENSE_RESISTOR = 0x2C;
    static constexpr uint8_t BATTERY_CONFIG = 0x2D;
    static constexpr uint8_t NTC_CONFIG = 0x2E;
    static constexpr uint8_t PACK_NUMBER = 0x2F;
    static constexpr uint8_t FET_CONTROL_TIME = 0x30;
    static constexpr uint8_t LED_DISPLAY_TIME = 0x31;
    static constexpr uint8_t HARD_CELL_OVER_VOLTAGE = 0x36;
    static constexpr uint8_t HARD_CELL_UNDER_VOLTAGE = 0x37;

    static constexpr uint8_t MANUFACTURER_NAME = 0xA0;
    static constexpr uint8_t DEVICE_NAME = 0xA1;
    static constexpr uint8_t BARCODE = 0xA2;

    static constexpr uint8_t CAPACITY = 0xE0;
    static constexpr uint8_t MOSFET = 0xE1;
    static constexpr uint8_t BALANCE = 0xE2;
    static constexpr uint8_t RESET = 0xE3;

    static constexpr uint16_t VALUE_EEPROM_OPEN = 0x5678;
    static constexpr uint16_t VALUE_EEPROM_CLOSE = 0x0000;
    static constexpr uint8_t VALUE_MOSFET_CHARGE_OFF = 0x01;
    static constexpr uint8_t VALUE_MOSFET_DISCHARGE_OFF = 0x02;
    static constexpr uint8_t VALUE_FET_CHARGE_ENABLED = 0x01;
    static constexpr uint8_t VALUE_FET_DISCHARGE_ENABLED = 0x02;
};

inline Frame Frame::eepromOpen() {
    return writeUInt16(Registers::EEPROM_OPEN, Registers::VALUE_EEPROM_OPEN);
}
inline Frame Frame::eepromClose() {
    return writeUInt16(Registers::EEPROM_CLOSE, Registers::VALUE_EEPROM_CLOSE);
}
inline Frame Frame::mosfetControl(const bool chargeOn, const bool dischargeOn) {
    const uint8_t bits = (chargeOn ? 0 : Registers::VALUE_MOSFET_CHARGE_OFF) | (dischargeOn ? 0 : Registers::VALUE_MOSFET_DISCHARGE_OFF);
    return writeRequest(Registers::MOSFET, { 0x00, bits });
}

// -----------------------------------------------------------------------------------------------

enum class Kind {
    Voltage,
    CellVoltage,
    Current,
    Capacity,
    Temperature,
    Resistance,
    Duration,
    Percentage,
    Date,
    Raw,
    Text
};

inline const char* toString(const Kind kind) {
    switch (kind) {
        case Kind::Voltage: return "voltage";
        case Kind::CellVoltage: return "cell-voltage";
        case Kind::Current: return "current";
        case Kind::Capacity: return "capacity";
        case Kind::Temperature: return "temperature";
        case Kind::Resistance: return "resistance";
        case Kind::Duration: return "duration";
        case Kind::Percentage: return "percentage";
        case Kind::Date: return "date";
        case Kind::Raw: return "raw";
        case Kind::Text: return "text";
    }
    return "unknown";
}
inline const char* unitOf(const Kind kind) {
    switch (kind) {
        case Kind::Voltage:
        case Kind::CellVoltage: return "V";
        case Kind::Current: return "A";
        case Kind::Capacity: return "Ah";
        case Kind::Temperature: return "C";
        case Kind::Resistance: return "mOhm";
        case Kind::Duration: return "s";
        case Kind::Percentage: return "%";
        default: return "";
    }
}

struct RegisterDescriptor {
    uint8_t id;
    const char* name;
    Kind kind;
    double scale;    // raw units per physical unit
};

inline constexpr RegisterDescriptor REGISTER_TABLE[] = {
    { 0x00, "EepromOpen", Kind::Raw, 1 },
    { 0x01, "EepromClose", Kind::Raw, 1 },
    { 0x03, "HardwareInfo", Kind::Raw, 1 },
    { 0x04, "CellInfo", Kind::Raw, 1 },
    { 0x05, "HardwareVersion", Kind::Text, 1 },
    { 0x0A, "FactoryReset", Kind::Raw, 1 },
    { 0x10, "DesignCapacity", Kind::Capacity, 100 },
    { 0x11, "CycleCapacity", Kind::Capacity, 100 },
    { 0x12, "FullChargeVoltage", Kind::Voltage, 100 },
    { 0x13, "ChargeEndVoltage", Kind::Voltage, 100 },
    { 0x14, "DischargingRate", Kind::Percentage, 1 },
    { 0x15, "ManufactureDate", Kind::Date, 1 },
    { 0x16, "SerialNumber", Kind::Raw, 1 },
    { 0x17, "CycleCount", Kind::Raw, 1 },
    { 0x18, "ChargeOverTemp", Kind::Temperature, 10 },
    { 0x19, "ChargeOverTempRelease", Kind::Temperature, 10 },
    { 0x1A, "ChargeLowTemp", Kind::Temperature, 10 },
    { 0x1B, "ChargeLowTempRelease", Kind::Temperature, 10 },
    { 0x1C, "DischargeOverTemp", Kind::Temperature, 10 },
    { 0x1D, "DischargeOverTempRelease", Kind::Temperature, 10 },
    { 0x1E, "DischargeLowTemp", Kind::Temperature, 10 },
    { 0x1F, "DischargeLowTempRelease", Kind::Temperature, 10 },
    { 0x20, "PackOverVoltage", Kind::Voltage, 100 },
    { 0x21, "PackOverVoltageRelease", Kind::Voltage, 100 },
    { 0x22, "PackUnderVoltage", Kind::Voltage, 100 },
    { 0x23, "PackUnderVoltageRelease", Kind::Voltage, 100 },
    { 0x24, "CellOverVoltage", Kind::CellVoltage, 1000 },
    { 0x25, "CellOverVoltageRelease", Kind::CellVoltage, 1000 },
    { 0x26, "CellUnderVoltage", Kind::CellVoltage, 1000 },
    { 0x27, "CellUnderVoltageRelease", Kind::CellVoltage, 1000 },
    { 0x28, "OverChargeCurrent", Kind::Current, 100 },
    { 0x29, "OverDischargeCurrent", Kind::Current, 100 },
    { 0x2A, "BalanceStartVoltage", Kind::CellVoltage, 1000 },
    { 0x2B, "BalanceWindow", Kind::CellVoltage, 1000 },
    { 0x2C, "SenseResistor", Kind::Resistance, 1 },
    { 0x2D, "BatteryConfig", Kind::Raw, 1 },
    { 0x2E, "NtcConfig", Kind::Raw, 1 },
    { 0x2F, "PackNumber", Kind::Raw, 1 },
    { 0x30, "FetControlTime", Kind::Duration, 1 },
    { 0x31, "LedDisplayTime", Kind::Duration, 1 },
    { 0x32, "VoltageCapacity80", Kind::CellVoltage, 1000 },
    { 0x33, "VoltageCapacity60", Kind::CellVoltage, 1000 },
    { 0x34, "VoltageCapacity40", Kind::CellVoltage, 1000 },
    { 0x35, "VoltageCapacity20", Kind::CellVoltage, 1000 },
    { 0x36, "HardCellOverVoltage", Kind::CellVoltage, 1000 },
    { 0x37, "HardCellUnderVoltage", Kind::CellVoltage, 1000 },
    { 0x38, "DoubleOverCurrentShortCircuit", Kind::Raw, 1 },
    { 0x39, "HardCellOverVoltageDelay", Kind::Duration, 1 },
    { 0x3A, "ChargeTempDelay", Kind::Duration, 1 },
    { 0x3B, "DischargeTempDelay", Kind::Duration, 1 },
    { 0x3C, "PackVoltageDelay", Kind::Duration, 1 },
    { 0x3D, "CellVoltageDelay", Kind::Duration, 1 },
    { 0x3E, "ChargeOverCurrentDelay", Kind::Duration, 1 },
    { 0x3F, "DischargeOverCurrentDelay", Kind::Duration, 1 },
    { 0x40, "GpsVoltage", Kind::CellVoltage, 1000 },
    { 0x41, "GpsTime", Kind::Duration, 1 },
    { 0x42, "VoltageCapacity90", Kind::CellVoltage, 1000 },
    { 0x43, "VoltageCapacity70", Kind::CellVoltage, 1000 },
    { 0x44, "VoltageCapacity50", Kind::CellVoltage, 1000 },
    { 0x45, "VoltageCapacity30", Kind::CellVoltage, 1000 },
    { 0x46, "VoltageCapacity10", Kind::CellVoltage, 1000 },
    { 0x47, "VoltageCapacity100", Kind::CellVoltage, 1000 },
    { 0xA0, "ManufacturerName", Kind::Text, 1 },
    { 0xA1, "DeviceName", Kind::Text, 1 },
    { 0xA2, "Barcode", Kind::Text, 1 },
    { 0xE0, "Capacity", Kind::Raw, 1 },
    { 0xE1, "Mosfet", Kind::Raw, 1 },
    { 0xE2, "Balance", Kind::Raw, 1 },
    { 0xE3, "Reset", Kind::Raw, 1 },
};

inline const RegisterDescriptor* findRegister(const uint8_t id) {
    const auto found = std::find_if(std::begin(REGISTER_TABLE), std::end(REGISTER_TABLE), [id](const RegisterDescriptor& descriptor) {
        return descriptor.id == id;
    });
    return found != std::end(REGISTER_TABLE) ? found : nullptr;
}
inline Kind kindOf(const uint8_t id) {
    const RegisterDescriptor* descriptor = findRegister(id);
    return descriptor != nullptr ? descriptor->kind : Kind::Raw;
}
inline std::string nameOf(const uint8_t id) {
    const RegisterDescriptor* descriptor = findRegister(id);
    if (descriptor != nullptr)
        return descriptor->name;
    char buffer[16];
    snprintf(buffer, sizeof(buffer), "0x%02X", id);
    return buffer;
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

struct DateYMD {
    uint16_t year;    // 2000-2127
    uint8_t month;
    uint8_t day;
    std::string toString() const {
        char buffer[16];
        snprintf(buffer, sizeof(buffer), "%04u-%02u-%02u", static_cast<unsigned>(year), static_cast<unsigned>(month), static_cast<unsigned>(day));
        return buffer;
    }
    bool operator==(const DateYMD&) const = default;
};

class RegisterConversion {
public:
    static constexpr int TEMPERATURE_OFFSET = 2731;

    static double decodeTemperature(const uint16_t raw) {
        return (static_cast<int>(raw) - TEMPERATURE_OFFSET) / 10.0;
    }
    static uint16_t encodeTemperature(const double celsius) {
        return checkedUnsigned(std::lround(celsius * 10.0 + TEMPERATURE_OFFSET), "temperature");
    }
    static double decodeCurrent(const uint16_t raw) {
        return static_cast<int16_t>(raw) / 100.0;
    }
    static uint16_t encodeCurrent(const double amps) {
        const long value = std::lround(amps * 100.0);
        if (value < INT16_MIN || value > INT16_MAX)
            throw std::out_of_range("current out of range for register");
        return static_cast<uint16_t>(static_cast<int16_t>(value));
    }
    static DateYMD decodeDate(const uint16_t raw) {
        return { .year = static_cast<uint16_t>(2000 + (raw >> 9)), .month = static_cast<uint8_t>((raw >> 5) & 0x0F), .day = static_cast<uint8_t>(raw & 0x1F) };
    }
    static uint16_t encodeDate(const DateYMD& date) {
        if (date.year < 2000 || date.year > 2000 + 0x7F || date.month > 0x0F || date.day > 0x1F)
            throw std::out_of_range("date out of range for register");
        return static_cast<uint16_t>(((date.year - 2000) << 9) | (date.month << 5) | date.day);
    }

    static double decode(const Kind kind, const uint16_t raw, const double scale = 1) {
        switch (kind) {
            case Kind::Temperature: return decodeTemperature(raw);
            case Kind::Current: return decodeCurrent(raw);
            case Kind::Text: throw std::invalid_argument("text register has no numeric value");
            default: return raw / scale;
        }
    }
    static uint16_t encode(const Kind kind, const double value, const double scale = 1) {
        switch (kind) {
            case Kind::Temperature: return encodeTemperature(value);
            case Kind::Current: return encodeCurrent(value);
            case Kind::Text: throw std::invalid_argument("text register has no numeric value");
            default: return checkedUnsigned(std::lround(value * scale), toString(kind));
        }
    }

    static double decodeValue(const uint8_t reg, const uint16_t raw) {
        const RegisterDescriptor* descriptor = findRegister(reg);
        return descriptor != nullptr ? decode(descriptor->kind, raw, descriptor->scale) : raw;
    }
    static uint16_t encodeValue(const uint8_t reg, const double value) {
        const RegisterDescriptor* descriptor = findRegister(reg);
        return descriptor != nullptr ? encode(descriptor->kind, value, descriptor->scale) : encode(Kind::Raw, value);
    }

    static std::string format(const uint8_t reg, const uint16_t raw) {
        const RegisterDescriptor* descriptor = findRegister(reg);
        const Kind kind = descriptor != nullptr ? descriptor->kind : Kind::Raw;
        char buffer[48];
        switch (kind) {
            case Kind::Date:
                return decodeDate(raw).toString();
            case Kind::Raw:
            case Kind::Text:
                snprintf(buffer, sizeof(buffer), "%u (0x%04X)", static_cast<unsigned>(raw), static_cast<unsigned>(raw));
                return buffer;
            case Kind::CellVoltage:
                snprintf(buffer, sizeof(buffer), "%.3f %s", decode(kind, raw, descriptor->scale), unitOf(kind));
                return buffer;
            case Kind::Temperature:
                snprintf(buffer, sizeof(buffer), "%.1f %s", decode(kind, raw, descriptor->scale), unitOf(kind));
                return buffer;
            case Kind::Resistance:
            case Kind::Duration:
            case Kind::Percentage:
                snprintf(buffer, sizeof(buffer), "%u %s", static_cast<unsigned>(raw), unitOf(kind));
                return buffer;
            default:
                snprintf(buffer, sizeof(buffer), "%.2f %s", decode(kind, raw, descriptor->scale), unitOf(kind));
                return buffer;
        }
    }

private:
    static uint16_t checkedUnsigned(const long value, const char* what) {
        if (value < 0 || value > UINT16_MAX)
            throw std::out_of_range(std::string(what) + " out of range for register");
        return static_cast<uint16_t>(value);
    }
};

// -----------------------------------------------------------------------------------------------

template<size_t N>
class FlagSet {
public:
    struct Flag {
        const char* key;
        const char* label;
    };
    using Flags = std::array<Flag, N>;

    FlagSet(const Flags& flags, const uint16_t bits = 0)
        : _flags(&flags), _bits(bits) {}

    uint16_t bits() const {
        return _bits;
    }
    bool test(const size_t bit) const {
        return bit < N && ((_bits >> bit) & 0x01);
    }
    bool any() const {
        return (_bits & ((1u << N) - 1)) != 0;
    }
    static constexpr size_t size() {
        return N;
    }
    const Flag& flag(const size_t bit) const {
        return (*_flags)[bit];
    }
    std::vector<const char*> active() const {
        std::vector<const char*> labels;
        for (size_t bit = 0; bit < N; bit++)
            if (test(bit))
                labels.push_back((*_flags)[bit].label);
        return labels;
    }

private:
    const Flags* _flags;
    uint16_t _bits;
};

inline constexpr std::array<FlagSet<13>::Flag, 13> PROTECTION_FLAGS = { {
    { "singleCellOV", "Cell Overvoltage" },
    { "singleCellUV", "Cell Undervoltage" },
    { "packOV", "Pack Overvoltage" },
    { "packUV", "Pack Undervoltage" },
    { "chargeOT", "Charge Over Temp" },
    { "chargeLT", "Charge Low Temp" },
    { "dischargeOT", "Discharge Over Temp" },
    { "dischargeLT", "Discharge Low Temp" },
    { "chargeOC", "Charge Overcurrent" },
    { "dischargeOC", "Discharge Overcurrent" },
    { "shortCircuit", "Short Circuit" },
    { "icError", "IC Error" },
    { "mosLock", "MOS Lock" },
} };

inline constexpr std::array<FlagSet<8>::Flag, 8> FUNCTION_FLAGS = { {
    { "switch", "Switch" },
    { "scrl", "SCRL" },
    { "balanceEn", "Balance Enable" },
    { "chgBalance", "Charge Balance" },
    { "ledEn", "LED Enable" },
    { "ledNum", "LED Number" },
    { "rtc", "RTC" },
    { "edv", "EDV" },
} };

struct ProtectionFlags : public FlagSet<13> {
    explicit ProtectionFlags(const uint16_t bits = 0)
        : FlagSet<13>(PROTECTION_FLAGS, bits) {}
};
struct FunctionFlags : public FlagSet<8> {
    explicit FunctionFlags(const uint16_t bits = 0)
        : FlagSet<8>(FUNCTION_FLAGS, bits) {}
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

struct HardwareInfo {
    static constexpr size_t SIZE_FIXED = 23;

    double voltage = 0.0, current = 0.0;
    double remainingCapacity = 0.0, fullCapacity = 0.0;
    uint16_t cycles = 0;
    DateYMD manufactureDate{ 2000, 0, 0 };
    uint16_t balanceLow = 0, balanceHigh = 0;
    ProtectionFlags protection;
    uint8_t version = 0;
    uint8_t rsoc = 0;
    uint8_t fetState = 0;
    bool chargeEnabled = false, dischargeEnabled = false;
    uint8_t cellCount = 0, temperatureCount = 0;
    std::vector<double> temperatures;

    static HardwareInfo decode(const Frame& frame) {
        const std::vector<uint8_t>& data = frame.data();
        if (data.size() < SIZE_FIXED)
            throw FramingError(FrameError::LengthMismatch, "hardware info payload too short");
        const size_t sensors = data[22];
        if (data.size() < SIZE_FIXED + 2 * sensors)
            throw FramingError(FrameError::LengthMismatch, "hardware info payload too short for sensors");

        HardwareInfo info;
        info.voltage = frame.getUInt16(0) / 100.0;
        info.current = RegisterConversion::decodeCurrent(frame.getUInt16(2));
        info.remainingCapacity = frame.getUInt16(4) / 100.0;
        info.fullCapacity = frame.getUInt16(6) / 100.0;
        info.cycles = frame.getUInt16(8);
        info.manufactureDate = RegisterConversion::decodeDate(frame.getUInt16(10));
        info.balanceLow = frame.getUInt16(12);
        info.balanceHigh = frame.getUInt16(14);
        info.protection = ProtectionFlags(frame.getUInt16(16));
        info.version = frame.getUInt8(18);
        info.rsoc = frame.getUInt8(19);
        info.fetState = frame.getUInt8(20);
        info.chargeEnabled = (info.fetState & Registers::VALUE_FET_CHARGE_ENABLED) != 0;
        info.dischargeEnabled = (info.fetState & Registers::VALUE_FET_DISCHARGE_ENABLED) != 0;
        info.cellCount = frame.getUInt8(21);
        info.temperatureCount = frame.getUInt8(22);
        for (size_t i = 0; i < sensors; i++)
            info.temperatures.push_back(RegisterConversion::decodeTemperature(frame.getUInt16(SIZE_FIXED + i * 2)));
        return info;
    }
};

struct CellInfo {
    std::vector<double> voltages;

    size_t cellCount() const {
        return voltages.size();
    }
    double minimum() const {
        return voltages.empty() ? 0.0 : *std::min_element(voltages.begin(), voltages.end());
    }
    double maximum() const {
        return voltages.empty() ? 0.0 : *std::max_element(voltages.begin(), voltages.end());
    }
    double delta() const {
        return maximum() - minimum();
    }

    static CellInfo decode(const Frame& frame) {
        CellInfo info;
        const size_t count = frame.data().size() / 2;
        info.voltages.reserve(count);
        for (size_t i = 0; i < count; i++)
            info.voltages.push_back(frame.getUInt16(i * 2) / 1000.0);
        return info;
    }
};

struct TelemetrySnapshot {
    HardwareInfo hardware;
    CellInfo cells;
    std::string version;
    int64_t timestamp = 0;    // ms since epoch
};

// -----------------------------------------------------------------------------------------------

struct ConfigSnapshot {
    double designCapacity = 0, cycleCapacity = 0, fullChargeVoltage = 0, chargeEndVoltage = 0, dischargingRate = 0;
    double chargeOverTemp = 0, chargeOverTempRelease = 0, chargeLowTemp = 0, chargeLowTempRelease = 0;
    double dischargeOverTemp = 0, dischargeOverTempRelease = 0, dischargeLowTemp = 0, dischargeLowTempRelease = 0;
    double packOverVoltage = 0, packOverVoltageRelease = 0, packUnderVoltage = 0, packUnderVoltageRelease = 0;
    double cellOverVoltage = 0, cellOverVoltageRelease = 0, cellUnderVoltage = 0, cellUnderVoltageRelease = 0;
    double overChargeCurrent = 0, overDischargeCurrent = 0;
    double balanceStartVoltage = 0, balanceWindow = 0, senseResistor = 0;
    double batteryConfig = 0, ntcConfig = 0, packNumber = 0;
    double fetControlTime = 0, ledDisplayTime = 0;
    double hardCellOverVoltage = 0, hardCellUnderVoltage = 0;
    double serialNumber = 0, cycleCount = 0;
    DateYMD manufactureDate{ 2000, 0, 0 };
    std::string manufacturerName, deviceName, barcode;

    FunctionFlags functions() const {
        return FunctionFlags(static_cast<uint16_t>(batteryConfig));
    }
};

struct ConfigField {
    uint8_t reg;
    double ConfigSnapshot::*member;
};
struct ConfigTextField {
    uint8_t reg;
    std::string ConfigSnapshot::*member;
};

// read order of a full configuration read, the date register follows the numerics
inline constexpr std::array<ConfigField, 35> CONFIG_NUMERIC_FIELDS = { {
    { Registers::DESIGN_CAPACITY, &ConfigSnapshot::designCapacity },
    { Registers::CYCLE_CAPACITY, &ConfigSnapshot::cycleCapacity },
    { Registers::FULL_CHARGE_VOLTAGE, &ConfigSnapshot::fullChargeVoltage },
    { Registers::CHARGE_END_VOLTAGE, &ConfigSnapshot::chargeEndVoltage },
    { Registers::DISCHARGING_RATE, &ConfigSnapshot::dischargingRate },
    { Registers::CHARGE_OVER_TEMPERATURE, &ConfigSnapshot::chargeOverTemp },
    { Registers::CHARGE_OVER_TEMPERATURE_RELEASE, &ConfigSnapshot::chargeOverTempRelease },
    { Registers::CHARGE_LOW_TEMPERATURE, &ConfigSnapshot::chargeLowTemp },
    { Registers::CHARGE_LOW_TEMPERATURE_RELEASE, &ConfigSnapshot::chargeLowTempRelease },
    { Registers::DISCHARGE_OVER_TEMPERATURE, &ConfigSnapshot::dischargeOverTemp },
    { Registers::DISCHARGE_OVER_TEMPERATURE_RELEASE, &ConfigSnapshot::dischargeOverTempRelease },
    { Registers::DISCHARGE_LOW_TEMPERATURE, &ConfigSnapshot::dischargeLowTemp },
    { Registers::DISCHARGE_LOW_TEMPERATURE_RELEASE, &ConfigSnapshot::dischargeLowTempRelease },
    { Registers::PACK_OVER_VOLTAGE, &ConfigSnapshot::packOverVoltage },
    { Registers::PACK_OVER_VOLTAGE_RELEASE, &ConfigSnapshot::packOverVoltageRelease },
    { Registers::PACK_UNDER_VOLTAGE, &ConfigSnapshot::packUnderVoltage },
    { Registers::PACK_UNDER_VOLTAGE_RELEASE, &ConfigSnapshot::packUnderVoltageRelease },
    { Registers::CELL_OVER_VOLTAGE, &ConfigSnapshot::cellOverVoltage },
    { Registers::CELL_OVER_VOLTAGE_RELEASE, &ConfigSnapshot::cellOverVoltageRelease },
    { Registers::CELL_UNDER_VOLTAGE, &ConfigSnapshot::cellUnderVoltage },
    { Registers::CELL_UNDER_VOLTAGE_RELEASE, &ConfigSnapshot::cellUnderVoltageRelease },
    { Registers::OVER_CHARGE_CURRENT, &ConfigSnapshot::overChargeCurrent },
    { Registers::OVER_DISCHARGE_CURRENT, &ConfigSnapshot::overDischargeCurrent },
    { Registers::BALANCE_START_VOLTAGE, &ConfigSnapshot::balanceStartVoltage },
    { Registers::BALANCE_WINDOW, &ConfigSnapshot::balanceWindow },
    { Registers::SENSE_RESISTOR, &ConfigSnapshot::senseResistor },
    { Registers::BATTERY_CONFIG, &ConfigSnapshot::batteryConfig },
    { Registers::NTC_CONFIG, &ConfigSnapshot::ntcConfig },
    { Registers::PACK_NUMBER, &ConfigSnapshot::packNumber },
    { Registers::FET_CONTROL_TIME, &ConfigSnapshot::fetControlTime },
    { Registers::LED_DISPLAY_TIME, &ConfigSnapshot::ledDisplayTime },
    { Registers::HARD_CELL_OVER_VOLTAGE, &ConfigSnapshot::hardCellOverVoltage },
    { Registers::HARD_CELL_UNDER_VOLTAGE, &ConfigSnapshot::hardCellUnderVoltage },
    { Registers::SERIAL_NUMBER, &ConfigSnapshot::serialNumber },
    { Registers::CYCLE_COUNT, &ConfigSnapshot::cycleCount },
} };
inline constexpr std::array<ConfigTextField, 3> CONFIG_TEXT_FIELDS = { {
    { Registers::MANUFACTURER_NAME, &ConfigSnapshot::manufacturerName },
    { Registers::DEVICE_NAME, &ConfigSnapshot::deviceName },
    { Registers::BARCODE, &ConfigSnapshot::barcode },
} };

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

}    // namespace jbd_bms

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
