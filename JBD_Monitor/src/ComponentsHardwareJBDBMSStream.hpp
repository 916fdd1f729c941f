
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __COMPONENTS_HARDWARE_JBDBMS_STREAM_HPP__
#define __COMPONENTS_HARDWARE_JBDBMS_STREAM_HPP__

#include "ComponentsHardwareJBDBMS.hpp"

#include <cctype>
#include <optional>

namespace jbd_bms {

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class StreamReassembler {
public:
    using Bytes = std::vector<uint8_t>;

    std::vector<Bytes> feed(const uint8_t* bytes, const size_t size) {
        _buffer.insert(_buffer.end(), bytes, bytes + size);
        std::vector<Bytes> frames;
        while (true) {
            const auto start = std::find(_buffer.begin(), _buffer.end(), Frame::Constants::VALUE_BYTE_START);
            _buffer.erase(_buffer.begin(), start);
            if (_buffer.size() < Frame::Constants::SIZE_HEADER)
                break;
            const size_t length = Frame::Constants::SIZE_MINIMUM + _buffer[Frame::Constants::OFFSET_SIZE];
            if (_buffer.size() < length)
                break;
            frames.emplace_back(_buffer.begin(), _buffer.begin() + static_cast<std::ptrdiff_t>(length));
            _buffer.erase(_buffer.begin(), _buffer.begin() + static_cast<std::ptrdiff_t>(length));
        }
        return frames;
    }
    std::vector<Bytes> feed(const Bytes& bytes) {
        return feed(bytes.data(), bytes.size());
    }

    // remaining bytes of an unterminated frame, as a terminal fragment
    std::optional<Bytes> flush() {
        if (_buffer.empty())
            return std::nullopt;
        Bytes fragment;
        fragment.swap(_buffer);
        return fragment;
    }
    size_t pending() const {
        return _buffer.size();
    }
    void reset() {
        _buffer.clear();
    }

    static std::vector<Bytes> split(const Bytes& bytes) {
        std::vector<Bytes> frames;
        size_t i = 0;
        while (i < bytes.size()) {
            if (bytes[i] != Frame::Constants::VALUE_BYTE_START) {
                i++;
                continue;
            }
            if (i + Frame::Constants::SIZE_MINIMUM > bytes.size()) {
                frames.emplace_back(bytes.begin() + static_cast<std::ptrdiff_t>(i), bytes.end());
                break;
            }
            const size_t length = Frame::Constants::SIZE_MINIMUM + bytes[i + Frame::Constants::OFFSET_SIZE];
            if (i + length > bytes.size()) {
                frames.emplace_back(bytes.begin() + static_cast<std::ptrdiff_t>(i), bytes.end());
                break;
            }
            frames.emplace_back(bytes.begin() + static_cast<std::ptrdiff_t>(i), bytes.begin() + static_cast<std::ptrdiff_t>(i + length));
            i += length;
        }
        return frames;
    }

private:
    Bytes _buffer;
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class TextInput {
public:
    using Bytes = std::vector<uint8_t>;

    // \xHH or \0 anywhere marks the text as a C-style escaped string
    static bool isEscaped(const std::string& text) {
        for (size_t i = 0; i + 1 < text.size(); i++)
            if (text[i] == '\\') {
                if (text[i + 1] == '0')
                    return true;
                if ((text[i + 1] == 'x' || text[i + 1] == 'X') && i + 3 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 2])) && std::isxdigit(static_cast<unsigned char>(text[i + 3])))
                    return true;
            }
        return false;
    }

    static Bytes parseEscaped(const std::string& text) {
        Bytes bytes;
        size_t i = 0;
        while (i < text.size()) {
            if (text[i] != '\\') {
                bytes.push_back(static_cast<uint8_t>(text[i++]));
                continue;
            }
            if (i + 1 >= text.size()) {
                i++;
                continue;
            }
            switch (text[i + 1]) {
                case 'x':
                case 'X':
                    if (i + 3 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 2])) && std::isxdigit(static_cast<unsigned char>(text[i + 3]))) {
                        bytes.push_back(static_cast<uint8_t>((hexValue(text[i + 2]) << 4) | hexValue(text[i + 3])));
                        i += 4;
                    } else
                        i += 2;    // malformed, skipped
                    break;
                case '0': bytes.push_back(0x00), i += 2; break;
                case 'n': bytes.push_back(0x0A), i += 2; break;
                case 'r': bytes.push_back(0x0D), i += 2; break;
                case 't': bytes.push_back(0x09), i += 2; break;
                case '\\': bytes.push_back(0x5C), i += 2; break;
                default:
                    bytes.push_back(static_cast<uint8_t>(text[i++]));
                    break;
            }
        }
        return bytes;
    }

    static std::optional<Bytes> parseHex(const std::string& text) {
        std::string cleaned = trim(text);
        cleaned.erase(std::remove_if(cleaned.begin(), cleaned.end(), [](const char c) {
                          return std::isspace(static_cast<unsigned char>(c)) || c == ':' || c == ',';
                      }),
                      cleaned.end());
        if (cleaned.size() >= 2 && cleaned[0] == '0' && (cleaned[1] == 'x' || cleaned[1] == 'X'))
            cleaned.erase(0, 2);
        if (cleaned.empty() || cleaned.size() % 2 != 0 || !std::all_of(cleaned.begin(), cleaned.end(), [](const char c) {
                return std::isxdigit(static_cast<unsigned char>(c));
            }))
            return std::nullopt;
        Bytes bytes;
        bytes.reserve(cleaned.size() / 2);
        for (size_t i = 0; i < cleaned.size(); i += 2)
            bytes.push_back(static_cast<uint8_t>((hexValue(cleaned[i]) << 4) | hexValue(cleaned[i + 1])));
        return bytes;
    }

    static std::optional<Bytes> parse(const std::string& text) {
        const std::string cleaned = trim(text);
        if (cleaned.empty())
            return std::nullopt;
        if (isEscaped(cleaned))
            return parseEscaped(cleaned);
        return parseHex(cleaned);
    }

private:
    static uint8_t hexValue(const char c) {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        return static_cast<uint8_t>(c - 'A' + 10);
    }
    static std::string trim(const std::string& text) {
        const auto begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
            return std::string();
        const auto end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

struct FrameAnalysis {
    struct Field {
        std::string label, value, detail;
    };
    Frame::Direction type = Frame::Direction::Response;
    bool valid = false;
    std::vector<std::string> errors;
    std::string summary;
    std::vector<Field> packetFields, dataFields;
};

class FrameAnalyzer {
public:
    using Bytes = std::vector<uint8_t>;
    using Field = FrameAnalysis::Field;

    static FrameAnalysis analyze(const Bytes& bytes) {
        FrameAnalysis analysis;
        if (bytes.size() < Frame::Constants::SIZE_MINIMUM) {
            analysis.errors.push_back("Packet too short (minimum 7 bytes)");
            analysis.summary = "Invalid packet";
            return analysis;
        }
        if (bytes.front() != Frame::Constants::VALUE_BYTE_START)
            analysis.errors.push_back("Expected start byte " + hex8(Frame::Constants::VALUE_BYTE_START) + ", got " + hex8(bytes.front()));
        if (bytes.back() != Frame::Constants::VALUE_BYTE_END)
            analysis.errors.push_back("Expected end byte " + hex8(Frame::Constants::VALUE_BYTE_END) + ", got " + hex8(bytes.back()));

        const uint8_t operation = bytes[Frame::Constants::OFFSET_OPERATION];
        const bool isRequest = operation == Frame::Constants::VALUE_OPERATION_READ || operation == Frame::Constants::VALUE_OPERATION_WRITE;
        const uint8_t reg = isRequest ? bytes[Frame::Constants::OFFSET_REGISTER] : operation;
        const uint8_t status = isRequest ? Frame::Constants::VALUE_STATUS_OK : bytes[Frame::Constants::OFFSET_REGISTER];
        const size_t length = bytes[Frame::Constants::OFFSET_SIZE];
        const bool isWrite = operation == Frame::Constants::VALUE_OPERATION_WRITE;

        analysis.type = isRequest ? Frame::Direction::Request : Frame::Direction::Response;
        analysis.packetFields.push_back({ "Start", hex8(bytes.front()), "" });
        if (isRequest) {
            analysis.packetFields.push_back({ "Command", isWrite ? "WRITE (0x5A)" : "READ (0xA5)", "" });
            analysis.packetFields.push_back({ "Register", registerName(reg), "" });
        } else {
            analysis.packetFields.push_back({ "Register", registerName(reg), "" });
            analysis.packetFields.push_back({ "Status", status == Frame::Constants::VALUE_STATUS_OK ? "0x00 (OK)" : hex8(status) + " (ERROR)", "" });
            if (status != Frame::Constants::VALUE_STATUS_OK)
                analysis.errors.push_back("Response status indicates error: " + hex8(status));
        }
        analysis.packetFields.push_back({ "Data Length", std::to_string(length) + " bytes", "" });

        const size_t expected = Frame::Constants::SIZE_MINIMUM + length;
        if (bytes.size() < expected) {
            analysis.errors.push_back("Packet too short: expected " + std::to_string(expected) + " bytes, got " + std::to_string(bytes.size()));
            analysis.summary = summary(isRequest, isWrite, reg, status, length);
            return analysis;
        }

        const Bytes data(bytes.begin() + Frame::Constants::OFFSET_DATA, bytes.begin() + static_cast<std::ptrdiff_t>(Frame::Constants::OFFSET_DATA + length));
        if (length > 0)
            analysis.packetFields.push_back({ isRequest ? "Data" : "Raw Data", BytesToHexString(data), "" });

        const uint16_t checksumExpected = calculateChecksum(bytes.data() + Frame::Constants::OFFSET_CHECKSUM_BEGIN, Frame::Constants::OFFSET_DATA + length - Frame::Constants::OFFSET_CHECKSUM_BEGIN);
        const uint16_t checksumActual = (static_cast<uint16_t>(bytes[Frame::Constants::OFFSET_DATA + length]) << 8) | bytes[Frame::Constants::OFFSET_DATA + length + 1];
        analysis.packetFields.push_back({ "CRC", hex8(checksumActual >> 8) + " " + hex8(checksumActual & 0xFF), checksumExpected == checksumActual ? "Valid" : "INVALID, expected " + hex8(checksumExpected >> 8) + " " + hex8(checksumExpected & 0xFF) });
        analysis.packetFields.push_back({ "End", hex8(bytes[expected - 1]), "" });
        if (checksumExpected != checksumActual)
            analysis.errors.push_back("CRC mismatch");

        if (isRequest && isWrite && length > 0)
            analyzeWriteData(reg, data, analysis.dataFields);
        else if (!isRequest && length > 0 && status == Frame::Constants::VALUE_STATUS_OK)
            analyzeResponseData(reg, data, analysis.dataFields);

        analysis.summary = summary(isRequest, isWrite, reg, status, length);
        analysis.valid = analysis.errors.empty();
        return analysis;
    }

    static std::vector<FrameAnalysis> analyzeStream(const Bytes& bytes) {
        std::vector<FrameAnalysis> analyses;
        for (const auto& frame : StreamReassembler::split(bytes))
            analyses.push_back(analyze(frame));
        return analyses;
    }

    static std::string registerName(const uint8_t reg) {
        const RegisterDescriptor* descriptor = findRegister(reg);
        return descriptor != nullptr ? std::string(descriptor->name) + " (" + hex8(reg) + ")" : hex8(reg);
    }

private:
    static std::string hex8(const unsigned value) {
        char buffer[8];
        snprintf(buffer, sizeof(buffer), "0x%02X", value & 0xFF);
        return buffer;
    }
    static std::string hex16(const unsigned value) {
        char buffer[8];
        snprintf(buffer, sizeof(buffer), "0x%04X", value & 0xFFFF);
        return buffer;
    }
    static std::string fixed(const double value, const int places, const char* unit = "") {
        char buffer[32];
        snprintf(buffer, sizeof(buffer), "%.*f%s", places, value, unit);
        return buffer;
    }
    static uint16_t readUInt16(const Bytes& data, const size_t offset) {
        return (static_cast<uint16_t>(data[offset]) << 8) | data[offset + 1];
    }

    static std::string summary(const bool isRequest, const bool isWrite, const uint8_t reg, const uint8_t status, const size_t length) {
        if (isRequest)
            return isWrite ? "Write to " + registerName(reg) + (length > 0 ? ", " + std::to_string(length) + " byte(s)" : "") : "Read " + registerName(reg);
        return "Response " + registerName(reg) + (status == Frame::Constants::VALUE_STATUS_OK ? "" : " (ERROR)");
    }

    static std::string balanceCells(const uint16_t mask) {
        if (mask == 0)
            return "None";
        std::string cells = "Cells:";
        for (int i = 0; i < 16; i++)
            if (mask & (1u << i))
                cells += " " + std::to_string(i + 1);
        return cells;
    }

    static void analyzeValue(const uint8_t reg, const Bytes& data, std::vector<Field>& fields) {
        const uint16_t value = readUInt16(data, 0);
        fields.push_back({ "Value (uint16)", std::to_string(value) + " (" + hex8(value >> 8) + " " + hex8(value & 0xFF) + ")", "" });
        const Kind kind = kindOf(reg);
        if (kind != Kind::Raw && kind != Kind::Text)
            fields.push_back({ std::string("As ") + toString(kind), RegisterConversion::format(reg, value), "" });
        if (reg == Registers::BATTERY_CONFIG) {
            const FunctionFlags functions(value);
            std::string active;
            for (const char* label : functions.active())
                active += (active.empty() ? "" : ", ") + std::string(label);
            fields.push_back({ "Functions", active.empty() ? "None" : active, "" });
        }
    }

    static void analyzeWriteData(const uint8_t reg, const Bytes& data, std::vector<Field>& fields) {
        if (reg == Registers::EEPROM_OPEN && data.size() == 2) {
            const uint16_t value = readUInt16(data, 0);
            if (value == Registers::VALUE_EEPROM_OPEN)
                fields.push_back({ "Action", "Open EEPROM for writing", "" });
            else
                fields.push_back({ "EEPROM Command", hex16(value), "" });
            return;
        }
        if (reg == Registers::EEPROM_CLOSE && data.size() == 2) {
            const uint16_t value = readUInt16(data, 0);
            if (value == Registers::VALUE_EEPROM_CLOSE)
                fields.push_back({ "Action", "Close EEPROM (save config)", "" });
            else
                fields.push_back({ "Config Command", hex16(value), "" });
            return;
        }
        if (reg == Registers::MOSFET && data.size() == 2) {
            fields.push_back({ "Charge MOSFET", (data[1] & Registers::VALUE_MOSFET_CHARGE_OFF) ? "OFF" : "ON", "" });
            fields.push_back({ "Discharge MOSFET", (data[1] & Registers::VALUE_MOSFET_DISCHARGE_OFF) ? "OFF" : "ON", "" });
            return;
        }
        if (kindOf(reg) == Kind::Text) {
            fields.push_back({ "Text", std::string(data.begin(), data.end()), "" });
            return;
        }
        if (data.size() == 2)
            analyzeValue(reg, data, fields);
        else
            fields.push_back({ "Raw", BytesToHexString(data), "" });
    }

    static void analyzeResponseData(const uint8_t reg, const Bytes& data, std::vector<Field>& fields) {
        const Frame frame = Frame::response(reg, Frame::Constants::VALUE_STATUS_OK, data);
        if (reg == Registers::HARDWARE_INFO) {
            try {
                const HardwareInfo info = HardwareInfo::decode(frame);
                fields.push_back({ "Pack Voltage", fixed(info.voltage, 2, " V"), "" });
                fields.push_back({ "Current", fixed(info.current, 2, " A"), info.current > 0 ? "Charging" : info.current < 0 ? "Discharging" : "Idle" });
                fields.push_back({ "Remaining Capacity", fixed(info.remainingCapacity, 2, " Ah"), "" });
                fields.push_back({ "Full Capacity", fixed(info.fullCapacity, 2, " Ah"), "" });
                fields.push_back({ "SOC", std::to_string(info.rsoc) + "%", "" });
                fields.push_back({ "Cycles", std::to_string(info.cycles), "" });
                fields.push_back({ "Cell Count", std::to_string(info.cellCount), "" });
                fields.push_back({ "Temp Sensors", std::to_string(info.temperatureCount), "" });
                std::string temperatures;
                for (const double temperature : info.temperatures)
                    temperatures += (temperatures.empty() ? "" : ", ") + fixed(temperature, 1, " C");
                fields.push_back({ "Temperatures", temperatures, "" });
                fields.push_back({ "Manufacture Date", info.manufactureDate.toString(), "" });
                fields.push_back({ "FW Version", hex8(info.version), "" });
                fields.push_back({ "Charge FET", info.chargeEnabled ? "ON" : "OFF", "" });
                fields.push_back({ "Discharge FET", info.dischargeEnabled ? "ON" : "OFF", "" });
                fields.push_back({ "Balance Low", hex16(info.balanceLow), balanceCells(info.balanceLow) });
                fields.push_back({ "Balance High", hex16(info.balanceHigh), balanceCells(info.balanceHigh) });
                const auto active = info.protection.active();
                std::string labels;
                for (const char* label : active)
                    labels += (labels.empty() ? "" : ", ") + std::string(label);
                fields.push_back({ "Protection", active.empty() ? "None" : std::to_string(active.size()) + " active", labels });
            } catch (const FramingError& e) {
                fields.push_back({ "Error", "Failed to decode hardware info", e.what() });
            }
            return;
        }
        if (reg == Registers::CELL_INFO) {
            const CellInfo info = CellInfo::decode(frame);
            fields.push_back({ "Cell Count", std::to_string(info.cellCount()), "" });
            for (size_t i = 0; i < info.cellCount(); i++)
                fields.push_back({ "Cell " + std::to_string(i + 1), fixed(info.voltages[i], 3, " V"), "" });
            if (info.cellCount() > 1)
                fields.push_back({ "Delta (max-min)", fixed(info.delta() * 1000.0, 1, " mV"), "" });
            return;
        }
        if (reg == Registers::HARDWARE_VERSION) {
            fields.push_back({ "Hardware Version", frame.getString(), "" });
            return;
        }
        if (kindOf(reg) == Kind::Text) {
            fields.push_back({ "Text", frame.getString(), "" });
            return;
        }
        if (data.size() == 2) {
            analyzeValue(reg, data, fields);
            return;
        }
        fields.push_back({ "Raw", BytesToHexString(data), "" });
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

}    // namespace jbd_bms

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
