
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __UTILITIES_JSON_HPP__
#define __UTILITIES_JSON_HPP__

#include <ArduinoJson.h>

#include "Utilities.hpp"
#include "ComponentsHardwareJBDBMSProber.hpp"
#include "ComponentsHardwareJBDBMSStream.hpp"
#include "ComponentsTrafficRecorder.hpp"

#include <fstream>
#include <string>
#include <vector>

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class JsonCollector {
    JsonDocument doc;

public:
    explicit JsonCollector(const std::string& type, const std::string& time, const std::string& addr = std::string()) {
        doc["type"] = type;
        doc["time"] = time;
        if (!addr.empty())
            doc["addr"] = addr;
    }
    inline JsonDocument& document() {
        return doc;
    }
    std::string toString(const bool pretty = false) const {
        std::string output;
        if (pretty)
            serializeJsonPretty(doc, output);
        else
            serializeJson(doc, output);
        return output;
    }
    operator std::string() const {
        return toString();
    }
};

namespace JsonFunctions {
inline bool loadFile(const std::string& filename, JsonDocument& doc) {
    std::ifstream file(filename);
    if (!file) {
        DEBUG_PRINTF("JsonFunctions::loadFile: '%s' not readable\n", filename.c_str());
        return false;
    }
    DeserializationError error;
    if ((error = deserializeJson(doc, file)) != DeserializationError::Ok) {
        DEBUG_PRINTF("JsonFunctions::loadFile: '%s' deserializeJson fault: %s\n", filename.c_str(), error.c_str());
        return false;
    }
    return true;
}
template<typename T>
inline void assign(JsonVariantConst src, const char* key, T& value) {
    if (src[key].is<T>())
        value = src[key].as<T>();
}
}    // namespace JsonFunctions

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

namespace jbd_bms {

template<typename T>
inline bool convertToJson(const std::vector<T>& src, JsonVariant dst) {
    JsonArray array = dst.to<JsonArray>();
    for (const auto& element : src)
        array.add(element);
    return true;
}

inline bool convertToJson(const DateYMD& src, JsonVariant dst) {
    return dst.set(src.toString());
}

template<size_t N>
inline void collectFlags(const FlagSet<N>& flags, JsonVariant dst) {
    dst["bits"] = flags.bits();
    JsonArray active = dst["active"].to<JsonArray>();
    for (const auto label : flags.active())
        active.add(label);
}

inline bool convertToJson(const HardwareInfo& src, JsonVariant dst) {
    dst["voltage"] = src.voltage;
    dst["current"] = src.current;
    dst["remainingCapacity"] = src.remainingCapacity;
    dst["fullCapacity"] = src.fullCapacity;
    dst["cycles"] = src.cycles;
    dst["manufactureDate"] = src.manufactureDate;
    dst["balanceLow"] = src.balanceLow;
    dst["balanceHigh"] = src.balanceHigh;
    collectFlags(src.protection, dst["protection"].to<JsonObject>());
    dst["version"] = src.version;
    dst["rsoc"] = src.rsoc;
    dst["fetState"] = src.fetState;
    dst["chargeEnabled"] = src.chargeEnabled;
    dst["dischargeEnabled"] = src.dischargeEnabled;
    dst["cellCount"] = src.cellCount;
    dst["temperatureCount"] = src.temperatureCount;
    JsonArray temperatures = dst["temperatures"].to<JsonArray>();
    for (const auto temperature : src.temperatures)
        temperatures.add(temperature);
    return true;
}

inline bool convertToJson(const CellInfo& src, JsonVariant dst) {
    JsonArray voltages = dst["voltages"].to<JsonArray>();
    for (const auto voltage : src.voltages)
        voltages.add(voltage);
    dst["minimum"] = src.minimum();
    dst["maximum"] = src.maximum();
    dst["delta"] = src.delta();
    return true;
}

inline bool convertToJson(const TelemetrySnapshot& src, JsonVariant dst) {
    dst["time"] = getTimeStringMillis(src.timestamp);
    dst["version"] = src.version;
    dst["hardware"] = src.hardware;
    dst["cells"] = src.cells;
    return true;
}

inline bool convertToJson(const ConfigSnapshot& src, JsonVariant dst) {
    for (const auto& field : CONFIG_NUMERIC_FIELDS)
        dst[nameOf(field.reg)] = src.*field.member;
    dst[nameOf(Registers::MANUFACTURE_DATE)] = src.manufactureDate;
    for (const auto& field : CONFIG_TEXT_FIELDS)
        dst[nameOf(field.reg)] = src.*field.member;
    collectFlags(src.functions(), dst["functions"].to<JsonObject>());
    return true;
}

inline bool convertToJson(const DetectedEndpoint& src, JsonVariant dst) {
    dst["identity"] = src.identity;
    dst["label"] = src.label;
    if (!src.vendor.empty())
        dst["vendor"] = src.vendor;
    dst["probed"] = src.probed;
    dst["confirmed"] = src.confirmed;
    return true;
}

inline bool convertToJson(const TrafficEvent& src, JsonVariant dst) {
    dst["time"] = getTimeStringMillis(src.timestamp);
    dst["direction"] = TrafficEvent::toString(src.direction);
    dst["hex"] = src.hex();
    dst["ascii"] = src.ascii();
    return true;
}

inline bool convertToJson(const FrameAnalysis::Field& src, JsonVariant dst) {
    dst["label"] = src.label;
    dst["value"] = src.value;
    if (!src.detail.empty())
        dst["detail"] = src.detail;
    return true;
}

inline bool convertToJson(const FrameAnalysis& src, JsonVariant dst) {
    dst["type"] = src.type == Frame::Direction::Request ? "request" : "response";
    dst["valid"] = src.valid;
    dst["summary"] = src.summary;
    if (!src.errors.empty()) {
        JsonArray errors = dst["errors"].to<JsonArray>();
        for (const auto& error : src.errors)
            errors.add(error);
    }
    JsonArray packet = dst["packet"].to<JsonArray>();
    for (const auto& field : src.packetFields)
        packet.add(field);
    JsonArray data = dst["data"].to<JsonArray>();
    for (const auto& field : src.dataFields)
        data.add(field);
    return true;
}

}    // namespace jbd_bms

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
