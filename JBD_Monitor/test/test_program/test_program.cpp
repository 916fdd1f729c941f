
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <unity.h>

#include <cstdio>

#include "../../Program.hpp"
#include "../MockTransport.hpp"

using namespace jbd_bms;

static const char* const CONFIG_FILE = "test_program_config.json";

// -----------------------------------------------------------------------------------------------

void test_parse_unsigned() {
    TEST_ASSERT_EQUAL(18, ProgramArguments::parseUnsigned("0x12", "value"));
    TEST_ASSERT_EQUAL(9600, ProgramArguments::parseUnsigned("9600", "value"));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([] { ProgramArguments::parseUnsigned("-1", "value"); }));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([] { ProgramArguments::parseUnsigned("12a", "value"); }));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([] { ProgramArguments::parseUnsigned("", "value"); }));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([] { ProgramArguments::parseUnsigned("300", "value", 0xFF); }));
}

void test_parse_double() {
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 3.65, ProgramArguments::parseDouble("3.65", "value"));
    TEST_ASSERT_FLOAT_WITHIN(0.0001, -10.5, ProgramArguments::parseDouble("-10.5", "value"));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([] { ProgramArguments::parseDouble("abc", "value"); }));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([] { ProgramArguments::parseDouble("inf", "value"); }));
}

void test_parse_register() {
    TEST_ASSERT_EQUAL_HEX8(Registers::FULL_CHARGE_VOLTAGE, ProgramArguments::parseRegister("FullChargeVoltage"));
    TEST_ASSERT_EQUAL_HEX8(Registers::FULL_CHARGE_VOLTAGE, ProgramArguments::parseRegister("fullchargevoltage"));
    TEST_ASSERT_EQUAL_HEX8(Registers::PACK_NUMBER, ProgramArguments::parseRegister("0x2F"));
    TEST_ASSERT_EQUAL_HEX8(0x99, ProgramArguments::parseRegister("153"));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([] { ProgramArguments::parseRegister("256"); }));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([] { ProgramArguments::parseRegister("NoSuchRegister"); }));
}

void test_parse_switch() {
    TEST_ASSERT_TRUE(ProgramArguments::parseSwitch("on", "state"));
    TEST_ASSERT_TRUE(ProgramArguments::parseSwitch("1", "state"));
    TEST_ASSERT_FALSE(ProgramArguments::parseSwitch("off", "state"));
    TEST_ASSERT_FALSE(ProgramArguments::parseSwitch("false", "state"));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([] { ProgramArguments::parseSwitch("maybe", "state"); }));
}

// -----------------------------------------------------------------------------------------------

void test_arguments_flags() {
    const char* argv[] = { "jbd_monitor", "monitor", "--port", "/dev/ttyUSB0", "--baud", "19200", "--interval", "500", "--count", "3", "--traffic", "--verbose" };
    Config config;
    const auto positional = ProgramConfigArguments(config, static_cast<int>(sizeof(argv) / sizeof(argv[0])), argv);
    TEST_ASSERT_EQUAL(1, positional.size());
    TEST_ASSERT_EQUAL_STRING("monitor", positional[0].c_str());
    TEST_ASSERT_EQUAL_STRING("/dev/ttyUSB0", config.serial.port.c_str());
    TEST_ASSERT_EQUAL(19200, config.session.baud);
    TEST_ASSERT_EQUAL(19200, config.prober.baud);
    TEST_ASSERT_EQUAL(500, config.poller.intervalTelemetry);
    TEST_ASSERT_EQUAL(3, config.host.count);
    TEST_ASSERT_TRUE(config.host.traffic);
    TEST_ASSERT_TRUE(config.logging.enableStderr);
}

void test_arguments_defaults_and_positionals() {
    const char* argv[] = { "jbd_monitor", "write-value", "CellOverVoltage", "3.6" };
    Config config;
    const auto positional = ProgramConfigArguments(config, 4, argv);
    TEST_ASSERT_EQUAL(3, positional.size());
    TEST_ASSERT_EQUAL_STRING("3.6", positional[2].c_str());
    TEST_ASSERT_EQUAL(DEFAULT_SERIAL_BAUD, config.session.baud);
    TEST_ASSERT_EQUAL(DEFAULT_POLL_INTERVAL, config.poller.intervalTelemetry);
    TEST_ASSERT_EQUAL_STRING("", config.serial.port.c_str());
    TEST_ASSERT_EQUAL(0, config.host.count);
}

void test_arguments_rejects() {
    Config config;
    const char* unknown[] = { "jbd_monitor", "status", "--bogus" };
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([&] { ProgramConfigArguments(config, 3, unknown); }));
    const char* missing[] = { "jbd_monitor", "status", "--port" };
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([&] { ProgramConfigArguments(config, 3, missing); }));
    const char* baud[] = { "jbd_monitor", "status", "--baud", "fast" };
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([&] { ProgramConfigArguments(config, 4, baud); }));
    const char* file[] = { "jbd_monitor", "status", "--config", "/nonexistent/config.json" };
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([&] { ProgramConfigArguments(config, 4, file); }));
}

void test_arguments_config_file_then_flags() {
    FILE* file = fopen(CONFIG_FILE, "w");
    TEST_ASSERT_NOT_NULL(file);
    fputs("{ \"serial\": { \"port\": \"/dev/ttyACM1\", \"baud\": 19200 },"
          "  \"session\": { \"timeoutRead\": 750, \"attempts\": 5 },"
          "  \"prober\": { \"timeoutProbe\": 900 },"
          "  \"recorder\": { \"capacity\": 64 },"
          "  \"poller\": { \"interval\": 2500 } }",
          file);
    fclose(file);
    const char* argv[] = { "jbd_monitor", "status", "--baud", "4800", "--config", CONFIG_FILE };
    Config config;
    ProgramConfigArguments(config, 6, argv);
    remove(CONFIG_FILE);
    TEST_ASSERT_EQUAL_STRING("/dev/ttyACM1", config.serial.port.c_str());
    TEST_ASSERT_EQUAL(4800, config.session.baud);
    TEST_ASSERT_EQUAL(750, config.session.timeoutRead);
    TEST_ASSERT_EQUAL(5, config.session.attempts);
    TEST_ASSERT_EQUAL(900, config.prober.timeoutProbe);
    TEST_ASSERT_EQUAL(64, config.recorder.capacity);
    TEST_ASSERT_EQUAL(2500, config.poller.intervalTelemetry);
}

// -----------------------------------------------------------------------------------------------

void test_json_collector() {
    JsonCollector collector("telemetry", "2024-03-15T10:00:00Z", "/dev/ttyUSB0");
    collector.document()["value"] = 1;
    JsonDocument doc;
    TEST_ASSERT_TRUE(deserializeJson(doc, collector.toString()) == DeserializationError::Ok);
    TEST_ASSERT_EQUAL_STRING("telemetry", doc["type"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("/dev/ttyUSB0", doc["addr"].as<const char*>());
    TEST_ASSERT_EQUAL(1, doc["value"].as<int>());
    JsonCollector anonymous("decode", "2024-03-15T10:00:00Z");
    TEST_ASSERT_NULL(strstr(std::string(anonymous).c_str(), "addr"));
}

void test_json_telemetry() {
    TelemetrySnapshot snapshot;
    snapshot.hardware = HardwareInfo::decode(Frame::response(Registers::HARDWARE_INFO, 0x00, MockDevice::hardwareInfoData()));
    snapshot.cells = CellInfo::decode(Frame::response(Registers::CELL_INFO, 0x00, MockDevice::cellInfoData()));
    snapshot.version = "JBD-SP04S";
    snapshot.timestamp = 1700000000123;
    JsonDocument doc;
    doc["telemetry"] = snapshot;
    JsonVariantConst telemetry = doc["telemetry"];
    TEST_ASSERT_EQUAL_STRING("2023-11-14T22:13:20.123Z", telemetry["time"].as<const char*>());
    TEST_ASSERT_FLOAT_WITHIN(0.001, 13.0, telemetry["hardware"]["voltage"].as<double>());
    TEST_ASSERT_FLOAT_WITHIN(0.001, -2.0, telemetry["hardware"]["current"].as<double>());
    TEST_ASSERT_EQUAL_STRING("2024-03-15", telemetry["hardware"]["manufactureDate"].as<const char*>());
    TEST_ASSERT_EQUAL(0, telemetry["hardware"]["protection"]["active"].size());
    TEST_ASSERT_EQUAL(2, telemetry["hardware"]["temperatures"].size());
    TEST_ASSERT_EQUAL(4, telemetry["cells"]["voltages"].size());
    TEST_ASSERT_FLOAT_WITHIN(0.0001, 3.248, telemetry["cells"]["minimum"].as<double>());
}

void test_json_config_keys() {
    ConfigSnapshot snapshot;
    snapshot.fullChargeVoltage = 14.6;
    snapshot.batteryConfig = 5;
    snapshot.deviceName = "PACK";
    snapshot.manufactureDate = { 2024, 3, 15 };
    JsonDocument doc;
    doc["config"] = snapshot;
    JsonVariantConst config = doc["config"];
    TEST_ASSERT_FLOAT_WITHIN(0.001, 14.6, config["FullChargeVoltage"].as<double>());
    TEST_ASSERT_EQUAL_STRING("PACK", config["DeviceName"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("2024-03-15", config["ManufactureDate"].as<const char*>());
    TEST_ASSERT_EQUAL(5, config["functions"]["bits"].as<int>());
    TEST_ASSERT_EQUAL(2, config["functions"]["active"].size());
}

void test_json_endpoints_and_analysis() {
    std::vector<DetectedEndpoint> endpoints(1);
    endpoints[0].identity = "/dev/ttyUSB0";
    endpoints[0].label = "ttyUSB0";
    endpoints[0].probed = endpoints[0].confirmed = true;
    JsonDocument doc;
    doc["endpoints"] = endpoints;
    TEST_ASSERT_EQUAL(1, doc["endpoints"].size());
    TEST_ASSERT_TRUE(doc["endpoints"][0]["confirmed"].as<bool>());
    TEST_ASSERT_TRUE(doc["endpoints"][0]["vendor"].isNull());

    doc["frames"] = FrameAnalyzer::analyzeStream(Frame::readRequest(Registers::CELL_INFO).encode());
    TEST_ASSERT_EQUAL(1, doc["frames"].size());
    TEST_ASSERT_EQUAL_STRING("request", doc["frames"][0]["type"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("Read CellInfo (0x04)", doc["frames"][0]["summary"].as<const char*>());
    TEST_ASSERT_TRUE(doc["frames"][0]["errors"].isNull());
}

// -----------------------------------------------------------------------------------------------

void test_program_commands() {
    const Config config;
    Program program(config);
    TEST_ASSERT_EQUAL(EXIT_SUCCESS, program.run({ "encode-read", "HardwareInfo" }));
    TEST_ASSERT_EQUAL(EXIT_SUCCESS, program.run({ "decode", "DD", "A5", "03", "00", "FF", "FD", "77" }));
    TEST_ASSERT_EQUAL(EXIT_FAILURE, program.run({ "decode", "DD A5 03 00 FF FE 77" }));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([&] { program.run({ "decode", "zz" }); }));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([&] { program.run({ "bogus" }); }));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([&] { program.run({ "write", "0x12" }); }));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([&] { program.run({ "mosfet", "on", "sideways" }); }));
    TEST_ASSERT_TRUE(throwsError<std::out_of_range>([&] { program.run({ "write-value", "CellOverVoltage", "70" }); }));
    TEST_ASSERT_TRUE(throwsError<std::invalid_argument>([&] { program.run({ "write-temp", "CellOverVoltage", "25" }); }));
}

void test_usage_lists_commands() {
    FILE* stream = tmpfile();
    TEST_ASSERT_NOT_NULL(stream);
    Program::usage(stream);
    rewind(stream);
    std::string text;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), stream) != nullptr)
        text += buffer;
    fclose(stream);
    for (const auto& command : Program::commands())
        TEST_ASSERT_NOT_NULL_MESSAGE(strstr(text.c_str(), command.name), command.name);
    TEST_ASSERT_EQUAL(12, Program::commands().size());
}

// -----------------------------------------------------------------------------------------------

void setUp(void) {
}

void tearDown(void) {
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_parse_unsigned);
    RUN_TEST(test_parse_double);
    RUN_TEST(test_parse_register);
    RUN_TEST(test_parse_switch);

    RUN_TEST(test_arguments_flags);
    RUN_TEST(test_arguments_defaults_and_positionals);
    RUN_TEST(test_arguments_rejects);
    RUN_TEST(test_arguments_config_file_then_flags);

    RUN_TEST(test_json_collector);
    RUN_TEST(test_json_telemetry);
    RUN_TEST(test_json_config_keys);
    RUN_TEST(test_json_endpoints_and_analysis);

    RUN_TEST(test_program_commands);
    RUN_TEST(test_usage_lists_commands);

    return UNITY_END();
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
