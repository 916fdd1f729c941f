
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <unity.h>

#include "../../src/ComponentsHardwareJBDBMSStream.hpp"
#include "../MockTransport.hpp"

using namespace jbd_bms;
using Bytes = std::vector<uint8_t>;

static Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes bytes;
    for (const auto& part : parts)
        bytes.insert(bytes.end(), part.begin(), part.end());
    return bytes;
}

// -----------------------------------------------------------------------------------------------

void test_reassembler_split_chunks() {
    // one response arriving a byte at a time emits exactly once, at the last byte
    const Bytes frame = MockDevice::respond(Registers::CELL_INFO, MockDevice::cellInfoData());
    int emitted = 0;
    StreamReassembler reassembler([&](const Bytes&) { emitted++; });
    for (size_t i = 0; i < frame.size(); i++) {
        const auto frames = reassembler.feed(&frame[i], 1);
        TEST_ASSERT_EQUAL(i + 1 == frame.size() ? 1 : 0, frames.size());
    }
    TEST_ASSERT_EQUAL(1, emitted);
    TEST_ASSERT_EQUAL(0, reassembler.pending());
}

void test_reassembler_skips_leading_junk() {
    const Bytes frame = Frame::readRequest(Registers::HARDWARE_INFO).encode();
    StreamReassembler reassembler;
    const auto frames = reassembler.feed(concat({ { 0x00, 0x77, 0x13 }, frame }));
    TEST_ASSERT_EQUAL(1, frames.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(frame.data(), frames[0].data(), frame.size());
}

void test_reassembler_two_frames_one_chunk() {
    const Bytes first = MockDevice::respond(Registers::FULL_CHARGE_VOLTAGE, MockDevice::u16(1460));
    const Bytes second = MockDevice::respond(Registers::DEVICE_NAME, { 'P', 'A', 'C', 'K' });
    const Bytes partial = Frame::readRequest(Registers::CELL_INFO).encode();
    StreamReassembler reassembler;
    const auto frames = reassembler.feed(concat({ first, second, Bytes(partial.begin(), partial.begin() + 3) }));
    TEST_ASSERT_EQUAL(2, frames.size());
    TEST_ASSERT_TRUE(frames[0] == first);
    TEST_ASSERT_TRUE(frames[1] == second);
    TEST_ASSERT_EQUAL(3, reassembler.pending());
    const auto rest = reassembler.feed(Bytes(partial.begin() + 3, partial.end()));
    TEST_ASSERT_EQUAL(1, rest.size());
    TEST_ASSERT_TRUE(rest[0] == partial);
}

void test_reassembler_flush_fragment() {
    std::vector<Bytes> seen;
    StreamReassembler reassembler([&](const Bytes& bytes) { seen.push_back(bytes); });
    reassembler.feed(Bytes{ 0xDD, 0x03, 0x00 });
    TEST_ASSERT_EQUAL(3, reassembler.pending());
    const auto fragment = reassembler.flush();
    TEST_ASSERT_TRUE(fragment.has_value());
    TEST_ASSERT_EQUAL(3, fragment->size());
    TEST_ASSERT_EQUAL(1, seen.size());
    TEST_ASSERT_EQUAL(0, reassembler.pending());
    TEST_ASSERT_FALSE(reassembler.flush().has_value());
}

void test_reassembler_reset() {
    StreamReassembler reassembler;
    reassembler.feed(Bytes{ 0xDD, 0xA5 });
    reassembler.reset();
    TEST_ASSERT_EQUAL(0, reassembler.pending());
}

void test_split_static() {
    const Bytes first = Frame::readRequest(Registers::HARDWARE_INFO).encode();
    const Bytes second = Frame::readRequest(Registers::CELL_INFO).encode();
    const auto frames = StreamReassembler::split(concat({ { 0x01 }, first, second, { 0xDD, 0x04 } }));
    TEST_ASSERT_EQUAL(3, frames.size());
    TEST_ASSERT_TRUE(frames[0] == first);
    TEST_ASSERT_TRUE(frames[1] == second);
    TEST_ASSERT_EQUAL(2, frames[2].size());
}

// -----------------------------------------------------------------------------------------------

void test_text_input_hex_forms() {
    const Bytes expected = { 0xDD, 0xA5, 0x03, 0x00, 0xFF, 0xFD, 0x77 };
    for (const char* text : { "DDA50300FFFD77", "dd a5 03 00 ff fd 77", "DD:A5:03:00:FF:FD:77", "DD,A5,03,00,FF,FD,77", "DD, A5, 03, 00, FF, FD, 77", "0xDDA50300FFFD77", "  DD A5 03 00 FF FD 77\n" }) {
        const auto bytes = TextInput::parse(text);
        TEST_ASSERT_TRUE_MESSAGE(bytes.has_value(), text);
        TEST_ASSERT_TRUE_MESSAGE(*bytes == expected, text);
    }
}

void test_text_input_rejects() {
    TEST_ASSERT_FALSE(TextInput::parse("").has_value());
    TEST_ASSERT_FALSE(TextInput::parse("   ").has_value());
    TEST_ASSERT_FALSE(TextInput::parse("DDA").has_value());
    TEST_ASSERT_FALSE(TextInput::parse("ZZ").has_value());
}

void test_text_input_escaped() {
    TEST_ASSERT_TRUE(TextInput::isEscaped("\\xDD\\xA5"));
    TEST_ASSERT_TRUE(TextInput::isEscaped("AB\\0"));
    TEST_ASSERT_FALSE(TextInput::isEscaped("DD A5"));
    const auto bytes = TextInput::parse("\\xDD\\x03\\x00\\x02JB\\xFF\\x72w");
    TEST_ASSERT_TRUE(bytes.has_value());
    const Bytes expected = { 0xDD, 0x03, 0x00, 0x02, 'J', 'B', 0xFF, 0x72, 0x77 };
    TEST_ASSERT_TRUE(*bytes == expected);
    const Bytes specials = TextInput::parseEscaped("\\0\\n\\r\\t\\\\\\q");
    const Bytes expectedSpecials = { 0x00, 0x0A, 0x0D, 0x09, 0x5C, '\\', 'q' };
    TEST_ASSERT_TRUE(specials == expectedSpecials);
}

// -----------------------------------------------------------------------------------------------

static const FrameAnalysis::Field* findField(const std::vector<FrameAnalysis::Field>& fields, const std::string& label) {
    for (const auto& field : fields)
        if (field.label == label)
            return &field;
    return nullptr;
}

void test_analyze_read_request() {
    const FrameAnalysis analysis = FrameAnalyzer::analyze(Frame::readRequest(Registers::HARDWARE_INFO).encode());
    TEST_ASSERT_TRUE(analysis.valid);
    TEST_ASSERT_TRUE(analysis.type == Frame::Direction::Request);
    TEST_ASSERT_EQUAL_STRING("Read HardwareInfo (0x03)", analysis.summary.c_str());
    const auto* crc = findField(analysis.packetFields, "CRC");
    TEST_ASSERT_NOT_NULL(crc);
    TEST_ASSERT_EQUAL_STRING("Valid", crc->detail.c_str());
}

void test_analyze_hardware_info_response() {
    const FrameAnalysis analysis = FrameAnalyzer::analyze(MockDevice::respond(Registers::HARDWARE_INFO, MockDevice::hardwareInfoData()));
    TEST_ASSERT_TRUE(analysis.valid);
    TEST_ASSERT_TRUE(analysis.type == Frame::Direction::Response);
    const auto* voltage = findField(analysis.dataFields, "Pack Voltage");
    TEST_ASSERT_NOT_NULL(voltage);
    TEST_ASSERT_EQUAL_STRING("13.00 V", voltage->value.c_str());
    const auto* current = findField(analysis.dataFields, "Current");
    TEST_ASSERT_NOT_NULL(current);
    TEST_ASSERT_EQUAL_STRING("Discharging", current->detail.c_str());
    const auto* balance = findField(analysis.dataFields, "Balance Low");
    TEST_ASSERT_NOT_NULL(balance);
    TEST_ASSERT_EQUAL_STRING("Cells: 1 3", balance->detail.c_str());
    const auto* protection = findField(analysis.dataFields, "Protection");
    TEST_ASSERT_NOT_NULL(protection);
    TEST_ASSERT_EQUAL_STRING("None", protection->value.c_str());
}

void test_analyze_cell_info_response() {
    const FrameAnalysis analysis = FrameAnalyzer::analyze(MockDevice::respond(Registers::CELL_INFO, MockDevice::cellInfoData()));
    TEST_ASSERT_TRUE(analysis.valid);
    const auto* cell = findField(analysis.dataFields, "Cell 2");
    TEST_ASSERT_NOT_NULL(cell);
    TEST_ASSERT_EQUAL_STRING("3.262 V", cell->value.c_str());
    const auto* delta = findField(analysis.dataFields, "Delta (max-min)");
    TEST_ASSERT_NOT_NULL(delta);
    TEST_ASSERT_EQUAL_STRING("14.0 mV", delta->value.c_str());
}

void test_analyze_write_requests() {
    const FrameAnalysis open = FrameAnalyzer::analyze(Frame::eepromOpen().encode());
    TEST_ASSERT_TRUE(open.valid);
    TEST_ASSERT_EQUAL_STRING("Open EEPROM for writing", findField(open.dataFields, "Action")->value.c_str());
    const FrameAnalysis mosfet = FrameAnalyzer::analyze(Frame::mosfetControl(false, true).encode());
    TEST_ASSERT_EQUAL_STRING("OFF", findField(mosfet.dataFields, "Charge MOSFET")->value.c_str());
    TEST_ASSERT_EQUAL_STRING("ON", findField(mosfet.dataFields, "Discharge MOSFET")->value.c_str());
    const FrameAnalysis value = FrameAnalyzer::analyze(Frame::writeUInt16(Registers::CELL_OVER_VOLTAGE, 3650).encode());
    TEST_ASSERT_NOT_NULL(findField(value.dataFields, "Value (uint16)"));
}

void test_analyze_reports_errors() {
    Bytes bytes = MockDevice::respond(Registers::FULL_CHARGE_VOLTAGE, MockDevice::u16(1460));
    bytes[bytes.size() - 2] ^= 0x01;
    const FrameAnalysis corrupt = FrameAnalyzer::analyze(bytes);
    TEST_ASSERT_FALSE(corrupt.valid);
    TEST_ASSERT_EQUAL_STRING("CRC mismatch", corrupt.errors.back().c_str());

    const FrameAnalysis status = FrameAnalyzer::analyze(MockDevice::respond(Registers::FULL_CHARGE_VOLTAGE, {}, 0x80));
    TEST_ASSERT_FALSE(status.valid);
    TEST_ASSERT_EQUAL_STRING("Response FullChargeVoltage (0x12) (ERROR)", status.summary.c_str());

    const FrameAnalysis tiny = FrameAnalyzer::analyze(Bytes{ 0xDD, 0xA5 });
    TEST_ASSERT_FALSE(tiny.valid);
    TEST_ASSERT_EQUAL_STRING("Invalid packet", tiny.summary.c_str());

    const FrameAnalysis truncated = FrameAnalyzer::analyze(Bytes{ 0xDD, 0x03, 0x00, 0x05, 0x00, 0x00, 0x77 });
    TEST_ASSERT_FALSE(truncated.valid);
}

void test_analyze_stream() {
    const auto analyses = FrameAnalyzer::analyzeStream(concat({ Frame::readRequest(Registers::CELL_INFO).encode(), MockDevice::respond(Registers::CELL_INFO, MockDevice::cellInfoData()) }));
    TEST_ASSERT_EQUAL(2, analyses.size());
    TEST_ASSERT_TRUE(analyses[0].type == Frame::Direction::Request);
    TEST_ASSERT_TRUE(analyses[1].type == Frame::Direction::Response);
    TEST_ASSERT_TRUE(analyses[0].valid && analyses[1].valid);
}

// -----------------------------------------------------------------------------------------------

void setUp(void) {
}

void tearDown(void) {
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_reassembler_split_chunks);
    RUN_TEST(test_reassembler_skips_leading_junk);
    RUN_TEST(test_reassembler_two_frames_one_chunk);
    RUN_TEST(test_reassembler_flush_fragment);
    RUN_TEST(test_reassembler_reset);
    RUN_TEST(test_split_static);

    RUN_TEST(test_text_input_hex_forms);
    RUN_TEST(test_text_input_rejects);
    RUN_TEST(test_text_input_escaped);

    RUN_TEST(test_analyze_read_request);
    RUN_TEST(test_analyze_hardware_info_response);
    RUN_TEST(test_analyze_cell_info_response);
    RUN_TEST(test_analyze_write_requests);
    RUN_TEST(test_analyze_reports_errors);
    RUN_TEST(test_analyze_stream);

    return UNITY_END();
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
