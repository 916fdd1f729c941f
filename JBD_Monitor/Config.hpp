
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __CONFIG_HPP__
#define __CONFIG_HPP__

#ifndef DEFAULT_SERIAL_PORT
#define DEFAULT_SERIAL_PORT ""    // autodetect
#endif
#ifndef DEFAULT_SERIAL_BAUD
#define DEFAULT_SERIAL_BAUD 9600
#endif
#ifndef DEFAULT_POLL_INTERVAL
#define DEFAULT_POLL_INTERVAL (1 * 1000)
#endif
#ifndef DEFAULT_TRAFFIC_CAPACITY
#define DEFAULT_TRAFFIC_CAPACITY 500
#endif
#ifndef DEFAULT_LOG_FILE
#define DEFAULT_LOG_FILE ""
#endif

// -----------------------------------------------------------------------------------------------

/*
    JBD (Jiabaida) protection boards, UART at 9600 8N1, 3.3V TTL levels on the 4 pin BMS connector
        GND / RX / TX / (VCC)
    usual host side adapters: CH340, CP210x, FTDI, PL2303

    frame: DD [op|reg] [reg|status] LEN DATA... CHK_HI CHK_LO 77
        requests carry A5 (read) or 5A (write), responses carry the register then a status byte
        checksum is 0x10000 minus the sum of the bytes from [reg|status] to the end of DATA

    writes to configuration registers must sit between EEPROM open (0x00 <- 5678) and close (0x01 <- 0000)
*/

// -----------------------------------------------------------------------------------------------

struct Config {

    // LOGGING
    ProgramLoggingManager::Config logging = {
        .enableStderr = false,
        .enableFile = false,
        .filename = DEFAULT_LOG_FILE,
        .timestamps = false
    };

    // DEVICE
    jbd_bms::SerialTransportProvider::Config serial = {
        .port = DEFAULT_SERIAL_PORT,
        .includeBuiltin = false
    };
    jbd_bms::Session::Config session = {
        .baud = DEFAULT_SERIAL_BAUD,
        .timeoutRead = 2 * 1000,
        .attempts = 3,
        .backoffStep = 100,
        .readSlice = 50,
        .delayEepromSettle = 50,
        .delayConfigRead = 30,
        .delayTelemetryRead = 50
    };
    jbd_bms::Prober::Config prober = {
        .baud = DEFAULT_SERIAL_BAUD,
        .timeoutProbe = 1500,
        .readSlice = 50
    };
    jbd_bms::TrafficRecorder::Config recorder = {
        .capacity = DEFAULT_TRAFFIC_CAPACITY
    };
    ProgramInterfaceSerialJBDBMS::Config poller = {
        .intervalTelemetry = DEFAULT_POLL_INTERVAL
    };

    // HOST
    struct {
        counter_t count;    // 0 is unbounded
        bool traffic, pretty;
    } host = { .count = 0, .traffic = false, .pretty = true };
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#endif
