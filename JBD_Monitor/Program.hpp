
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __PROGRAM_HPP__
#define __PROGRAM_HPP__

#define DEFAULT_NAME "JBD_Monitor"
#define DEFAULT_VERS "1.0.0"
#ifdef DEBUG
#define DEFAULT_DEBUG_LOGGING_BUFFER (2 * 1024)
#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include "src/Utilities.hpp"
#include "src/UtilitiesSerial.hpp"
#include "src/UtilitiesJson.hpp"

#include "src/ComponentsHardwareJBDBMS.hpp"
#include "src/ComponentsHardwareJBDBMSStream.hpp"
#include "src/ComponentsHardwareJBDBMSSession.hpp"
#include "src/ComponentsHardwareJBDBMSProber.hpp"
#include "src/ComponentsTrafficRecorder.hpp"

#include "src/ProgramManageLogging.hpp"
#include "src/ProgramInterfaceSerialJBDBMS.hpp"

#include "Config.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <limits>
#include <mutex>
#include <vector>

#include <strings.h>

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

namespace ProgramArguments {

inline unsigned long parseUnsigned (const std::string &text, const char *what, const unsigned long maximum = std::numeric_limits<unsigned long>::max ()) {
    char *end = nullptr;
    errno = 0;
    const unsigned long value = strtoul (text.c_str (), &end, 0);
    if (text.empty () || text [0] == '-' || end == text.c_str () || *end != '\0' || errno == ERANGE || value > maximum)
        throw std::invalid_argument (std::string ("invalid ") + what + " '" + text + "'");
    return value;
}
inline double parseDouble (const std::string &text, const char *what) {
    char *end = nullptr;
    const double value = strtod (text.c_str (), &end);
    if (text.empty () || end == text.c_str () || *end != '\0' || ! std::isfinite (value))
        throw std::invalid_argument (std::string ("invalid ") + what + " '" + text + "'");
    return value;
}
// register as number (0x.. or decimal) or table name
inline uint8_t parseRegister (const std::string &text) {
    for (const auto &descriptor : jbd_bms::REGISTER_TABLE)
        if (strcasecmp (descriptor.name, text.c_str ()) == 0)
            return descriptor.id;
    return static_cast<uint8_t> (parseUnsigned (text, "register", 0xFF));
}
inline bool parseSwitch (const std::string &text, const char *what) {
    if (text == "on" || text == "1" || text == "true")
        return true;
    if (text == "off" || text == "0" || text == "false")
        return false;
    throw std::invalid_argument (std::string ("invalid ") + what + " '" + text + "', expected on or off");
}

}    // namespace ProgramArguments

// -----------------------------------------------------------------------------------------------

inline void ProgramConfigLoad (Config &config, JsonVariantConst src) {
    using JsonFunctions::assign;
    JsonVariantConst logging = src ["logging"];
    assign (logging, "stderr", config.logging.enableStderr);
    assign (logging, "timestamps", config.logging.timestamps);
    if (logging ["file"].is<std::string> ())
        config.logging.filename = logging ["file"].as<std::string> (), config.logging.enableFile = ! config.logging.filename.empty ();
    JsonVariantConst serial = src ["serial"];
    assign (serial, "port", config.serial.port);
    assign (serial, "includeBuiltin", config.serial.includeBuiltin);
    if (serial ["baud"].is<unsigned long> ())
        config.session.baud = config.prober.baud = serial ["baud"].as<unsigned long> ();
    JsonVariantConst session = src ["session"];
    assign (session, "timeoutRead", config.session.timeoutRead);
    assign (session, "attempts", config.session.attempts);
    assign (session, "backoffStep", config.session.backoffStep);
    assign (session, "delayEepromSettle", config.session.delayEepromSettle);
    assign (session, "delayConfigRead", config.session.delayConfigRead);
    assign (session, "delayTelemetryRead", config.session.delayTelemetryRead);
    assign (src ["prober"], "timeoutProbe", config.prober.timeoutProbe);
    assign (src ["recorder"], "capacity", config.recorder.capacity);
    assign (src ["poller"], "interval", config.poller.intervalTelemetry);
}

// returns the positional arguments, command first
inline std::vector<std::string> ProgramConfigArguments (Config &config, const int argc, const char *const argv []) {
    std::vector<std::string> arguments (argv + 1, argv + argc);
    for (size_t i = 0; i + 1 < arguments.size (); i++)
        if (arguments [i] == "--config") {
            JsonDocument doc;
            if (! JsonFunctions::loadFile (arguments [i + 1], doc))
                throw std::invalid_argument ("config file '" + arguments [i + 1] + "' not loadable");
            ProgramConfigLoad (config, doc.as<JsonVariantConst> ());
        }
    std::vector<std::string> positional;
    for (size_t i = 0; i < arguments.size (); i++) {
        const std::string &argument = arguments [i];
        const auto value = [&] () -> const std::string & {
            if (i + 1 >= arguments.size ())
                throw std::invalid_argument ("option " + argument + " requires a value");
            return arguments [++i];
        };
        if (argument == "--port")
            config.serial.port = value ();
        else if (argument == "--baud")
            config.session.baud = config.prober.baud = ProgramArguments::parseUnsigned (value (), "baud rate");
        else if (argument == "--interval")
            config.poller.intervalTelemetry = ProgramArguments::parseUnsigned (value (), "interval");
        else if (argument == "--count")
            config.host.count = ProgramArguments::parseUnsigned (value (), "count");
        else if (argument == "--config")
            value ();
        else if (argument == "--log")
            config.logging.filename = value (), config.logging.enableFile = true;
        else if (argument == "--traffic")
            config.host.traffic = true;
        else if (argument == "--verbose")
            config.logging.enableStderr = true, config.logging.timestamps = true;
        else if (argument == "--quiet")
            config.logging.enableStderr = false, config.host.pretty = false;
        else if (argument.size () > 2 && argument.rfind ("--", 0) == 0)
            throw std::invalid_argument ("unknown option " + argument);
        else
            positional.push_back (argument);
    }
    return positional;
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

inline std::atomic<bool> __programInterrupted = false;

class Program : public ProgramInterfaceSerialJBDBMS::Handler, public jbd_bms::TrafficRecorder::Listener {

    const Config config;

    ProgramLoggingManager programLogging;
    jbd_bms::TrafficRecorder trafficRecorder;
    jbd_bms::SerialTransportProvider transportProvider;
    jbd_bms::Session session;
    jbd_bms::Prober prober;

    std::mutex outputMutex;
    std::atomic<counter_t> telemetryCount = 0;

    //

    template <typename T>
    void output (const char *type, const char *key, const T &value) {
        JsonCollector collector (type, getTimeString (), session.identity ());
        collector.document () [key] = value;
        std::lock_guard<std::mutex> guard (outputMutex);
        printf ("%s\n", collector.toString (config.host.pretty).c_str ());
        fflush (stdout);
    }
    void progress (const jbd_bms::DetectedEndpoint &endpoint) {
        if (config.host.pretty)
            fprintf (stderr, "probe: %s ... %s\n", endpoint.label.c_str (), endpoint.confirmed ? "JBD BMS" : "no response");
    }

    void connect () {
        if (! config.serial.port.empty ()) {
            session.connect (std::make_shared<jbd_bms::SerialTransport> (config.serial.port, jbd_bms::SerialTransportProvider::vendorOf (config.serial.port)));
            return;
        }
        const auto endpoint = prober.autodetect (transportProvider, session, config.session.baud, [&] (const jbd_bms::DetectedEndpoint &e) {
            progress (e);
        });
        if (! endpoint.has_value ())
            throw jbd_bms::TransportError ("no JBD BMS detected, use --port to name the device");
        DEBUG_PRINTF ("Program::connect: detected '%s'\n", endpoint->label.c_str ());
    }

    //

    int commandList () {
        std::vector<jbd_bms::DetectedEndpoint> endpoints;
        for (const auto &transport : transportProvider.enumerate ())
            endpoints.push_back ({ .transport = transport, .identity = transport->identity (), .label = transport->label (), .vendor = transport->vendor () });
        output ("endpoints", "endpoints", endpoints);
        return EXIT_SUCCESS;
    }
    int commandAutodetect () {
        const auto endpoints = prober.autodetect (transportProvider, config.prober.baud, [&] (const jbd_bms::DetectedEndpoint &e) {
            progress (e);
        });
        output ("endpoints", "endpoints", endpoints);
        return std::any_of (endpoints.begin (), endpoints.end (), [] (const auto &e) { return e.confirmed; }) ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    int commandStatus () {
        connect ();
        output ("telemetry", "telemetry", session.readTelemetry ());
        return EXIT_SUCCESS;
    }
    int commandMonitor () {
        connect ();
        if (config.host.traffic)
            trafficRecorder.registerListener (this);
        ProgramInterfaceSerialJBDBMS poller (config.poller, session, *this);
        poller.start ();
        while (! __programInterrupted && poller.running () && (config.host.count == 0 || telemetryCount < config.host.count))
            delay (50);
        poller.stop ();
        if (config.host.traffic)
            trafficRecorder.unregisterListener (this);
        DEBUG_PRINTF ("Program::monitor: %lu polls, %lu failures\n", poller.polls (), poller.failures ());
        return (poller.failures () == 0 || telemetryCount > 0) ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    int commandConfig () {
        connect ();
        output ("config", "config", session.readConfig ());
        return EXIT_SUCCESS;
    }
    int commandWrite (const std::vector<std::string> &args) {
        const uint8_t reg = ProgramArguments::parseRegister (args.at (0));
        const uint16_t raw = static_cast<uint16_t> (ProgramArguments::parseUnsigned (args.at (1), "value", 0xFFFF));
        connect ();
        session.writeRegister (reg, raw);
        fprintf (stderr, "wrote %s = %u\n", jbd_bms::nameOf (reg).c_str (), static_cast<unsigned> (raw));
        return EXIT_SUCCESS;
    }
    int commandWriteValue (const std::vector<std::string> &args) {
        const uint8_t reg = ProgramArguments::parseRegister (args.at (0));
        const double value = ProgramArguments::parseDouble (args.at (1), "value");
        const uint16_t raw = jbd_bms::RegisterConversion::encodeValue (reg, value);
        connect ();
        session.writeRegisterValue (reg, value);
        fprintf (stderr, "wrote %s = %s\n", jbd_bms::nameOf (reg).c_str (), jbd_bms::RegisterConversion::format (reg, raw).c_str ());
        return EXIT_SUCCESS;
    }
    int commandWriteTemp (const std::vector<std::string> &args) {
        const uint8_t reg = ProgramArguments::parseRegister (args.at (0));
        const double celsius = ProgramArguments::parseDouble (args.at (1), "temperature");
        if (jbd_bms::kindOf (reg) != jbd_bms::Kind::Temperature)
            throw std::invalid_argument ("register " + jbd_bms::nameOf (reg) + " is not a temperature");
        connect ();
        session.writeTemperatureRegister (reg, celsius);
        fprintf (stderr, "wrote %s = %.1f C\n", jbd_bms::nameOf (reg).c_str (), celsius);
        return EXIT_SUCCESS;
    }
    int commandWriteString (const std::vector<std::string> &args) {
        const uint8_t reg = ProgramArguments::parseRegister (args.at (0));
        connect ();
        session.writeStringRegister (reg, args.at (1));
        fprintf (stderr, "wrote %s = '%s'\n", jbd_bms::nameOf (reg).c_str (), args.at (1).c_str ());
        return EXIT_SUCCESS;
    }
    int commandMosfet (const std::vector<std::string> &args) {
        const bool chargeOn = ProgramArguments::parseSwitch (args.at (0), "charge state"), dischargeOn = ProgramArguments::parseSwitch (args.at (1), "discharge state");
        connect ();
        session.setMosfet (chargeOn, dischargeOn);
        fprintf (stderr, "mosfet charge=%s discharge=%s\n", chargeOn ? "on" : "off", dischargeOn ? "on" : "off");
        return EXIT_SUCCESS;
    }
    int commandDecode (const std::vector<std::string> &args) {
        std::string text;
        for (const auto &arg : args)
            text += (text.empty () ? "" : " ") + arg;
        const auto bytes = jbd_bms::TextInput::parse (text);
        if (! bytes.has_value ())
            throw std::invalid_argument ("input is neither hex nor escaped bytes");
        const auto analyses = jbd_bms::FrameAnalyzer::analyzeStream (*bytes);
        output ("decode", "frames", analyses);
        return std::all_of (analyses.begin (), analyses.end (), [] (const auto &a) { return a.valid; }) ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    int commandEncodeRead (const std::vector<std::string> &args) {
        const uint8_t reg = ProgramArguments::parseRegister (args.at (0));
        printf ("%s\n", jbd_bms::BytesToHexString (jbd_bms::Frame::readRequest (reg).encode ()).c_str ());
        return EXIT_SUCCESS;
    }

public:
    explicit Program (const Config &conf) :
        config (conf),
        programLogging (config.logging),
        trafficRecorder (config.recorder),
        transportProvider (config.serial),
        session (config.session, &trafficRecorder),
        prober (config.prober, &trafficRecorder) {
        session.registerStateHandler ([] (const jbd_bms::Session::State state) {
            DEBUG_PRINTF ("Program::session: %s\n", jbd_bms::Session::toString (state));
        });
    }
    ~Program () override {
        session.disconnect ();
    }

    struct Command {
        const char *name, *usage;
        size_t arguments;
        std::function<int (Program &, const std::vector<std::string> &)> handler;
    };
    static const std::vector<Command> &commands () {
        static const std::vector<Command> table = {
            { "list", "", 0, [] (Program &p, const auto &) { return p.commandList (); } },
            { "autodetect", "", 0, [] (Program &p, const auto &) { return p.commandAutodetect (); } },
            { "status", "", 0, [] (Program &p, const auto &) { return p.commandStatus (); } },
            { "monitor", "", 0, [] (Program &p, const auto &) { return p.commandMonitor (); } },
            { "config", "", 0, [] (Program &p, const auto &) { return p.commandConfig (); } },
            { "write", "<reg> <raw>", 2, [] (Program &p, const auto &a) { return p.commandWrite (a); } },
            { "write-value", "<reg> <value>", 2, [] (Program &p, const auto &a) { return p.commandWriteValue (a); } },
            { "write-temp", "<reg> <celsius>", 2, [] (Program &p, const auto &a) { return p.commandWriteTemp (a); } },
            { "write-string", "<reg> <text>", 2, [] (Program &p, const auto &a) { return p.commandWriteString (a); } },
            { "mosfet", "<charge on|off> <discharge on|off>", 2, [] (Program &p, const auto &a) { return p.commandMosfet (a); } },
            { "decode", "<text>", 1, [] (Program &p, const auto &a) { return p.commandDecode (a); } },
            { "encode-read", "<reg>", 1, [] (Program &p, const auto &a) { return p.commandEncodeRead (a); } },
        };
        return table;
    }
    static void usage (FILE *stream) {
        fprintf (stream, "usage: jbd_monitor <command> [options]\n\ncommands:\n");
        for (const auto &command : commands ())
            fprintf (stream, "  %s %s\n", command.name, command.usage);
        fprintf (stream, "\noptions:\n  --port <device>  --baud <rate>  --interval <ms>  --count <n>  --traffic\n  --config <json>  --log <file>  --verbose  --quiet\n");
    }

    int run (const std::vector<std::string> &positional) {
        const auto command = std::find_if (commands ().begin (), commands ().end (), [&] (const Command &c) { return positional.front () == c.name; });
        if (command == commands ().end ())
            throw std::invalid_argument ("unknown command '" + positional.front () + "'");
        const std::vector<std::string> args (positional.begin () + 1, positional.end ());
        if (args.size () < command->arguments)
            throw std::invalid_argument (std::string ("command '") + command->name + "' requires " + command->usage);
        DEBUG_PRINTF ("Program::run: %s (%zu arguments)\n", command->name, args.size ());
        return command->handler (*this, args);
    }

    // ProgramInterfaceSerialJBDBMS::Handler
    void onTelemetry (const jbd_bms::TelemetrySnapshot &snapshot) override {
        if (config.host.count == 0 || telemetryCount < config.host.count)
            output ("telemetry", "telemetry", snapshot);
        telemetryCount++;
    }
    void onTelemetryError (const std::exception &error) override {
        std::lock_guard<std::mutex> guard (outputMutex);
        fprintf (stderr, "telemetry: %s\n", error.what ());
    }
    void onStopped () override {
        DEBUG_PRINTF ("Program::monitor: poller stopped with session %s\n", jbd_bms::Session::toString (session.state ()));
    }

    // jbd_bms::TrafficRecorder::Listener
    void onTrafficEvent (const jbd_bms::TrafficEvent &event) override {
        std::lock_guard<std::mutex> guard (outputMutex);
        fprintf (stderr, "%s %s %s\n", getTimeStringMillis (event.timestamp).c_str (), jbd_bms::TrafficEvent::toString (event.direction), event.hex ().c_str ());
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#endif
