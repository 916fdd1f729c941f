
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __COMPONENTS_HARDWARE_JBDBMS_PROBER_HPP__
#define __COMPONENTS_HARDWARE_JBDBMS_PROBER_HPP__

#include "ComponentsHardwareJBDBMSSession.hpp"

#include <optional>

namespace jbd_bms {

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

struct DetectedEndpoint {
    std::shared_ptr<Transport> transport;
    std::string identity, label, vendor;
    bool probed = false, confirmed = false;
};

class Prober {
public:
    struct Config {
        unsigned long baud;
        interval_t timeoutProbe;
        interval_t readSlice;
    };

    using ProgressHandler = std::function<void(const DetectedEndpoint&)>;

    explicit Prober(const Config& conf, TrafficRecorder* recorder = nullptr)
        : config(conf), _recorder(recorder) {}

    // true only for a structurally valid response to a hardware info request; endpoint left closed
    bool probe(Transport& transport, const unsigned long baud = 0) {
        if (transport.isOpen()) {
            DEBUG_PRINTF("Prober::probe: '%s' already open, skipped\n", transport.identity().c_str());
            return false;
        }
        try {
            transport.open(baud != 0 ? baud : config.baud);
        } catch (const TransportError& e) {
            DEBUG_PRINTF("Prober::probe: '%s' open failed: %s\n", transport.identity().c_str(), e.what());
            return false;
        }
        const ClosingGuard guard(transport);
        try {
            return exchange(transport);
        } catch (const Error& e) {
            DEBUG_PRINTF("Prober::probe: '%s' failed: %s\n", transport.identity().c_str(), e.what());
        }
        return false;
    }

    std::vector<DetectedEndpoint> autodetect(TransportProvider& provider, const unsigned long baud = 0, const ProgressHandler& progress = nullptr) {
        std::vector<std::shared_ptr<Transport>> transports = provider.enumerate();
        if (transports.empty()) {
            DEBUG_PRINTF("Prober::autodetect: no endpoints, requesting\n");
            if (auto transport = provider.requestNew())
                transports.push_back(transport);
        }
        std::vector<DetectedEndpoint> endpoints;
        for (const auto& transport : transports) {
            DetectedEndpoint endpoint{ .transport = transport, .identity = transport->identity(), .label = transport->label(), .vendor = transport->vendor() };
            endpoint.confirmed = probe(*transport, baud);
            endpoint.probed = true;
            DEBUG_PRINTF("Prober::autodetect: '%s' (%s) %s\n", endpoint.identity.c_str(), endpoint.label.c_str(), endpoint.confirmed ? "confirmed" : "rejected");
            if (progress)
                progress(endpoint);
            endpoints.push_back(endpoint);
        }
        return endpoints;
    }

    // connects the session to the first confirmed endpoint
    std::optional<DetectedEndpoint> autodetect(TransportProvider& provider, Session& session, const unsigned long baud = 0, const ProgressHandler& progress = nullptr) {
        for (const auto& endpoint : autodetect(provider, baud, progress))
            if (endpoint.confirmed) {
                session.connect(endpoint.transport, baud);
                return endpoint;
            }
        return std::nullopt;
    }

private:
    const Config& config;
    TrafficRecorder* _recorder;

    class ClosingGuard {
        Transport& _transport;

    public:
        explicit ClosingGuard(Transport& transport)
            : _transport(transport) {}
        ~ClosingGuard() {
            try {
                _transport.close();
            } catch (const TransportError& e) {
                DEBUG_PRINTF("Prober::probe: '%s' close failed: %s\n", _transport.identity().c_str(), e.what());
            }
        }
    };

    bool exchange(Transport& transport) {
        const std::vector<uint8_t> request = Frame::readRequest(Registers::HARDWARE_INFO).encode();
        transport.write(request.data(), request.size());
        if (_recorder)
            _recorder->record(TrafficEvent::Direction::TX, request);

        std::vector<uint8_t> received;
        StreamReassembler reassembler;
        uint8_t buffer[256];
        bool confirmed = false;
        for (const interval_t started = millis(); !confirmed && millis() - started < config.timeoutProbe;) {
            const size_t size = transport.read(buffer, sizeof(buffer), std::min<interval_t>(config.readSlice, config.timeoutProbe - (millis() - started)));
            if (size == 0)
                continue;
            received.insert(received.end(), buffer, buffer + size);
            for (const auto& candidate : reassembler.feed(buffer, size)) {
                const Frame::Decoded decoded = Frame::decode(candidate);
                if (decoded && decoded.frame.isResponse() && decoded.frame.getRegister() == Registers::HARDWARE_INFO) {
                    confirmed = true;
                    break;
                }
            }
        }
        if (_recorder && !received.empty())
            _recorder->record(TrafficEvent::Direction::RX, received);
        return confirmed;
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

}    // namespace jbd_bms

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
