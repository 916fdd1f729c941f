
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __UTILITIES_SERIAL_HPP__
#define __UTILITIES_SERIAL_HPP__

#include "ComponentsHardwareJBDBMSSession.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace jbd_bms {

// -----------------------------------------------------------------------------------------------

inline const char *UsbVendorName (const uint16_t vendorId) {
    static constexpr struct {
        uint16_t id;
        const char *name;
    } vendors [] = {
        { 0x0403, "FTDI" },
        { 0x1a86, "CH340" },
        { 0x10c4, "CP210x" },
        { 0x067b, "PL2303" },
        { 0x2341, "Arduino" },
        { 0x1d6b, "Linux USB" },
        { 0x239a, "Adafruit" },
        { 0x2e8a, "Raspberry Pi" },
        { 0x0d28, "ARM DAPLink" },
        { 0x303a, "Espressif" },
    };
    for (const auto &vendor : vendors)
        if (vendor.id == vendorId)
            return vendor.name;
    return nullptr;
}

inline std::string UsbDescribe (const uint16_t vendorId, const uint16_t productId) {
    char buffer [64];
    const char *name = UsbVendorName (vendorId);
    if (name != nullptr)
        snprintf (buffer, sizeof (buffer), "%s (%04x:%04x)", name, vendorId, productId);
    else
        snprintf (buffer, sizeof (buffer), "USB %04x:%04x", vendorId, productId);
    return buffer;
}

// -----------------------------------------------------------------------------------------------

class SerialTransport : public Transport {
public:
    explicit SerialTransport (const std::string &path, const std::string &vendor = std::string ()) :
        _path (path),
        _vendor (vendor) { }
    ~SerialTransport () override {
        if (_fd >= 0)
            ::close (_fd);
    }
    SerialTransport (const SerialTransport &) = delete;
    SerialTransport &operator= (const SerialTransport &) = delete;

    void open (const unsigned long baud) override {
        if (_fd >= 0)
            throw TransportError ("serial port '" + _path + "' already open");
        const speed_t speed = BaudToSpeed (baud);
        const int fd = ::open (_path.c_str (), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd < 0)
            throw TransportError ("serial port '" + _path + "' open failed: " + strerror (errno));
        struct termios tio;
        if (tcgetattr (fd, &tio) != 0) {
            const int error = errno;
            ::close (fd);
            throw TransportError ("serial port '" + _path + "' tcgetattr failed: " + strerror (error));
        }
        tio.c_iflag &= static_cast<tcflag_t> (~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON | IXOFF | IXANY));
        tio.c_oflag &= static_cast<tcflag_t> (~OPOST);
        tio.c_lflag &= static_cast<tcflag_t> (~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
        tio.c_cflag &= static_cast<tcflag_t> (~(CSIZE | PARENB | PARODD | CSTOPB | CRTSCTS));
        tio.c_cflag |= static_cast<tcflag_t> (CS8 | CLOCAL | CREAD);
        tio.c_cc [VMIN] = 0;
        tio.c_cc [VTIME] = 0;
        cfsetispeed (&tio, speed);
        cfsetospeed (&tio, speed);
        if (tcsetattr (fd, TCSANOW, &tio) != 0) {
            const int error = errno;
            ::close (fd);
            throw TransportError ("serial port '" + _path + "' tcsetattr failed: " + strerror (error));
        }
        tcflush (fd, TCIOFLUSH);
        _fd = fd;
        DEBUG_PRINTF ("SerialTransport::open: '%s' at %lu baud\n", _path.c_str (), baud);
    }
    void close () override {
        if (_fd < 0)
            return;
        const int fd = _fd;
        _fd = -1;
        if (::close (fd) != 0)
            throw TransportError ("serial port '" + _path + "' close failed: " + strerror (errno));
        DEBUG_PRINTF ("SerialTransport::close: '%s'\n", _path.c_str ());
    }
    bool isOpen () const override {
        return _fd >= 0;
    }

    size_t read (uint8_t *buffer, const size_t size, const interval_t timeout) override {
        if (_fd < 0)
            throw TransportError ("serial port '" + _path + "' not open");
        struct pollfd pfd = { .fd = _fd, .events = POLLIN, .revents = 0 };
        const int ready = poll (&pfd, 1, static_cast<int> (timeout));
        if (ready < 0) {
            if (errno == EINTR)
                return 0;
            throw TransportError ("serial port '" + _path + "' poll failed: " + strerror (errno));
        }
        if (ready == 0)
            return 0;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
            throw TransportError ("serial port '" + _path + "' disconnected");
        const ssize_t count = ::read (_fd, buffer, size);
        if (count < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                return 0;
            throw TransportError ("serial port '" + _path + "' read failed: " + strerror (errno));
        }
        return static_cast<size_t> (count);
    }
    void write (const uint8_t *data, const size_t size) override {
        if (_fd < 0)
            throw TransportError ("serial port '" + _path + "' not open");
        for (size_t offset = 0; offset < size;) {
            const ssize_t count = ::write (_fd, data + offset, size - offset);
            if (count < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    struct pollfd pfd = { .fd = _fd, .events = POLLOUT, .revents = 0 };
                    poll (&pfd, 1, 10);
                    continue;
                }
                throw TransportError ("serial port '" + _path + "' write failed: " + strerror (errno));
            }
            offset += static_cast<size_t> (count);
        }
        tcdrain (_fd);
    }

    std::string identity () const override {
        return _path;
    }
    std::string label () const override {
        return _vendor.empty () ? _path : _path + " [" + _vendor + "]";
    }
    std::string vendor () const override {
        return _vendor;
    }

    static speed_t BaudToSpeed (const unsigned long baud) {
        switch (baud) {
            case 1200: return B1200;
            case 2400: return B2400;
            case 4800: return B4800;
            case 9600: return B9600;
            case 19200: return B19200;
            case 38400: return B38400;
            case 57600: return B57600;
            case 115200: return B115200;
            case 230400: return B230400;
            default: throw TransportError ("unsupported baud rate " + std::to_string (baud));
        }
    }

private:
    const std::string _path, _vendor;
    int _fd = -1;
};

// -----------------------------------------------------------------------------------------------

class SerialTransportProvider : public TransportProvider {
public:
    typedef struct {
        std::string port;    // explicit device, tried first
        bool includeBuiltin;    // also list /dev/ttyS*
    } Config;

    explicit SerialTransportProvider (const Config &cfg) :
        config (cfg) { }

    std::vector<std::shared_ptr<Transport>> enumerate () override {
        std::vector<std::string> paths;
        if (! config.port.empty ())
            paths.push_back (config.port);
        std::error_code error;
        for (const auto &entry : std::filesystem::directory_iterator ("/dev", error)) {
            const std::string name = entry.path ().filename ().string ();
            if (name.rfind ("ttyUSB", 0) == 0 || name.rfind ("ttyACM", 0) == 0 || (config.includeBuiltin && name.rfind ("ttyS", 0) == 0))
                if (std::find (paths.begin (), paths.end (), entry.path ().string ()) == paths.end ())
                    paths.push_back (entry.path ().string ());
        }
        if (error)
            DEBUG_PRINTF ("SerialTransportProvider::enumerate: /dev not readable: %s\n", error.message ().c_str ());
        std::sort (paths.begin () + (config.port.empty () ? 0 : 1), paths.end ());
        std::vector<std::shared_ptr<Transport>> transports;
        for (const auto &path : paths)
            transports.push_back (std::make_shared<SerialTransport> (path, vendorOf (path)));
        DEBUG_PRINTF ("SerialTransportProvider::enumerate: %zu endpoints\n", transports.size ());
        return transports;
    }

    std::shared_ptr<Transport> requestNew () override {
        if (config.port.empty () || ! std::filesystem::exists (config.port))
            return nullptr;
        return std::make_shared<SerialTransport> (config.port, vendorOf (config.port));
    }

    static std::string vendorOf (const std::string &path) {
        std::error_code error;
        const std::filesystem::path device = std::filesystem::path ("/sys/class/tty") / std::filesystem::path (path).filename () / "device";
        std::filesystem::path directory = std::filesystem::canonical (device, error);
        if (error)
            return std::string ();
        for (int depth = 0; depth < 4 && ! directory.empty () && directory != directory.root_path (); depth++, directory = directory.parent_path ()) {
            const auto vendorId = readHex (directory / "idVendor"), productId = readHex (directory / "idProduct");
            if (vendorId.has_value ())
                return UsbDescribe (*vendorId, productId.value_or (0));
        }
        return std::string ();
    }

private:
    const Config &config;

    static std::optional<uint16_t> readHex (const std::filesystem::path &file) {
        std::ifstream stream (file);
        std::string text;
        if (! stream || ! (stream >> text))
            return std::nullopt;
        char *end = nullptr;
        const unsigned long value = strtoul (text.c_str (), &end, 16);
        if (end == text.c_str () || value > 0xFFFF)
            return std::nullopt;
        return static_cast<uint16_t> (value);
    }
};

// -----------------------------------------------------------------------------------------------

}    // namespace jbd_bms

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
