
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __PROGRAM_MANAGE_LOGGING_HPP__
#define __PROGRAM_MANAGE_LOGGING_HPP__

#include "Utilities.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#ifdef DEBUG
#include <mutex>
#endif

#ifndef DEFAULT_DEBUG_LOGGING_BUFFER
#define DEFAULT_DEBUG_LOGGING_BUFFER (2 * 1024)
#endif

class ProgramLoggingManager : private Singleton<ProgramLoggingManager> {
public:
    typedef struct {
        bool enableStderr, enableFile;
        std::string filename;
        bool timestamps;
    } Config;

#ifdef DEBUG
private:
    const Config &config;

    bool _enableStderr = false, _enableFile = false;
    __DebugLoggerFunc __debugLoggerPrevious = nullptr;
    FILE *_file = nullptr;

public:
    explicit ProgramLoggingManager (const Config &cfg) :
        Singleton<ProgramLoggingManager> (this),
        config (cfg) {
        init ();
    }
    ~ProgramLoggingManager () {
        term ();
    }

protected:
    void init () {
        if (config.enableFile && ! config.filename.empty ()) {
            _file = fopen (config.filename.c_str (), "a");
            if (_file == nullptr)
                fprintf (stderr, "warning: log file '%s' not writable: %s\n", config.filename.c_str (), strerror (errno));
        }
        if (_file != nullptr || config.enableStderr) {
            __debugLoggerPrevious = __debugLoggerSet (__debugLoggerManaged);
            _enableStderr = config.enableStderr;
            _enableFile = _file != nullptr;
            DEBUG_PRINTF ("ProgramLoggingManager::init: logging directed to%s%s\n", _enableStderr ? " stderr" : "", _enableFile ? (" file '" + config.filename + "'").c_str () : "");
        } else {
            __debugLoggerPrevious = __debugLoggerSet (nullptr);
        }
    }
    void term () {    // not entirely thread safe
        DEBUG_PRINTF ("ProgramLoggingManager::term: logging reverted to previous\n");
        __debugLoggerSet (__debugLoggerPrevious);
        __debugLoggerPrevious = nullptr;
        std::lock_guard<std::mutex> guard (_bufferMutex);
        _enableStderr = false;
        _enableFile = false;
        if (_file != nullptr)
            fclose (_file), _file = nullptr;
    }

private:
    inline static std::mutex _bufferMutex;
    static int constexpr _bufferLength = DEFAULT_DEBUG_LOGGING_BUFFER;
    inline static char _bufferContent [_bufferLength];
    inline static int _bufferOffset = 0;

    static void __debugLoggerManaged (const char *format, ...) {

        auto logging = Singleton<ProgramLoggingManager>::instance ();
        if (! logging)
            return;

        std::lock_guard<std::mutex> guard (_bufferMutex);

        va_list args;
        va_start (args, format);
        int printed = vsnprintf (_bufferContent + _bufferOffset, (_bufferLength - _bufferOffset), format, args);
        va_end (args);
        if (printed < 0)
            return;

        _bufferOffset = (printed >= (_bufferLength - _bufferOffset)) ? (_bufferLength - 1) : (_bufferOffset + printed);
        if (_bufferOffset == (_bufferLength - 1) || (_bufferOffset > 0 && _bufferContent [_bufferOffset - 1] == '\n')) {
            while (_bufferOffset > 0 && _bufferContent [_bufferOffset - 1] == '\n')
                _bufferContent [--_bufferOffset] = '\0';
            _bufferContent [_bufferOffset] = '\0';
            _bufferOffset = 0;

            const std::string prefix = logging->config.timestamps ? "[" + getTimeStringMillis (timestampMillis ()) + "] " : "";
            if (logging->_enableStderr)
                fprintf (stderr, "%s%s\n", prefix.c_str (), _bufferContent);
            if (logging->_enableFile && _bufferContent [0] != '\0')
                fprintf (logging->_file, "[%s] %s\n", getTimeStringMillis (timestampMillis ()).c_str (), _bufferContent), fflush (logging->_file);
        }
    }
#else
public:
    explicit ProgramLoggingManager (const Config &) :
        Singleton<ProgramLoggingManager> (this) { }
#endif
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#endif
