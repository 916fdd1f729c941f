
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include "src/Debug.hpp"

#include "Program.hpp"

// -----------------------------------------------------------------------------------------------

static const std::string build_info (std::string (DEFAULT_NAME) + " V" + DEFAULT_VERS + " (" + __DATE__ + " " + __TIME__ + ")");

static void interrupted (int) {
    __programInterrupted = true;
}

int main (int argc, char *argv []) {

    DEBUG_START ();

    if (argc < 2 || strcmp (argv [1], "--help") == 0 || strcmp (argv [1], "help") == 0) {
        Program::usage (argc < 2 ? stderr : stdout);
        return argc < 2 ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    std::signal (SIGINT, interrupted);
    std::signal (SIGTERM, interrupted);

    int result = EXIT_FAILURE;
    Config config;
    std::vector<std::string> positional;
    if (! exception_catcher ([&] () {
            positional = ProgramConfigArguments (config, argc, argv);
            if (positional.empty ())
                throw std::invalid_argument ("no command given");
        })) {
        Program::usage (stderr);
        return EXIT_FAILURE;
    }

    exception_catcher ([&] () {
        Program program (config);
        DEBUG_PRINTF ("\n*** %s ***\n\n", build_info.c_str ());
        result = program.run (positional);
    });

    DEBUG_END ();
    return result;
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
