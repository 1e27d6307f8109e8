#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <raylib.h>

int main(int argc, char* argv[])
{
    // raylib logs every font load at INFO, keep test output readable
    SetTraceLogLevel(LOG_WARNING);
    return Catch::Session().run(argc, argv);
}
