#include <LogCompat.hpp>

#include "SpdlogInit.hpp"

extern int app_main(int argc, char** argv);
int main(int argc, char** argv) {
    GmShim_SpdlogInit();
    SPDLOG_DEBUG("Launching {} with {} args", argv[0], argc);
    return app_main(argc, argv);
}
