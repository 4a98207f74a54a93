#include <AbslLogCompat.hpp>

#include "SpdlogInit.hpp"

extern int app_main(int argc, char** argv);
int main(int argc, char** argv) {
    AssistantBot_SpdlogInit();
    SPDLOG_DEBUG("Launching {} with {} args", argv[0], argc);
    const int ret = app_main(argc, argv);
    AssistantBot_SpdlogDeInit();
    return ret;
}
