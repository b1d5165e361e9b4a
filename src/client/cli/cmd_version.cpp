#include "cli_common.hpp"

using namespace bridgelink::client;

int cmd_version() {
    std::cout << "bridgelink " << version::VERSION << "\n"
              << "  Commit:     " << version::GIT_COMMIT << "\n"
              << "  Built:      " << version::BUILD_TIMESTAMP << "\n"
              << "  Language:   C++23\n"
#if defined(__APPLE__)
              << "  Platform:   macos/"
#else
              << "  Platform:   linux/"
#endif
#if defined(__x86_64__)
              << "amd64\n";
#elif defined(__aarch64__)
              << "arm64\n";
#else
              << "unknown\n";
#endif
    return 0;
}
