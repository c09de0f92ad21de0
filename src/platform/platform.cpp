#include "lstree/platform.h"

#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace lstree::platform {

bool stdout_supports_color() {
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
#ifdef _WIN32
    HANDLE handle = ::GetStdHandle(STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return false;
    }
    // box-drawing connectors and emoji markers are UTF-8
    SetConsoleOutputCP(CP_UTF8);
    DWORD mode = 0;
    if (!::GetConsoleMode(handle, &mode)) {
        return false;
    }
    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    ::SetConsoleMode(handle, mode);
    return true;
#else
    return ::isatty(STDOUT_FILENO) != 0;
#endif
}

} // namespace lstree::platform
