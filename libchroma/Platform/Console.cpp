#include "Console.h"

#include <libchroma/Platform/Log.h>

#include <mutex>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>

namespace
{
    void enable_virtual_terminal_processing_once()
    {
        const HANDLE stdout_handle = GetStdHandle(STD_OUTPUT_HANDLE);
        if (stdout_handle == INVALID_HANDLE_VALUE or stdout_handle == nullptr) {
            chroma::log_warn("could not enable ANSI escape sequences: standard output has no console handle (error code %lu)", GetLastError());
            return;
        }

        DWORD mode = 0;
        if (not GetConsoleMode(stdout_handle, &mode)) {
            chroma::log_warn("could not enable ANSI escape sequences: GetConsoleMode failed (error code %lu)", GetLastError());
            return;
        }

        if (mode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) {
            return;  // already enabled
        }

        if (not SetConsoleMode(stdout_handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING)) {
            chroma::log_warn("could not enable ANSI escape sequences: SetConsoleMode failed (error code %lu)", GetLastError());
            return;
        }
        chroma::log_debug("enabled ANSI virtual terminal processing on standard output");
    }
}
#else
namespace
{
    void enable_virtual_terminal_processing_once()
    {
        // POSIX terminals natively process ANSI sequences
    }
}
#endif

void chroma::enable_virtual_terminal_processing()
{
    static std::once_flag s_once_flag;
    std::call_once(s_once_flag, enable_virtual_terminal_processing_once);
}
