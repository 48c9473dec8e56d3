#pragma once

// console: where the icky terminal-specific stuff is hidden
namespace chroma
{
    // Tries to enable ANSI virtual-terminal sequence processing on the process's
    // standard output, so that the escape sequences emitted by libchroma are
    // rendered rather than printed verbatim.
    //
    // - only does something on Windows: other terminals handle ANSI sequences natively
    // - is best-effort: failures are logged as warnings and otherwise ignored
    // - only does work on the first call: subsequent calls (from any thread) do nothing
    void enable_virtual_terminal_processing();
}
