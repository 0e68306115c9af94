#ifndef APP_H
#define APP_H

#include <unistd.h>

namespace sockspipe
{

struct stdio_handles
{
    int input_fd = STDIN_FILENO;
    int output_fd = STDOUT_FILENO;
};

// Whole invocation: arguments, configuration, logging, signals and the session.
// Returns the process exit code, 0 on a clean end of forwarding and 1 otherwise.
[[nodiscard]] int run_app(int argc, const char* const* argv, const stdio_handles& handles = {});

}    // namespace sockspipe

#endif
