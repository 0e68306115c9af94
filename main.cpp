#include <csignal>

#include "app.h"
#include "log.h"

int main(int argc, char** argv)
{
    // a closed stdout must surface as a write error instead of terminating the process
    std::signal(SIGPIPE, SIG_IGN);

    const int rc = sockspipe::run_app(argc, argv);
    sockspipe::shutdown_log();
    return rc;
}
