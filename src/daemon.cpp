#include "daemon.hpp"
#include "log.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace {

bool fork_and_exit_parent(const char* stage) {
    pid_t pid = fork();
    if (pid < 0) {
        log_error() << "fork (" << stage << ") failed: " << strerror(errno);
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }
    return true;
}

} // namespace

bool daemonize_process() {
    if (!fork_and_exit_parent("first")) {
        return false;
    }

    if (setsid() < 0) {
        log_error() << "setsid failed: " << strerror(errno);
        return false;
    }

    if (!fork_and_exit_parent("second")) {
        return false;
    }

    umask(0);

    int fd = open("/dev/null", O_RDWR);
    if (fd < 0) {
        log_error() << "Cannot open /dev/null: " << strerror(errno);
        return false;
    }
    for (int target : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        if (dup2(fd, target) < 0) {
            log_error() << "dup2 failed: " << strerror(errno);
            close(fd);
            return false;
        }
    }
    if (fd > STDERR_FILENO) {
        close(fd);
    }
    return true;
}
