#include "utils/Subprocess.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Yturl {

Subprocess::Subprocess(std::vector<std::string> args)
    : args(std::move(args))
    , pid(-1)
    , outputFd(-1)
    , exitCode(-1)
    , reaped(false)
    , eof(false) {
}

Subprocess::~Subprocess() {
    if (pid > 0 && !reaped) {
        terminate();
        wait();
    }
    closeOutput();
}

void Subprocess::start() {
    if (args.empty()) {
        throw std::runtime_error("empty command line");
    }

    int output[2];
    int status[2];
    if (pipe2(output, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }
    // Carries the exec errno back; closes on successful exec
    if (pipe2(status, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(output[0]);
        ::close(output[1]);
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(err));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        ::close(output[0]);
        ::close(output[1]);
        ::close(status[0]);
        ::close(status[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(err));
    }

    if (child == 0) {
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(output[1], STDOUT_FILENO);
        ::dup2(output[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = ::write(status[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    pid = child;
    // Also set from the parent so terminate() cannot race the child's setpgid
    ::setpgid(child, child);
    ::close(output[1]);
    ::close(status[1]);
    outputFd = output[0];

    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(status[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(status[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        wait();
        closeOutput();
        throw std::runtime_error("cannot execute " + args[0] + ": " + std::strerror(childErr));
    }
}

bool Subprocess::fillBuffer() {
    if (eof || outputFd < 0) {
        return false;
    }

    char chunk[4096];
    while (true) {
        ssize_t n = ::read(outputFd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        eof = true;
        return false;
    }
}

bool Subprocess::readLine(std::string& line) {
    while (true) {
        // '\r' also ends a line: progress updates are carriage-return separated without --newline
        size_t pos = buffer.find_first_of("\r\n");
        if (pos != std::string::npos) {
            line = buffer.substr(0, pos);
            size_t skip = (buffer[pos] == '\r' && pos + 1 < buffer.size() && buffer[pos + 1] == '\n') ? 2 : 1;
            buffer.erase(0, pos + skip);
            return true;
        }

        if (!fillBuffer()) {
            if (buffer.empty()) {
                return false;
            }
            line.swap(buffer);
            buffer.clear();
            return true;
        }
    }
}

int Subprocess::wait() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (pid <= 0 || reaped) {
            return exitCode;
        }
    }

    // Wait without reaping so terminate() never signals a recycled pid
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) {
            break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (reaped) {
        return exitCode;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    reaped = true;
    if (result == pid) {
        if (WIFEXITED(status)) {
            exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exitCode = 128 + WTERMSIG(status);
        }
    }
    return exitCode;
}

void Subprocess::terminate() {
    std::lock_guard<std::mutex> lock(mutex);
    if (pid > 0 && !reaped) {
        ::kill(-pid, SIGKILL);
    }
}

void Subprocess::closeOutput() {
    if (outputFd >= 0) {
        ::close(outputFd);
        outputFd = -1;
    }
}

} // namespace Yturl
