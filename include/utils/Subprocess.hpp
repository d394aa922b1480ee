#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

namespace Yturl {

/**
 * Child process with stdout and stderr merged into one pipe
 * The child leads its own process group so terminate() also reaches the
 * helpers it spawns (ffmpeg under yt-dlp)
 */
class Subprocess {
public:
    explicit Subprocess(std::vector<std::string> args);
    ~Subprocess();

    // Prevent copying
    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Fork and exec; throws std::runtime_error if the program cannot be started
    void start();

    // Next line of combined output without the terminator; false at end of stream
    bool readLine(std::string& line);

    // Block until the child exits and reap it
    // Returns the exit status, or 128 + signal number when killed
    int wait();

    // Kill the process group; safe from any thread, no-op once reaped
    void terminate();

    pid_t getPid() const { return pid; }

private:
    std::vector<std::string> args;
    pid_t pid;
    int outputFd;
    int exitCode;
    bool reaped;
    std::mutex mutex;

    std::string buffer;
    bool eof;

    bool fillBuffer();
    void closeOutput();
};

} // namespace Yturl
