#pragma once

#include <memory>
#include <string>
#include <vector>

namespace Yturl {

/**
 * Running invocation of the external media tool
 */
class ToolProcess {
public:
    virtual ~ToolProcess() = default;

    // Next line of combined stdout/stderr; false at end of output
    virtual bool readLine(std::string& line) = 0;

    // Block until exit; returns the exit status
    virtual int wait() = 0;

    // Kill the process; callable from another thread while readLine blocks
    virtual void terminate() = 0;
};

/**
 * Starts tool processes
 * spawn() throws std::runtime_error when the program cannot be started
 */
class ToolRunner {
public:
    virtual ~ToolRunner() = default;

    virtual std::unique_ptr<ToolProcess> spawn(const std::vector<std::string>& args) = 0;
};

/**
 * Runs the configured program (yt-dlp) as a real child process
 */
class SubprocessRunner : public ToolRunner {
public:
    explicit SubprocessRunner(std::string programPath);

    std::unique_ptr<ToolProcess> spawn(const std::vector<std::string>& args) override;

    const std::string& getProgram() const { return program; }

private:
    std::string program;
};

} // namespace Yturl
