#include "media/ToolRunner.hpp"
#include "utils/Subprocess.hpp"

#include <cassert>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

using Yturl::Subprocess;
using Yturl::SubprocessRunner;

void TestLinesAndExitCode() {
    Subprocess child({"/bin/sh", "-c", "printf 'a\\nb\\r\\nc\\rd'; exit 3"});
    child.start();

    std::vector<std::string> lines;
    std::string line;
    while (child.readLine(line)) {
        lines.push_back(line);
    }
    assert((lines == std::vector<std::string>{"a", "b", "c", "d"}));
    assert(child.wait() == 3);
    // Reaped once, answered from then on
    assert(child.wait() == 3);
}

void TestStderrIsMerged() {
    Subprocess child({"/bin/sh", "-c", "echo out; echo err 1>&2"});
    child.start();

    std::vector<std::string> lines;
    std::string line;
    while (child.readLine(line)) {
        lines.push_back(line);
    }
    assert(lines.size() == 2);
    assert(child.wait() == 0);
}

void TestMissingProgramThrows() {
    Subprocess child({"/nonexistent/yt-dlp-binary"});
    bool threw = false;
    try {
        child.start();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    SubprocessRunner runner("/nonexistent/yt-dlp-binary");
    threw = false;
    try {
        runner.spawn({"--version"});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

void TestTerminateKillsBlockedChild() {
    Subprocess child({"/bin/sh", "-c", "echo started; sleep 30; echo never"});
    child.start();
    pid_t pid = child.getPid();

    std::string line;
    assert(child.readLine(line));
    assert(line == "started");

    std::thread killer([&child] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        child.terminate();
    });

    auto begin = std::chrono::steady_clock::now();
    assert(!child.readLine(line));
    killer.join();

    assert(child.wait() == 128 + SIGKILL);
    assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(10));

    // Gone from the process table
    errno = 0;
    assert(::kill(pid, 0) == -1);
    assert(errno == ESRCH);
}

void TestRunnerPrependsProgram() {
    SubprocessRunner runner("/bin/sh");
    auto process = runner.spawn({"-c", "echo hi"});

    std::string line;
    assert(process->readLine(line));
    assert(line == "hi");
    assert(!process->readLine(line));
    assert(process->wait() == 0);
}

} // namespace

int main() {
    TestLinesAndExitCode();
    TestStderrIsMerged();
    TestMissingProgramThrows();
    TestTerminateKillsBlockedChild();
    TestRunnerPrependsProgram();

    std::cout << "subprocess_test: pass\n";
    return 0;
}
