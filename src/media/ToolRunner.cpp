#include "media/ToolRunner.hpp"
#include "utils/Subprocess.hpp"
#include "utils/Logger.hpp"

namespace Yturl {

namespace {

class ChildToolProcess : public ToolProcess {
public:
    explicit ChildToolProcess(std::unique_ptr<Subprocess> child)
        : child(std::move(child)) {
    }

    bool readLine(std::string& line) override {
        return child->readLine(line);
    }

    int wait() override {
        return child->wait();
    }

    void terminate() override {
        child->terminate();
    }

private:
    std::unique_ptr<Subprocess> child;
};

} // namespace

SubprocessRunner::SubprocessRunner(std::string programPath)
    : program(std::move(programPath)) {
}

std::unique_ptr<ToolProcess> SubprocessRunner::spawn(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(program);
    argv.insert(argv.end(), args.begin(), args.end());

    auto child = std::make_unique<Subprocess>(std::move(argv));
    child->start();
    LOG_DL_DEBUG("Started {} (pid {})", program, child->getPid());
    return std::make_unique<ChildToolProcess>(std::move(child));
}

} // namespace Yturl
