#ifndef NETHEAL_PROCESS_HPP
#define NETHEAL_PROCESS_HPP

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace netheal {

struct CommandResult {
    int exit_code = -1;
    std::string output;
    bool timed_out = false;
    bool interrupted = false;

    bool ok() const { return exit_code == 0 && !timed_out && !interrupted; }
};

// Raised when an external command that must succeed does not.
class CommandError : public std::runtime_error {
public:
    CommandError(const std::vector<std::string>& argv, CommandResult result);

    const CommandResult& result() const { return result_; }

private:
    CommandResult result_;
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs argv[0] from PATH with stdout and stderr captured together.
    // timeout_s <= 0 waits indefinitely. stop_when is polled while the child
    // runs; once it returns true the child is terminated and the result is
    // marked interrupted.
    virtual CommandResult run(const std::vector<std::string>& argv, double timeout_s,
                              std::function<bool()> stop_when = nullptr) = 0;
};

class SystemCommandRunner : public CommandRunner {
public:
    explicit SystemCommandRunner(double poll_interval_s = 0.2);

    CommandResult run(const std::vector<std::string>& argv, double timeout_s,
                      std::function<bool()> stop_when = nullptr) override;

private:
    double poll_interval_s_ = 0.2;
};

std::string describe_command(const std::vector<std::string>& argv);

}  // namespace netheal

#endif  // NETHEAL_PROCESS_HPP
