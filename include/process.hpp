#pragma once

#include <string>
#include <vector>

namespace roto {

struct CommandResult {
    int exit_code = -1;
    std::string output;        // stdout
    std::string error_output;  // stderr

    bool ok() const { return exit_code == 0; }
};

// Exit status used by coreutils `timeout` when the command ran too long.
constexpr int kTimeoutExitCode = 124;
// Exit status /bin/sh uses when the program does not exist.
constexpr int kCommandNotFoundExitCode = 127;

// Quote one argument for /bin/sh.
std::string shell_quote(const std::string& arg);

// Join argv into a shell command line, quoting every element.
std::string join_command(const std::vector<std::string>& argv);

// Run a shell command, capturing stdout and stderr separately.
// Throws TransientError only if the command could not be started.
CommandResult run_command(const std::string& command);

// Temp file that receives a child's stderr; removed on destruction.
class StderrCapture {
public:
    StderrCapture();
    ~StderrCapture();

    StderrCapture(const StderrCapture&) = delete;
    StderrCapture& operator=(const StderrCapture&) = delete;

    const std::string& path() const { return path_; }
    std::string read() const;

    // " 2>'<path>'" for appending to a command line.
    std::string redirect() const;

private:
    std::string path_;
};

// Prefix a command with `timeout <seconds>` when seconds > 0.
std::string with_time_limit(const std::string& command, long seconds);

} // namespace roto
