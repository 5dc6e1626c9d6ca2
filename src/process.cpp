#include "process.hpp"
#include "errors.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace roto {

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string command;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) command += ' ';
        command += shell_quote(argv[i]);
    }
    return command;
}

std::string with_time_limit(const std::string& command, long seconds) {
    if (seconds <= 0) {
        return command;
    }
    return "timeout " + std::to_string(seconds) + " " + command;
}

StderrCapture::StderrCapture() {
    char pattern[] = "/tmp/roto-stderr-XXXXXX";
    int fd = mkstemp(pattern);
    if (fd < 0) {
        throw TransientError("mkstemp() failed for stderr capture");
    }
    close(fd);
    path_ = pattern;
}

StderrCapture::~StderrCapture() {
    std::remove(path_.c_str());
}

std::string StderrCapture::read() const {
    std::ifstream file(path_);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string StderrCapture::redirect() const {
    return " 2>" + shell_quote(path_);
}

CommandResult run_command(const std::string& command) {
    StderrCapture capture;
    std::string full_command = command + capture.redirect();

    CommandResult result;
    std::array<char, 4096> buffer;

    FILE* raw = popen(full_command.c_str(), "r");
    if (!raw) {
        throw TransientError("popen() failed for: " + command);
    }

    size_t n = 0;
    while ((n = fread(buffer.data(), 1, buffer.size(), raw)) > 0) {
        result.output.append(buffer.data(), n);
    }

    int status = pclose(raw);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    result.error_output = capture.read();
    return result;
}

} // namespace roto
