#include "process.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>

// Required Linux/Unix Headers
#include <sys/types.h> // pid_t
#include <sys/wait.h>  // waitpid
#include <unistd.h>    // fork, execvp, pipe, dup2, _exit
#include <errno.h>
#include <cstring>     // strerror
#include <cstdlib>     // _exit

namespace Dotsync {
namespace Process {

    Result run(const std::vector<std::string>& args, const std::string& workingDir)
    {
        if (args.empty() || args[0].empty()) {
            throw std::invalid_argument("Process::run requires a command");
        }

        int fds[2];
        if (pipe(fds) != 0) {
            throw std::system_error(errno, std::system_category(), "pipe failed");
        }

        pid_t pid = fork();
        if (pid < 0) {
            int err = errno;
            close(fds[0]);
            close(fds[1]);
            throw std::system_error(err, std::system_category(), "Fork failed");
        }

        // --- Child Process ---
        if (pid == 0) {
            close(fds[0]);
            dup2(fds[1], STDOUT_FILENO);
            dup2(fds[1], STDERR_FILENO);
            close(fds[1]);

            if (!workingDir.empty() && chdir(workingDir.c_str()) != 0) {
                std::cerr << "chdir to " << workingDir << " failed: " << strerror(errno) << std::endl;
                _exit(kExecFailed);
            }

            std::vector<char*> argv;
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr); // Null terminator

            execvp(argv[0], argv.data());

            // If execvp returns, an error occurred
            std::cerr << "execvp failed for command: " << args[0] << ": " << strerror(errno) << std::endl;
            _exit(kExecFailed);
        }

        // --- Parent Process ---
        close(fds[1]);

        Result result;
        char buffer[4096];
        while (true) {
            ssize_t n = read(fds[0], buffer, sizeof(buffer));
            if (n > 0) {
                result.output.append(buffer, static_cast<size_t>(n));
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
        close(fds[0]);

        int status = 0;
        pid_t waited;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (waited < 0) {
            throw std::system_error(errno, std::system_category(), "waitpid failed");
        }

        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.output += "terminated by signal " + std::to_string(WTERMSIG(status)) + "\n";
            result.exitCode = -1;
        }
        return result;
    }

} // namespace Process
} // namespace Dotsync
