#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <string>
#include <vector>

namespace Dotsync {
namespace Process {

/**
 * @brief Exit status reported when the command could not be executed at all.
 */
constexpr int kExecFailed = 127;

struct Result
{
    int exitCode = -1;  // -1 when the child was killed by a signal
    std::string output; // stdout and stderr, interleaved
};

/**
 * @brief Runs a command (no shell) and captures its combined output.
 *
 * @param args       argv of the command; args[0] is looked up on PATH.
 * @param workingDir Directory the child changes into before exec; empty keeps
 *                   the current directory.
 * @return The exit code and captured output. A command that cannot be
 *         started reports kExecFailed.
 *
 * @throws std::system_error if the pipe or the fork cannot be created.
 */
Result run(const std::vector<std::string>& args, const std::string& workingDir = "");

} // namespace Process
} // namespace Dotsync

#endif // PROCESS_HPP
