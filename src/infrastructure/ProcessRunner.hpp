/**
 * @file ProcessRunner.hpp
 * @brief Runs an external program with captured output and a wall-clock deadline.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace docxpdf::infrastructure {

/**
 * @struct ProcessResult
 * @brief Outcome of a child process. Exactly one of these holds:
 *        !launched, timedOut, or the child exited with exitCode.
 */
struct ProcessResult {
    bool launched = false;
    bool timedOut = false;
    int exitCode = -1;          ///< 128 + signal number when the child was killed by a signal.
    std::string stdOut;
    std::string stdErr;          ///< On launch failure, the reason the program could not be started.
    std::chrono::milliseconds elapsed{0};
};

/**
 * @class ProcessRunner
 * @brief Bounded blocking execution of a program (no shell involved).
 */
class ProcessRunner {
public:
    /**
     * @brief Starts argv[0] with the remaining arguments and waits for it.
     *
     * When the deadline passes the whole child process group is killed and reaped,
     * and the result is reported with timedOut = true.
     *
     * @param argv Program followed by its arguments. argv[0] is looked up on PATH.
     * @param timeout Maximum wall-clock time the call may block.
     */
    static ProcessResult Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);
};

} // namespace docxpdf::infrastructure
