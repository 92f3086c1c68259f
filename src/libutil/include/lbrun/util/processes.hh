#pragma once
///@file

#include "lbrun/util/error.hh"
#include "lbrun/util/types.hh"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace lbrun {

/**
 * A child process that is killed and reaped when this object goes out
 * of scope, unless it was already waited for.
 */
class Pid
{
    pid_t pid = -1;
    bool separatePG = false;

public:
    Pid() = default;
    explicit Pid(pid_t pid);
    Pid(const Pid &) = delete;
    Pid(Pid && other) noexcept;
    ~Pid();

    Pid & operator=(Pid && other);

    /**
     * Kill the child with SIGKILL (its whole process group if it has
     * one) and return its status.
     */
    int kill();

    /**
     * Block until the child exits and return its status.
     */
    int wait();

    /**
     * Return the child's status if it has exited, without blocking.
     */
    std::optional<int> tryWait();

    void setSeparatePG(bool separatePG);
};

/**
 * Fork a process that runs `fun`. The child is killed when its parent
 * dies, and exits with status 1 if `fun` throws or returns.
 */
Pid startProcess(std::function<void()> fun);

struct RunOptions
{
    Path program;
    bool searchPath = true;
    Strings args;
    std::optional<Path> chdir;
    bool mergeStderrToStdout = false;

    /**
     * Kill the program (and everything in its process group) once it
     * has been running for this long. Unset means no limit.
     */
    std::optional<std::chrono::seconds> timeout;

    /**
     * Polled while the program runs; once it becomes true the program
     * is killed.
     */
    const std::atomic<bool> * interrupt = nullptr;

    /**
     * Called for every line of output, without the trailing newline.
     * If unset, the output is collected in `ProcessResult::output`.
     */
    std::function<void(std::string_view line)> lineCallback;
};

struct ProcessResult
{
    /**
     * Status as returned by waitpid().
     */
    int status = 0;
    bool timedOut = false;
    bool interrupted = false;
    std::string output;
};

/**
 * Run a program to completion, streaming its output. The timeout and
 * the interrupt flag apply until the program has exited, also after it
 * closed its output.
 */
ProcessResult runProgram2(const RunOptions & options);

std::pair<int, std::string> runProgram(RunOptions && options);

/**
 * Run a program and return its stdout, throwing `ExecError` if it
 * fails.
 */
std::string runProgram(Path program, bool searchPath = false, const Strings & args = Strings());

class ExecError : public Error
{
public:
    int status;

    template<typename... Args>
    ExecError(int status, const Args &... args)
        : Error(args...)
        , status(status)
    {
    }
};

/**
 * Describe a status returned by waitpid(), e.g. "failed with exit
 * code 2".
 */
std::string statusToString(int status);

bool statusOk(int status);

} // namespace lbrun
