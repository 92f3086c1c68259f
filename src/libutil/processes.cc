#include "lbrun/util/processes.hh"
#include "lbrun/util/file-descriptor.hh"
#include "lbrun/util/logging.hh"
#include "lbrun/util/strings.hh"
#include "lbrun/util/util.hh"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lbrun {

Pid::Pid(pid_t pid)
    : pid(pid)
{
}

Pid::Pid(Pid && other) noexcept
    : pid(std::exchange(other.pid, -1))
    , separatePG(other.separatePG)
{
}

Pid & Pid::operator=(Pid && other)
{
    Pid tmp(std::move(other));
    std::swap(pid, tmp.pid);
    std::swap(separatePG, tmp.separatePG);
    return *this;
}

Pid::~Pid()
{
    if (pid == -1)
        return;
    try {
        kill();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

int Pid::kill()
{
    debug("killing process %d", pid);

    if (::kill(separatePG ? -pid : pid, SIGKILL) == -1) {
        /* The child may not have called setsid() yet, in which case
           it has no descendants either. */
        if (!(separatePG && errno == ESRCH && ::kill(pid, SIGKILL) == 0))
            logError(SysError("killing process %d", pid).info());
    }

    return wait();
}

int Pid::wait()
{
    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR)
            throw SysError("cannot get exit status of process %d", pid);
    }
    pid = -1;
    return status;
}

std::optional<int> Pid::tryWait()
{
    int status;
    for (;;) {
        auto res = waitpid(pid, &status, WNOHANG);
        if (res == 0)
            return std::nullopt;
        if (res == pid) {
            pid = -1;
            return status;
        }
        if (errno != EINTR)
            throw SysError("cannot get exit status of process %d", pid);
    }
}

void Pid::setSeparatePG(bool separatePG)
{
    this->separatePG = separatePG;
}

Pid startProcess(std::function<void()> fun)
{
    pid_t pid = fork();
    if (pid == -1)
        throw SysError("unable to fork");

    if (pid == 0) {
        logger = makeSimpleLogger();
        try {
            if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1)
                throw SysError("setting death signal");
            fun();
        } catch (std::exception & e) {
            try {
                std::cerr << e.what() << "\n";
            } catch (...) {
            }
        }
        _exit(1);
    }

    return Pid(pid);
}

namespace {

std::vector<char *> toArgv(const Strings & args)
{
    std::vector<char *> argv;
    for (auto & s : args)
        argv.push_back(const_cast<char *>(s.c_str()));
    argv.push_back(nullptr);
    return argv;
}

} // namespace

ProcessResult runProgram2(const RunOptions & options)
{
    ProcessResult result;

    Pipe out;
    out.create();

    printMsg(lvlChatty, "running command: %s %s", options.program, concatMapStringsSep(" ", options.args, shellEscape));

    Pid pid = startProcess([&]() {
        /* A new session lets a timeout kill the whole process tree. */
        if (setsid() == -1)
            throw SysError("creating a new session");

        AutoCloseFD devNull = open("/dev/null", O_RDWR | O_CLOEXEC);
        if (!devNull)
            throw SysError("cannot open '/dev/null'");
        if (dup2(devNull.get(), STDIN_FILENO) == -1 || dup2(out.writeSide.get(), STDOUT_FILENO) == -1)
            throw SysError("setting up standard streams");
        if (options.mergeStderrToStdout && dup2(STDOUT_FILENO, STDERR_FILENO) == -1)
            throw SysError("redirecting stderr to stdout");

        if (options.chdir && chdir(options.chdir->c_str()) == -1)
            throw SysError("changing directory to '%s'", *options.chdir);

        Strings argv(options.args);
        argv.push_front(options.program);

        if (options.searchPath)
            execvp(options.program.c_str(), toArgv(argv).data());
        else
            execv(options.program.c_str(), toArgv(argv).data());

        throw SysError("executing '%s'", options.program);
    });
    pid.setSeparatePG(true);

    out.writeSide.close();

    using Clock = std::chrono::steady_clock;
    std::optional<Clock::time_point> deadline;
    if (options.timeout && options.timeout->count() > 0)
        deadline = Clock::now() + *options.timeout;

    std::string pending;

    auto emit = [&](std::string_view line) {
        if (options.lineCallback)
            options.lineCallback(line);
        else {
            result.output.append(line);
            result.output.push_back('\n');
        }
    };

    auto flushLines = [&]() {
        size_t start = 0;
        for (auto nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
            emit(std::string_view(pending).substr(start, nl - start));
            start = nl + 1;
        }
        pending.erase(0, start);
    };

    bool eof = false;
    char buf[16384];

    for (;;) {
        if (options.interrupt && options.interrupt->load()) {
            result.interrupted = true;
            break;
        }

        auto slice = std::chrono::milliseconds(eof ? 100 : 1000);
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
            if (left.count() <= 0) {
                result.timedOut = true;
                break;
            }
            slice = std::min(slice, left);
        }

        if (eof) {
            /* The program closed its output but may still be running. */
            if (auto status = pid.tryWait()) {
                result.status = *status;
                return result;
            }
            std::this_thread::sleep_for(slice);
            continue;
        }

        struct pollfd pfd{.fd = out.readSide.get(), .events = POLLIN, .revents = 0};
        int ready = poll(&pfd, 1, slice.count());
        if (ready == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("waiting for output of '%s'", options.program);
        }
        if (ready == 0)
            continue;

        auto n = read(out.readSide.get(), buf, sizeof(buf));
        if (n == -1) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            throw SysError("reading output of '%s'", options.program);
        }
        if (n == 0) {
            eof = true;
            if (!pending.empty())
                emit(pending);
            pending.clear();
            continue;
        }

        pending.append(buf, n);
        flushLines();
    }

    if (!pending.empty())
        emit(pending);

    debug("killing '%s' (%s)", options.program, result.timedOut ? "timed out" : "interrupted");
    result.status = pid.kill();
    return result;
}

std::pair<int, std::string> runProgram(RunOptions && options)
{
    options.lineCallback = nullptr;
    auto res = runProgram2(options);
    return {res.status, std::move(res.output)};
}

std::string runProgram(Path program, bool searchPath, const Strings & args)
{
    auto [status, output] = runProgram(RunOptions{.program = program, .searchPath = searchPath, .args = args});

    if (!statusOk(status))
        throw ExecError(status, "program '%s' %s", program, statusToString(status));

    return output;
}

std::string statusToString(int status)
{
    if (statusOk(status))
        return "succeeded";
    if (WIFEXITED(status))
        return fmt("failed with exit code %d", WEXITSTATUS(status));
    if (WIFSIGNALED(status))
        return fmt("failed due to signal %d (%s)", WTERMSIG(status), strsignal(WTERMSIG(status)));
    return "died abnormally";
}

bool statusOk(int status)
{
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace lbrun
