#pragma once
///@file

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "lbrun/util/logging.hh"

namespace lbrun {

/**
 * A job description as delivered by the build farm: a JSON object with
 * at least `architecture` and a `data` object holding `suite`,
 * `liveBuildGit` and optionally `flavor`.
 */
typedef nlohmann::json JobDescriptor;

/**
 * Parse the JSON text of a job description. Throws `Error` if the text
 * is not JSON or its root is not an object.
 */
JobDescriptor parseJobDescriptor(std::string_view text);

/**
 * Throw `UsageError` unless `jobId` can name the job's directory in the
 * sandbox, its build script and its schroot session: a non-empty file
 * name made of letters, digits, `.`, `_` and `-`, other than `.` and
 * `..`.
 */
void checkJobId(std::string_view jobId);

/**
 * Everything a single job run needs from its caller: the identifier
 * that keys the sandbox and script, the logger receiving the command
 * output, and the controls for aborting it.
 */
struct JobContext
{
    std::string jobId;

    Logger & logger;

    /**
     * Limit for each individual sandbox command.
     */
    std::optional<std::chrono::seconds> timeout;

    /**
     * Set (e.g. from a signal handler) to ask the run to stop.
     */
    std::shared_ptr<std::atomic<bool>> interrupt = std::make_shared<std::atomic<bool>>(false);

    bool checkInterrupt() const
    {
        return interrupt && interrupt->load();
    }
};

} // namespace lbrun
