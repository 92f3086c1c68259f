#pragma once
///@file

#include <string>
#include <vector>

#include "lbrun/util/types.hh"

namespace lbrun {

/**
 * An ordered list of shell command lines that is executed as one unit
 * by `sh -e`, so the first failing line aborts the whole batch.
 */
class CommandScript
{
    std::vector<std::string> _lines;

public:

    CommandScript & add(std::string line);

    const std::vector<std::string> & lines() const
    {
        return _lines;
    }

    /**
     * The text of the script file: an interpreter line followed by one
     * command per line.
     */
    std::string render() const;

    bool operator==(const CommandScript &) const = default;
};

struct IsoBuildParams
{
    /**
     * Per-job directory inside the sandbox; the recipe is cloned to
     * `<workDir>/lb`.
     */
    Path workDir;

    Path resultsDir;

    std::string liveBuildGit;

    /**
     * Exported as `FLAVOR` when non-empty.
     */
    std::string flavor;

    /**
     * Whether the script fails when no `.iso` image was produced.
     */
    bool requireIsoArtifact = true;
};

/**
 * Artifacts covered by the checksum manifests.
 */
extern const std::vector<std::string> checksummedArtifacts;

/**
 * Artifact classes moved to the results directory, in move order.
 */
extern const std::vector<std::string> collectedArtifacts;

/**
 * The script that clones the live-build recipe, builds it, checksums
 * the produced images and collects them into `params.resultsDir`.
 */
CommandScript makeIsoBuildScript(const IsoBuildParams & params);

} // namespace lbrun
