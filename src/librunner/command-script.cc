#include "lbrun/runner/command-script.hh"
#include "lbrun/util/fmt.hh"
#include "lbrun/util/strings.hh"

namespace lbrun {

CommandScript & CommandScript::add(std::string line)
{
    _lines.push_back(std::move(line));
    return *this;
}

std::string CommandScript::render() const
{
    std::string res = "#!/bin/sh\n";
    for (auto & line : _lines) {
        res += line;
        res += '\n';
    }
    return res;
}

const std::vector<std::string> checksummedArtifacts = {"iso", "contents", "zsync", "packages"};

const std::vector<std::string> collectedArtifacts = {
    "iso", "zsync", "contents", "files", "packages", "b2sum", "sha256sum"};

/**
 * A `find` over the regular files directly in the current directory
 * whose extension is one of `exts`.
 */
static std::string findArtifacts(const std::vector<std::string> & exts)
{
    auto names = concatMapStringsSep(
        " -o ", exts, [](const std::string & ext) { return fmt("-name '*.%s'", ext); });
    return "find . -maxdepth 1 -type f \\( " + names + " \\)";
}

/**
 * Digest every existing artifact in name order; no artifacts yields an
 * empty manifest rather than an error.
 */
static std::string checksumLine(std::string_view program, std::string_view manifest)
{
    return fmt(
        "%s -printf '%%P\\0' | sort -z | xargs -0 -r %s > %s", findArtifacts(checksummedArtifacts), program, manifest);
}

/**
 * Move the artifacts with extension `ext` into `dest`. Without
 * `required`, having none is not an error.
 */
static std::string moveLine(const std::string & ext, const Path & dest, bool required)
{
    if (required)
        return fmt("mv ./*.%s %s/", ext, dest);
    return fmt("%s -exec mv -f -t %s/ {} +", findArtifacts({ext}), dest);
}

CommandScript makeIsoBuildScript(const IsoBuildParams & params)
{
    CommandScript script;

    script.add("export DEBIAN_FRONTEND=noninteractive");
    script.add(fmt("cd %s", params.workDir));
    script.add(fmt("git clone --depth=2 %s %s/lb", shellEscape(params.liveBuildGit), params.workDir));
    script.add("cd ./lb");

    if (!params.flavor.empty())
        script.add(fmt("export FLAVOR=%s", shellEscape(params.flavor)));

    script.add("lb config");
    script.add("lb build");

    script.add(checksumLine("b2sum -l 256", "checksums.b2sum"));
    script.add(checksumLine("sha256sum", "checksums.sha256sum"));

    for (auto & ext : collectedArtifacts)
        script.add(moveLine(ext, params.resultsDir, ext == "iso" && params.requireIsoArtifact));

    return script;
}

} // namespace lbrun
