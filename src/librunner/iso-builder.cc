#include "lbrun/runner/iso-builder.hh"
#include "lbrun/util/json-utils.hh"
#include "lbrun/util/logging.hh"

namespace lbrun {

IsoBuilder::IsoBuilder(SandboxProvider & provider, const RunnerSettings & settings)
    : provider(provider)
    , settings(settings)
{
}

/**
 * The non-empty string at `key` in `obj`, or nullptr if it is missing,
 * not a string or empty.
 */
static const std::string * nonEmptyString(const nlohmann::json::object_t & obj, std::string_view key)
{
    auto * value = optionalValueAt(obj, key);
    if (!value || !value->is_string())
        return nullptr;
    auto & s = getString(*value);
    return s.empty() ? nullptr : &s;
}

bool IsoBuilder::configure(const JobDescriptor & job, const Path & workspace)
{
    if (state != State::Unconfigured)
        throw Error("the ISO builder has already been configured for a job");

    /* Nothing is stored until the whole job has been validated. */
    state = State::Invalid;

    if (!job.is_object()) {
        debug("rejecting job: not a JSON object");
        return false;
    }
    auto & jobObj = getObject(job);

    auto * data = optionalValueAt(jobObj, "data");
    if (!data || !data->is_object()) {
        debug("rejecting job: no 'data' object");
        return false;
    }
    auto & dataObj = getObject(*data);

    auto * suite = nonEmptyString(dataObj, "suite");
    auto * architecture = nonEmptyString(jobObj, "architecture");
    if (!suite || !architecture) {
        debug("rejecting job: 'data.suite' and 'architecture' must be non-empty strings");
        return false;
    }

    if (!nonEmptyString(dataObj, "liveBuildGit")) {
        debug("rejecting job: 'data.liveBuildGit' must be a non-empty string");
        return false;
    }

    if (auto * flavor = optionalValueAt(dataObj, "flavor"); flavor && !flavor->is_string() && !flavor->is_null()) {
        debug("rejecting job: 'data.flavor' must be a string");
        return false;
    }

    _workspace = workspace;
    _jobData = *data;
    _chrootName = fmt("%s-%s", *suite, *architecture);
    state = State::Configured;
    return true;
}

IsoBuildParams IsoBuilder::buildParams(const SandboxSession & session) const
{
    auto & data = getObject(_jobData);
    std::string flavor;
    if (auto * f = optionalValueAt(data, "flavor"); f && f->is_string())
        flavor = getString(*f);
    return IsoBuildParams{
        .workDir = session.workDir,
        .resultsDir = session.resultsDir,
        .liveBuildGit = getString(valueAt(data, "liveBuildGit")),
        .flavor = std::move(flavor),
        .requireIsoArtifact = settings.requireIsoArtifact,
    };
}

bool IsoBuilder::run(const JobContext & ctx)
{
    switch (state) {
    case State::Configured:
        break;
    case State::Ran:
        throw Error("the ISO builder has already run");
    default:
        throw Error("the ISO builder must be successfully configured before it can run");
    }
    checkJobId(ctx.jobId);
    state = State::Ran;

    Activity act(ctx.logger, lvlInfo, actJob, fmt("building ISO image of '%s' for job '%s'", _chrootName, ctx.jobId));
    PushActivity pact(act.id);

    auto step = [&](std::string_view description) {
        if (ctx.checkInterrupt()) {
            printMsgUsing((&ctx.logger), lvlError, "job '%s' was cancelled", ctx.jobId);
            return false;
        }
        act.result(resSetPhase, description);
        printMsgUsing((&ctx.logger), lvlInfo, "%s", description);
        return true;
    };

    auto session = provider.acquire(_chrootName, ctx.jobId);

    if (!step("upgrading the sandbox"))
        return false;
    if (!provider.upgrade(*session, ctx))
        printMsgUsing((&ctx.logger), lvlWarn, "upgrading sandbox '%s' failed, building anyway", session->name);

    const std::string & installer = settings.packageInstaller;
    const std::string & user = settings.sandboxUser;

    if (!step("installing git"))
        return false;
    if (provider.runLogged(*session, ctx, {installer, "install", "-y", "git", "ca-certificates"}, user) != 0)
        return false;

    if (!step("installing live-build"))
        return false;
    if (provider.runLogged(*session, ctx, {installer, "install", "-y", "live-build"}, user) != 0)
        return false;

    auto script = makeIsoBuildScript(buildParams(*session));

    if (!step("building the image"))
        return false;
    auto scriptFile = provider.materializeScopedScript(ctx.jobId, script);
    Path scriptPath = scriptFile.path().string();
    provider.copyInto(*session, scriptPath, scriptPath);

    if (provider.runLogged(*session, ctx, {"sh", "-e", scriptPath}, user) != 0)
        return false;

    printMsgUsing((&ctx.logger), lvlInfo, "ISO image of '%s' built into '%s'", _chrootName, session->resultsDir);
    return true;
}

} // namespace lbrun
