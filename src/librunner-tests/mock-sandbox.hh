#pragma once
///@file

#include <gmock/gmock.h>

#include "lbrun/runner/sandbox.hh"

namespace lbrun {

class MockSandboxProvider : public SandboxProvider
{
public:
    MockSandboxProvider(const RunnerSettings & settings)
        : SandboxProvider(settings)
    {
    }

    MOCK_METHOD(
        std::unique_ptr<SandboxSession>,
        acquire,
        (const std::string & chrootName, const std::string & jobId),
        (override));
    MOCK_METHOD(bool, upgrade, (SandboxSession & session, const JobContext & ctx), (override));
    MOCK_METHOD(
        int,
        runLogged,
        (SandboxSession & session, const JobContext & ctx, const Strings & argv, const std::string & user),
        (override));
    MOCK_METHOD(void, copyInto, (SandboxSession & session, const Path & localPath, const Path & remotePath), (override));
};

/**
 * A session that counts how often it has been released.
 */
class CountingSession : public SandboxSession
{
    int & releases;

public:
    CountingSession(const std::string & jobId, int & releases)
        : SandboxSession("lbrun-" + jobId, "/workspaces/" + jobId, "/workspaces/" + jobId + "/result")
        , releases(releases)
    {
    }

    ~CountingSession()
    {
        ++releases;
    }
};

} // namespace lbrun
