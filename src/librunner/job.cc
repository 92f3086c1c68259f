#include "lbrun/runner/job.hh"
#include "lbrun/util/error.hh"

namespace lbrun {

JobDescriptor parseJobDescriptor(std::string_view text)
{
    JobDescriptor job;
    try {
        job = nlohmann::json::parse(text);
    } catch (nlohmann::json::parse_error & e) {
        throw Error("job description is not valid JSON: %s", e.what());
    }
    if (!job.is_object())
        throw Error("job description must be a JSON object, not %s", job.type_name());
    return job;
}

void checkJobId(std::string_view jobId)
{
    static constexpr std::string_view allowed =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789._-";

    if (jobId.empty() || jobId == "." || jobId == ".." || jobId.find_first_not_of(allowed) != jobId.npos)
        throw UsageError("invalid job identifier '%s': only letters, digits, '.', '_' and '-' are allowed", jobId);
}

} // namespace lbrun
