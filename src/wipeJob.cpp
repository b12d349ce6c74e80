#include "wipeJob.hpp"

#include "errors.hpp"
#include "util.hpp"

#include <phosphor-logging/lg2.hpp>

#include <mutex>
#include <string>

namespace cryptowipe
{

std::string_view toString(JobState state)
{
    switch (state)
    {
        case JobState::queued:
            return "queued";
        case JobState::running:
            return "running";
        case JobState::finished:
            return "finished";
        case JobState::failed:
            return "failed";
    }
    return "unknown";
}

std::string_view toString(JobOutcome outcome)
{
    switch (outcome)
    {
        case JobOutcome::none:
            return "none";
        case JobOutcome::success:
            return "success";
        case JobOutcome::successUncertified:
            return "success-uncertified";
        case JobOutcome::failed:
            return "failed";
    }
    return "unknown";
}

WipeJob::WipeJob(std::string id, JobRequest request,
                 std::filesystem::path logPath) :
    jobId(std::move(id)), jobRequest(std::move(request)),
    logPath(std::move(logPath))
{}

void WipeJob::appendLog(std::string_view message)
{
    std::string line =
        "[" + util::utcTimestamp("%Y-%m-%d %H:%M:%S") + "] " +
        std::string(message);

    std::lock_guard<std::mutex> lock(jobMutex);
    logLines.push_back(line);
    try
    {
        util::appendLine(logPath, line);
    }
    catch (const CryptoWipeError& e)
    {
        lg2::error("Unable to persist log of job {JOB}: {ERROR}", "JOB", jobId,
                   "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.JobLogFailure"));
    }
}

void WipeJob::transition(JobState to)
{
    bool allowed = false;
    switch (jobState)
    {
        case JobState::queued:
            allowed = to == JobState::running || to == JobState::failed;
            break;
        case JobState::running:
            allowed = isTerminal(to);
            break;
        case JobState::finished:
        case JobState::failed:
            break;
    }
    if (!allowed)
    {
        throw InvalidStateTransition(toString(jobState), toString(to));
    }
    jobState = to;
}

void WipeJob::start()
{
    std::lock_guard<std::mutex> lock(jobMutex);
    transition(JobState::running);
}

void WipeJob::finish(const std::filesystem::path& certificate,
                     const std::filesystem::path& signature)
{
    std::lock_guard<std::mutex> lock(jobMutex);
    transition(JobState::finished);
    jobOutcome = JobOutcome::success;
    certPath = certificate;
    sigPath = signature;
}

void WipeJob::finishUncertified(std::string_view error)
{
    std::lock_guard<std::mutex> lock(jobMutex);
    transition(JobState::finished);
    jobOutcome = JobOutcome::successUncertified;
    jobError = error;
}

void WipeJob::fail(std::string_view error)
{
    std::lock_guard<std::mutex> lock(jobMutex);
    transition(JobState::failed);
    jobOutcome = JobOutcome::failed;
    jobError = error;
}

JobStatus WipeJob::snapshot() const
{
    std::lock_guard<std::mutex> lock(jobMutex);
    JobStatus status;
    status.id = jobId;
    status.os = jobRequest.os;
    status.target = jobRequest.target;
    status.action = jobRequest.action;
    status.state = jobState;
    status.outcome = jobOutcome;
    status.success = jobOutcome == JobOutcome::success;
    status.error = jobError;
    status.log = logLines;
    status.certificatePath = certPath;
    status.signaturePath = sigPath;
    return status;
}

JobState WipeJob::state() const
{
    std::lock_guard<std::mutex> lock(jobMutex);
    return jobState;
}

} // namespace cryptowipe
