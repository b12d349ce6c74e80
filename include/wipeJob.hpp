#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cryptowipe
{

enum class JobState
{
    queued,
    running,
    finished,
    failed,
};

/** @brief How a terminal job ended.
 *  @details successUncertified means the destructive action completed but
 *    no certificate could be produced; the device is wiped regardless.
 */
enum class JobOutcome
{
    none,
    success,
    successUncertified,
    failed,
};

std::string_view toString(JobState state);
std::string_view toString(JobOutcome outcome);

inline bool isTerminal(JobState state)
{
    return state == JobState::finished || state == JobState::failed;
}

/** @struct JobRequest
 *  @brief Parameters of one device wipe.
 */
struct JobRequest
{
    std::string os;
    std::string target;
    std::string action;
    /* Only used by the key-slot kill action; negative selects the default. */
    int keySlot = -1;
};

/** @struct JobStatus
 *  @brief Point-in-time copy of a job. It may be stale as soon as it is
 *  returned.
 */
struct JobStatus
{
    std::string id;
    std::string os;
    std::string target;
    std::string action;
    JobState state = JobState::queued;
    JobOutcome outcome = JobOutcome::none;
    /** True only for a certified success. */
    bool success = false;
    std::string error;
    std::vector<std::string> log;
    std::optional<std::filesystem::path> certificatePath;
    std::optional<std::filesystem::path> signaturePath;
};

/** @class WipeJob
 *  @brief One destructive job and its audit trail.
 *  @details Only the job's worker mutates it. Log lines are kept in memory
 *    and appended to the per-job log file as they are produced.
 */
class WipeJob
{
  public:
    WipeJob(std::string id, JobRequest request,
            std::filesystem::path logPath);

    WipeJob(const WipeJob&) = delete;
    WipeJob& operator=(const WipeJob&) = delete;

    const std::string& id() const
    {
        return jobId;
    }

    const JobRequest& request() const
    {
        return jobRequest;
    }

    /** @brief Timestamp message, keep it and persist it.
     *  @details A failure to persist is reported to the journal only; the
     *    in-memory log still receives the line.
     */
    void appendLog(std::string_view message);

    /** @brief queued -> running.
     *  @throws InvalidStateTransition from any other state.
     */
    void start();

    /** @brief running -> finished with a certificate. */
    void finish(const std::filesystem::path& certificate,
                const std::filesystem::path& signature);

    /** @brief running -> finished without a certificate. */
    void finishUncertified(std::string_view error);

    /** @brief queued or running -> failed. */
    void fail(std::string_view error);

    JobStatus snapshot() const;

    JobState state() const;

  private:
    void transition(JobState to);

    const std::string jobId;
    const JobRequest jobRequest;
    const std::filesystem::path logPath;

    mutable std::mutex jobMutex;
    JobState jobState = JobState::queued;
    JobOutcome jobOutcome = JobOutcome::none;
    std::string jobError;
    std::vector<std::string> logLines;
    std::optional<std::filesystem::path> certPath;
    std::optional<std::filesystem::path> sigPath;
};

} // namespace cryptowipe
