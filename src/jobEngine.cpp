#include "jobEngine.hpp"

#include "errors.hpp"
#include "util.hpp"

#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <span>
#include <string>
#include <system_error>
#include <utility>

namespace cryptowipe
{

namespace
{

constexpr size_t jobIdBytes = 16;

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool isKeySlotKill(std::string_view action)
{
    return action == "luks_killslot" || action == "key_slot_kill";
}

bool isHeaderZero(std::string_view action)
{
    return action == "zero_header" || action == "header_zero";
}

std::span<const uint8_t> asBytes(const std::string& s)
{
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

} // namespace

bool JobRegistry::add(std::shared_ptr<WipeJob> job)
{
    std::lock_guard<std::mutex> lock(registryMutex);
    std::string id = job->id();
    return jobs.emplace(std::move(id), std::move(job)).second;
}

std::shared_ptr<WipeJob> JobRegistry::find(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(registryMutex);
    auto it = jobs.find(id);
    if (it == jobs.end())
    {
        return nullptr;
    }
    return it->second;
}

size_t JobRegistry::size() const
{
    std::lock_guard<std::mutex> lock(registryMutex);
    return jobs.size();
}

std::thread JobEngine::launchThread(std::function<void()> work)
{
    return std::thread(std::move(work));
}

JobEngine::JobEngine(Config config, CertificateSignerInterface& signer,
                     std::unique_ptr<WipeToolsInterface> tools,
                     WorkerLauncher launcher) :
    config(std::move(config)), signer(signer), tools(std::move(tools)),
    launcher(std::move(launcher))
{}

JobEngine::~JobEngine()
{
    std::lock_guard<std::mutex> lock(workerMutex);
    for (Worker& worker : workers)
    {
        if (worker.thread.joinable())
        {
            worker.thread.join();
        }
    }
}

void JobEngine::reapFinished()
{
    auto done = std::partition(workers.begin(), workers.end(),
                               [](const Worker& worker) {
        return !isTerminal(worker.job->state());
    });
    /* A terminal job's worker only has notifyTerminal() left to run. */
    for (auto it = done; it != workers.end(); ++it)
    {
        if (it->thread.joinable())
        {
            it->thread.join();
        }
    }
    workers.erase(done, workers.end());
}

size_t JobEngine::reapWorkers()
{
    std::lock_guard<std::mutex> lock(workerMutex);
    reapFinished();
    return workers.size();
}

std::string JobEngine::startJob(const DeviceWipeAuthorization& /*unused*/,
                                JobRequest request)
{
    request.os = lower(request.os);

    std::shared_ptr<WipeJob> job;
    do
    {
        std::string id = util::toHex(util::randomBytes(jobIdBytes));
        std::filesystem::path logPath = config.logsDir() / (id + ".log");
        job = std::make_shared<WipeJob>(std::move(id), request,
                                        std::move(logPath));
    } while (!registry.add(job));

    lg2::info("Accepted wipe job {JOB}: {OS} {ACTION} on {TARGET}", "JOB",
              job->id(), "OS", request.os, "ACTION", request.action,
              "TARGET", request.target, "REDFISH_MESSAGE_ID",
              std::string("CryptoWipe.1.0.JobAccepted"));

    std::lock_guard<std::mutex> lock(workerMutex);
    reapFinished();
    workers.reserve(workers.size() + 1);
    try
    {
        workers.push_back(Worker{job, launcher([this, job] { run(job); })});
    }
    catch (const std::system_error& e)
    {
        job->appendLog(std::string("Could not start a worker: ") + e.what());
        job->fail(e.what());
        lg2::error("Unable to start a worker for job {JOB}: {ERROR}", "JOB",
                   job->id(), "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.JobFailed"));
        notifyTerminal();
        throw;
    }
    return job->id();
}

JobStatus JobEngine::getJobStatus(const std::string& id) const
{
    std::shared_ptr<WipeJob> job = registry.find(id);
    if (!job)
    {
        throw NotFound("job " + id);
    }
    return job->snapshot();
}

Certificate JobEngine::getCertificate(const std::string& id) const
{
    JobStatus status = getJobStatus(id);
    if (!status.certificatePath || !status.signaturePath)
    {
        throw NotFound("certificate for job " + id);
    }

    Certificate certificate;
    std::vector<uint8_t> payload = util::readFile(*status.certificatePath);
    certificate.payload.assign(payload.begin(), payload.end());
    certificate.signature = util::readFile(*status.signaturePath);
    certificate.payloadPath = *status.certificatePath;
    certificate.signaturePath = *status.signaturePath;
    return certificate;
}

bool JobEngine::verifyCertificate(const Certificate& certificate)
{
    return signer.verifyPayload(certificate.payload, certificate.signature);
}

bool JobEngine::waitForJob(const std::string& id,
                           std::chrono::milliseconds timeout)
{
    std::shared_ptr<WipeJob> job = registry.find(id);
    if (!job)
    {
        throw NotFound("job " + id);
    }
    std::unique_lock<std::mutex> lock(terminalMutex);
    return terminalCv.wait_for(lock, timeout,
                               [&job] { return isTerminal(job->state()); });
}

void JobEngine::notifyTerminal()
{
    {
        std::lock_guard<std::mutex> lock(terminalMutex);
    }
    terminalCv.notify_all();
}

void JobEngine::run(const std::shared_ptr<WipeJob>& job)
{
    const JobRequest& request = job->request();
    try
    {
        job->start();
        job->appendLog("Job started: os=" + request.os + " target=" +
                       request.target + " action=" + request.action);

        try
        {
            execute(*job);
        }
        catch (const std::exception& e)
        {
            job->appendLog(std::string("Job failed: ") + e.what());
            job->fail(e.what());
            lg2::error("Wipe job {JOB} failed: {ERROR}", "JOB", job->id(),
                       "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                       std::string("CryptoWipe.1.0.JobFailed"));
            notifyTerminal();
            return;
        }

        job->appendLog("Destructive action completed");
        try
        {
            certify(*job);
        }
        catch (const std::exception& e)
        {
            job->appendLog(
                std::string("Action completed but no certificate was "
                            "produced: ") +
                e.what());
            job->finishUncertified(e.what());
            lg2::error("Wipe job {JOB} completed uncertified: {ERROR}", "JOB",
                       job->id(), "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                       std::string("CryptoWipe.1.0.JobUncertified"));
        }
    }
    catch (const std::exception& e)
    {
        lg2::error("Wipe job {JOB} worker error: {ERROR}", "JOB", job->id(),
                   "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.JobFailed"));
    }
    notifyTerminal();
}

void JobEngine::execute(WipeJob& job)
{
    const JobRequest& request = job.request();

    if (request.os == "linux")
    {
        if (isKeySlotKill(request.action))
        {
            int slot =
                request.keySlot >= 0 ? request.keySlot : config.defaultKeySlot;
            job.appendLog("Destroying LUKS key slot " + std::to_string(slot) +
                          " on " + request.target);
            int status = tools->runKillSlot(request.target, slot);
            if (status != 0)
            {
                throw ExternalActionFailed(request.action, status);
            }
            return;
        }
        if (isHeaderZero(request.action))
        {
            job.appendLog("Zeroing the first " +
                          std::to_string(config.headerZeroBytes) +
                          " bytes of " + request.target);
            int status =
                tools->runZeroHeader(request.target, config.headerZeroBytes);
            if (status != 0)
            {
                throw ExternalActionFailed(request.action, status);
            }
            return;
        }
        throw UnsupportedAction(request.os, request.action);
    }

    if (request.os == "windows")
    {
        job.appendLog("Windows detected. Remove the BitLocker key protectors "
                      "of " +
                      request.target +
                      " manually with manage-bde -protectors; automatic "
                      "execution is disabled.");
        throw ManualActionRequired(request.os);
    }

    if (request.os == "macos")
    {
        job.appendLog("macOS detected. Erase " + request.target +
                      " manually with fdesetup or diskutil; automatic "
                      "execution is disabled.");
        throw ManualActionRequired(request.os);
    }

    throw UnsupportedOS(request.os);
}

void JobEngine::certify(WipeJob& job)
{
    const JobRequest& request = job.request();

    CertificateRecord record;
    record.jobId = job.id();
    record.os = request.os;
    record.target = request.target;
    record.action = request.action;
    record.status = "success";
    record.timestamp = util::utcTimestamp("%Y-%m-%dT%H:%M:%SZ");

    SignedPayload signedPayload = signer.sign(record);

    std::filesystem::path payloadPath =
        config.certsDir() / (job.id() + ".json");
    std::filesystem::path signaturePath =
        config.certsDir() / (job.id() + ".sig");
    util::atomicReplace(payloadPath, asBytes(signedPayload.payload), 0644);
    try
    {
        util::atomicReplace(signaturePath, signedPayload.signature, 0644);
    }
    catch (const CryptoWipeError&)
    {
        std::error_code ec;
        std::filesystem::remove(payloadPath, ec);
        throw;
    }

    job.appendLog("Certificate written to " + payloadPath.string());
    job.finish(payloadPath, signaturePath);
    lg2::info("Wipe job {JOB} finished and certified", "JOB", job.id(),
              "REDFISH_MESSAGE_ID",
              std::string("CryptoWipe.1.0.JobFinished"));
}

} // namespace cryptowipe
