#pragma once

#include "authorization.hpp"
#include "certificate.hpp"
#include "certificateSigner.hpp"
#include "config.hpp"
#include "wipeJob.hpp"
#include "wipeToolsInterface.hpp"

#include <boost/container/flat_map.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cryptowipe
{

/** @class JobRegistry
 *  @brief Every job accepted during the lifetime of its engine, by id.
 */
class JobRegistry
{
  public:
    /** @brief Insert a job.
     *  @returns false if the id is already taken.
     */
    bool add(std::shared_ptr<WipeJob> job);

    /** @returns the job, or nullptr if the id is unknown. */
    std::shared_ptr<WipeJob> find(const std::string& id) const;

    size_t size() const;

  private:
    mutable std::mutex registryMutex;
    boost::container::flat_map<std::string, std::shared_ptr<WipeJob>> jobs;
};

/** @class JobEngine
 *  @brief Runs device wipe jobs, one fresh worker thread per job, and
 *  certifies the ones that succeed.
 *  @details Workers are not pooled and their number is not bounded.
 *    Errors raised while a job runs never leave its worker; they are
 *    recorded on the job. Workers of terminal jobs are joined when the
 *    next job is accepted, and destroying the engine waits for the rest.
 *    A destructive action cannot be cancelled once started.
 */
class JobEngine
{
  public:
    /** @brief Starts the thread that runs one job. */
    using WorkerLauncher = std::function<std::thread(std::function<void()>)>;

    /** @brief Launches a plain std::thread. */
    static std::thread launchThread(std::function<void()> work);

    JobEngine(Config config, CertificateSignerInterface& signer,
              std::unique_ptr<WipeToolsInterface> tools =
                  std::make_unique<WipeTools>(),
              WorkerLauncher launcher = launchThread);

    ~JobEngine();

    JobEngine(const JobEngine&) = delete;
    JobEngine& operator=(const JobEngine&) = delete;
    JobEngine(JobEngine&&) = delete;
    JobEngine& operator=(JobEngine&&) = delete;

    /** @brief Accept a job and launch its worker.
     *  @details The os is stored lower-cased; the action is kept as
     *    requested.
     *
     *  @returns the new job id, 32 hex digits drawn from the OpenSSL DRBG.
     *  @throws std::system_error if no worker thread can be started; the
     *    job is recorded as failed first.
     */
    std::string startJob(const DeviceWipeAuthorization& authorization,
                         JobRequest request);

    /** @throws NotFound for an unknown id. */
    JobStatus getJobStatus(const std::string& id) const;

    /** @brief Read back the certificate of a finished job.
     *  @throws NotFound for an unknown id, or a job without a certificate.
     */
    Certificate getCertificate(const std::string& id) const;

    /** @brief Check a certificate against the engine's signing identity. */
    bool verifyCertificate(const Certificate& certificate);

    /** @brief Block until the job is terminal or timeout expires.
     *  @returns true if the job is terminal.
     *  @throws NotFound for an unknown id.
     */
    bool waitForJob(const std::string& id, std::chrono::milliseconds timeout);

    /** @brief Join the workers of terminal jobs.
     *  @returns the number of workers still held.
     */
    size_t reapWorkers();

  private:
    struct Worker
    {
        std::shared_ptr<WipeJob> job;
        std::thread thread;
    };

    /** @brief Join and drop finished workers. Requires workerMutex. */
    void reapFinished();

    void run(const std::shared_ptr<WipeJob>& job);

    /** @brief Apply the per-os action policy. Throws on failure. */
    void execute(WipeJob& job);

    /** @brief Sign and persist the certificate, then finish the job. */
    void certify(WipeJob& job);

    void notifyTerminal();

    const Config config;
    CertificateSignerInterface& signer;
    std::unique_ptr<WipeToolsInterface> tools;
    WorkerLauncher launcher;

    JobRegistry registry;

    std::mutex workerMutex;
    std::vector<Worker> workers;

    std::mutex terminalMutex;
    std::condition_variable terminalCv;
};

} // namespace cryptowipe
