#include "authorization.hpp"
#include "certificate.hpp"
#include "certificateSigner.hpp"
#include "config.hpp"
#include "cryptowipe_test.hpp"
#include "errors.hpp"
#include "jobEngine.hpp"
#include "wipeJob.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <regex>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace cryptowipe_test
{

using cryptowipe::Authorizer;
using cryptowipe::Certificate;
using cryptowipe::CertificateRecord;
using cryptowipe::CertificateSigner;
using cryptowipe::Config;
using cryptowipe::DeviceWipeAuthorization;
using cryptowipe::InvalidStateTransition;
using cryptowipe::JobEngine;
using cryptowipe::JobOutcome;
using cryptowipe::JobRequest;
using cryptowipe::JobState;
using cryptowipe::JobStatus;
using cryptowipe::NotFound;
using cryptowipe::SigningFailed;
using cryptowipe::WipeJob;
using ::testing::_;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

namespace
{

constexpr std::chrono::seconds jobTimeout{30};

DeviceWipeAuthorization authorized()
{
    return Authorizer([] { return true; })
        .authorizeDeviceWipe(Authorizer::ownerConfirmation);
}

} // namespace

class JobEngineTest : public TempDirTest
{
  public:
    Config config;
    std::unique_ptr<CertificateSigner> signer;
    std::unique_ptr<MockWipeToolsInterface> tools =
        std::make_unique<MockWipeToolsInterface>();
    MockWipeToolsInterface* mockTools = tools.get();

    void SetUp() override
    {
        TempDirTest::SetUp();
        config = Config::withStateDir(dir);
        config.headerZeroBytes = 4096;
        config.createDirectories();
        signer = std::make_unique<CertificateSigner>(
            config.signingPrivateKey(), config.signingPublicKey());
    }

    JobStatus runToCompletion(JobEngine& engine, const JobRequest& request)
    {
        std::string id = engine.startJob(authorized(), request);
        EXPECT_TRUE(engine.waitForJob(id, jobTimeout));
        return engine.getJobStatus(id);
    }
};

TEST_F(JobEngineTest, linuxHeaderZeroIsCertified)
{
    EXPECT_CALL(*mockTools, runZeroHeader("/dev/fake0", 4096))
        .WillOnce(Return(0));
    JobEngine engine(config, *signer, std::move(tools));

    JobStatus status = runToCompletion(
        engine, JobRequest{"linux", "/dev/fake0", "header_zero"});

    EXPECT_EQ(status.state, JobState::finished);
    EXPECT_EQ(status.outcome, JobOutcome::success);
    EXPECT_TRUE(status.success);
    ASSERT_TRUE(status.certificatePath.has_value());
    ASSERT_TRUE(status.signaturePath.has_value());
    EXPECT_EQ(*status.certificatePath,
              config.certsDir() / (status.id + ".json"));
    EXPECT_EQ(*status.signaturePath, config.certsDir() / (status.id + ".sig"));
    EXPECT_TRUE(std::filesystem::exists(*status.certificatePath));
    EXPECT_TRUE(std::filesystem::exists(*status.signaturePath));

    Certificate certificate = engine.getCertificate(status.id);
    CertificateRecord record =
        cryptowipe::parseCertificate(certificate.payload);
    EXPECT_EQ(record.status, "success");
    EXPECT_EQ(record.jobId, status.id);
    EXPECT_EQ(record.os, "linux");
    EXPECT_EQ(record.target, "/dev/fake0");
    EXPECT_EQ(record.action, "header_zero");
    EXPECT_EQ(certificate.payload, cryptowipe::canonicalize(record));
    EXPECT_TRUE(engine.verifyCertificate(certificate));

    Certificate forged = certificate;
    forged.payload.replace(forged.payload.find("/dev/fake0"), 10,
                           "/dev/fake1");
    EXPECT_FALSE(engine.verifyCertificate(forged));
}

TEST_F(JobEngineTest, jobLogIsTimestampedAndPersisted)
{
    EXPECT_CALL(*mockTools, runZeroHeader(_, _)).WillOnce(Return(0));
    JobEngine engine(config, *signer, std::move(tools));

    JobStatus status = runToCompletion(
        engine, JobRequest{"linux", "/dev/fake0", "zero_header"});

    ASSERT_FALSE(status.log.empty());
    std::regex line(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] .+)");
    for (const std::string& entry : status.log)
    {
        EXPECT_TRUE(std::regex_match(entry, line)) << entry;
    }
    EXPECT_THAT(status.log.front(), HasSubstr("os=linux"));
    EXPECT_THAT(status.log.front(), HasSubstr("action=zero_header"));

    std::vector<uint8_t> persisted =
        readAll(config.logsDir() / (status.id + ".log"));
    std::string expected;
    for (const std::string& entry : status.log)
    {
        expected += entry + "\n";
    }
    EXPECT_EQ(std::string(persisted.begin(), persisted.end()), expected);
}

TEST_F(JobEngineTest, keySlotKillUsesDefaultSlot)
{
    EXPECT_CALL(*mockTools, runKillSlot("/dev/luks0", 0)).WillOnce(Return(0));
    EXPECT_CALL(*mockTools, runKillSlot("/dev/luks1", 2)).WillOnce(Return(0));
    EXPECT_CALL(*mockTools, runZeroHeader(_, _)).Times(0);
    JobEngine engine(config, *signer, std::move(tools));

    JobStatus first = runToCompletion(
        engine, JobRequest{"linux", "/dev/luks0", "luks_killslot"});
    EXPECT_EQ(first.state, JobState::finished);

    JobStatus second = runToCompletion(
        engine, JobRequest{"linux", "/dev/luks1", "key_slot_kill", 2});
    EXPECT_EQ(second.state, JobState::finished);
    EXPECT_THAT(engine.getCertificate(second.id).payload,
                HasSubstr("\"action\":\"key_slot_kill\""));
}

TEST_F(JobEngineTest, osNameIsCaseInsensitive)
{
    EXPECT_CALL(*mockTools, runZeroHeader(_, _)).WillOnce(Return(0));
    JobEngine engine(config, *signer, std::move(tools));

    JobStatus status = runToCompletion(
        engine, JobRequest{"Linux", "/dev/fake0", "zero_header"});
    EXPECT_EQ(status.state, JobState::finished);
    EXPECT_EQ(status.os, "linux");
}

TEST_F(JobEngineTest, windowsNeedsManualAction)
{
    EXPECT_CALL(*mockTools, runKillSlot(_, _)).Times(0);
    EXPECT_CALL(*mockTools, runZeroHeader(_, _)).Times(0);
    JobEngine engine(config, *signer, std::move(tools));

    JobStatus status = runToCompletion(
        engine, JobRequest{"windows", "C:", "zero_header"});

    EXPECT_EQ(status.state, JobState::failed);
    EXPECT_EQ(status.outcome, JobOutcome::failed);
    EXPECT_FALSE(status.success);
    EXPECT_THAT(status.log, Contains(HasSubstr("manage-bde")));
    EXPECT_THAT(status.log, Contains(HasSubstr("manually")));
    EXPECT_FALSE(status.certificatePath.has_value());
    EXPECT_THROW(engine.getCertificate(status.id), NotFound);
    EXPECT_FALSE(
        std::filesystem::exists(config.certsDir() / (status.id + ".json")));
}

TEST_F(JobEngineTest, macosNeedsManualAction)
{
    EXPECT_CALL(*mockTools, runKillSlot(_, _)).Times(0);
    EXPECT_CALL(*mockTools, runZeroHeader(_, _)).Times(0);
    JobEngine engine(config, *signer, std::move(tools));

    JobStatus status = runToCompletion(
        engine, JobRequest{"macos", "/dev/disk2", "luks_killslot"});

    EXPECT_EQ(status.state, JobState::failed);
    EXPECT_THAT(status.log, Contains(HasSubstr("fdesetup")));
}

TEST_F(JobEngineTest, unknownOsFails)
{
    EXPECT_CALL(*mockTools, runKillSlot(_, _)).Times(0);
    EXPECT_CALL(*mockTools, runZeroHeader(_, _)).Times(0);
    JobEngine engine(config, *signer, std::move(tools));

    JobStatus status = runToCompletion(
        engine, JobRequest{"solaris", "/dev/dsk0", "zero_header"});

    EXPECT_EQ(status.state, JobState::failed);
    EXPECT_THAT(status.error, HasSubstr("Unsupported OS"));
}

TEST_F(JobEngineTest, unknownLinuxActionFails)
{
    EXPECT_CALL(*mockTools, runKillSlot(_, _)).Times(0);
    EXPECT_CALL(*mockTools, runZeroHeader(_, _)).Times(0);
    JobEngine engine(config, *signer, std::move(tools));

    JobStatus status =
        runToCompletion(engine, JobRequest{"linux", "/dev/sda", "shred"});

    EXPECT_EQ(status.state, JobState::failed);
    EXPECT_THAT(status.error, HasSubstr("Unsupported action"));
}

TEST_F(JobEngineTest, toolFailureIsNotRetried)
{
    EXPECT_CALL(*mockTools, runZeroHeader("/dev/fake0", _))
        .Times(1)
        .WillOnce(Return(5));
    JobEngine engine(config, *signer, std::move(tools));

    JobStatus status = runToCompletion(
        engine, JobRequest{"linux", "/dev/fake0", "zero_header"});

    EXPECT_EQ(status.state, JobState::failed);
    EXPECT_THAT(status.error, HasSubstr("exited with status 5"));
    EXPECT_THAT(status.log.back(), HasSubstr("Job failed"));
    EXPECT_THROW(engine.getCertificate(status.id), NotFound);
}

TEST_F(JobEngineTest, signingFailureAfterWipeIsUncertified)
{
    MockCertificateSignerInterface failingSigner;
    EXPECT_CALL(failingSigner, sign(_))
        .WillOnce(Throw(SigningFailed("key unavailable")));
    EXPECT_CALL(*mockTools, runZeroHeader(_, _)).WillOnce(Return(0));
    JobEngine engine(config, failingSigner, std::move(tools));

    JobStatus status = runToCompletion(
        engine, JobRequest{"linux", "/dev/fake0", "zero_header"});

    EXPECT_EQ(status.state, JobState::finished);
    EXPECT_EQ(status.outcome, JobOutcome::successUncertified);
    EXPECT_FALSE(status.success);
    EXPECT_THAT(status.error, HasSubstr("key unavailable"));
    EXPECT_THAT(status.log, Contains(HasSubstr("no certificate")));
    EXPECT_FALSE(status.certificatePath.has_value());
    EXPECT_THROW(engine.getCertificate(status.id), NotFound);
}

TEST_F(JobEngineTest, terminalStateIsStable)
{
    EXPECT_CALL(*mockTools, runZeroHeader(_, _)).WillOnce(Return(0));
    JobEngine engine(config, *signer, std::move(tools));

    std::string id = engine.startJob(
        authorized(), JobRequest{"linux", "/dev/fake0", "zero_header"});

    bool sawTerminal = false;
    JobState terminal = JobState::queued;
    auto deadline = std::chrono::steady_clock::now() + jobTimeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        JobState state = engine.getJobStatus(id).state;
        if (sawTerminal)
        {
            ASSERT_EQ(state, terminal);
        }
        else if (cryptowipe::isTerminal(state))
        {
            sawTerminal = true;
            terminal = state;
            deadline = std::chrono::steady_clock::now() +
                       std::chrono::milliseconds(200);
        }
    }
    EXPECT_TRUE(sawTerminal);
    EXPECT_EQ(terminal, JobState::finished);
}

TEST_F(JobEngineTest, jobIdsAreUniqueAndOpaque)
{
    EXPECT_CALL(*mockTools, runZeroHeader(_, _))
        .WillRepeatedly(Return(0));
    JobEngine engine(config, *signer, std::move(tools));

    std::set<std::string> ids;
    constexpr int jobs = 20;
    for (int i = 0; i < jobs; i++)
    {
        std::string id = engine.startJob(
            authorized(), JobRequest{"linux", "/dev/fake0", "zero_header"});
        EXPECT_TRUE(std::regex_match(id, std::regex("[0-9a-f]{32}"))) << id;
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), static_cast<size_t>(jobs));
    for (const std::string& id : ids)
    {
        EXPECT_TRUE(engine.waitForJob(id, jobTimeout));
        EXPECT_EQ(engine.getJobStatus(id).state, JobState::finished);
    }
}

TEST_F(JobEngineTest, finishedWorkersAreJoined)
{
    EXPECT_CALL(*mockTools, runZeroHeader(_, _))
        .WillRepeatedly(Return(0));
    JobEngine engine(config, *signer, std::move(tools));

    std::string last;
    for (int i = 0; i < 10; i++)
    {
        last = engine.startJob(
            authorized(), JobRequest{"linux", "/dev/fake0", "zero_header"});
        EXPECT_TRUE(engine.waitForJob(last, jobTimeout));
    }
    /* Each accept joins the workers of the jobs already finished. */
    EXPECT_LE(engine.reapWorkers(), 1U);
    EXPECT_EQ(engine.reapWorkers(), 0U);
    EXPECT_EQ(engine.getJobStatus(last).state, JobState::finished);
}

TEST_F(JobEngineTest, workerLaunchFailureFailsTheJob)
{
    EXPECT_CALL(*mockTools, runZeroHeader(_, _)).Times(0);
    JobEngine engine(config, *signer, std::move(tools),
                     [](std::function<void()>) -> std::thread {
        throw std::system_error(
            std::make_error_code(std::errc::resource_unavailable_try_again));
    });

    EXPECT_THROW(engine.startJob(authorized(), JobRequest{"linux",
                                                          "/dev/fake0",
                                                          "zero_header"}),
                 std::system_error);

    std::vector<std::string> ids;
    for (const auto& entry :
         std::filesystem::directory_iterator(config.logsDir()))
    {
        ids.push_back(entry.path().stem().string());
    }
    ASSERT_EQ(ids.size(), 1U);

    JobStatus status = engine.getJobStatus(ids.front());
    EXPECT_EQ(status.state, JobState::failed);
    EXPECT_EQ(status.outcome, JobOutcome::failed);
    EXPECT_FALSE(status.success);
    EXPECT_THAT(status.log, Contains(HasSubstr("Could not start a worker")));
    EXPECT_TRUE(engine.waitForJob(ids.front(), std::chrono::milliseconds(1)));
    EXPECT_EQ(engine.reapWorkers(), 0U);
}

TEST_F(JobEngineTest, unknownJob)
{
    JobEngine engine(config, *signer, std::move(tools));
    EXPECT_THROW(engine.getJobStatus("0123"), NotFound);
    EXPECT_THROW(engine.getCertificate("0123"), NotFound);
    EXPECT_THROW(engine.waitForJob("0123", std::chrono::milliseconds(1)),
                 NotFound);
}

class WipeJobTest : public TempDirTest
{};

TEST_F(WipeJobTest, transitions)
{
    WipeJob job("id", JobRequest{"linux", "/dev/x", "zero_header"},
                dir / "id.log");
    EXPECT_EQ(job.state(), JobState::queued);
    EXPECT_THROW(job.finish(dir / "c", dir / "s"), InvalidStateTransition);

    job.start();
    EXPECT_THROW(job.start(), InvalidStateTransition);
    job.finish(dir / "c.json", dir / "c.sig");
    EXPECT_EQ(job.state(), JobState::finished);

    EXPECT_THROW(job.fail("late"), InvalidStateTransition);
    EXPECT_THROW(job.finishUncertified("late"), InvalidStateTransition);
    EXPECT_EQ(job.snapshot().state, JobState::finished);
    EXPECT_EQ(job.snapshot().outcome, JobOutcome::success);
    EXPECT_TRUE(job.snapshot().error.empty());
}

TEST_F(WipeJobTest, failedIsTerminal)
{
    WipeJob job("id", JobRequest{"linux", "/dev/x", "zero_header"},
                dir / "id.log");
    job.start();
    job.fail("boom");
    EXPECT_THROW(job.start(), InvalidStateTransition);
    EXPECT_THROW(job.finish(dir / "c", dir / "s"), InvalidStateTransition);
    EXPECT_EQ(job.snapshot().state, JobState::failed);
    EXPECT_EQ(job.snapshot().error, "boom");
}

TEST_F(WipeJobTest, logSurvivesUnwritableFile)
{
    WipeJob job("id", JobRequest{"linux", "/dev/x", "zero_header"},
                dir / "missing" / "id.log");
    job.appendLog("still recorded");
    ASSERT_EQ(job.snapshot().log.size(), 1U);
    EXPECT_THAT(job.snapshot().log.front(), HasSubstr("still recorded"));
}

TEST(JobStrings, names)
{
    EXPECT_EQ(cryptowipe::toString(JobState::running), "running");
    EXPECT_EQ(cryptowipe::toString(JobOutcome::successUncertified),
              "success-uncertified");
}

} // namespace cryptowipe_test
