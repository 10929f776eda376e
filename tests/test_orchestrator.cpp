#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <unistd.h>

#include "conversion_orchestrator.h"
#include "fake_media.h"
#include "processor.h"

namespace fs = std::filesystem;

class OrchestratorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = fs::temp_directory_path() /
                ("sbs2spatial_" + std::string(info->name()) + "_" + std::to_string(::getpid()));
        fs::create_directories(m_dir);
        m_source = (m_dir / "input_sbs.mp4").string();
        m_destination = (m_dir / "output_spatial.mov").string();
        std::ofstream(m_source) << "sbs";
        m_script = std::make_shared<FakeScript>();
        m_backend.reset(new FakeBackend(m_script));
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    ConversionError::Kind expectFailure(ConversionOrchestrator &orchestrator)
    {
        try
        {
            orchestrator.convert(m_source, m_destination);
        }
        catch (const ConversionError &e)
        {
            return e.kind();
        }
        ADD_FAILURE() << "convert() did not throw";
        return ConversionError::Kind::Busy;
    }

    fs::path m_dir;
    std::string m_source;
    std::string m_destination;
    FakeScriptPtr m_script;
    std::unique_ptr<FakeBackend> m_backend;
    FakeAccessProvider m_access;
    FrameProcessor m_processor;
};

TEST_F(OrchestratorTest, VideoOnlyConversionCompletes)
{
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);

    EXPECT_EQ(m_script->pairsAppended, 300);
    EXPECT_EQ(m_script->malformedPairs, 0);
    EXPECT_TRUE(std::is_sorted(m_script->pairPts.begin(), m_script->pairPts.end()));
    EXPECT_EQ(m_script->finishWritingCalls, 1);
    EXPECT_FALSE(m_script->audioConfigured);
    EXPECT_EQ(m_script->videoSettings.width, 8);
    EXPECT_EQ(m_script->videoSettings.height, 8);
    EXPECT_DOUBLE_EQ(m_script->videoSettings.horizontalFieldOfViewDegrees, 90.0);
    EXPECT_DOUBLE_EQ(m_script->videoSettings.horizontalDisparityAdjustment, 0.0);

    ProgressSnapshot progress = orchestrator.progress();
    EXPECT_FALSE(progress.isProcessing);
    EXPECT_DOUBLE_EQ(progress.totalFrames, 300.0);
    EXPECT_EQ(progress.framesProcessed, 299);
    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Idle);

    ASSERT_TRUE(orchestrator.lastConvertedFile().has_value());
    ConversionResult result = *orchestrator.lastConvertedFile();
    EXPECT_EQ(result.outputPath, m_destination);
    EXPECT_EQ(result.outputSizeBytes, 2048u);
    EXPECT_DOUBLE_EQ(result.outputDurationSeconds, 10.0);
    EXPECT_GE(result.elapsedSeconds, 0.0);

    EXPECT_TRUE(fs::exists(m_destination));
    EXPECT_EQ(m_access.starts(m_source), 1);
    EXPECT_EQ(m_access.stops(m_source), 1);
    EXPECT_EQ(m_access.starts(m_destination), 1);
    EXPECT_EQ(m_access.stops(m_destination), 1);
    EXPECT_EQ(m_processor.outstandingBuffers(), 0);
}

TEST_F(OrchestratorTest, AudioIsCopiedAlongsideVideo)
{
    m_script->audioSamples = 280;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);

    EXPECT_TRUE(m_script->audioConfigured);
    EXPECT_EQ(m_script->pairsAppended, 300);
    EXPECT_EQ(m_script->samplesAppended, 280);
    EXPECT_EQ(m_script->finishWritingCalls, 1);
    EXPECT_TRUE(orchestrator.lastConvertedFile().has_value());
}

TEST_F(OrchestratorTest, FinalizesWhenAudioEndsLast)
{
    m_script->audioSamples = 280;
    m_script->order = FakeScript::Order::AudioEndsAfterVideo;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);

    const std::vector<std::string> expected = {"video-finished", "audio-finished", "finish-writing"};
    EXPECT_EQ(m_script->events, expected);
}

TEST_F(OrchestratorTest, FinalizesWhenVideoEndsLast)
{
    m_script->audioSamples = 280;
    m_script->order = FakeScript::Order::VideoEndsAfterAudio;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);

    const std::vector<std::string> expected = {"audio-finished", "video-finished", "finish-writing"};
    EXPECT_EQ(m_script->events, expected);
}

TEST_F(OrchestratorTest, SkipsFrameWhenEyeViewUnavailable)
{
    FaultInjectingProcessor faulty(m_processor, 150);
    ConversionOrchestrator orchestrator(*m_backend, m_access, faulty);

    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);

    EXPECT_EQ(m_script->pairsAppended, 299);
    EXPECT_EQ(std::count(m_script->pairPts.begin(), m_script->pairPts.end(), 150), 0);
    EXPECT_EQ(orchestrator.progress().framesProcessed, 299);
    EXPECT_EQ(m_processor.outstandingBuffers(), 0);
}

TEST_F(OrchestratorTest, AppendFailuresDoNotStopTheConversion)
{
    m_script->failAppendEvery = 10;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);
    EXPECT_EQ(m_script->pairsAppended, 300);
    EXPECT_EQ(orchestrator.progress().framesProcessed, 299);
    EXPECT_TRUE(fs::exists(m_destination));
}

TEST_F(OrchestratorTest, ExhaustedBufferPoolSkipsFramesUntilBuffersReturn)
{
    m_script->retainPairAt = 10;
    m_script->releaseRetainedAt = 20;
    ConverterSettings settings;
    settings.retainedBufferCount = 2;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor, settings);

    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);

    // Frames 11..19 find both buffers held by the sink
    EXPECT_EQ(m_script->pairsAppended, 291);
    for (int64_t pts = 11; pts < 20; ++pts)
        EXPECT_EQ(std::count(m_script->pairPts.begin(), m_script->pairPts.end(), pts), 0) << "pts " << pts;
    EXPECT_EQ(std::count(m_script->pairPts.begin(), m_script->pairPts.end(), 20), 1);
    EXPECT_EQ(m_script->malformedPairs, 0);
    EXPECT_EQ(orchestrator.progress().framesProcessed, 291);
    EXPECT_EQ(m_processor.outstandingBuffers(), 0);
    EXPECT_TRUE(fs::exists(m_destination));
}

TEST_F(OrchestratorTest, ProgressCallbackSeesMonotonicCounts)
{
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);
    std::vector<int64_t> seen;
    orchestrator.setProgressCallback([&seen](const ProgressSnapshot &snap)
                                     { seen.push_back(snap.framesProcessed); });

    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);

    ASSERT_EQ(seen.size(), 300u);
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_EQ(seen.front(), 1);
    EXPECT_EQ(seen.back(), 299);
}

TEST_F(OrchestratorTest, CancelWhileProcessingRemovesOutput)
{
    m_script->pauseVideoAt = 100;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    auto outcome = std::async(std::launch::async, [&]
                              { return orchestrator.convert(m_source, m_destination); });
    ASSERT_TRUE(m_script->waitUntil([this]
                                    { return m_script->videoPaused; }));

    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Processing);
    EXPECT_EQ(orchestrator.progress().framesProcessed, 100);
    try
    {
        orchestrator.convert(m_source, m_destination);
        ADD_FAILURE() << "second convert() should be rejected";
    }
    catch (const ConversionError &e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::Busy);
    }

    EXPECT_TRUE(orchestrator.cancel(m_destination));
    EXPECT_EQ(outcome.get(), ConversionOutcome::Cancelled);

    EXPECT_FALSE(fs::exists(m_destination));
    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Idle);
    EXPECT_FALSE(orchestrator.progress().isProcessing);
    EXPECT_EQ(orchestrator.progress().framesProcessed, 0);
    EXPECT_EQ(m_script->finishWritingCalls, 0);
    EXPECT_GE(m_script->cancelWritingCalls, 1);
    EXPECT_TRUE(m_script->readingCancelled);
    EXPECT_EQ(m_access.stops(m_source), 1);
    EXPECT_EQ(m_access.stops(m_destination), 1);
    EXPECT_FALSE(orchestrator.lastConvertedFile().has_value());
    EXPECT_EQ(m_processor.outstandingBuffers(), 0);
}

TEST_F(OrchestratorTest, ConvertAfterCancelStartsFromCleanBaseline)
{
    m_script->pauseVideoAt = 100;
    m_script->holdAfterCancel = true;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    auto outcome = std::async(std::launch::async, [&]
                              { return orchestrator.convert(m_source, m_destination); });
    ASSERT_TRUE(m_script->waitUntil([this]
                                    { return m_script->videoPaused; }));
    EXPECT_TRUE(orchestrator.cancel(m_destination));
    ASSERT_TRUE(m_script->waitUntil([this]
                                    { return m_script->heldAfterCancel; }));

    // The old pump is still running, so the orchestrator is not free yet
    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Cancelled);
    EXPECT_FALSE(fs::exists(m_destination));
    EXPECT_FALSE(orchestrator.cancel(m_destination));
    try
    {
        orchestrator.convert(m_source, m_destination);
        ADD_FAILURE() << "convert() during the cancelled tail should be rejected";
    }
    catch (const ConversionError &e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::Busy);
    }

    {
        std::lock_guard<std::mutex> lock(m_script->mutex);
        m_script->pumpReleased = true;
    }
    m_script->notify();
    EXPECT_EQ(outcome.get(), ConversionOutcome::Cancelled);

    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Idle);
    ProgressSnapshot baseline = orchestrator.progress();
    EXPECT_FALSE(baseline.isProcessing);
    EXPECT_EQ(baseline.framesProcessed, 0);
    EXPECT_DOUBLE_EQ(baseline.timeRemaining, 0.0);
    EXPECT_EQ(m_access.stops(m_source), 1);
    EXPECT_EQ(m_access.stops(m_destination), 1);
    EXPECT_EQ(m_processor.outstandingBuffers(), 0);

    {
        std::lock_guard<std::mutex> lock(m_script->mutex);
        m_script->pauseVideoAt = -1;
        m_script->holdAfterCancel = false;
        m_script->readingCancelled = false;
        m_script->videoFinished = false;
        m_script->pairsAppended = 0;
        m_script->pairPts.clear();
        m_script->events.clear();
    }
    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);

    EXPECT_EQ(m_script->pairsAppended, 300);
    EXPECT_EQ(orchestrator.progress().framesProcessed, 299);
    EXPECT_TRUE(fs::exists(m_destination));
    EXPECT_EQ(m_access.starts(m_source), 2);
    EXPECT_EQ(m_access.stops(m_source), 2);
    EXPECT_EQ(m_access.starts(m_destination), 2);
    EXPECT_EQ(m_access.stops(m_destination), 2);
    EXPECT_EQ(orchestrator.lastConvertedFile()->outputPath, m_destination);
}

TEST_F(OrchestratorTest, CancelWhilePreparingStopsBeforeProcessing)
{
    m_script->blockOpenSource = true;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    auto outcome = std::async(std::launch::async, [&]
                              { return orchestrator.convert(m_source, m_destination); });
    ASSERT_TRUE(m_script->waitUntil([this]
                                    { return m_script->openSourceEntered; }));

    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Preparing);
    EXPECT_TRUE(orchestrator.cancel(m_destination));
    {
        std::lock_guard<std::mutex> lock(m_script->mutex);
        m_script->openSourceReleased = true;
    }
    m_script->notify();

    EXPECT_EQ(outcome.get(), ConversionOutcome::Cancelled);
    EXPECT_FALSE(m_script->writingStarted);
    EXPECT_FALSE(m_script->readingStarted);
    EXPECT_EQ(m_script->pairsAppended, 0);
    EXPECT_FALSE(fs::exists(m_destination));
    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Idle);
    EXPECT_EQ(m_access.stops(m_source), 1);
    EXPECT_EQ(m_access.stops(m_destination), 1);
}

TEST_F(OrchestratorTest, CancelWhenIdleIsRejected)
{
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);
    EXPECT_FALSE(orchestrator.cancel(m_destination));
    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Idle);
}

TEST_F(OrchestratorTest, DeniedSourceAccessOpensNothing)
{
    m_access.deny(m_source);
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(expectFailure(orchestrator), ConversionError::Kind::PermissionDenied);
    EXPECT_EQ(m_script->sinksOpened, 0);
    EXPECT_EQ(m_script->sourcesOpened, 0);
    EXPECT_EQ(m_access.stops(m_source), 0);
    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Idle);
}

TEST_F(OrchestratorTest, DeniedDestinationAccessReleasesSource)
{
    m_access.deny(m_destination);
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(expectFailure(orchestrator), ConversionError::Kind::PermissionDenied);
    EXPECT_EQ(m_script->sinksOpened, 0);
    EXPECT_EQ(m_access.starts(m_source), 1);
    EXPECT_EQ(m_access.stops(m_source), 1);
    EXPECT_EQ(m_access.stops(m_destination), 0);
}

TEST_F(OrchestratorTest, ReplacesExistingDestination)
{
    std::ofstream(m_destination) << std::string(100000, 'o');
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);
    EXPECT_EQ(fs::file_size(m_destination), 2048u);
}

TEST_F(OrchestratorTest, MissingVideoTrackFailsAndCleansUp)
{
    m_script->noVideoTrack = true;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(expectFailure(orchestrator), ConversionError::Kind::NoVideoTrack);
    EXPECT_EQ(m_script->cancelWritingCalls, 1);
    EXPECT_FALSE(fs::exists(m_destination));
    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Idle);
    EXPECT_EQ(m_access.stops(m_source), 1);
    EXPECT_EQ(m_access.stops(m_destination), 1);
}

TEST_F(OrchestratorTest, UnusableSourceFormatMeansNoProcessor)
{
    m_script->info.format.width = 0;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(expectFailure(orchestrator), ConversionError::Kind::ProcessorUnavailable);
    EXPECT_FALSE(fs::exists(m_destination));
    EXPECT_FALSE(m_processor.isPrepared());
}

TEST_F(OrchestratorTest, FailedFinishIsReportedAsWriteFailure)
{
    m_script->finishFails = true;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(expectFailure(orchestrator), ConversionError::Kind::WriteFailed);
    EXPECT_FALSE(fs::exists(m_destination));
    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Idle);
    EXPECT_FALSE(orchestrator.lastConvertedFile().has_value());
    EXPECT_EQ(m_access.stops(m_destination), 1);
}

TEST_F(OrchestratorTest, RejectedStreamAtFinishKeepsItsReason)
{
    m_script->finishThrows = "encoder wrote single-layer packets";
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    try
    {
        orchestrator.convert(m_source, m_destination);
        ADD_FAILURE() << "convert() did not throw";
    }
    catch (const ConversionError &e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::WriteFailed);
        EXPECT_STREQ(e.what(), "encoder wrote single-layer packets");
    }
    EXPECT_FALSE(fs::exists(m_destination));
    EXPECT_EQ(orchestrator.phase(), ConversionPhase::Idle);
    EXPECT_EQ(m_access.stops(m_source), 1);
    EXPECT_EQ(m_access.stops(m_destination), 1);
}

TEST_F(OrchestratorTest, UnreadableMetadataStillCompletes)
{
    m_script->probeFails = true;
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);

    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);
    EXPECT_TRUE(fs::exists(m_destination));
    EXPECT_FALSE(orchestrator.lastConvertedFile().has_value());
}

TEST_F(OrchestratorTest, SecondConversionStartsFromCleanState)
{
    ConversionOrchestrator orchestrator(*m_backend, m_access, m_processor);
    EXPECT_EQ(orchestrator.convert(m_source, m_destination), ConversionOutcome::Completed);
    EXPECT_EQ(m_processor.outstandingBuffers(), 0);

    const std::string second = (m_dir / "second.mov").string();
    {
        std::lock_guard<std::mutex> lock(m_script->mutex);
        m_script->pairsAppended = 0;
        m_script->videoFinished = false;
        m_script->events.clear();
    }
    EXPECT_EQ(orchestrator.convert(m_source, second), ConversionOutcome::Completed);

    EXPECT_EQ(m_script->pairsAppended, 300);
    EXPECT_EQ(orchestrator.progress().framesProcessed, 299);
    EXPECT_EQ(orchestrator.lastConvertedFile()->outputPath, second);
    EXPECT_EQ(m_processor.outstandingBuffers(), 0);
    EXPECT_EQ(m_access.starts(m_source), 2);
    EXPECT_EQ(m_access.stops(m_source), 2);
}
