#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <exception>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include "config_parser.h"
#include "conversion_orchestrator.h"
#include "ffmpeg_backend.h"
#include "ffmpeg_utils.h"
#include "file_access.h"
#include "logger.h"
#include "processor.h"
#include "utils.h"

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_sigint(int)
{
    g_interrupted = 1;
}

static void show_progress(const ProgressSnapshot &snap)
{
    if (!snap.isProcessing || snap.totalFrames <= 0)
        return;

    double progress = static_cast<double>(snap.framesProcessed) / snap.totalFrames;
    if (progress > 1.0)
        progress = 1.0;
    const int bar_width = 50;
    int pos = static_cast<int>(bar_width * progress);

    std::string bar = "[";
    for (int i = 0; i < bar_width; ++i)
    {
        if (i < pos)
            bar += "=";
        else if (i == pos)
            bar += ">";
        else
            bar += " ";
    }
    bar += "] ";

    int remaining = static_cast<int>(snap.timeRemaining);
    std::ostringstream oss;
    oss << bar;
    oss << std::setw(5) << std::fixed << std::setprecision(1) << (progress * 100.0) << "% ";
    oss << "[" << snap.framesProcessed << "/" << static_cast<long long>(snap.totalFrames) << "] ";
    oss << "ETA: " << std::setw(2) << std::setfill('0') << remaining / 60 << ":"
        << std::setw(2) << std::setfill('0') << remaining % 60;

    fprintf(stderr, "\r\033[2K"); // Clear the entire line and move cursor to start
    fprintf(stderr, "%s", oss.str().c_str());
    fflush(stderr);
}

static int run_conversion(const ConverterConfig &cfg)
{
    Logger::instance().setVerbose(cfg.verbose || cfg.debug);
    Logger::instance().setDebug(cfg.debug);
    install_ffmpeg_log_bridge();

    if (!endsWith(lowercase_copy(cfg.outputPath), ".mov"))
        LOG_WARN("Output %s is not a .mov file; players may ignore the stereo views", cfg.outputPath.c_str());

    FileAccessProvider access;
    FfmpegMediaBackend backend(cfg.encoder);
    FrameProcessor processor;
    ConverterSettings settings;
    settings.retainedBufferCount = cfg.retainedBufferCount;
    ConversionOrchestrator orchestrator(backend, access, processor, settings);

    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    ConversionOutcome outcome = ConversionOutcome::Cancelled;
    std::exception_ptr failure;

    std::thread worker([&]()
                       {
        try
        {
            outcome = orchestrator.convert(cfg.inputPath, cfg.outputPath);
        }
        catch (const std::exception &)
        {
            failure = std::current_exception();
        }
        std::lock_guard<std::mutex> lock(mutex);
        done = true;
        cv.notify_all(); });

    std::signal(SIGINT, on_sigint);
    bool cancelRequested = false;
    {
        std::unique_lock<std::mutex> lock(mutex);
        while (!done)
        {
            cv.wait_for(lock, std::chrono::milliseconds(500));
            if (done)
                break;
            if (g_interrupted && !cancelRequested)
            {
                cancelRequested = true;
                lock.unlock();
                fprintf(stderr, "\r\033[2K");
                LOG_INFO("Interrupted, cancelling...");
                if (!orchestrator.cancel(cfg.outputPath))
                    LOG_WARN("Nothing to cancel; the conversion is already finishing");
                lock.lock();
                continue;
            }
            if (cfg.showProgress)
            {
                lock.unlock();
                show_progress(orchestrator.progress());
                lock.lock();
            }
        }
    }
    worker.join();
    std::signal(SIGINT, SIG_DFL);
    if (cfg.showProgress)
        fprintf(stderr, "\r\033[2K");

    if (failure)
    {
        try
        {
            std::rethrow_exception(failure);
        }
        catch (const ConversionError &e)
        {
            fprintf(stderr, "Error (%s): %s\n", error_kind_name(e.kind()), e.what());
        }
        catch (const std::exception &e)
        {
            fprintf(stderr, "Error: %s\n", e.what());
        }
        return 2;
    }

    if (outcome == ConversionOutcome::Cancelled)
    {
        LOG_INFO("Conversion cancelled; partial output removed");
        return 130;
    }

    std::optional<ConversionResult> result = orchestrator.lastConvertedFile();
    if (!result)
    {
        LOG_INFO("Finished %s (output details unavailable)", cfg.outputPath.c_str());
        return 0;
    }
    LOG_INFO("Finished %s", result->outputPath.c_str());
    LOG_INFO("  Elapsed:  %s", format_elapsed(result->elapsedSeconds).c_str());
    LOG_INFO("  Size:     %s", format_byte_count(result->outputSizeBytes).c_str());
    LOG_INFO("  Duration: %s", format_elapsed(result->outputDurationSeconds).c_str());
    return 0;
}

int main(int argc, char **argv)
{
    ConverterConfig cfg;
    if (!parse_arguments(argc, argv, &cfg))
        return 1;
    if (cfg.showHelp)
    {
        print_help(argv[0]);
        return 0;
    }
    return run_conversion(cfg);
}
