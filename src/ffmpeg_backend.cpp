#include "ffmpeg_backend.h"
#include "ffmpeg_sink.h"
#include "ffmpeg_source.h"
#include "ffmpeg_utils.h"

std::unique_ptr<IMediaSource> FfmpegMediaBackend::openSource(const std::string &path)
{
    try
    {
        return std::make_unique<FfmpegSource>(path);
    }
    catch (const ConversionError &)
    {
        throw;
    }
    catch (const std::runtime_error &e)
    {
        throw ConversionError(ConversionError::Kind::SourceOpenFailed, e.what());
    }
}

std::unique_ptr<IMediaSink> FfmpegMediaBackend::openSink(const std::string &path)
{
    try
    {
        return std::make_unique<FfmpegSink>(path, m_encoderName);
    }
    catch (const ConversionError &)
    {
        throw;
    }
    catch (const std::runtime_error &e)
    {
        throw ConversionError(ConversionError::Kind::DestinationOpenFailed, e.what());
    }
}

double FfmpegMediaBackend::probeDuration(const std::string &path)
{
    return probe_media_duration(path);
}
