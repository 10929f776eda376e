#pragma once

#include <string>
#include <utility>

#include "media_interfaces.h"

// Creates FFmpeg-backed sources and sinks
class FfmpegMediaBackend : public IMediaBackend
{
public:
    explicit FfmpegMediaBackend(std::string encoderName = "libx265")
        : m_encoderName(std::move(encoderName)) {}

    std::unique_ptr<IMediaSource> openSource(const std::string &path) override;
    std::unique_ptr<IMediaSink> openSink(const std::string &path) override;
    double probeDuration(const std::string &path) override;

private:
    std::string m_encoderName;
};
