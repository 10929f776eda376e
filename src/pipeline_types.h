#pragma once

extern "C"
{
#include <libavutil/frame.h>
#include <libavutil/pixfmt.h>
#include <libavutil/rational.h>
#include <libavcodec/avcodec.h>
#include <libavcodec/packet.h>
}

#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

// RAII deleters for FFmpeg types that require ** double-pointer frees
static inline void av_frame_free_single(AVFrame *f)
{
    if (f)
        av_frame_free(&f);
}
static inline void av_packet_free_single(AVPacket *p)
{
    if (p)
        av_packet_free(&p);
}
static inline void avcodec_parameters_free_single(AVCodecParameters *p)
{
    if (p)
        avcodec_parameters_free(&p);
}

using FramePtr = std::unique_ptr<AVFrame, void (*)(AVFrame *)>;
using PacketPtr = std::unique_ptr<AVPacket, void (*)(AVPacket *)>;
using CodecParametersPtr = std::unique_ptr<AVCodecParameters, void (*)(AVCodecParameters *)>;

inline FramePtr make_frame_ptr(AVFrame *f = nullptr) { return FramePtr(f, &av_frame_free_single); }
inline PacketPtr make_packet_ptr(AVPacket *p = nullptr) { return PacketPtr(p, &av_packet_free_single); }

// Pixel format and color description of the source video track
struct FormatDescriptor
{
    AVPixelFormat pixelFormat = AV_PIX_FMT_NONE;
    int width = 0;
    int height = 0;
    AVColorPrimaries primaries = AVCOL_PRI_UNSPECIFIED;
    AVColorTransferCharacteristic transfer = AVCOL_TRC_UNSPECIFIED;
    AVColorSpace matrix = AVCOL_SPC_UNSPECIFIED;
    AVColorRange range = AVCOL_RANGE_UNSPECIFIED;

    bool operator==(const FormatDescriptor &o) const
    {
        return pixelFormat == o.pixelFormat && width == o.width && height == o.height &&
               primaries == o.primaries && transfer == o.transfer && matrix == o.matrix &&
               range == o.range;
    }
    bool operator!=(const FormatDescriptor &o) const { return !(*this == o); }
};

struct OutputColorSpace
{
    AVColorPrimaries primaries = AVCOL_PRI_BT709;
    AVColorTransferCharacteristic transfer = AVCOL_TRC_IEC61966_2_1;
    AVColorSpace matrix = AVCOL_SPC_BT709;
    AVColorRange range = AVCOL_RANGE_MPEG;
    std::string name = "sRGB";
    bool propagated = false; // true when taken from the source's color tags
};

// Geometry and pixel layout of the pooled output buffers
struct OutputFormat
{
    int width = 0;
    int height = 0;
    AVPixelFormat pixelFormat = AV_PIX_FMT_NONE;
    OutputColorSpace colorSpace;
};

// Fractional rectangle in source pixel coordinates
struct CropRegion
{
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

struct EyeRegions
{
    CropRegion left;
    CropRegion right;
};

enum class StereoEye
{
    Left,
    Right
};

struct VideoFrame
{
    FramePtr image{nullptr, &av_frame_free_single};
    int64_t pts = AV_NOPTS_VALUE;
    AVRational timeBase{0, 1};
};

struct AudioSample
{
    PacketPtr packet{nullptr, &av_packet_free_single};
    AVRational timeBase{0, 1};
};

struct TaggedBuffer
{
    FramePtr buffer{nullptr, &av_frame_free_single};
    int layerId = 0;
    StereoEye eye = StereoEye::Left;
};

struct StereoFramePair
{
    std::array<TaggedBuffer, 2> views; // [0] = left / layer 0, [1] = right / layer 1
    int64_t pts = AV_NOPTS_VALUE;
    AVRational timeBase{0, 1};
};

struct AudioTrackInfo
{
    int streamIndex = -1;
    CodecParametersPtr params{nullptr, &avcodec_parameters_free_single};
    AVRational timeBase{0, 1};
};

// Everything the orchestrator needs to know about an opened source
struct SourceInfo
{
    FormatDescriptor format;
    int naturalWidth = 0;
    int naturalHeight = 0;
    AVRational frameRate{0, 1};
    int64_t estimatedBitRate = 0;
    double durationSeconds = 0.0;
    bool hasAudio = false;
};

// Fixed output policy for the spatial video track
struct VideoOutputSettings
{
    int width = 0;
    int height = 0;
    AVPixelFormat pixelFormat = AV_PIX_FMT_NONE;
    AVRational frameRate{0, 1};
    int64_t bitRate = 0;
    OutputColorSpace colorSpace;
    double horizontalFieldOfViewDegrees = 90.0;
    double horizontalDisparityAdjustment = 0.0;
};

enum class ConversionPhase
{
    Idle,
    Preparing,
    Processing,
    Finishing,
    Cancelled
};

const char *phase_name(ConversionPhase phase);

enum class ConversionOutcome
{
    Completed,
    Cancelled
};

struct ProgressSnapshot
{
    bool isProcessing = false;
    double totalFrames = 0.0;
    int64_t framesProcessed = 0;
    double timeRemaining = 0.0; // seconds
};

struct ConversionResult
{
    std::string outputPath;
    double elapsedSeconds = 0.0;
    uint64_t outputSizeBytes = 0;
    double outputDurationSeconds = 0.0;
};

class ConversionError : public std::runtime_error
{
public:
    enum class Kind
    {
        Busy,
        PermissionDenied,
        DestinationNotRemovable,
        SourceOpenFailed,
        NoVideoTrack,
        NoFormatDescription,
        DestinationOpenFailed,
        ProcessorUnavailable,
        WriteFailed
    };

    ConversionError(Kind kind, const std::string &what)
        : std::runtime_error(what), m_kind(kind) {}

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

const char *error_kind_name(ConversionError::Kind kind);
