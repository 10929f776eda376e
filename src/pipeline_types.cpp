#include "pipeline_types.h"

const char *phase_name(ConversionPhase phase)
{
    switch (phase)
    {
    case ConversionPhase::Idle:
        return "idle";
    case ConversionPhase::Preparing:
        return "preparing";
    case ConversionPhase::Processing:
        return "processing";
    case ConversionPhase::Finishing:
        return "finishing";
    case ConversionPhase::Cancelled:
        return "cancelled";
    default:
        return "unknown";
    }
}

const char *error_kind_name(ConversionError::Kind kind)
{
    switch (kind)
    {
    case ConversionError::Kind::Busy:
        return "busy";
    case ConversionError::Kind::PermissionDenied:
        return "permission denied";
    case ConversionError::Kind::DestinationNotRemovable:
        return "destination not removable";
    case ConversionError::Kind::SourceOpenFailed:
        return "source open failed";
    case ConversionError::Kind::NoVideoTrack:
        return "no video track";
    case ConversionError::Kind::NoFormatDescription:
        return "no format description";
    case ConversionError::Kind::DestinationOpenFailed:
        return "destination open failed";
    case ConversionError::Kind::ProcessorUnavailable:
        return "processor unavailable";
    case ConversionError::Kind::WriteFailed:
        return "write failed";
    default:
        return "unknown";
    }
}
