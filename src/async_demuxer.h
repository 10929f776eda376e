#pragma once

extern "C" {
#include <libavformat/avformat.h>
}

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>

#include "pipeline_types.h"

/**
 * Reads one track of a container on a background thread.
 *
 * Packets of other streams are dropped, the rest wait in a bounded queue
 * until getPacket() takes them. Each track owns its AVFormatContext so video
 * and audio can be consumed at unrelated rates.
 */
class AsyncDemuxer {
public:
    enum class State {
        Idle,     // start() not called yet
        Reading,
        Drained,  // end of file seen; queued packets may remain
        Failed,   // av_read_frame error; queued packets may remain
        Stopped
    };

    struct Config {
        size_t max_queue_size = 60;
    };

    AsyncDemuxer(AVFormatContext* fmt_ctx, int stream_index, const Config& config = Config());
    ~AsyncDemuxer();

    AsyncDemuxer(const AsyncDemuxer&) = delete;
    AsyncDemuxer& operator=(const AsyncDemuxer&) = delete;

    bool start();

    // Joins the reader and drops whatever is queued. Idempotent.
    void stop();

    // Blocks for the next packet of the track. Empty once the track is
    // drained, failed or stopped.
    PacketPtr getPacket();

    State state() const;
    int error() const { return error_code_; }
    int streamIndex() const { return stream_index_; }

    struct Stats {
        size_t packets_read = 0;
        size_t packets_dropped = 0; // belonged to other streams
        size_t producer_stalls = 0;
        size_t peak_depth = 0;
    };
    Stats stats() const;

private:
    void readLoop();
    void finishReading(State final_state, int error_code);

    AVFormatContext* fmt_ctx_;
    const int stream_index_;
    const Config config_;

    std::thread reader_;
    std::atomic<int> error_code_{0};

    mutable std::mutex mutex_;
    std::condition_variable packet_ready_;
    std::condition_variable space_ready_;
    State state_ = State::Idle;
    std::deque<PacketPtr> queue_;
    Stats stats_;
};
