#include "async_demuxer.h"
#include "ffmpeg_utils.h"
#include "logger.h"

AsyncDemuxer::AsyncDemuxer(AVFormatContext* fmt_ctx, int stream_index, const Config& config)
    : fmt_ctx_(fmt_ctx), stream_index_(stream_index), config_(config) {}

AsyncDemuxer::~AsyncDemuxer() {
    stop();
}

bool AsyncDemuxer::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Idle) {
            LOG_WARN("AsyncDemuxer[%d] cannot start twice", stream_index_);
            return false;
        }
        state_ = State::Reading;
    }
    reader_ = std::thread(&AsyncDemuxer::readLoop, this);
    LOG_DEBUG("AsyncDemuxer[%d] reading (queue limit %zu)", stream_index_, config_.max_queue_size);
    return true;
}

void AsyncDemuxer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Stopped)
            return;
        state_ = State::Stopped;
    }
    packet_ready_.notify_all();
    space_ready_.notify_all();

    if (reader_.joinable())
        reader_.join();

    Stats final_stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        final_stats = stats_;
    }
    LOG_DEBUG("AsyncDemuxer[%d] stopped: read=%zu dropped=%zu stalls=%zu peak=%zu",
              stream_index_, final_stats.packets_read, final_stats.packets_dropped,
              final_stats.producer_stalls, final_stats.peak_depth);
}

PacketPtr AsyncDemuxer::getPacket() {
    std::unique_lock<std::mutex> lock(mutex_);
    packet_ready_.wait(lock, [this]() {
        return !queue_.empty() || state_ != State::Reading;
    });
    if (state_ == State::Stopped || queue_.empty())
        return make_packet_ptr();

    PacketPtr pkt = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    space_ready_.notify_one();
    return pkt;
}

AsyncDemuxer::State AsyncDemuxer::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

AsyncDemuxer::Stats AsyncDemuxer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void AsyncDemuxer::finishReading(State final_state, int error_code) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_code_ = error_code;
        if (state_ == State::Reading)
            state_ = final_state;
    }
    packet_ready_.notify_all();
}

void AsyncDemuxer::readLoop() {
    for (;;) {
        PacketPtr pkt = make_packet_ptr(av_packet_alloc());
        if (!pkt) {
            LOG_ERROR("AsyncDemuxer[%d] out of memory", stream_index_);
            finishReading(State::Failed, AVERROR(ENOMEM));
            return;
        }

        const int ret = av_read_frame(fmt_ctx_, pkt.get());
        if (ret == AVERROR_EOF) {
            LOG_DEBUG("AsyncDemuxer[%d] end of file", stream_index_);
            finishReading(State::Drained, 0);
            return;
        }
        if (ret < 0) {
            LOG_ERROR("AsyncDemuxer[%d] read failed: %s", stream_index_, ff_err_string(ret).c_str());
            finishReading(State::Failed, ret);
            return;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ != State::Reading)
            return;
        if (pkt->stream_index != stream_index_) {
            ++stats_.packets_dropped;
            continue;
        }

        ++stats_.packets_read;
        if (queue_.size() >= config_.max_queue_size)
            ++stats_.producer_stalls;
        space_ready_.wait(lock, [this]() {
            return queue_.size() < config_.max_queue_size || state_ != State::Reading;
        });
        if (state_ != State::Reading)
            return;

        queue_.push_back(std::move(pkt));
        if (queue_.size() > stats_.peak_depth)
            stats_.peak_depth = queue_.size();
        lock.unlock();
        packet_ready_.notify_one();
    }
}
