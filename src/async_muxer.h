#pragma once

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/packet.h>
}

#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>
#include "logger.h"
#include "pipeline_types.h"

/**
 * Background packet writer for an output container
 *
 * - av_interleaved_write_frame runs on its own thread
 * - producers wait in waitForRoom() while the queue is at its soft limit;
 *   push() itself never blocks so an encoder burst is always accepted
 * - finish() drains the queue, abort() drops it
 *
 * The header must be written before start() and the trailer after finish().
 */
class AsyncMuxer {
public:
    struct Config {
        size_t max_queue_size = 32;
        bool enable_stats = true;
    };

    explicit AsyncMuxer(AVFormatContext* fmt_ctx, const Config& config = Config())
        : fmt_ctx_(fmt_ctx)
        , config_(config)
        , running_(false)
        , closing_(false)
        , aborted_(false)
        , error_code_(0)
    {}

    ~AsyncMuxer() {
        abort();
    }

    AsyncMuxer(const AsyncMuxer&) = delete;
    AsyncMuxer& operator=(const AsyncMuxer&) = delete;

    bool start() {
        if (running_.exchange(true)) {
            LOG_WARN("AsyncMuxer already running");
            return false;
        }
        closing_ = false;
        aborted_ = false;
        error_code_ = 0;

        mux_thread_ = std::thread([this]() {
            this->muxLoop();
        });
        LOG_DEBUG("AsyncMuxer started (queue_size=%zu)", config_.max_queue_size);
        return true;
    }

    // Queues a packet whose stream_index and timestamps are already in output terms
    bool push(PacketPtr pkt) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (aborted_ || closing_ || error_code_ != 0) {
            return false;
        }
        packet_queue_.push(pkt.release());
        if (packet_queue_.size() > stats_.max_queue_depth) {
            stats_.max_queue_depth = packet_queue_.size();
        }
        cv_not_empty_.notify_one();
        return true;
    }

    bool hasRoom() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return packet_queue_.size() < config_.max_queue_size && !aborted_ && error_code_ == 0;
    }

    /**
     * Blocks until the queue is below its limit. Returns false when the
     * muxer is shutting down or `finished` becomes true; wakeAll() forces
     * waiters to re-check `finished`.
     */
    bool waitForRoom(const std::atomic<bool>& finished) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_not_full_.wait(lock, [&]() {
            return packet_queue_.size() < config_.max_queue_size || finished || aborted_ ||
                   closing_ || error_code_ != 0;
        });
        return !finished && !aborted_ && !closing_ && error_code_ == 0;
    }

    void wakeAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_not_full_.notify_all();
    }

    // Writes everything still queued and joins the thread. Returns the first write error.
    int finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closing_ = true;
            cv_not_empty_.notify_all();
            cv_not_full_.notify_all();
        }
        join();
        return error_code_;
    }

    // Stops immediately and frees queued packets. Safe to call more than once.
    void abort() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            aborted_ = true;
            cv_not_empty_.notify_all();
            cv_not_full_.notify_all();
        }
        join();

        std::lock_guard<std::mutex> lock(mutex_);
        while (!packet_queue_.empty()) {
            AVPacket* pkt = packet_queue_.front();
            packet_queue_.pop();
            av_packet_free(&pkt);
        }
    }

    int getError() const { return error_code_; }

    struct Stats {
        size_t total_writes = 0;
        size_t max_queue_depth = 0;
    };

    Stats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    void join() {
        if (!running_.exchange(false)) {
            return;
        }
        if (mux_thread_.joinable()) {
            mux_thread_.join();
        }
        if (config_.enable_stats) {
            LOG_DEBUG("AsyncMuxer stopped - Stats: writes=%zu, max_queue=%zu",
                      stats_.total_writes, stats_.max_queue_depth);
        }
    }

    void muxLoop() {
        LOG_DEBUG("AsyncMuxer thread started");

        for (;;) {
            AVPacket* pkt = nullptr;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_not_empty_.wait(lock, [this]() {
                    return !packet_queue_.empty() || closing_ || aborted_;
                });
                if (aborted_) {
                    break;
                }
                if (packet_queue_.empty()) {
                    break; // closing and drained
                }
                pkt = packet_queue_.front();
                packet_queue_.pop();
                cv_not_full_.notify_all();
            }

            int ret = av_interleaved_write_frame(fmt_ctx_, pkt);
            av_packet_free(&pkt);

            std::lock_guard<std::mutex> lock(mutex_);
            if (ret < 0) {
                char errbuf[AV_ERROR_MAX_STRING_SIZE];
                av_make_error_string(errbuf, sizeof(errbuf), ret);
                LOG_ERROR("AsyncMuxer write error: %s", errbuf);
                error_code_ = ret;
                cv_not_full_.notify_all();
                break;
            }
            stats_.total_writes++;
        }

        LOG_DEBUG("AsyncMuxer thread exiting");
    }

    AVFormatContext* fmt_ctx_;
    Config config_;

    std::thread mux_thread_;
    std::atomic<bool> running_;
    bool closing_;
    bool aborted_;
    std::atomic<int> error_code_;

    mutable std::mutex mutex_;
    std::condition_variable cv_not_empty_;
    std::condition_variable cv_not_full_;

    std::queue<AVPacket*> packet_queue_;
    Stats stats_;
};
