#ifndef STREAM_CHANNEL_H
#define STREAM_CHANNEL_H

#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>

/**
 * Hand-off between a producer thread and the HTTP connection thread that
 * drains a streamed response.
 *
 * The producer calls write() per record and finish() when done. The
 * connection side calls read() and, once the client is gone or the response
 * is torn down, close(). After close() every write() returns false.
 */
class StreamChannel {
public:
    StreamChannel() = default;
    StreamChannel(const StreamChannel&) = delete;
    StreamChannel& operator=(const StreamChannel&) = delete;

    bool write(const std::string& data);
    void finish();

    // Blocks until data is available. Returns 0 at end of stream.
    size_t read(char* buffer, size_t max_size);
    void close();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> pending_;
    size_t front_offset_ = 0;
    bool finished_ = false;
    bool closed_ = false;
};

#endif // STREAM_CHANNEL_H
