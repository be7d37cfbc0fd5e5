#pragma once

/// @file image.hpp
/// @brief Asynchronous image requests with a pluggable decoder

#include "fwd.hpp"
#include "task_pool.hpp"

#include <arbor/core/error.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace arbor_asset {

// =============================================================================
// Decoded Image
// =============================================================================

/// RGBA8 pixels
struct DecodedImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] std::size_t byte_size() const { return pixels.size(); }
};

/// Turns a source string into pixels. Called from worker threads.
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;

    [[nodiscard]] virtual arbor_core::Result<DecodedImage> decode(const std::string& src) = 0;
};

// =============================================================================
// ImageHandle
// =============================================================================

/// Outstanding image request. Dropping the handle cancels the request.
class ImageHandle {
public:
    ImageHandle() = default;
    ~ImageHandle() { cancel(); }

    ImageHandle(ImageHandle&& other) noexcept = default;
    ImageHandle& operator=(ImageHandle&& other) noexcept {
        if (this != &other) {
            cancel();
            m_id = other.m_id;
            m_cancelled = std::move(other.m_cancelled);
            other.m_id = 0;
        }
        return *this;
    }

    // Non-copyable
    ImageHandle(const ImageHandle&) = delete;
    ImageHandle& operator=(const ImageHandle&) = delete;

    [[nodiscard]] std::uint64_t id() const { return m_id; }
    [[nodiscard]] bool is_valid() const { return m_cancelled != nullptr; }

    /// Best effort: skips a decode that has not started, discards a finished one
    void cancel() {
        if (m_cancelled) {
            m_cancelled->store(true);
            m_cancelled.reset();
        }
    }

private:
    friend class ImageLoader;

    ImageHandle(std::uint64_t id, std::shared_ptr<std::atomic<bool>> cancelled)
        : m_id(id), m_cancelled(std::move(cancelled)) {}

    std::uint64_t m_id = 0;
    std::shared_ptr<std::atomic<bool>> m_cancelled;
};

/// Finished request delivered on the UI thread
struct ImageCompletion {
    std::uint64_t request = 0;
    std::string src;
    arbor_core::Result<std::shared_ptr<const DecodedImage>> result;
};

// =============================================================================
// ImageLoader
// =============================================================================

/// Issues decodes on a worker pool and queues their results until drained
class ImageLoader {
public:
    explicit ImageLoader(std::shared_ptr<ImageDecoder> decoder, std::size_t num_threads = 2);

    // Non-copyable
    ImageLoader(const ImageLoader&) = delete;
    ImageLoader& operator=(const ImageLoader&) = delete;

    /// Start decoding a source. Returns immediately.
    [[nodiscard]] ImageHandle request(const std::string& src);

    /// Take every completion whose handle is still alive
    [[nodiscard]] std::vector<ImageCompletion> drain();

    /// Block until no decode is queued or running
    void wait_idle();

    /// Requests not yet drained
    [[nodiscard]] std::size_t in_flight() const;

private:
    struct Finished {
        ImageCompletion completion;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    void run(std::uint64_t id, const std::string& src, const std::shared_ptr<std::atomic<bool>>& cancelled);

    std::shared_ptr<ImageDecoder> m_decoder;
    mutable std::mutex m_mutex;
    std::vector<Finished> m_finished;
    std::atomic<std::uint64_t> m_next_id{1};
    std::atomic<std::size_t> m_in_flight{0};
    AsyncTaskPool m_pool;  // Destroyed first: workers never outlive the queue
};

} // namespace arbor_asset
