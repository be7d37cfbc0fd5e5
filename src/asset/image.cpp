/// @file image.cpp
/// @brief ImageLoader implementation

#include <arbor/asset/image.hpp>
#include <arbor/core/log.hpp>

namespace arbor_asset {

using arbor_core::Err;
using arbor_core::ImageLoadError;
using arbor_core::Ok;

ImageLoader::ImageLoader(std::shared_ptr<ImageDecoder> decoder, std::size_t num_threads)
    : m_decoder(std::move(decoder))
    , m_pool(num_threads)
{
}

ImageHandle ImageLoader::request(const std::string& src) {
    std::uint64_t id = m_next_id.fetch_add(1);
    auto cancelled = std::make_shared<std::atomic<bool>>(false);

    ++m_in_flight;
    m_pool.submit([this, id, src, cancelled] {
        run(id, src, cancelled);
    });

    arbor_core::asset_logger()->debug("Image request {} for '{}'", id, src);
    return ImageHandle(id, std::move(cancelled));
}

void ImageLoader::run(std::uint64_t id, const std::string& src, const std::shared_ptr<std::atomic<bool>>& cancelled) {
    using ImagePtr = std::shared_ptr<const DecodedImage>;

    arbor_core::Result<ImagePtr> result = Err<ImagePtr>(ImageLoadError::decode_failed(src, "cancelled"));
    if (!cancelled->load()) {
        try {
            auto decoded = m_decoder->decode(src);
            if (decoded) {
                result = Ok<ImagePtr>(std::make_shared<DecodedImage>(std::move(*decoded)));
            } else {
                result = Err<ImagePtr>(decoded.error());
            }
        } catch (const std::exception& e) {
            result = Err<ImagePtr>(ImageLoadError::decode_failed(src, e.what()));
        }
    }

    std::lock_guard lock(m_mutex);
    m_finished.push_back(Finished{ImageCompletion{id, src, std::move(result)}, cancelled});
}

std::vector<ImageCompletion> ImageLoader::drain() {
    std::vector<Finished> finished;
    {
        std::lock_guard lock(m_mutex);
        finished.swap(m_finished);
    }

    std::vector<ImageCompletion> completions;
    completions.reserve(finished.size());
    for (auto& entry : finished) {
        --m_in_flight;
        if (entry.cancelled->load()) {
            arbor_core::asset_logger()->trace("Discarded cancelled image request {}", entry.completion.request);
            continue;
        }
        completions.push_back(std::move(entry.completion));
    }
    return completions;
}

void ImageLoader::wait_idle() {
    m_pool.wait_all();
}

std::size_t ImageLoader::in_flight() const {
    return m_in_flight.load();
}

} // namespace arbor_asset
