#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arbor_asset

#include <cstdint>

namespace arbor_asset {

class AsyncTaskPool;
struct DecodedImage;
class ImageDecoder;
class ImageHandle;
struct ImageCompletion;
class ImageLoader;

} // namespace arbor_asset
