#pragma once

#include "Draft.h"
#include "../core/Config.h"
#include "../core/Types.h"
#include <cstdint>
#include <optional>
#include <string>

// Composites RGBA8 pixels over white
Image flatten_alpha(const uint8_t* rgba, uint32_t width, uint32_t height);

// Box-filtered resize keeping the aspect ratio, longest side = size
Image resize_to_fit(const Image& image, uint32_t size);

// Decodes draft icons into flattened, resized images and keeps a png copy
// of each in the runtime icon cache
class IconLoader {
private:
    Config config;
    uint32_t icon_size;

public:
    IconLoader(const Config& config, uint32_t icon_size);

    std::optional<std::string> cache_path(const DraftProgram& draft) const;

    // Icon from the cache directory; nullopt if not cached yet
    std::optional<Image> load_cached(const DraftProgram& draft) const;

    // Decodes the source icon and writes the cache file. Returns nullopt
    // if the icon is already cached, absent or undecodable.
    std::optional<Image> load(const DraftProgram& draft) const;
};
