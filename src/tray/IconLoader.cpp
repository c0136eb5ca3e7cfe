#include "IconLoader.h"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace fs = std::filesystem;

Image flatten_alpha(const uint8_t* rgba, uint32_t width, uint32_t height) {
    Image image;
    image.width = width;
    image.height = height;
    image.rgb.resize((size_t)width * height * 3);

    for (size_t i = 0; i < (size_t)width * height; i++) {
        float alpha = rgba[i * 4 + 3] / 255.0f;
        for (int c = 0; c < 3; c++) {
            float color = rgba[i * 4 + c] / 255.0f;
            color = color + (1.0f - color) * (1.0f - alpha);
            image.rgb[i * 3 + c] = (uint8_t)(color * 255.0f);
        }
    }
    return image;
}

Image resize_to_fit(const Image& image, uint32_t size) {
    if (image.width == 0 || image.height == 0 || size == 0) return Image();

    float scale = std::min((float)size / image.width, (float)size / image.height);
    Image out;
    out.width = std::max<uint32_t>(1, (uint32_t)(image.width * scale + 0.5f));
    out.height = std::max<uint32_t>(1, (uint32_t)(image.height * scale + 0.5f));
    out.rgb.resize((size_t)out.width * out.height * 3);

    for (uint32_t dy = 0; dy < out.height; dy++) {
        uint32_t sy0 = (uint64_t)dy * image.height / out.height;
        uint32_t sy1 = std::max(sy0 + 1, (uint32_t)((uint64_t)(dy + 1) * image.height / out.height));

        for (uint32_t dx = 0; dx < out.width; dx++) {
            uint32_t sx0 = (uint64_t)dx * image.width / out.width;
            uint32_t sx1 = std::max(sx0 + 1, (uint32_t)((uint64_t)(dx + 1) * image.width / out.width));

            uint32_t sum[3] = {0, 0, 0};
            for (uint32_t sy = sy0; sy < sy1; sy++) {
                for (uint32_t sx = sx0; sx < sx1; sx++) {
                    const uint8_t* p = &image.rgb[((size_t)sy * image.width + sx) * 3];
                    sum[0] += p[0];
                    sum[1] += p[1];
                    sum[2] += p[2];
                }
            }

            uint32_t count = (sy1 - sy0) * (sx1 - sx0);
            uint8_t* q = &out.rgb[((size_t)dy * out.width + dx) * 3];
            for (int c = 0; c < 3; c++) {
                q[c] = (uint8_t)(sum[c] / count);
            }
        }
    }
    return out;
}

IconLoader::IconLoader(const Config& config, uint32_t icon_size)
    : config(config), icon_size(icon_size) {}

std::optional<std::string> IconLoader::cache_path(const DraftProgram& draft) const {
    if (!draft.icon) return std::nullopt;
    return config.icon_cache_path(*draft.icon);
}

std::optional<Image> IconLoader::load_cached(const DraftProgram& draft) const {
    auto path = cache_path(draft);
    std::error_code ec;
    if (!path || !fs::exists(*path, ec)) return std::nullopt;

    int width, height, channels;
    std::unique_ptr<stbi_uc, void(*)(void*)> pixels(
        stbi_load(path->c_str(), &width, &height, &channels, 3), stbi_image_free);
    if (!pixels) {
        std::cerr << "⚠️  Unreadable cached icon " << *path << ": " << stbi_failure_reason() << std::endl;
        return std::nullopt;
    }

    std::cout << "Loading cached icon " << *path << std::endl;
    Image image;
    image.width = width;
    image.height = height;
    image.rgb.assign(pixels.get(), pixels.get() + (size_t)width * height * 3);
    return image;
}

std::optional<Image> IconLoader::load(const DraftProgram& draft) const {
    auto path = cache_path(draft);
    if (!path) return std::nullopt;

    std::error_code ec;
    if (fs::exists(*path, ec)) return std::nullopt;

    int width, height, channels;
    std::unique_ptr<stbi_uc, void(*)(void*)> pixels(
        stbi_load(draft.icon->c_str(), &width, &height, &channels, 4), stbi_image_free);
    if (!pixels) {
        std::cerr << "⚠️  Failed to decode icon " << *draft.icon << ": "
                  << stbi_failure_reason() << std::endl;
        return std::nullopt;
    }

    Image image = resize_to_fit(flatten_alpha(pixels.get(), width, height), icon_size);

    std::cout << "Saving icon to " << *path << std::endl;
    if (!stbi_write_png(path->c_str(), image.width, image.height, 3,
                        image.rgb.data(), image.width * 3)) {
        std::cerr << "⚠️  Failed to write icon cache " << *path << std::endl;
    }
    return image;
}
