#pragma once

#include <string>
#include <map>
#include <vector>
#include <cstdint>

#include <xf86drm.h>
#include <xf86drmMode.h>
#include <EGL/egl.h>
#include <GLES2/gl2.h>
#include <gbm.h>
#include <ft2build.h>
#include FT_FREETYPE_H

#include "Surface.h"
#include "Types.h"

// Display surface on DRM/KMS. Drawing happens in a CPU-side RGBA back
// buffer; refreshes upload the dirty rows to a texture, draw it fullscreen
// and present through GBM/EGL with a page flip.
class DrmSurface : public Surface {
private:
    // DRM/GBM/EGL
    int drm_fd;
    drmModeConnector* connector;
    drmModeCrtc* crtc;
    drmModeModeInfo mode;
    uint32_t connector_id;
    struct gbm_device* gbm_dev;
    struct gbm_surface* gbm_surf;
    struct gbm_bo* previous_bo;
    uint32_t previous_fb;
    EGLDisplay egl_display;
    EGLSurface egl_surface;
    EGLContext egl_context;
    bool waiting_for_flip;

    // Display
    uint32_t width, height;

    // Back buffer, 4 bytes per pixel
    std::vector<uint8_t> pixels;

    // OpenGL
    GLuint shader_program_blit;
    GLuint frame_texture;
    GLuint vbo;

    // Font
    std::string font_path;
    FT_Library ft_library;
    std::map<FontCacheKey, FT_Face> font_faces;
    std::map<FontCacheKey, std::map<uint32_t, Glyph>> font_cache;
    std::map<FontCacheKey, FontMetrics> font_metrics;
    bool ft_initialized;

    const char* vertex_shader;
    const char* fragment_shader_blit;

    static void page_flip_handler(int fd, unsigned int frame, unsigned int sec,
                                  unsigned int usec, void* data);
    GLuint compile_shader(GLenum type, const char* source);
    GLuint create_program(const char* vs, const char* fs);
    bool open_device();
    bool load_font(int size);
    const Glyph* get_glyph(int size, uint32_t codepoint);
    const FontMetrics* get_font_metrics(int size);
    void wait_for_flip(int max_polls);
    void present(const DrawRect& dirty, bool wait);

    DrawRect clip(const DrawRect& rect) const;
    void blend_pixel(int32_t x, int32_t y, const Color& color, float coverage);
    void put_pixel(int32_t x, int32_t y, const Color& color);

public:
    explicit DrmSurface(const std::string& font_path);
    ~DrmSurface() override;

    DrmSurface(const DrmSurface&) = delete;
    DrmSurface& operator=(const DrmSurface&) = delete;

    bool initialize();
    void cleanup();

    uint32_t get_width() const override { return width; }
    uint32_t get_height() const override { return height; }

    void clear() override;
    void fill_rect(const DrawRect& rect, const Color& color) override;
    void stroke_rect(const DrawRect& rect, uint32_t border_px, const Color& color) override;
    void fill_circle(const Point& center, uint32_t radius, const Color& color) override;
    void stroke_circle(const Point& center, uint32_t radius, const Color& color) override;
    DrawRect draw_line(const Point& start, const Point& end,
                       uint32_t line_width, const Color& color) override;
    DrawRect draw_text(const Point& position, const std::string& text,
                       float size, const Color& color, bool dry_run) override;
    DrawRect draw_image(const Image& image, const Point& position) override;

    std::vector<uint8_t> dump_region(const DrawRect& rect) override;
    bool restore_region(const DrawRect& rect, const std::vector<uint8_t>& data) override;

    void partial_refresh(const DrawRect& rect, const RefreshProfile& profile) override;
    void full_refresh(const RefreshProfile& profile) override;
};
