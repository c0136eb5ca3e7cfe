#include "DrmSurface.h"
#include <iostream>
#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <cmath>
#include <poll.h>
#include <algorithm>

namespace {

uint32_t next_codepoint(const std::string& text, size_t& i) {
    unsigned char c = (unsigned char)text[i];
    int extra = 0;
    uint32_t codepoint = c;

    if (c >= 0xF0) { codepoint = c & 0x07; extra = 3; }
    else if (c >= 0xE0) { codepoint = c & 0x0F; extra = 2; }
    else if (c >= 0xC0) { codepoint = c & 0x1F; extra = 1; }

    i++;
    for (int k = 0; k < extra && i < text.length(); k++, i++) {
        codepoint = (codepoint << 6) | ((unsigned char)text[i] & 0x3F);
    }
    return codepoint;
}

uint8_t to_byte(float channel) {
    return (uint8_t)std::clamp(channel * 255.0f + 0.5f, 0.0f, 255.0f);
}

}

DrmSurface::DrmSurface(const std::string& font_path)
    : drm_fd(-1), connector(nullptr), crtc(nullptr), connector_id(0), gbm_dev(nullptr),
      gbm_surf(nullptr), previous_bo(nullptr), previous_fb(0),
      egl_display(EGL_NO_DISPLAY), egl_surface(EGL_NO_SURFACE),
      egl_context(EGL_NO_CONTEXT), waiting_for_flip(false),
      width(0), height(0), shader_program_blit(0), frame_texture(0), vbo(0),
      font_path(font_path), ft_library(nullptr), ft_initialized(false)
{
    std::memset(&mode, 0, sizeof(mode));

    vertex_shader = R"(
        attribute vec2 position;
        varying vec2 v_texcoord;
        void main() {
            v_texcoord = position;
            vec2 ndc = position * 2.0 - 1.0;
            ndc.y = -ndc.y;
            gl_Position = vec4(ndc, 0.0, 1.0);
        }
    )";

    fragment_shader_blit = R"(
        precision mediump float;
        uniform sampler2D tex;
        varying vec2 v_texcoord;
        void main() {
            gl_FragColor = vec4(texture2D(tex, v_texcoord).rgb, 1.0);
        }
    )";
}

DrmSurface::~DrmSurface() {
    cleanup();
}

void DrmSurface::page_flip_handler(int fd, unsigned int frame, unsigned int sec,
                                   unsigned int usec, void* data) {
    (void)fd; (void)frame; (void)sec; (void)usec;
    bool* waiting = (bool*)data;
    *waiting = false;
}

GLuint DrmSurface::compile_shader(GLenum type, const char* source) {
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    GLint success;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        char log[512];
        glGetShaderInfoLog(shader, 512, nullptr, log);
        std::cerr << "❌ Shader error: " << log << std::endl;
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

GLuint DrmSurface::create_program(const char* vs, const char* fs) {
    GLuint vertex = compile_shader(GL_VERTEX_SHADER, vs);
    GLuint fragment = compile_shader(GL_FRAGMENT_SHADER, fs);

    if (!vertex || !fragment) return 0;

    GLuint program = glCreateProgram();
    glAttachShader(program, vertex);
    glAttachShader(program, fragment);
    glLinkProgram(program);

    GLint success;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success) {
        char log[512];
        glGetProgramInfoLog(program, 512, nullptr, log);
        std::cerr << "❌ Link error: " << log << std::endl;
        return 0;
    }

    glDeleteShader(vertex);
    glDeleteShader(fragment);

    return program;
}

bool DrmSurface::load_font(int size) {
    if (!ft_initialized) {
        if (FT_Init_FreeType(&ft_library)) {
            std::cerr << "❌ FreeType init failed" << std::endl;
            return false;
        }
        ft_initialized = true;
    }

    FontCacheKey key = {size};
    if (font_faces.find(key) != font_faces.end()) {
        return true;
    }

    FT_Face face;
    if (FT_New_Face(ft_library, font_path.c_str(), 0, &face)) {
        std::cerr << "❌ Failed to load font: " << font_path << std::endl;
        return false;
    }

    FT_Set_Pixel_Sizes(face, 0, size);

    FontMetrics metrics;
    metrics.ascender = face->size->metrics.ascender >> 6;
    metrics.descender = face->size->metrics.descender >> 6;
    metrics.line_height = face->size->metrics.height >> 6;
    font_metrics[key] = metrics;
    font_faces[key] = face;

    std::cout << "✅ Font loaded: " << font_path << " (" << size << "px)" << std::endl;
    return true;
}

const Glyph* DrmSurface::get_glyph(int size, uint32_t codepoint) {
    if (!load_font(size)) return nullptr;

    FontCacheKey key = {size};
    auto& glyphs = font_cache[key];
    auto it = glyphs.find(codepoint);
    if (it != glyphs.end()) {
        return &it->second;
    }

    FT_Face face = font_faces[key];
    if (FT_Load_Char(face, codepoint, FT_LOAD_RENDER)) {
        return nullptr;
    }

    const FT_Bitmap& bitmap = face->glyph->bitmap;
    Glyph glyph;
    glyph.width = (int)bitmap.width;
    glyph.height = (int)bitmap.rows;
    glyph.bearing_x = face->glyph->bitmap_left;
    glyph.bearing_y = face->glyph->bitmap_top;
    glyph.advance = (int)(face->glyph->advance.x >> 6);
    glyph.bitmap.resize((size_t)glyph.width * glyph.height);
    for (int row = 0; row < glyph.height; row++) {
        std::memcpy(glyph.bitmap.data() + (size_t)row * glyph.width,
                    bitmap.buffer + row * bitmap.pitch, glyph.width);
    }

    return &(glyphs[codepoint] = std::move(glyph));
}

const FontMetrics* DrmSurface::get_font_metrics(int size) {
    if (!load_font(size)) return nullptr;
    return &font_metrics[FontCacheKey{size}];
}

bool DrmSurface::open_device() {
    const char* drm_devices[] = {"/dev/dri/card0", "/dev/dri/card1", "/dev/dri/card2"};
    for (const char* device : drm_devices) {
        drm_fd = open(device, O_RDWR | O_CLOEXEC);
        if (drm_fd < 0) continue;

        drmModeRes* res = drmModeGetResources(drm_fd);
        if (res) {
            for (int i = 0; i < res->count_connectors && !connector; i++) {
                drmModeConnector* candidate = drmModeGetConnector(drm_fd, res->connectors[i]);
                if (candidate && candidate->connection == DRM_MODE_CONNECTED &&
                    candidate->count_modes > 0) {
                    connector = candidate;
                    connector_id = candidate->connector_id;
                    mode = candidate->modes[0];
                } else if (candidate) {
                    drmModeFreeConnector(candidate);
                }
            }
            drmModeFreeResources(res);
        }

        if (connector) {
            std::cout << "📺 DRM device: " << device << std::endl;
            return true;
        }
        close(drm_fd);
        drm_fd = -1;
    }
    return false;
}

bool DrmSurface::initialize() {
    if (!open_device()) {
        std::cerr << "❌ No connected DRM display" << std::endl;
        return false;
    }

    width = mode.hdisplay;
    height = mode.vdisplay;
    pixels.assign((size_t)width * height * 4, 255);

    std::cout << "📺 Display: " << width << "x" << height << std::endl;

    // CRTC Setup
    uint32_t crtc_id = 0;
    if (connector->encoder_id) {
        drmModeEncoder* encoder = drmModeGetEncoder(drm_fd, connector->encoder_id);
        if (encoder) {
            crtc_id = encoder->crtc_id;
            drmModeFreeEncoder(encoder);
        }
    }

    if (crtc_id == 0) {
        drmModeRes* res = drmModeGetResources(drm_fd);
        if (res) {
            for (int i = 0; i < connector->count_encoders && crtc_id == 0; i++) {
                drmModeEncoder* encoder = drmModeGetEncoder(drm_fd, connector->encoders[i]);
                if (!encoder) continue;
                for (int j = 0; j < res->count_crtcs; j++) {
                    if (encoder->possible_crtcs & (1 << j)) {
                        crtc_id = res->crtcs[j];
                        break;
                    }
                }
                drmModeFreeEncoder(encoder);
            }
            drmModeFreeResources(res);
        }
    }

    if (crtc_id == 0) return false;
    crtc = drmModeGetCrtc(drm_fd, crtc_id);
    if (!crtc) return false;

    // GBM Setup
    gbm_dev = gbm_create_device(drm_fd);
    if (!gbm_dev) return false;

    gbm_surf = gbm_surface_create(gbm_dev, width, height,
                                  GBM_FORMAT_XRGB8888,
                                  GBM_BO_USE_SCANOUT | GBM_BO_USE_RENDERING);
    if (!gbm_surf) return false;

    // EGL Setup
    egl_display = eglGetDisplay((EGLNativeDisplayType)gbm_dev);
    if (egl_display == EGL_NO_DISPLAY) return false;

    if (!eglInitialize(egl_display, nullptr, nullptr)) return false;
    if (!eglBindAPI(EGL_OPENGL_ES_API)) return false;

    EGLConfig configs[64];
    EGLint num_configs = 0;
    if (!eglGetConfigs(egl_display, configs, 64, &num_configs)) return false;

    for (int i = 0; i < num_configs; i++) {
        EGLint r, g, b, a, surface_type, renderable;
        eglGetConfigAttrib(egl_display, configs[i], EGL_RED_SIZE, &r);
        eglGetConfigAttrib(egl_display, configs[i], EGL_GREEN_SIZE, &g);
        eglGetConfigAttrib(egl_display, configs[i], EGL_BLUE_SIZE, &b);
        eglGetConfigAttrib(egl_display, configs[i], EGL_ALPHA_SIZE, &a);
        eglGetConfigAttrib(egl_display, configs[i], EGL_SURFACE_TYPE, &surface_type);
        eglGetConfigAttrib(egl_display, configs[i], EGL_RENDERABLE_TYPE, &renderable);

        if (!(surface_type & EGL_WINDOW_BIT)) continue;
        if (!(renderable & EGL_OPENGL_ES2_BIT)) continue;
        if (r != 8 || g != 8 || b != 8 || a != 0) continue;

        EGLint ctx_attrs[] = { EGL_CONTEXT_CLIENT_VERSION, 2, EGL_NONE };
        egl_context = eglCreateContext(egl_display, configs[i], EGL_NO_CONTEXT, ctx_attrs);
        if (egl_context == EGL_NO_CONTEXT) continue;

        egl_surface = eglCreateWindowSurface(egl_display, configs[i],
                                             (EGLNativeWindowType)gbm_surf, nullptr);
        if (egl_surface != EGL_NO_SURFACE) break;

        eglDestroyContext(egl_display, egl_context);
        egl_context = EGL_NO_CONTEXT;
    }

    if (egl_surface == EGL_NO_SURFACE) return false;
    if (!eglMakeCurrent(egl_display, egl_surface, egl_surface, egl_context)) return false;

    // OpenGL Setup
    shader_program_blit = create_program(vertex_shader, fragment_shader_blit);
    if (!shader_program_blit) return false;

    float vertices[] = { 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 1.0f, 1.0f, 1.0f };

    glGenBuffers(1, &vbo);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(vertices), vertices, GL_STATIC_DRAW);

    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glGenTextures(1, &frame_texture);
    glBindTexture(GL_TEXTURE_2D, frame_texture);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, width, height, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);

    glViewport(0, 0, width, height);
    glDisable(GL_BLEND);
    glDisable(GL_DEPTH_TEST);

    eglSwapInterval(egl_display, 1);
    return true;
}

void DrmSurface::wait_for_flip(int max_polls) {
    if (!waiting_for_flip) return;

    drmEventContext ev_ctx;
    std::memset(&ev_ctx, 0, sizeof(ev_ctx));
    ev_ctx.version = 2;
    ev_ctx.page_flip_handler = page_flip_handler;

    struct pollfd pfd;
    pfd.fd = drm_fd;
    pfd.events = POLLIN;

    for (int polls = 0; waiting_for_flip && polls < max_polls; polls++) {
        if (poll(&pfd, 1, 100) > 0) {
            drmHandleEvent(drm_fd, &ev_ctx);
        }
    }
}

void DrmSurface::present(const DrawRect& dirty, bool wait) {
    DrawRect region = clip(dirty);
    if (region.empty()) return;

    // GLES2 has no unpack row length, so whole rows are uploaded
    glBindTexture(GL_TEXTURE_2D, frame_texture);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, region.top, width, region.height,
                    GL_RGBA, GL_UNSIGNED_BYTE,
                    pixels.data() + (size_t)region.top * width * 4);

    glUseProgram(shader_program_blit);
    glActiveTexture(GL_TEXTURE0);
    glUniform1i(glGetUniformLocation(shader_program_blit, "tex"), 0);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    GLint pos_loc = glGetAttribLocation(shader_program_blit, "position");
    glEnableVertexAttribArray(pos_loc);
    glVertexAttribPointer(pos_loc, 2, GL_FLOAT, GL_FALSE, 0, 0);
    glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);

    glFinish();
    eglSwapBuffers(egl_display, egl_surface);

    struct gbm_bo* next_bo = gbm_surface_lock_front_buffer(gbm_surf);
    if (!next_bo) {
        std::cerr << "⚠️  No front buffer to present" << std::endl;
        return;
    }

    uint32_t fb_id = 0;
    uint32_t handle = gbm_bo_get_handle(next_bo).u32;
    uint32_t pitch = gbm_bo_get_stride(next_bo);

    int ret = drmModeAddFB(drm_fd, width, height, 24, 32, pitch, handle, &fb_id);
    if (ret) {
        std::cerr << "⚠️  drmModeAddFB failed: " << ret << std::endl;
        gbm_surface_release_buffer(gbm_surf, next_bo);
        return;
    }

    wait_for_flip(50);

    waiting_for_flip = true;
    ret = drmModePageFlip(drm_fd, crtc->crtc_id, fb_id,
                          DRM_MODE_PAGE_FLIP_EVENT, &waiting_for_flip);
    if (ret) {
        waiting_for_flip = false;
        drmModeSetCrtc(drm_fd, crtc->crtc_id, fb_id, 0, 0,
                       &connector_id, 1, &mode);
    }

    // Panels that refresh on demand only update the reported region
    drmModeClip damage;
    damage.x1 = (unsigned short)region.left;
    damage.y1 = (unsigned short)region.top;
    damage.x2 = (unsigned short)(region.left + region.width);
    damage.y2 = (unsigned short)(region.top + region.height);
    drmModeDirtyFB(drm_fd, fb_id, &damage, 1);

    if (previous_bo) {
        drmModeRmFB(drm_fd, previous_fb);
        gbm_surface_release_buffer(gbm_surf, previous_bo);
    }

    previous_bo = next_bo;
    previous_fb = fb_id;

    if (wait) {
        wait_for_flip(10);
    }
}

DrawRect DrmSurface::clip(const DrawRect& rect) const {
    int64_t left = std::max<int64_t>(rect.left, 0);
    int64_t top = std::max<int64_t>(rect.top, 0);
    int64_t right = std::min<int64_t>((int64_t)rect.left + rect.width, width);
    int64_t bottom = std::min<int64_t>((int64_t)rect.top + rect.height, height);
    if (right <= left || bottom <= top) return DrawRect();
    return DrawRect((int32_t)left, (int32_t)top, (uint32_t)(right - left), (uint32_t)(bottom - top));
}

void DrmSurface::put_pixel(int32_t x, int32_t y, const Color& color) {
    blend_pixel(x, y, color, 1.0f);
}

void DrmSurface::blend_pixel(int32_t x, int32_t y, const Color& color, float coverage) {
    if (x < 0 || y < 0 || (uint32_t)x >= width || (uint32_t)y >= height) return;

    uint8_t* px = pixels.data() + ((size_t)y * width + x) * 4;
    float alpha = std::clamp(color.a * coverage, 0.0f, 1.0f);
    px[0] = to_byte(color.r * alpha + (px[0] / 255.0f) * (1.0f - alpha));
    px[1] = to_byte(color.g * alpha + (px[1] / 255.0f) * (1.0f - alpha));
    px[2] = to_byte(color.b * alpha + (px[2] / 255.0f) * (1.0f - alpha));
    px[3] = 255;
}

void DrmSurface::clear() {
    std::fill(pixels.begin(), pixels.end(), 255);
}

void DrmSurface::fill_rect(const DrawRect& rect, const Color& color) {
    DrawRect region = clip(rect);
    if (region.empty()) return;

    uint8_t r = to_byte(color.r), g = to_byte(color.g), b = to_byte(color.b);
    for (uint32_t row = 0; row < region.height; row++) {
        uint8_t* px = pixels.data() + ((size_t)(region.top + row) * width + region.left) * 4;
        for (uint32_t col = 0; col < region.width; col++, px += 4) {
            px[0] = r; px[1] = g; px[2] = b; px[3] = 255;
        }
    }
}

void DrmSurface::stroke_rect(const DrawRect& rect, uint32_t border_px, const Color& color) {
    if (rect.empty() || border_px == 0) return;

    uint32_t bw = std::min(border_px, rect.width);
    uint32_t bh = std::min(border_px, rect.height);
    fill_rect(DrawRect(rect.left, rect.top, rect.width, bh), color);
    fill_rect(DrawRect(rect.left, rect.top + (int32_t)(rect.height - bh), rect.width, bh), color);
    fill_rect(DrawRect(rect.left, rect.top, bw, rect.height), color);
    fill_rect(DrawRect(rect.left + (int32_t)(rect.width - bw), rect.top, bw, rect.height), color);
}

void DrmSurface::fill_circle(const Point& center, uint32_t radius, const Color& color) {
    int32_t r = (int32_t)radius;
    int64_t r2 = (int64_t)r * r;
    for (int32_t dy = -r; dy <= r; dy++) {
        int32_t span = (int32_t)std::sqrt((double)(r2 - (int64_t)dy * dy));
        fill_rect(DrawRect(center.x - span, center.y + dy, (uint32_t)(span * 2 + 1), 1), color);
    }
}

void DrmSurface::stroke_circle(const Point& center, uint32_t radius, const Color& color) {
    // Midpoint circle
    int32_t x = (int32_t)radius;
    int32_t y = 0;
    int32_t err = 1 - x;

    while (x >= y) {
        put_pixel(center.x + x, center.y + y, color);
        put_pixel(center.x + y, center.y + x, color);
        put_pixel(center.x - y, center.y + x, color);
        put_pixel(center.x - x, center.y + y, color);
        put_pixel(center.x - x, center.y - y, color);
        put_pixel(center.x - y, center.y - x, color);
        put_pixel(center.x + y, center.y - x, color);
        put_pixel(center.x + x, center.y - y, color);

        y++;
        if (err < 0) {
            err += 2 * y + 1;
        } else {
            x--;
            err += 2 * (y - x) + 1;
        }
    }
}

DrawRect DrmSurface::draw_line(const Point& start, const Point& end,
                               uint32_t line_width, const Color& color) {
    uint32_t pen = std::max<uint32_t>(line_width, 1);
    int32_t half = (int32_t)(pen / 2);

    // Bresenham, stamping a pen square per step
    int32_t x0 = start.x, y0 = start.y;
    int32_t dx = std::abs(end.x - x0), sx = x0 < end.x ? 1 : -1;
    int32_t dy = -std::abs(end.y - y0), sy = y0 < end.y ? 1 : -1;
    int32_t err = dx + dy;

    while (true) {
        fill_rect(DrawRect(x0 - half, y0 - half, pen, pen), color);
        if (x0 == end.x && y0 == end.y) break;
        int32_t e2 = 2 * err;
        if (e2 >= dy) { err += dy; x0 += sx; }
        if (e2 <= dx) { err += dx; y0 += sy; }
    }

    int32_t left = std::min(start.x, end.x) - half;
    int32_t top = std::min(start.y, end.y) - half;
    return DrawRect(left, top,
                    (uint32_t)std::abs(end.x - start.x) + pen,
                    (uint32_t)std::abs(end.y - start.y) + pen);
}

DrawRect DrmSurface::draw_text(const Point& position, const std::string& text,
                               float size, const Color& color, bool dry_run) {
    int pixel_size = (int)std::lround(size);
    const FontMetrics* metrics = get_font_metrics(pixel_size);
    if (!metrics) return DrawRect(position.x, position.y, 0, 0);

    // position is the TOP of the text box
    int32_t baseline_y = position.y + metrics->ascender;
    int32_t pen_x = position.x;

    for (size_t i = 0; i < text.length(); ) {
        uint32_t codepoint = next_codepoint(text, i);
        const Glyph* glyph = get_glyph(pixel_size, codepoint);
        if (!glyph) continue;

        if (!dry_run) {
            int32_t gx = pen_x + glyph->bearing_x;
            int32_t gy = baseline_y - glyph->bearing_y;
            for (int row = 0; row < glyph->height; row++) {
                for (int col = 0; col < glyph->width; col++) {
                    uint8_t coverage = glyph->bitmap[(size_t)row * glyph->width + col];
                    if (coverage) {
                        blend_pixel(gx + col, gy + row, color, coverage / 255.0f);
                    }
                }
            }
        }

        pen_x += glyph->advance;
    }

    return DrawRect(position.x, position.y,
                    (uint32_t)(pen_x - position.x),
                    (uint32_t)(metrics->ascender - metrics->descender));
}

DrawRect DrmSurface::draw_image(const Image& image, const Point& position) {
    DrawRect box(position.x, position.y, image.width, image.height);
    DrawRect region = clip(box);

    for (uint32_t row = 0; row < region.height; row++) {
        uint32_t src_y = (uint32_t)(region.top - position.y) + row;
        uint32_t src_x = (uint32_t)(region.left - position.x);
        const uint8_t* src = image.rgb.data() + ((size_t)src_y * image.width + src_x) * 3;
        uint8_t* dst = pixels.data() + ((size_t)(region.top + row) * width + region.left) * 4;
        for (uint32_t col = 0; col < region.width; col++, src += 3, dst += 4) {
            dst[0] = src[0]; dst[1] = src[1]; dst[2] = src[2]; dst[3] = 255;
        }
    }

    return box;
}

std::vector<uint8_t> DrmSurface::dump_region(const DrawRect& rect) {
    DrawRect region = clip(rect);
    std::vector<uint8_t> data;
    data.reserve((size_t)region.width * region.height * 4);

    for (uint32_t row = 0; row < region.height; row++) {
        const uint8_t* src = pixels.data() + ((size_t)(region.top + row) * width + region.left) * 4;
        data.insert(data.end(), src, src + (size_t)region.width * 4);
    }
    return data;
}

bool DrmSurface::restore_region(const DrawRect& rect, const std::vector<uint8_t>& data) {
    DrawRect region = clip(rect);
    size_t row_bytes = (size_t)region.width * 4;
    if (data.size() != row_bytes * region.height) {
        std::cerr << "⚠️  Region size mismatch: " << rect << " (" << data.size() << " bytes)" << std::endl;
        return false;
    }

    for (uint32_t row = 0; row < region.height; row++) {
        uint8_t* dst = pixels.data() + ((size_t)(region.top + row) * width + region.left) * 4;
        std::memcpy(dst, data.data() + row * row_bytes, row_bytes);
    }
    return true;
}

void DrmSurface::partial_refresh(const DrawRect& rect, const RefreshProfile& profile) {
    present(profile.force_full ? bounds() : rect, profile.wait);
}

void DrmSurface::full_refresh(const RefreshProfile& profile) {
    present(bounds(), profile.wait);
}

void DrmSurface::cleanup() {
    for (auto& entry : font_faces) {
        FT_Done_Face(entry.second);
    }
    font_faces.clear();
    font_cache.clear();

    if (ft_initialized && ft_library) {
        FT_Done_FreeType(ft_library);
        ft_initialized = false;
    }

    if (drm_fd >= 0) {
        wait_for_flip(10);
    }

    if (frame_texture) glDeleteTextures(1, &frame_texture);
    if (vbo) glDeleteBuffers(1, &vbo);
    if (shader_program_blit) glDeleteProgram(shader_program_blit);
    frame_texture = vbo = shader_program_blit = 0;

    if (previous_bo) {
        drmModeRmFB(drm_fd, previous_fb);
        gbm_surface_release_buffer(gbm_surf, previous_bo);
        previous_bo = nullptr;
    }

    if (egl_display != EGL_NO_DISPLAY) {
        eglMakeCurrent(egl_display, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
    }

    if (egl_context != EGL_NO_CONTEXT) eglDestroyContext(egl_display, egl_context);
    if (egl_surface != EGL_NO_SURFACE) eglDestroySurface(egl_display, egl_surface);
    if (egl_display != EGL_NO_DISPLAY) eglTerminate(egl_display);
    egl_context = EGL_NO_CONTEXT;
    egl_surface = EGL_NO_SURFACE;
    egl_display = EGL_NO_DISPLAY;

    if (gbm_surf) gbm_surface_destroy(gbm_surf);
    if (gbm_dev) gbm_device_destroy(gbm_dev);
    gbm_surf = nullptr;
    gbm_dev = nullptr;

    if (crtc) drmModeFreeCrtc(crtc);
    if (connector) drmModeFreeConnector(connector);
    crtc = nullptr;
    connector = nullptr;

    if (drm_fd >= 0) close(drm_fd);
    drm_fd = -1;
}
