// =============================================================================
// Tapshot - Screenshot Annotation Implementation
// =============================================================================
#include "image_annotator.hpp"
#include "tapshot_log.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>

// Implementations live in stb_impl.cpp
#include "stb_image.h"
#include "stb_image_write.h"

static constexpr const char* TAG = "annotate";

namespace tapshot {

namespace {

void appendToString(void* ctx, void* data, int size) {
    auto* out = static_cast<std::string*>(ctx);
    out->append(static_cast<const char*>(data), static_cast<size_t>(size));
}

} // namespace

Result<RgbaImage> decodeImage(const std::string& bytes) {
    if (bytes.empty()) {
        return Err<RgbaImage>(ErrorKind::Capture, "empty image data");
    }

    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load_from_memory(
        reinterpret_cast<const stbi_uc*>(bytes.data()), static_cast<int>(bytes.size()),
        &w, &h, &channels, 4);
    if (!data) {
        const char* why = stbi_failure_reason();
        return Err<RgbaImage>(ErrorKind::Capture,
                              std::string("image decode failed: ") + (why ? why : "unknown"));
    }

    RgbaImage img;
    img.w = w;
    img.h = h;
    img.pix.assign(data, data + static_cast<size_t>(w) * h * 4);
    stbi_image_free(data);
    return img;
}

Result<std::string> encodePng(const RgbaImage& img) {
    if (img.empty()) {
        return Err<std::string>(ErrorKind::Capture, "invalid image");
    }
    std::string out;
    int ok = stbi_write_png_to_func(appendToString, &out, img.w, img.h, 4,
                                    img.pix.data(), img.w * 4);
    if (ok == 0 || out.empty()) {
        return Err<std::string>(ErrorKind::Capture, "stbi_write_png_to_func failed");
    }
    return out;
}

Result<void> writePng(const std::string& path, const RgbaImage& img) {
    if (img.empty()) {
        return Err<void>(ErrorKind::Capture, "invalid image");
    }
    int ret = stbi_write_png(path.c_str(), img.w, img.h, 4, img.pix.data(), img.w * 4);
    if (ret == 0) {
        std::string err = "stbi_write_png failed: " + path;
        TLOG_ERROR(TAG, "%s", err.c_str());
        return Err<void>(ErrorKind::Capture, err);
    }
    TLOG_DEBUG(TAG, "PNG saved: %dx%d -> %s", img.w, img.h, path.c_str());
    return Ok();
}

Result<void> writeBytes(const std::string& path, const std::string& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return Err<void>(ErrorKind::Capture, "cannot open " + path);
    }
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
        return Err<void>(ErrorKind::Capture, "write failed: " + path);
    }
    return Ok();
}

void drawRect(RgbaImage& img, const ui::BoundingRect& rect, int width,
              uint8_t r, uint8_t g, uint8_t b) {
    if (img.empty()) return;

    auto put = [&](int x, int y) {
        if (x < 0 || y < 0 || x >= img.w || y >= img.h) return;
        uint8_t* p = &img.pix[(static_cast<size_t>(y) * img.w + x) * 4];
        p[0] = r;
        p[1] = g;
        p[2] = b;
        p[3] = 255;
    };

    for (int i = 0; i < std::max(width, 1); i++) {
        int x1 = rect.x1 - i, y1 = rect.y1 - i;
        int x2 = rect.x2 + i, y2 = rect.y2 + i;

        int cx1 = std::max(x1, 0), cx2 = std::min(x2, img.w - 1);
        int cy1 = std::max(y1, 0), cy2 = std::min(y2, img.h - 1);
        for (int x = cx1; x <= cx2; x++) {
            put(x, y1);
            put(x, y2);
        }
        for (int y = cy1; y <= cy2; y++) {
            put(x1, y);
            put(x2, y);
        }
    }
}

Result<void> annotateScreenshot(const std::string& png_bytes,
                                const std::optional<ui::BoundingRect>& rect,
                                const std::string& out_path, int width) {
    if (!rect) {
        return writeBytes(out_path, png_bytes);
    }

    auto decoded = decodeImage(png_bytes);
    if (decoded.is_err()) return decoded.error();

    RgbaImage img = std::move(decoded).value();
    drawRect(img, *rect, width);
    return writePng(out_path, img);
}

} // namespace tapshot
