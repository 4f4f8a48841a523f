#pragma once
// =============================================================================
// Tapshot - Screenshot Annotation
// =============================================================================
// Decodes device screenshots (PNG/JPEG via stb_image), draws the resolved
// node's bounding box and writes PNG files (stb_image_write).
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "result.hpp"
#include "ui/ui_hierarchy.hpp"

namespace tapshot {

struct RgbaImage {
    int w = 0;
    int h = 0;
    std::vector<uint8_t> pix;   // w*h*4, row-major

    bool empty() const { return w <= 0 || h <= 0 || pix.empty(); }
};

Result<RgbaImage> decodeImage(const std::string& bytes);
Result<std::string> encodePng(const RgbaImage& img);
Result<void> writePng(const std::string& path, const RgbaImage& img);

// Writes raw bytes unchanged
Result<void> writeBytes(const std::string& path, const std::string& bytes);

// Outline of `width` pixels growing outward from rect, clipped to the image.
void drawRect(RgbaImage& img, const ui::BoundingRect& rect, int width = 4,
              uint8_t r = 255, uint8_t g = 0, uint8_t b = 0);

// Boxed copy of a screenshot. Without a rect the screenshot bytes are
// written as-is.
Result<void> annotateScreenshot(const std::string& png_bytes,
                                const std::optional<ui::BoundingRect>& rect,
                                const std::string& out_path, int width = 4);

} // namespace tapshot
