#pragma once

#include <optional>
#include <string>
#include <vector>

#include "outline_types.hpp"

/* 8-bit grey raster of one page. scale is pixels per page unit, so a pixel
 * row r sits at page y = r / scale.
 */
struct Raster_Image {
    int width = 0;
    int height = 0;
    int stride = 0;
    double scale = 1.0;
    std::vector<unsigned char> pixels;
};

/* Page geometry provider and rasterizer for one opened document. Page
 * indexes are 0-based; every other page number in the project is 1-based.
 */
class Document_Source {
  public:
    virtual ~Document_Source() = default;

    virtual unsigned int page_count() const = 0;

    // empty chars for image-only pages or pages that fail to parse
    virtual Page_Geometry page_geometry(unsigned int index) const = 0;

    virtual std::optional<Raster_Image> render_page(unsigned int index, unsigned int dpi) const = 0;
};

// visual lines of the page whose characters have top <= y < bottom, one per text line
std::string page_region_text(const Document_Source& source, unsigned int index, double top, double bottom);

std::string page_full_text(const Document_Source& source, unsigned int index);
