#include "pdf_utils.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <cstring>
#include <utility>

Mupdf_Document::Mupdf_Document(fz_context* ctx, fz_document* doc, int page_count, std::string file_path) :
    ctx_(ctx),
    doc_(doc),
    page_count_(page_count),
    file_path_(std::move(file_path)) {

}

Mupdf_Document::~Mupdf_Document() {
    fz_drop_document(ctx_, doc_);
    fz_drop_context(ctx_);
}

unsigned int Mupdf_Document::page_count() const {
    return page_count_ > 0 ? static_cast<unsigned int>(page_count_) : 0;
}

Page_Geometry Mupdf_Document::page_geometry(unsigned int index) const {
    Page_Geometry geometry;
    fz_page* page = nullptr;
    fz_stext_page* text = nullptr;
    fz_rect mediabox = fz_empty_rect;
    fz_var(page);
    fz_var(text);

    // only mupdf calls inside fz_try, a longjmp must not cross C++ destructors
    fz_try(ctx_) {
        page = fz_load_page(ctx_, doc_, static_cast<int>(index));
        mediabox = fz_bound_page(ctx_, page);

        fz_stext_options stext_options;
        std::memset(&stext_options, 0, sizeof(stext_options));
        stext_options.flags = 0;
        text = fz_new_stext_page_from_page(ctx_, page, &stext_options);
    } fz_catch(ctx_) {
        LOG_CHANNEL_WARNING("outline") << file_path_ << ": cannot extract text of page " << index + 1 << ": " << fz_caught_message(ctx_);
        fz_drop_stext_page(ctx_, text);
        fz_drop_page(ctx_, page);
        return geometry;
    }

    geometry.width = mediabox.x1 - mediabox.x0;
    geometry.height = mediabox.y1 - mediabox.y0;

    for (fz_stext_block* block = text->first_block; block; block = block->next) {
        if (block->type != FZ_STEXT_BLOCK_TEXT) { // image blocks do not have lines
            continue;
        }

        for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
            for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                Char_Record record;
                record.text = UnicodeToUTF8(static_cast<unsigned int>(ch->c));

                // curly double quotes are matched as plain quotes by the heading patterns
                if (record.text.compare("“") == 0 ||
                    record.text.compare("”") == 0) {
                    record.text = "\"";
                }

                record.x0 = ch->quad.ll.x;
                record.y0 = ch->origin.y;
                record.size = ch->size;
                if (ch->font) {
                    record.font_name = fz_font_name(ctx_, ch->font);
                }
                geometry.chars.push_back(std::move(record));
            }
        }
    }

    fz_drop_stext_page(ctx_, text);
    fz_drop_page(ctx_, page);
    return geometry;
}

std::optional<Raster_Image> Mupdf_Document::render_page(unsigned int index, unsigned int dpi) const {
    fz_page* page = nullptr;
    fz_pixmap* pix = nullptr;
    fz_var(page);
    fz_var(pix);

    const float zoom = static_cast<float>(dpi) / 72.0f;

    fz_try(ctx_) {
        page = fz_load_page(ctx_, doc_, static_cast<int>(index));
        pix = fz_new_pixmap_from_page(ctx_, page, fz_scale(zoom, zoom), fz_device_gray(ctx_), 0);
    } fz_always(ctx_) {
        fz_drop_page(ctx_, page);
    } fz_catch(ctx_) {
        LOG_CHANNEL_WARNING("ocr") << file_path_ << ": cannot render page " << index + 1 << ": " << fz_caught_message(ctx_);
        return std::nullopt;
    }

    Raster_Image image;
    image.width = fz_pixmap_width(ctx_, pix);
    image.height = fz_pixmap_height(ctx_, pix);
    image.scale = zoom;

    const int components = fz_pixmap_components(ctx_, pix);
    const size_t src_stride = static_cast<size_t>(fz_pixmap_stride(ctx_, pix));
    const unsigned char* samples = fz_pixmap_samples(ctx_, pix);

    // keep the first (grey) component only
    image.stride = image.width;
    image.pixels.resize(static_cast<size_t>(image.width) * static_cast<size_t>(image.height));
    for (int row = 0; row < image.height; ++row) {
        const unsigned char* src = samples + row * src_stride;
        unsigned char* dst = image.pixels.data() + static_cast<size_t>(row) * image.stride;
        for (int col = 0; col < image.width; ++col) {
            dst[col] = src[col * components];
        }
    }

    fz_drop_pixmap(ctx_, pix);
    return image;
}

std::unique_ptr<Mupdf_Document> open_pdf_document(const std::string& file_path) {
    fz_context* ctx = nullptr;
    fz_document* doc = nullptr;
    int page_count = 0;
    fz_var(doc);
    fz_var(page_count);

    /* Create a context to hold the exception stack and various caches. */
    ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
    if (!ctx) {
        LOG_CHANNEL_ERROR("outline") << "cannot create mupdf context";
        return nullptr;
    }

    /* Register the default file types to handle. */
    fz_try(ctx) {
        fz_register_document_handlers(ctx);
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR("outline") << "cannot register document handlers: " << fz_caught_message(ctx);
        fz_drop_context(ctx);
        return nullptr;
    }

    /* Open the document. */
    fz_try(ctx) {
        doc = fz_open_document(ctx, file_path.c_str());
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR("outline") << "cannot open document " << file_path << ": " << fz_caught_message(ctx);
        fz_drop_context(ctx);
        return nullptr;
    }

    /* Count the number of pages. */
    fz_try(ctx) {
        page_count = fz_count_pages(ctx, doc);
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR("outline") << "cannot count number of pages of " << file_path << ": " << fz_caught_message(ctx);
        fz_drop_document(ctx, doc);
        fz_drop_context(ctx);
        return nullptr;
    }

    return std::unique_ptr<Mupdf_Document>(new Mupdf_Document(ctx, doc, page_count, file_path));
}
