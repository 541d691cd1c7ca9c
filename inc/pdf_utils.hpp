#pragma once

#include <memory>
#include <string>

#include <mupdf/fitz.h>

#include "document_source.hpp"

/* Document_Source backed by MuPDF. Each instance owns its own fz_context so
 * separate documents can be processed on separate threads.
 */
class Mupdf_Document : public Document_Source {
  public:
    // disable copy constructor and copy assignment (non-copyable)
    Mupdf_Document(Mupdf_Document const&) = delete;
    Mupdf_Document& operator=(Mupdf_Document const&) = delete;

    ~Mupdf_Document() override;

    unsigned int page_count() const override;

    Page_Geometry page_geometry(unsigned int index) const override;

    std::optional<Raster_Image> render_page(unsigned int index, unsigned int dpi) const override;

    const std::string& file_path() const { return file_path_; }

    friend std::unique_ptr<Mupdf_Document> open_pdf_document(const std::string& file_path);

  private:
    Mupdf_Document(fz_context* ctx, fz_document* doc, int page_count, std::string file_path);

    fz_context* ctx_;
    fz_document* doc_;
    int page_count_;
    std::string file_path_;
};

// return nullptr if cant read pdf document
std::unique_ptr<Mupdf_Document> open_pdf_document(const std::string& file_path);
