#pragma once

#include <retext/content-stream-parser.h>
#include <retext/document.h>
#include <retext/font-metrics.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

// pdfio types (pdfio uses _pdfio_*_s naming)
struct _pdfio_file_s;
typedef struct _pdfio_file_s pdfio_file_t;
struct _pdfio_obj_s;
typedef struct _pdfio_obj_s pdfio_obj_t;
struct _pdfio_dict_s;
typedef struct _pdfio_dict_s pdfio_dict_t;

namespace retext::font {
class FaceMetricsSource;
}

namespace retext::pdf {

//=============================================================================
// PdfioDocument - Document over a PDF file opened with pdfio
//
// Rectangles passed in and out use a top-left page origin with y growing
// down, the way viewers address a page. Content stream positions are
// flipped through the MediaBox.
//=============================================================================
class PdfioDocument : public Document {
public:
    using Ptr = std::shared_ptr<PdfioDocument>;

    static Result<Ptr> open(const std::string& path);

    ~PdfioDocument() override;

    PdfioDocument(const PdfioDocument&) = delete;
    PdfioDocument& operator=(const PdfioDocument&) = delete;

    const std::string& path() const { return _path; }

    // Widths used to advance the text matrix; fallback tables when unset
    void setMetricsSource(FontMetricsSource::Ptr metrics) { _metrics = std::move(metrics); }

    Result<Rect> mediaBox(int page) const;

    // Resource tag ("F1") -> BaseFont
    Result<std::map<std::string, std::string>> fontMap(int page) const;

    Result<std::vector<ParsedTextBlock>> parsePage(int page) const;

    // Registers the embedded TrueType/CFF programs of the page under their BaseFont
    Result<size_t> loadEmbeddedFaces(int page, font::FaceMetricsSource& into) const;

    //-------------------------------------------------------------------------
    // Document
    //-------------------------------------------------------------------------
    int pageCount() const override;
    Result<void> checkPage(int page) const override;
    Result<std::vector<FontRef>> pageFonts(int page) const override;
    Result<std::string> pageContent(int page) const override;
    Result<std::string> pageText(int page) const override;
    Result<std::string> extractText(int page, const Rect& rect) const override;
    int objectCount() const override;
    Result<void> resolveObject(int number) const override;
    bool hasSignatures() const override;

private:
    explicit PdfioDocument(std::string path);
    Result<void> init();

    Result<pdfio_obj_t*> pageObject(int page) const;
    Result<pdfio_dict_t*> fontDictionary(int page) const;

    double textAdvance(const std::string& text, const TextState& state) const;

    std::string _path;
    pdfio_file_t* _file = nullptr;
    FontMetricsSource::Ptr _metrics;
};

} // namespace retext::pdf
