#include <retext/pdf/pdfio-document.h>
#include <retext/font/font-face.h>
#include "../utf8.h"

#include <ytrace/ytrace.hpp>
#include <fmt/format.h>

extern "C" {
#include <pdfio.h>
}

#include <cstring>
#include <vector>

namespace retext::pdf {

namespace {

bool pdfioErrorHandler(pdfio_file_t*, const char* message, void*) {
    ywarn("pdfio: {}", message);
    return true;
}

// Inline dictionary or a reference to one
pdfio_dict_t* dictEntry(pdfio_dict_t* dict, const char* key) {
    if (!dict) return nullptr;
    pdfio_dict_t* value = pdfioDictGetDict(dict, key);
    if (!value) {
        pdfio_obj_t* obj = pdfioDictGetObj(dict, key);
        if (obj) value = pdfioObjGetDict(obj);
    }
    return value;
}

Result<std::string> readStream(pdfio_stream_t* stream) {
    if (!stream) return Err<std::string>("cannot open stream");
    std::string out;
    char buf[8192];
    ssize_t n;
    while ((n = pdfioStreamRead(stream, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    pdfioStreamClose(stream);
    if (n < 0) return Err<std::string>("stream read error");
    return Ok(std::move(out));
}

// Font descriptor of a simple font, or of DescendantFonts[0] for Type0
pdfio_dict_t* fontDescriptor(pdfio_dict_t* fontDict) {
    if (pdfio_dict_t* desc = dictEntry(fontDict, "FontDescriptor")) return desc;

    pdfio_array_t* descendants = pdfioDictGetArray(fontDict, "DescendantFonts");
    if (!descendants) {
        pdfio_obj_t* obj = pdfioDictGetObj(fontDict, "DescendantFonts");
        if (obj) descendants = pdfioObjGetArray(obj);
    }
    if (!descendants || pdfioArrayGetSize(descendants) == 0) return nullptr;

    pdfio_obj_t* cidFont = pdfioArrayGetObj(descendants, 0);
    return cidFont ? dictEntry(pdfioObjGetDict(cidFont), "FontDescriptor") : nullptr;
}

struct FontProgram {
    pdfio_obj_t* object = nullptr;
    const char* extension = "";
};

FontProgram fontProgram(pdfio_dict_t* descriptor) {
    if (!descriptor) return {};
    if (pdfio_obj_t* obj = pdfioDictGetObj(descriptor, "FontFile2")) return {obj, "ttf"};
    if (pdfio_obj_t* obj = pdfioDictGetObj(descriptor, "FontFile3")) return {obj, "cff"};
    if (pdfio_obj_t* obj = pdfioDictGetObj(descriptor, "FontFile")) return {obj, "pfa"};
    return {};
}

} // namespace

PdfioDocument::PdfioDocument(std::string path) : _path(std::move(path)) {}

PdfioDocument::~PdfioDocument() {
    if (_file) pdfioFileClose(_file);
}

Result<PdfioDocument::Ptr> PdfioDocument::open(const std::string& path) {
    auto doc = Ptr(new PdfioDocument(path));
    if (auto res = doc->init(); !res) {
        return Err<Ptr>("Cannot open " + path, res);
    }
    return Ok(std::move(doc));
}

Result<void> PdfioDocument::init() {
    _file = pdfioFileOpen(_path.c_str(), nullptr, nullptr, pdfioErrorHandler, nullptr);
    if (!_file) {
        return Err("pdfioFileOpen failed");
    }
    yinfo("PdfioDocument: opened '{}' ({} pages, {} objects)", _path,
          pdfioFileGetNumPages(_file), pdfioFileGetNumObjs(_file));
    return Ok();
}

Result<pdfio_obj_t*> PdfioDocument::pageObject(int page) const {
    if (page < 0 || page >= pageCount()) {
        return Err<pdfio_obj_t*>(fmt::format("page {} out of range", page));
    }
    pdfio_obj_t* obj = pdfioFileGetPage(_file, static_cast<size_t>(page));
    if (!obj) {
        return Err<pdfio_obj_t*>(fmt::format("page {} missing from the page tree", page));
    }
    return Ok(obj);
}

Result<pdfio_dict_t*> PdfioDocument::fontDictionary(int page) const {
    auto obj = pageObject(page);
    if (!obj) return Err<pdfio_dict_t*>("fontDictionary", obj);

    pdfio_dict_t* resources = dictEntry(pdfioObjGetDict(*obj), "Resources");
    // A page without fonts is legal
    return Ok(dictEntry(resources, "Font"));
}

//-----------------------------------------------------------------------------
// Document
//-----------------------------------------------------------------------------

int PdfioDocument::pageCount() const {
    return static_cast<int>(pdfioFileGetNumPages(_file));
}

Result<void> PdfioDocument::checkPage(int page) const {
    auto obj = pageObject(page);
    if (!obj) return Err("checkPage", obj);
    if (!pdfioObjGetDict(*obj)) {
        return Err(fmt::format("page {} is not a dictionary", page));
    }
    return Ok();
}

Result<Rect> PdfioDocument::mediaBox(int page) const {
    auto obj = pageObject(page);
    if (!obj) return Err<Rect>("mediaBox", obj);

    pdfio_rect_t box = {};
    if (!pdfioDictGetRect(pdfioObjGetDict(*obj), "MediaBox", &box)) {
        // Letter
        box = {0.0, 0.0, 612.0, 792.0};
    }
    return Ok(Rect{box.x1, box.y1, box.x2, box.y2});
}

Result<std::vector<FontRef>> PdfioDocument::pageFonts(int page) const {
    auto fonts = fontDictionary(page);
    if (!fonts) return Err<std::vector<FontRef>>("pageFonts", fonts);

    std::vector<FontRef> out;
    if (!*fonts) return Ok(std::move(out));

    size_t count = pdfioDictGetNumPairs(*fonts);
    for (size_t i = 0; i < count; i++) {
        const char* tag = pdfioDictGetKey(*fonts, i);
        if (!tag) continue;
        pdfio_dict_t* font = dictEntry(*fonts, tag);
        if (!font) {
            ydebug("page {}: font {} is not a dictionary", page, tag);
            continue;
        }
        const char* baseFont = pdfioDictGetName(font, "BaseFont");
        FontRef ref;
        ref.name = baseFont ? baseFont : tag;
        ref.extension = fontProgram(fontDescriptor(font)).extension;
        out.push_back(std::move(ref));
    }
    return Ok(std::move(out));
}

Result<std::map<std::string, std::string>> PdfioDocument::fontMap(int page) const {
    using FontMap = std::map<std::string, std::string>;
    auto fonts = fontDictionary(page);
    if (!fonts) return Err<FontMap>("fontMap", fonts);

    FontMap out;
    if (!*fonts) return Ok(std::move(out));

    size_t count = pdfioDictGetNumPairs(*fonts);
    for (size_t i = 0; i < count; i++) {
        const char* tag = pdfioDictGetKey(*fonts, i);
        if (!tag) continue;
        pdfio_dict_t* font = dictEntry(*fonts, tag);
        const char* baseFont = font ? pdfioDictGetName(font, "BaseFont") : nullptr;
        if (baseFont) out[tag] = baseFont;
    }
    return Ok(std::move(out));
}

Result<std::string> PdfioDocument::pageContent(int page) const {
    auto obj = pageObject(page);
    if (!obj) return Err<std::string>("pageContent", obj);

    std::string content;
    size_t numStreams = pdfioPageGetNumStreams(*obj);
    for (size_t s = 0; s < numStreams; s++) {
        auto data = readStream(pdfioPageOpenStream(*obj, s, true));
        if (!data) {
            return Err<std::string>(fmt::format("page {} content stream {}", page, s), data);
        }
        // Streams are concatenated as if they were one
        if (!content.empty()) content += '\n';
        content += *data;
    }
    return Ok(std::move(content));
}

double PdfioDocument::textAdvance(const std::string& text, const TextState& state) const {
    double advance = 0.0;
    for (uint32_t cp : utf8::codepoints(text)) {
        std::optional<double> width;
        if (_metrics) width = _metrics->charWidth(state.fontName, cp);
        double w = width ? *width : fallbackCharWidth(state.fontName, cp);
        advance += w / 1000.0 * state.fontSize + state.charSpacing;
        if (cp == 0x20) advance += state.wordSpacing;
    }
    return advance;
}

Result<std::vector<ParsedTextBlock>> PdfioDocument::parsePage(int page) const {
    using Blocks = std::vector<ParsedTextBlock>;
    auto content = pageContent(page);
    if (!content) return Err<Blocks>("parsePage", content);
    auto fonts = fontMap(page);
    if (!fonts) return Err<Blocks>("parsePage", fonts);

    ContentStreamParser parser;
    parser.setFontMap(std::move(*fonts));
    parser.setAdvanceCallback([this](const std::string& text, const TextState& state) {
        return textAdvance(text, state);
    });
    return Ok(parser.parse(*content));
}

Result<std::string> PdfioDocument::pageText(int page) const {
    auto blocks = parsePage(page);
    if (!blocks) return Err<std::string>("pageText", blocks);

    std::string text;
    for (const auto& block : *blocks) {
        if (!text.empty()) text += '\n';
        text += block.text();
    }
    return Ok(std::move(text));
}

Result<std::string> PdfioDocument::extractText(int page, const Rect& rect) const {
    auto blocks = parsePage(page);
    if (!blocks) return Err<std::string>("extractText", blocks);
    auto box = mediaBox(page);
    if (!box) return Err<std::string>("extractText", box);

    std::string text;
    for (const auto& block : *blocks) {
        for (const auto& op : block.operations) {
            Point p = op.position();
            // Flip into the top-left origin
            Point q{p.x - box->x0, box->y1 - p.y};
            if (!rect.contains(q.x, q.y)) continue;
            if (!text.empty() && text.back() != ' ') text += ' ';
            text += op.text;
        }
    }
    return Ok(std::move(text));
}

int PdfioDocument::objectCount() const {
    // Slot 0 stands for the free list head, loaded objects follow in xref order
    return static_cast<int>(pdfioFileGetNumObjs(_file)) + 1;
}

Result<void> PdfioDocument::resolveObject(int number) const {
    if (number <= 0 || number >= objectCount()) {
        return Err(fmt::format("object slot {} out of range", number));
    }
    pdfio_obj_t* obj = pdfioFileGetObj(_file, static_cast<size_t>(number - 1));
    if (!obj) {
        return Err(fmt::format("object slot {} not found", number));
    }
    if (pdfioObjGetNumber(obj) == 0) {
        return Err(fmt::format("object slot {} has no object number", number));
    }
    return Ok();
}

bool PdfioDocument::hasSignatures() const {
    pdfio_dict_t* acroForm = dictEntry(pdfioFileGetCatalog(_file), "AcroForm");
    if (!acroForm) return false;
    auto flags = static_cast<long>(pdfioDictGetNumber(acroForm, "SigFlags"));
    // Bit 1: SignaturesExist
    return (flags & 1) != 0;
}

Result<size_t> PdfioDocument::loadEmbeddedFaces(int page, font::FaceMetricsSource& into) const {
    auto fonts = fontDictionary(page);
    if (!fonts) return Err<size_t>("loadEmbeddedFaces", fonts);
    if (!*fonts) return Ok(size_t{0});

    size_t loaded = 0;
    size_t count = pdfioDictGetNumPairs(*fonts);
    for (size_t i = 0; i < count; i++) {
        const char* tag = pdfioDictGetKey(*fonts, i);
        pdfio_dict_t* font = tag ? dictEntry(*fonts, tag) : nullptr;
        if (!font) continue;

        const char* baseFont = pdfioDictGetName(font, "BaseFont");
        std::string name = baseFont ? baseFont : tag;
        if (into.hasFont(name)) continue;

        FontProgram program = fontProgram(fontDescriptor(font));
        // Type 1 programs are not loaded
        if (!program.object || std::strcmp(program.extension, "pfa") == 0) continue;

        auto bytes = readStream(pdfioObjOpenStream(program.object, true));
        if (!bytes || bytes->empty()) {
            ywarn("page {}: cannot read font program of {}: {}", page, name, error_msg(bytes));
            continue;
        }

        auto face = font::FontFace::create(reinterpret_cast<const uint8_t*>(bytes->data()),
                                           bytes->size(), name);
        if (!face) {
            ywarn("page {}: {}: {}", page, name, error_msg(face));
            continue;
        }
        into.addFace(name, std::move(*face));
        loaded++;
    }
    ydebug("page {}: loaded {} embedded faces", page, loaded);
    return Ok(loaded);
}

} // namespace retext::pdf
