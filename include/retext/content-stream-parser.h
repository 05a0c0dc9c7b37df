#pragma once

#include <retext/transform-matrix.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace retext {

//=============================================================================
// TextState - PDF 9.3 text state plus the matrices in effect
//=============================================================================
struct TextState {
    std::string fontResource;          // resource name from Tf, e.g. "F1"
    std::string fontName;              // resolved base font, falls back to fontResource
    double fontSize = 0.0;             // Tfs
    double charSpacing = 0.0;          // Tc
    double wordSpacing = 0.0;          // Tw
    double horizontalScaling = 100.0;  // Tz (percentage)
    double leading = 0.0;              // TL
    int renderMode = 0;                // Tr
    double rise = 0.0;                 // Ts

    TransformMatrix textMatrix;        // Tm
    TransformMatrix textLineMatrix;    // Tlm
    TransformMatrix ctm;

    // Start-of-text position in page space
    Point effectivePosition() const {
        return ctm.transformPoint(textMatrix.e, textMatrix.f);
    }

    TextTransformInfo transformInfo() const {
        return {ctm, textMatrix, fontSize, horizontalScaling};
    }
};

enum class ShowOperator {
    Tj,             // (string) Tj
    TJ,             // [(a) -120 (b)] TJ
    NextLineShow,   // (string) '
    SpacedShow,     // aw ac (string) "
};

const char* toString(ShowOperator op);

//=============================================================================
// TextShowOperation - one resolved text-show event
//=============================================================================
struct TextShowOperation {
    std::string text;                       // decoded, UTF-8
    ShowOperator op = ShowOperator::Tj;
    TextState state;                        // snapshot at emission
    std::vector<double> glyphAdjustments;   // TJ numbers, 1/1000 em
    std::string rawOperand;
    size_t streamOffset = 0;

    const std::string& fontName() const { return state.fontName; }
    double fontSize() const { return state.fontSize; }
    Point position() const { return state.effectivePosition(); }

    bool hasCharSpacing() const;
    bool hasWordSpacing() const;
    bool hasRise() const;
    bool isSuperscript() const;
    bool isSubscript() const;
};

//=============================================================================
// ParsedTextBlock - operations between one BT/ET pair
//=============================================================================
struct ParsedTextBlock {
    std::vector<TextShowOperation> operations;
    size_t startOffset = 0;
    size_t endOffset = 0;

    std::string text() const;
    bool hasSpacingInfo() const;
    bool hasRiseInfo() const;
    std::vector<std::pair<std::string, double>> uniqueFonts() const;
};

// Returns the horizontal advance of `text` in unscaled text space units
// (glyph widths / 1000 * Tfs + Tc + Tw, before Tz). When set, the parser moves
// Tm after each show so consecutive shows get their true start positions.
using TextAdvanceCallback = std::function<double(const std::string& text, const TextState& state)>;

//=============================================================================
// ContentStreamParser
//
// Interprets the text-relevant subset of a page content stream. Malformed
// input never aborts the parse: unbalanced Q is clamped, text operators
// outside BT/ET are dropped, bad operands turn the operator into a no-op.
//=============================================================================
class ContentStreamParser {
public:
    enum class TokenKind {
        Number,
        Name,
        LiteralString,
        HexString,
        Array,
        Operator,
    };

    struct Token {
        TokenKind kind;
        std::string text;
        size_t offset = 0;
    };

    ContentStreamParser() = default;

    // Resource name ("F1") -> base font ("Helvetica")
    void setFontMap(std::map<std::string, std::string> fontMap) { _fontMap = std::move(fontMap); }
    void setAdvanceCallback(TextAdvanceCallback cb) { _advanceCallback = std::move(cb); }

    std::vector<ParsedTextBlock> parse(std::string_view content);

    // Flattened result of the last parse
    std::vector<TextShowOperation> allOperations() const;
    const std::vector<ParsedTextBlock>& blocks() const { return _blocks; }

    static std::vector<Token> tokenize(std::string_view content);

    // Body of a (literal) or <hex> token to UTF-8 through WinAnsi
    static std::string decodeString(const Token& token);
    static std::string decodeLiteral(std::string_view body);
    static std::string decodeHex(std::string_view body);

    // "[(AB) -120 (C)]" -> text + numeric adjustments
    static std::pair<std::string, std::vector<double>> parseTjArray(std::string_view array);

private:
    void reset();
    void dispatchOperator(const Token& op);

    // Text object operators
    void handleBT(const Token& op);
    void handleET(const Token& op);

    // Text state operators
    void handleTf();
    void handleTc();
    void handleTw();
    void handleTz();
    void handleTL();
    void handleTr();
    void handleTs();

    // Text positioning operators
    void handleTd();
    void handleTD();
    void handleTm();
    void handleTstar();

    // Text showing operators
    void handleTj(const Token& op);
    void handleTJ(const Token& op);
    void handleQuote(const Token& op);
    void handleDblQuote(const Token& op);

    // Graphics state operators
    void handleCm();
    void handleQ();   // save
    void handleQr();  // restore

    void moveTextPosition(double tx, double ty);
    void advanceTextMatrix(double tx);
    void emitText(std::string text, ShowOperator op, const Token& operand,
                  std::vector<double> adjustments, size_t offset);

    // Operand access from the top of the stack; false when missing or malformed
    bool numberAt(size_t fromTop, double& out) const;
    const Token* operandAt(size_t fromTop) const;

    std::vector<Token> _operands;
    std::map<std::string, std::string> _fontMap;
    TextAdvanceCallback _advanceCallback;

    TextState _state;
    std::vector<TextState> _stateStack;
    bool _inTextObject = false;

    ParsedTextBlock _current;
    std::vector<ParsedTextBlock> _blocks;
};

// One-shot convenience
std::vector<ParsedTextBlock> parseContentStream(std::string_view content,
                                                const std::map<std::string, std::string>& fontMap = {});

} // namespace retext
