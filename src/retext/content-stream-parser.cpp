#include <retext/content-stream-parser.h>
#include "utf8.h"

#include <ytrace/ytrace.hpp>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstring>
#include <set>

namespace retext {

namespace {

bool isWhitespace(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\f' || ch == '\0';
}

bool isDelimiter(char ch) {
    return std::strchr("()<>[]{}/%", ch) != nullptr;
}

bool isOperatorChar(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) || ch == '*' || ch == '\'' || ch == '"';
}

bool isDigit(char ch) {
    return ch >= '0' && ch <= '9';
}

// Index just past the literal string that opens at `start`
size_t skipLiteral(std::string_view s, size_t start) {
    int depth = 0;
    size_t i = start;
    while (i < s.size()) {
        char ch = s[i];
        if (ch == '\\') {
            i += 2;
            continue;
        }
        if (ch == '(') depth++;
        else if (ch == ')') {
            depth--;
            if (depth == 0) return i + 1;
        }
        i++;
    }
    return s.size();
}

// [+-]?(\d+\.?\d*|\.\d+), returns length or 0
size_t matchNumber(std::string_view s, size_t start) {
    size_t i = start;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) i++;
    size_t intStart = i;
    while (i < s.size() && isDigit(s[i])) i++;
    if (i > intStart) {
        if (i < s.size() && s[i] == '.') {
            i++;
            while (i < s.size() && isDigit(s[i])) i++;
        }
        return i - start;
    }
    if (i < s.size() && s[i] == '.') {
        size_t fracStart = ++i;
        while (i < s.size() && isDigit(s[i])) i++;
        if (i > fracStart) return i - start;
    }
    return 0;
}

bool parseNumber(const std::string& text, double& out) {
    std::string_view sv = text;
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    auto res = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return res.ec == std::errc() && res.ptr == sv.data() + sv.size();
}

int hexVal(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

const char* toString(ShowOperator op) {
    switch (op) {
        case ShowOperator::Tj:           return "Tj";
        case ShowOperator::TJ:           return "TJ";
        case ShowOperator::NextLineShow: return "'";
        case ShowOperator::SpacedShow:   return "\"";
    }
    return "Tj";
}

//=============================================================================
// TextShowOperation / ParsedTextBlock
//=============================================================================

bool TextShowOperation::hasCharSpacing() const { return std::abs(state.charSpacing) > 0.001; }
bool TextShowOperation::hasWordSpacing() const { return std::abs(state.wordSpacing) > 0.001; }
bool TextShowOperation::hasRise() const { return std::abs(state.rise) > 0.001; }
bool TextShowOperation::isSuperscript() const { return state.rise > 0.5; }
bool TextShowOperation::isSubscript() const { return state.rise < -0.5; }

std::string ParsedTextBlock::text() const {
    std::string out;
    for (const auto& op : operations) out += op.text;
    return out;
}

bool ParsedTextBlock::hasSpacingInfo() const {
    for (const auto& op : operations) {
        if (op.hasCharSpacing() || op.hasWordSpacing()) return true;
    }
    return false;
}

bool ParsedTextBlock::hasRiseInfo() const {
    for (const auto& op : operations) {
        if (op.hasRise()) return true;
    }
    return false;
}

std::vector<std::pair<std::string, double>> ParsedTextBlock::uniqueFonts() const {
    std::vector<std::pair<std::string, double>> out;
    std::set<std::pair<std::string, double>> seen;
    for (const auto& op : operations) {
        auto key = std::make_pair(op.state.fontName, op.state.fontSize);
        if (seen.insert(key).second) out.push_back(key);
    }
    return out;
}

//=============================================================================
// Tokenizer
//=============================================================================

std::vector<ContentStreamParser::Token> ContentStreamParser::tokenize(std::string_view s) {
    std::vector<Token> tokens;
    size_t i = 0;
    const size_t n = s.size();

    while (i < n) {
        char ch = s[i];

        if (isWhitespace(ch)) {
            i++;
            continue;
        }

        if (ch == '%') {
            while (i < n && s[i] != '\n' && s[i] != '\r') i++;
            continue;
        }

        if (ch == '(') {
            size_t end = skipLiteral(s, i);
            tokens.push_back({TokenKind::LiteralString, std::string(s.substr(i, end - i)), i});
            i = end;
            continue;
        }

        if (ch == '<') {
            if (i + 1 < n && s[i + 1] == '<') {
                // Dictionary (inline image params, marked content): skipped
                int depth = 0;
                size_t j = i;
                while (j < n) {
                    if (s[j] == '(') { j = skipLiteral(s, j); continue; }
                    if (s.substr(j, 2) == "<<") { depth++; j += 2; continue; }
                    if (s.substr(j, 2) == ">>") {
                        depth--;
                        j += 2;
                        if (depth == 0) break;
                        continue;
                    }
                    j++;
                }
                i = j;
                continue;
            }
            size_t end = s.find('>', i + 1);
            end = (end == std::string_view::npos) ? n : end + 1;
            tokens.push_back({TokenKind::HexString, std::string(s.substr(i, end - i)), i});
            i = end;
            continue;
        }

        if (ch == '[') {
            int depth = 0;
            size_t j = i;
            while (j < n) {
                if (s[j] == '(') { j = skipLiteral(s, j); continue; }
                if (s[j] == '[') depth++;
                else if (s[j] == ']') {
                    depth--;
                    if (depth == 0) { j++; break; }
                }
                j++;
            }
            tokens.push_back({TokenKind::Array, std::string(s.substr(i, j - i)), i});
            i = j;
            continue;
        }

        if (ch == '/') {
            size_t j = i + 1;
            while (j < n && !isWhitespace(s[j]) && !isDelimiter(s[j])) j++;
            tokens.push_back({TokenKind::Name, std::string(s.substr(i + 1, j - i - 1)), i});
            i = j;
            continue;
        }

        if (isDigit(ch) || ch == '+' || ch == '-' || ch == '.') {
            size_t len = matchNumber(s, i);
            if (len > 0) {
                tokens.push_back({TokenKind::Number, std::string(s.substr(i, len)), i});
                i += len;
            } else {
                i++;
            }
            continue;
        }

        if (isOperatorChar(ch)) {
            size_t j = i;
            while (j < n && isOperatorChar(s[j])) j++;
            std::string_view op = s.substr(i, j - i);
            tokens.push_back({TokenKind::Operator, std::string(op), i});
            i = j;

            // Inline image data is binary: jump to the EI that closes it
            if (op == "ID") {
                size_t k = i;
                while (k + 2 <= n) {
                    if (s.substr(k, 2) == "EI" && isWhitespace(s[k - 1]) &&
                        (k + 2 == n || isWhitespace(s[k + 2]))) {
                        break;
                    }
                    k++;
                }
                i = (k + 2 <= n) ? k + 2 : n;
            }
            continue;
        }

        // ')' '>' ']' '{' '}' and stray bytes
        i++;
    }

    return tokens;
}

//=============================================================================
// String decoding
//=============================================================================

std::string ContentStreamParser::decodeLiteral(std::string_view body) {
    std::string bytes;
    bytes.reserve(body.size());

    for (size_t i = 0; i < body.size(); i++) {
        char ch = body[i];
        if (ch != '\\') {
            bytes += ch;
            continue;
        }
        if (++i >= body.size()) break;
        char esc = body[i];
        switch (esc) {
            case 'n': bytes += '\n'; break;
            case 'r': bytes += '\r'; break;
            case 't': bytes += '\t'; break;
            case 'b': bytes += '\b'; break;
            case 'f': bytes += '\f'; break;
            case '(': bytes += '('; break;
            case ')': bytes += ')'; break;
            case '\\': bytes += '\\'; break;
            default:
                if (esc >= '0' && esc <= '7') {
                    int value = 0;
                    size_t digits = 0;
                    while (digits < 3 && i < body.size() && body[i] >= '0' && body[i] <= '7') {
                        value = value * 8 + (body[i] - '0');
                        i++;
                        digits++;
                    }
                    i--;
                    bytes += static_cast<char>(value & 0xFF);
                } else {
                    bytes += esc;
                }
                break;
        }
    }

    std::string out;
    out.reserve(bytes.size());
    for (char b : bytes) {
        utf8::appendWinAnsi(out, static_cast<uint8_t>(b));
    }
    return out;
}

std::string ContentStreamParser::decodeHex(std::string_view body) {
    std::string digits;
    digits.reserve(body.size());
    for (char ch : body) {
        if (hexVal(ch) >= 0) digits += ch;
    }
    // Odd trailing nibble: pad with 0
    if (digits.size() % 2 == 1) digits += '0';

    std::string out;
    out.reserve(digits.size() / 2);
    for (size_t i = 0; i + 1 < digits.size(); i += 2) {
        int byte = (hexVal(digits[i]) << 4) | hexVal(digits[i + 1]);
        utf8::appendWinAnsi(out, static_cast<uint8_t>(byte));
    }
    return out;
}

std::string ContentStreamParser::decodeString(const Token& token) {
    std::string_view raw = token.text;
    if (token.kind == TokenKind::LiteralString) {
        if (!raw.empty() && raw.front() == '(') raw.remove_prefix(1);
        if (!raw.empty() && raw.back() == ')') raw.remove_suffix(1);
        return decodeLiteral(raw);
    }
    if (token.kind == TokenKind::HexString) {
        if (!raw.empty() && raw.front() == '<') raw.remove_prefix(1);
        if (!raw.empty() && raw.back() == '>') raw.remove_suffix(1);
        return decodeHex(raw);
    }
    return std::string(raw);
}

std::pair<std::string, std::vector<double>> ContentStreamParser::parseTjArray(std::string_view array) {
    std::string_view inner = array;
    if (!inner.empty() && inner.front() == '[') inner.remove_prefix(1);
    if (!inner.empty() && inner.back() == ']') inner.remove_suffix(1);

    std::string text;
    std::vector<double> adjustments;
    for (const auto& element : tokenize(inner)) {
        if (element.kind == TokenKind::LiteralString || element.kind == TokenKind::HexString) {
            text += decodeString(element);
        } else if (element.kind == TokenKind::Number) {
            double value = 0.0;
            if (parseNumber(element.text, value)) adjustments.push_back(value);
        }
    }
    return {std::move(text), std::move(adjustments)};
}

//=============================================================================
// Main parse loop
//=============================================================================

void ContentStreamParser::reset() {
    _operands.clear();
    _state = TextState{};
    _stateStack.clear();
    _inTextObject = false;
    _current = ParsedTextBlock{};
    _blocks.clear();
}

std::vector<ParsedTextBlock> ContentStreamParser::parse(std::string_view content) {
    reset();

    for (auto& token : tokenize(content)) {
        if (token.kind == TokenKind::Operator) {
            dispatchOperator(token);
            _operands.clear();
        } else {
            _operands.push_back(std::move(token));
        }
    }

    // Stream ended inside BT: keep what was resolved
    if (_inTextObject && !_current.operations.empty()) {
        ydebug("ContentStreamParser: unterminated text object at end of stream");
        _current.endOffset = content.size();
        _blocks.push_back(std::move(_current));
    }
    _current = ParsedTextBlock{};
    _inTextObject = false;

    if (!_stateStack.empty()) {
        ydebug("ContentStreamParser: {} unbalanced q at end of stream", _stateStack.size());
    }

    return _blocks;
}

std::vector<TextShowOperation> ContentStreamParser::allOperations() const {
    std::vector<TextShowOperation> out;
    for (const auto& block : _blocks) {
        out.insert(out.end(), block.operations.begin(), block.operations.end());
    }
    return out;
}

//=============================================================================
// Operator dispatch
//=============================================================================

void ContentStreamParser::dispatchOperator(const Token& token) {
    const char* op = token.text.c_str();

    // Graphics state
    if (std::strcmp(op, "q") == 0)  { handleQ(); return; }
    if (std::strcmp(op, "Q") == 0)  { handleQr(); return; }
    if (std::strcmp(op, "cm") == 0) { handleCm(); return; }

    // Text object
    if (std::strcmp(op, "BT") == 0) { handleBT(token); return; }
    if (std::strcmp(op, "ET") == 0) { handleET(token); return; }

    // Text state
    if (std::strcmp(op, "Tf") == 0) { handleTf(); return; }
    if (std::strcmp(op, "Tc") == 0) { handleTc(); return; }
    if (std::strcmp(op, "Tw") == 0) { handleTw(); return; }
    if (std::strcmp(op, "Tz") == 0) { handleTz(); return; }
    if (std::strcmp(op, "TL") == 0) { handleTL(); return; }
    if (std::strcmp(op, "Tr") == 0) { handleTr(); return; }
    if (std::strcmp(op, "Ts") == 0) { handleTs(); return; }

    // Everything below needs an open text object
    if (!_inTextObject) return;

    // Text positioning
    if (std::strcmp(op, "Td") == 0) { handleTd(); return; }
    if (std::strcmp(op, "TD") == 0) { handleTD(); return; }
    if (std::strcmp(op, "Tm") == 0) { handleTm(); return; }
    if (std::strcmp(op, "T*") == 0) { handleTstar(); return; }

    // Text showing
    if (std::strcmp(op, "Tj") == 0) { handleTj(token); return; }
    if (std::strcmp(op, "TJ") == 0) { handleTJ(token); return; }
    if (std::strcmp(op, "'") == 0)  { handleQuote(token); return; }
    if (std::strcmp(op, "\"") == 0) { handleDblQuote(token); return; }
}

//=============================================================================
// Operand helpers
//=============================================================================

const ContentStreamParser::Token* ContentStreamParser::operandAt(size_t fromTop) const {
    if (fromTop >= _operands.size()) return nullptr;
    return &_operands[_operands.size() - 1 - fromTop];
}

bool ContentStreamParser::numberAt(size_t fromTop, double& out) const {
    const Token* tok = operandAt(fromTop);
    if (!tok || tok->kind != TokenKind::Number) return false;
    return parseNumber(tok->text, out);
}

//=============================================================================
// Text object operators
//=============================================================================

void ContentStreamParser::handleBT(const Token& op) {
    if (_inTextObject) {
        ydebug("ContentStreamParser: nested BT at offset {}", op.offset);
        if (!_current.operations.empty()) {
            _current.endOffset = op.offset;
            _blocks.push_back(std::move(_current));
        }
    }
    _inTextObject = true;
    _state.textMatrix = TransformMatrix::identity();
    _state.textLineMatrix = TransformMatrix::identity();
    _current = ParsedTextBlock{};
    _current.startOffset = op.offset;
}

void ContentStreamParser::handleET(const Token& op) {
    if (!_inTextObject) {
        ydebug("ContentStreamParser: ET without BT at offset {}", op.offset);
        return;
    }
    if (!_current.operations.empty()) {
        _current.endOffset = op.offset;
        _blocks.push_back(std::move(_current));
    }
    _current = ParsedTextBlock{};
    _inTextObject = false;
}

//=============================================================================
// Text state operators
//=============================================================================

void ContentStreamParser::handleTf() {
    // Operands: /FontName fontSize
    double size = 0.0;
    const Token* name = operandAt(1);
    if (!name || name->kind != TokenKind::Name || !numberAt(0, size)) return;

    _state.fontResource = name->text;
    auto it = _fontMap.find(name->text);
    _state.fontName = (it != _fontMap.end()) ? it->second : name->text;
    _state.fontSize = size;
}

void ContentStreamParser::handleTc() {
    double v;
    if (numberAt(0, v)) _state.charSpacing = v;
}

void ContentStreamParser::handleTw() {
    double v;
    if (numberAt(0, v)) _state.wordSpacing = v;
}

void ContentStreamParser::handleTz() {
    double v;
    if (numberAt(0, v)) _state.horizontalScaling = v;
}

void ContentStreamParser::handleTL() {
    double v;
    if (numberAt(0, v)) _state.leading = v;
}

void ContentStreamParser::handleTr() {
    double v;
    if (numberAt(0, v)) _state.renderMode = static_cast<int>(v);
}

void ContentStreamParser::handleTs() {
    double v;
    if (numberAt(0, v)) _state.rise = v;
}

//=============================================================================
// Text positioning operators
//=============================================================================

void ContentStreamParser::moveTextPosition(double tx, double ty) {
    const auto& lm = _state.textLineMatrix;
    TransformMatrix next{lm.a, lm.b, lm.c, lm.d,
                         lm.a * tx + lm.c * ty + lm.e,
                         lm.b * tx + lm.d * ty + lm.f};
    _state.textLineMatrix = next;
    _state.textMatrix = next;
}

void ContentStreamParser::advanceTextMatrix(double tx) {
    // Tm = [1 0 0 1 tx 0] × Tm
    _state.textMatrix = TransformMatrix::translation(tx, 0.0).multiply(_state.textMatrix);
}

void ContentStreamParser::handleTd() {
    // Operands: tx ty
    double tx, ty;
    if (numberAt(1, tx) && numberAt(0, ty)) moveTextPosition(tx, ty);
}

void ContentStreamParser::handleTD() {
    // Same as: -ty TL  tx ty Td
    double tx, ty;
    if (numberAt(1, tx) && numberAt(0, ty)) {
        _state.leading = -ty;
        moveTextPosition(tx, ty);
    }
}

void ContentStreamParser::handleTm() {
    // Operands: a b c d e f
    double v[6];
    for (size_t i = 0; i < 6; i++) {
        if (!numberAt(5 - i, v[i])) return;
    }
    TransformMatrix m{v[0], v[1], v[2], v[3], v[4], v[5]};
    _state.textMatrix = m;
    _state.textLineMatrix = m;
}

void ContentStreamParser::handleTstar() {
    // T* is equivalent to: 0 -TL Td
    moveTextPosition(0.0, -_state.leading);
}

//=============================================================================
// Text showing operators
//=============================================================================

void ContentStreamParser::emitText(std::string text, ShowOperator op, const Token& operand,
                                   std::vector<double> adjustments, size_t offset) {
    TextShowOperation event;
    event.text = std::move(text);
    event.op = op;
    event.state = _state;
    event.glyphAdjustments = std::move(adjustments);
    event.rawOperand = operand.text;
    event.streamOffset = offset;

    if (_advanceCallback) {
        double hScale = _state.horizontalScaling / 100.0;
        if (op == ShowOperator::TJ) {
            // Walk the array so string advances and numeric kerns interleave
            std::string_view inner = operand.text;
            if (!inner.empty() && inner.front() == '[') inner.remove_prefix(1);
            if (!inner.empty() && inner.back() == ']') inner.remove_suffix(1);
            for (const auto& element : tokenize(inner)) {
                if (element.kind == TokenKind::Number) {
                    double adj = 0.0;
                    if (!parseNumber(element.text, adj)) continue;
                    advanceTextMatrix(-adj / 1000.0 * _state.fontSize * hScale);
                } else if (element.kind == TokenKind::LiteralString ||
                           element.kind == TokenKind::HexString) {
                    advanceTextMatrix(_advanceCallback(decodeString(element), _state) * hScale);
                }
            }
        } else {
            advanceTextMatrix(_advanceCallback(event.text, _state) * hScale);
        }
    }

    _current.operations.push_back(std::move(event));
}

void ContentStreamParser::handleTj(const Token& op) {
    const Token* str = operandAt(0);
    if (!str || (str->kind != TokenKind::LiteralString && str->kind != TokenKind::HexString)) {
        ydebug("ContentStreamParser: Tj without string operand at offset {}", op.offset);
        return;
    }
    emitText(decodeString(*str), ShowOperator::Tj, *str, {}, op.offset);
}

void ContentStreamParser::handleTJ(const Token& op) {
    const Token* arr = operandAt(0);
    if (!arr || arr->kind != TokenKind::Array) {
        ydebug("ContentStreamParser: TJ without array operand at offset {}", op.offset);
        return;
    }
    auto [text, adjustments] = parseTjArray(arr->text);
    emitText(std::move(text), ShowOperator::TJ, *arr, std::move(adjustments), op.offset);
}

void ContentStreamParser::handleQuote(const Token& op) {
    // ' is: T*  string Tj
    handleTstar();
    const Token* str = operandAt(0);
    if (!str || (str->kind != TokenKind::LiteralString && str->kind != TokenKind::HexString)) return;
    emitText(decodeString(*str), ShowOperator::NextLineShow, *str, {}, op.offset);
}

void ContentStreamParser::handleDblQuote(const Token& op) {
    // " is: aw Tw  ac Tc  string '
    const Token* str = operandAt(0);
    if (!str || _operands.size() < 3) return;

    double aw, ac;
    if (numberAt(2, aw)) _state.wordSpacing = aw;
    if (numberAt(1, ac)) _state.charSpacing = ac;
    handleTstar();
    if (str->kind != TokenKind::LiteralString && str->kind != TokenKind::HexString) return;
    emitText(decodeString(*str), ShowOperator::SpacedShow, *str, {}, op.offset);
}

//=============================================================================
// Graphics state operators
//=============================================================================

void ContentStreamParser::handleCm() {
    double v[6];
    for (size_t i = 0; i < 6; i++) {
        if (!numberAt(5 - i, v[i])) return;
    }
    TransformMatrix m{v[0], v[1], v[2], v[3], v[4], v[5]};
    _state.ctm = m * _state.ctm;
}

void ContentStreamParser::handleQ() {
    _stateStack.push_back(_state);
}

void ContentStreamParser::handleQr() {
    if (_stateStack.empty()) {
        ydebug("ContentStreamParser: Q with empty state stack");
        return;
    }
    // Tm and Tlm live in the text object, not the graphics state
    TransformMatrix tm = _state.textMatrix;
    TransformMatrix tlm = _state.textLineMatrix;
    _state = std::move(_stateStack.back());
    _stateStack.pop_back();
    _state.textMatrix = tm;
    _state.textLineMatrix = tlm;
}

//=============================================================================
// Convenience
//=============================================================================

std::vector<ParsedTextBlock> parseContentStream(std::string_view content,
                                                const std::map<std::string, std::string>& fontMap) {
    ContentStreamParser parser;
    parser.setFontMap(fontMap);
    return parser.parse(content);
}

} // namespace retext
