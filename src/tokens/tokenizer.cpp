#include <docpipe/tokens/tokenizer.hpp>

namespace docpipe {

namespace {

enum CharClass {
    CC_LETTER,
    CC_DIGIT,
    CC_SPACE,       // horizontal whitespace
    CC_NEWLINE,
    CC_SYMBOL
};

// Bytes >= 0x80 belong to multi-byte UTF-8 sequences and are treated as letters
CharClass classify(unsigned char c) {
    if (c == '\n' || c == '\r') return CC_NEWLINE;
    if (c == ' ' || c == '\t' || c == '\v' || c == '\f') return CC_SPACE;
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c >= 0x80) return CC_LETTER;
    if (c >= '0' && c <= '9') return CC_DIGIT;
    return CC_SYMBOL;
}

inline CharClass class_at(const std::string& text, size_t i) {
    return classify(static_cast<unsigned char>(text[i]));
}

size_t scan_while(const std::string& text, size_t i, CharClass cc) {
    while (i < text.size() && class_at(text, i) == cc) ++i;
    return i;
}

// Decode one code point starting at i; returns its byte length
size_t decode_code_point(const std::string& text, size_t i, unsigned int& cp) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    size_t len = 1;
    if (c < 0x80) { cp = c; return 1; }
    if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; len = 2; }
    else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; len = 3; }
    else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; len = 4; }
    else { cp = c; return 1; }
    if (i + len > text.size()) { cp = c; return 1; }
    for (size_t k = 1; k < len; ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
    }
    return len;
}

size_t word_cost(size_t letters) {
    if (letters == 0) return 0;
    if (letters <= 4) return 1;
    if (letters <= 8) return 2;
    if (letters <= 12) return 3;
    return (letters + 3) / 4;
}

} // anonymous namespace

size_t next_piece(const std::string& text, size_t pos, PieceKind& kind) {
    const size_t n = text.size();
    if (pos >= n) {
        kind = PieceKind::WHITESPACE;
        return 0;
    }

    size_t i = pos;
    CharClass cc = class_at(text, i);

    // One leading space binds to a following word or symbol run
    if (text[i] == ' ' && i + 1 < n) {
        CharClass next = class_at(text, i + 1);
        if (next == CC_LETTER || next == CC_SYMBOL) {
            ++i;
            cc = next;
        }
    }

    switch (cc) {
        case CC_LETTER:
            kind = PieceKind::WORD;
            return scan_while(text, i, CC_LETTER) - pos;

        case CC_DIGIT: {
            kind = PieceKind::NUMBER;
            size_t end = i;
            while (end < n && end - i < 3 && class_at(text, end) == CC_DIGIT) ++end;
            return end - pos;
        }

        case CC_SYMBOL: {
            kind = PieceKind::PUNCTUATION;
            size_t end = scan_while(text, i, CC_SYMBOL);
            while (end < n && class_at(text, end) == CC_NEWLINE) ++end;
            return end - pos;
        }

        case CC_SPACE:
        case CC_NEWLINE: {
            size_t end = i;
            size_t last_newline = std::string::npos;
            while (end < n) {
                CharClass c = class_at(text, end);
                if (c == CC_NEWLINE) last_newline = end;
                else if (c != CC_SPACE) break;
                ++end;
            }
            if (last_newline != std::string::npos) {
                kind = PieceKind::NEWLINE;
                return last_newline + 1 - pos;
            }
            kind = PieceKind::WHITESPACE;
            // Leave the final space for the following word or symbol
            if (end < n && end - pos > 1 && text[end - 1] == ' ') {
                CharClass next = class_at(text, end);
                if (next == CC_LETTER || next == CC_SYMBOL) {
                    return end - 1 - pos;
                }
            }
            return end - pos;
        }
    }
    kind = PieceKind::PUNCTUATION;
    return 1;
}

size_t HeuristicTokenizer::piece_cost(const std::string& text, size_t begin, size_t len, PieceKind kind) {
    switch (kind) {
        case PieceKind::NUMBER:
        case PieceKind::NEWLINE:
        case PieceKind::WHITESPACE:
            return 1;

        case PieceKind::PUNCTUATION: {
            size_t symbols = 0;
            for (size_t i = begin; i < begin + len; ++i) {
                if (class_at(text, i) == CC_SYMBOL) ++symbols;
            }
            return symbols == 0 ? 1 : (symbols + 1) / 2;
        }

        case PieceKind::WORD: {
            // Latin-like letters share tokens; ideographic code points cost one each
            size_t letters = 0;
            size_t ideographs = 0;
            size_t i = begin;
            if (text[i] == ' ') ++i;
            while (i < begin + len) {
                unsigned int cp = 0;
                size_t step = decode_code_point(text, i, cp);
                if (cp >= 0x2E80) ++ideographs;
                else ++letters;
                i += step;
            }
            size_t cost = word_cost(letters) + ideographs;
            return cost == 0 ? 1 : cost;
        }
    }
    return 1;
}

size_t HeuristicTokenizer::count(const std::string& text) const {
    size_t total = 0;
    size_t pos = 0;
    PieceKind kind;
    while (pos < text.size()) {
        size_t len = next_piece(text, pos, kind);
        total += piece_cost(text, pos, len, kind);
        pos += len;
    }
    return total;
}

} // namespace docpipe
