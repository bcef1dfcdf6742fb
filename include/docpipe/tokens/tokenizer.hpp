/*
 * docpipe C++17 - Tokenizers
 *
 * A Tokenizer maps text to a sub-word unit count. Both implementations
 * share one cl100k-style pre-tokenizer so piece boundaries agree:
 *
 *   HeuristicTokenizer - deterministic per-piece cost model, no data files
 *   BpeTokenizer       - byte-pair merges over a .tiktoken rank table
 */
#ifndef docpipe_TOKENS_TOKENIZER_HPP
#define docpipe_TOKENS_TOKENIZER_HPP

#include <string>
#include <cstddef>

namespace docpipe {

enum class PieceKind {
    WORD,           // letters, optionally with one leading space
    NUMBER,         // up to three digits
    PUNCTUATION,    // symbol run, optionally with one leading space
    NEWLINE,        // whitespace run ending in a line break
    WHITESPACE      // horizontal whitespace run
};

// Length in bytes of the piece starting at `pos`; never 0 while pos < text.size()
size_t next_piece(const std::string& text, size_t pos, PieceKind& kind);

class Tokenizer {
public:
    virtual ~Tokenizer() {}

    virtual size_t count(const std::string& text) const = 0;
    virtual const char* name() const = 0;

    // True when counts come from the real encoding rather than an estimate
    virtual bool exact() const = 0;
};

// Cost model over pre-tokenized pieces. Counts are deterministic and never
// decrease when text is appended.
class HeuristicTokenizer : public Tokenizer {
public:
    size_t count(const std::string& text) const override;
    const char* name() const override { return "heuristic-cl100k"; }
    bool exact() const override { return false; }

    static size_t piece_cost(const std::string& text, size_t begin, size_t len, PieceKind kind);
};

} // namespace docpipe

#endif // docpipe_TOKENS_TOKENIZER_HPP
