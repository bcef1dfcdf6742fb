/*
 * docpipe C++17 - Document Chunker
 *
 * Splits sanitized text into token-budgeted chunks. Text is segmented into
 * paragraph sections (long ones split at sentences, then at punctuation or
 * whitespace), packed greedily under the budget, and each chunk after the
 * first is prefixed with a bounded tail of the previous chunk's body.
 *
 * Chunks are contiguous spans of the input: the body of chunk k is
 * text[body_offset, body_offset + body length), and the bodies in order
 * reproduce the input exactly.
 */
#ifndef docpipe_CHUNK_DOCUMENT_CHUNKER_HPP
#define docpipe_CHUNK_DOCUMENT_CHUNKER_HPP

#include <docpipe/core/types.hpp>
#include <docpipe/tokens/token_counter.hpp>
#include <string>
#include <vector>

namespace docpipe {

// ============================================================================
// Chunking parameters and output
// ============================================================================

struct ChunkerOptions {
    size_t max_tokens_per_chunk;    // budget, valid range [100, 32000]
    size_t overlap_tokens;          // requested overlap, capped at a quarter of the budget
    std::string model;              // token counting profile
    size_t max_chunks;              // packing stops early at this many chunks
    size_t max_document_length;     // bytes
    size_t section_soft_cap;        // sections longer than this are split at sentences
    size_t max_slice_chars;         // ceiling for character slicing of giant sentences
    size_t preview_chars;

    ChunkerOptions()
        : max_tokens_per_chunk(6000), overlap_tokens(200), model("gpt-4"), max_chunks(100)
        , max_document_length(10 * 1024 * 1024), section_soft_cap(3000), max_slice_chars(10000)
        , preview_chars(200) {}
};

struct TextChunk {
    size_t index;               // 1-based
    std::string text;           // overlap prefix + body
    size_t token_count;
    size_t char_count;
    size_t word_count;
    std::string preview;
    size_t sentence_count;
    bool has_overlap;
    size_t overlap_length;      // bytes of `text` repeated from the previous chunk
    size_t body_offset;         // byte offset of the body in the chunked text

    TextChunk()
        : index(0), token_count(0), char_count(0), word_count(0), sentence_count(0)
        , has_overlap(false), overlap_length(0), body_offset(0) {}

    std::string body() const { return text.substr(overlap_length); }
    Json to_json(bool include_text) const;
};

struct ChunkingStats {
    size_t total_chunks;
    size_t total_tokens;
    size_t average_tokens;
    size_t min_tokens;
    size_t max_tokens;
    double efficiency;          // average / budget, percent

    ChunkingStats()
        : total_chunks(0), total_tokens(0), average_tokens(0), min_tokens(0), max_tokens(0)
        , efficiency(0.0) {}

    Json to_json() const;
};

struct ChunkingResult {
    std::vector<TextChunk> chunks;
    ChunkingStats stats;
    bool truncated;             // chunk cap reached before the end of the text
    size_t effective_overlap_tokens;

    ChunkingResult() : truncated(false), effective_overlap_tokens(0) {}

    Json to_json(bool include_text) const;
};

class DocumentChunker {
public:
    static constexpr size_t MIN_TOKENS_PER_CHUNK = 100;
    static constexpr size_t MAX_TOKENS_PER_CHUNK = 32000;

    explicit DocumentChunker(const TokenCounter& counter);

    // Parameter check only; used to fail jobs before any work starts
    static bool check_options(const ChunkerOptions& options, std::string& error);

    Result<ChunkingResult> chunk(const std::string& text, const ChunkerOptions& options,
                                 const CancelToken* cancel = nullptr) const;

private:
    const TokenCounter& counter_;
};

} // namespace docpipe

#endif // docpipe_CHUNK_DOCUMENT_CHUNKER_HPP
