/*
 * docpipe C++17 - Document Chunker Implementation
 */
#include <docpipe/chunk/document_chunker.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <algorithm>
#include <cmath>

namespace docpipe {

namespace {

// Half-open byte range of the source text with its reference token count
struct Span {
    size_t begin;
    size_t end;
    size_t raw;

    Span(size_t b, size_t e) : begin(b), end(e), raw(0) {}
};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool is_sentence_end(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool is_upper(char c) {
    return c >= 'A' && c <= 'Z';
}

bool is_continuation(const std::string& t, size_t i) {
    return i < t.size() && (static_cast<unsigned char>(t[i]) & 0xC0) == 0x80;
}

bool all_space(const std::string& t, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        if (!is_space(t[i])) return false;
    }
    return true;
}

// Sentence starts in [begin, end): begin itself, plus every uppercase letter
// that follows sentence-end punctuation and whitespace.
std::vector<size_t> sentence_starts(const std::string& t, size_t begin, size_t end) {
    std::vector<size_t> starts;
    starts.push_back(begin);
    for (size_t i = begin; i < end; ++i) {
        if (!is_sentence_end(t[i])) continue;
        size_t j = i + 1;
        while (j < end && is_space(t[j])) ++j;
        if (j > i + 1 && j < end && is_upper(t[j])) {
            starts.push_back(j);
        }
        i = j - 1;
    }
    return starts;
}

// Word starts in (begin, end): first non-space byte after whitespace
std::vector<size_t> word_starts(const std::string& t, size_t begin, size_t end) {
    std::vector<size_t> starts;
    for (size_t i = begin + 1; i < end; ++i) {
        if (!is_space(t[i]) && is_space(t[i - 1])) {
            starts.push_back(i);
        }
    }
    return starts;
}

// Sections end after a run of blank lines; the separator stays with the
// section before it so sections tile the text.
std::vector<Span> split_sections(const std::string& t) {
    std::vector<Span> sections;
    size_t start = 0;
    size_t i = 0;
    const size_t n = t.size();
    while (i < n) {
        if (t[i] != '\n') {
            ++i;
            continue;
        }
        size_t j = i + 1;
        while (j < n && (t[j] == ' ' || t[j] == '\t' || t[j] == '\r')) ++j;
        if (j >= n || t[j] != '\n') {
            i = j;
            continue;
        }
        size_t last_newline = j;
        size_t k = j + 1;
        while (k < n && is_space(t[k])) {
            if (t[k] == '\n') last_newline = k;
            ++k;
        }
        size_t boundary = last_newline + 1;
        if (boundary < n) {
            sections.push_back(Span(start, boundary));
            start = boundary;
        }
        i = boundary;
    }
    if (start < n) {
        sections.push_back(Span(start, n));
    }
    return sections;
}

// Cut point in (begin, begin + cap] for a span longer than cap. Prefers
// sentence punctuation in the back half, then whitespace past 30%, then a
// hard cut on a UTF-8 boundary.
size_t find_cut(const std::string& t, size_t begin, size_t end, size_t cap) {
    if (end - begin <= cap) return end;
    if (cap == 0) cap = 1;
    size_t limit = begin + cap;

    size_t punct_floor = begin + cap / 2;
    for (size_t p = limit; p > punct_floor; --p) {
        if (is_sentence_end(t[p - 1])) return p;
    }
    size_t space_floor = begin + (cap * 3) / 10;
    for (size_t w = limit; w > space_floor; --w) {
        if (is_space(t[w - 1])) return w;
    }

    size_t cut = limit;
    while (cut > begin + 1 && is_continuation(t, cut)) --cut;
    if (cut == begin + 1 && is_continuation(t, cut)) {
        cut = limit;
        while (cut < end && is_continuation(t, cut)) ++cut;
    }
    return cut;
}

size_t count_sentences(const std::string& s) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_sentence_end(s[i])) continue;
        size_t j = i;
        while (j + 1 < s.size() && is_sentence_end(s[j + 1])) ++j;
        if (j + 1 == s.size() || is_space(s[j + 1])) ++count;
        i = j;
    }
    if (count == 0 && !all_space(s, 0, s.size())) count = 1;
    return count;
}

class Packer {
public:
    Packer(const std::string& text, const ChunkerOptions& options, const TokenMeasure& measure,
           size_t overlap_budget, const CancelToken* cancel)
        : text_(text), options_(options), measure_(measure), budget_(options.max_tokens_per_chunk)
        , overlap_budget_(overlap_budget), unit_budget_(budget_ - overlap_budget), cancel_(cancel) {}

    bool cancelled() const { return cancel_ && cancel_->cancelled(); }

    // Sections no longer than the soft cap, covering the text
    bool build_sections(std::vector<Span>& out) {
        std::vector<Span> sections = split_sections(text_);
        for (size_t s = 0; s < sections.size(); ++s) {
            if (cancelled()) return false;
            const Span& sec = sections[s];
            if (sec.end - sec.begin <= options_.section_soft_cap) {
                out.push_back(sec);
                continue;
            }
            split_long_section(sec, out);
        }
        return true;
    }

    // Sections whose token count exceeds the unit budget are broken down
    // to sentences, and oversized sentences to character slices.
    bool build_units(const std::vector<Span>& sections, std::vector<Span>& units) {
        for (size_t s = 0; s < sections.size(); ++s) {
            if (cancelled()) return false;
            Span sec = sections[s];
            sec.raw = measure_.raw(slice(sec));
            if (measure_.scale(sec.raw) <= unit_budget_) {
                units.push_back(sec);
                continue;
            }
            std::vector<size_t> starts = sentence_starts(text_, sec.begin, sec.end);
            for (size_t k = 0; k < starts.size(); ++k) {
                Span sent(starts[k], k + 1 < starts.size() ? starts[k + 1] : sec.end);
                sent.raw = measure_.raw(slice(sent));
                if (measure_.scale(sent.raw) <= unit_budget_) {
                    units.push_back(sent);
                } else {
                    slice_by_characters(sent, units);
                }
            }
        }
        return true;
    }

    size_t select_overlap(size_t body_begin, size_t body_end) const {
        if (overlap_budget_ == 0 || body_end <= body_begin + 1) return body_end;

        // Whole trailing sentences
        std::vector<size_t> sentences = sentence_starts(text_, body_begin, body_end);
        size_t best = widest_fitting_tail(sentences, body_begin, body_end);
        if (best != body_end) return best;

        // Trailing words
        std::vector<size_t> words = word_starts(text_, body_begin, body_end);
        best = widest_fitting_tail(words, body_begin, body_end);
        if (best != body_end) return best;

        // Trailing code points
        size_t lo = 0;
        size_t hi = std::min(body_end - body_begin - 1, overlap_budget_ * 8);
        while (lo < hi) {
            size_t mid = lo + (hi - lo + 1) / 2;
            if (tail_fits(align_forward(body_end - mid, body_end), body_end)) lo = mid;
            else hi = mid - 1;
        }
        return lo == 0 ? body_end : align_forward(body_end - lo, body_end);
    }

    std::string slice(const Span& s) const {
        return text_.substr(s.begin, s.end - s.begin);
    }

private:
    void split_long_section(const Span& sec, std::vector<Span>& out) const {
        const size_t cap = options_.section_soft_cap;
        std::vector<size_t> starts = sentence_starts(text_, sec.begin, sec.end);
        size_t group_begin = sec.begin;
        size_t group_end = sec.begin;
        for (size_t k = 0; k < starts.size(); ++k) {
            size_t s_begin = starts[k];
            size_t s_end = k + 1 < starts.size() ? starts[k + 1] : sec.end;

            if (s_end - group_begin <= cap) {
                group_end = s_end;
                continue;
            }
            if (group_end > group_begin) {
                out.push_back(Span(group_begin, group_end));
                group_begin = group_end;
            }
            if (s_end - s_begin <= cap) {
                group_end = s_end;
                continue;
            }
            // Single sentence over the cap
            size_t pos = s_begin;
            while (s_end - pos > cap) {
                size_t cut = find_cut(text_, pos, s_end, cap);
                out.push_back(Span(pos, cut));
                pos = cut;
            }
            group_begin = pos;
            group_end = s_end;
        }
        if (group_end > group_begin) {
            out.push_back(Span(group_begin, group_end));
        }
    }

    void slice_by_characters(const Span& sent, std::vector<Span>& units) const {
        const size_t initial_cap = std::min(budget_ * 3, options_.max_slice_chars);
        size_t pos = sent.begin;
        while (pos < sent.end) {
            size_t cap = initial_cap;
            size_t cut = find_cut(text_, pos, sent.end, cap);
            size_t raw = measure_.raw(text_.substr(pos, cut - pos));
            while (measure_.scale(raw) > unit_budget_ && cap > 1) {
                cap /= 2;
                cut = find_cut(text_, pos, sent.end, cap);
                raw = measure_.raw(text_.substr(pos, cut - pos));
            }
            if (cut < sent.end && all_space(text_, cut, sent.end)) {
                cut = sent.end;
                raw = measure_.raw(text_.substr(pos, cut - pos));
            }
            Span piece(pos, cut);
            piece.raw = raw;
            units.push_back(piece);
            pos = cut;
        }
    }

    bool tail_fits(size_t start, size_t body_end) const {
        return start < body_end &&
               measure_.count(text_.substr(start, body_end - start)) <= overlap_budget_;
    }

    size_t align_forward(size_t pos, size_t limit) const {
        while (pos < limit && is_continuation(text_, pos)) ++pos;
        return pos;
    }

    // Earliest candidate whose tail to body_end fits the overlap budget.
    // Candidates ascend, so tails shrink and the fit predicate is monotone.
    size_t widest_fitting_tail(const std::vector<size_t>& candidates, size_t body_begin, size_t body_end) const {
        size_t lo = std::upper_bound(candidates.begin(), candidates.end(), body_begin) - candidates.begin();
        size_t hi = candidates.size();
        while (hi > lo && candidates[hi - 1] >= body_end) --hi;
        const size_t end_index = hi;
        while (lo < hi) {
            size_t mid = lo + (hi - lo) / 2;
            if (tail_fits(candidates[mid], body_end)) hi = mid;
            else lo = mid + 1;
        }
        return lo < end_index ? candidates[lo] : body_end;
    }

    const std::string& text_;
    const ChunkerOptions& options_;
    const TokenMeasure& measure_;
    size_t budget_;
    size_t overlap_budget_;
    size_t unit_budget_;
    const CancelToken* cancel_;
};

} // anonymous namespace

// ============================================================================
// Serialization
// ============================================================================

Json TextChunk::to_json(bool include_text) const {
    Json j;
    j["index"] = index;
    if (include_text) {
        j["text"] = text;
    }
    j["tokenCount"] = token_count;
    j["charCount"] = char_count;
    j["wordCount"] = word_count;
    j["preview"] = preview;
    j["sentenceCount"] = sentence_count;
    j["hasOverlap"] = has_overlap;
    j["overlapLength"] = overlap_length;
    j["bodyOffset"] = body_offset;
    return j;
}

Json ChunkingStats::to_json() const {
    Json j;
    j["totalChunks"] = total_chunks;
    j["totalTokens"] = total_tokens;
    j["avgTokensPerChunk"] = average_tokens;
    j["minTokens"] = min_tokens;
    j["maxTokens"] = max_tokens;
    j["efficiency"] = efficiency;
    return j;
}

Json ChunkingResult::to_json(bool include_text) const {
    Json j;
    Json list = Json::array();
    for (size_t i = 0; i < chunks.size(); ++i) {
        list.push_back(chunks[i].to_json(include_text));
    }
    j["chunks"] = list;
    j["stats"] = stats.to_json();
    j["truncated"] = truncated;
    j["overlapTokens"] = effective_overlap_tokens;
    return j;
}

// ============================================================================
// DocumentChunker
// ============================================================================

DocumentChunker::DocumentChunker(const TokenCounter& counter) : counter_(counter) {}

bool DocumentChunker::check_options(const ChunkerOptions& options, std::string& error) {
    if (options.max_tokens_per_chunk < MIN_TOKENS_PER_CHUNK ||
        options.max_tokens_per_chunk > MAX_TOKENS_PER_CHUNK) {
        error = "maxTokensPerChunk must be between " + std::to_string(MIN_TOKENS_PER_CHUNK) +
                " and " + std::to_string(MAX_TOKENS_PER_CHUNK) + ", got " +
                std::to_string(options.max_tokens_per_chunk);
        return false;
    }
    if (options.max_chunks == 0) {
        error = "maximum chunk count must be positive";
        return false;
    }
    if (options.section_soft_cap == 0 || options.max_slice_chars == 0) {
        error = "section and slice caps must be positive";
        return false;
    }
    return true;
}

Result<ChunkingResult> DocumentChunker::chunk(const std::string& text, const ChunkerOptions& options,
                                              const CancelToken* cancel) const {
    std::string error;
    if (!check_options(options, error)) {
        return Result<ChunkingResult>::fail(ErrorKind::CHUNKING, error);
    }
    if (all_space(text, 0, text.size())) {
        return Result<ChunkingResult>::fail(ErrorKind::CHUNKING, "No text to chunk");
    }
    if (text.size() > options.max_document_length) {
        return Result<ChunkingResult>::fail(ErrorKind::CHUNKING,
            "Document too long for chunking (" + std::to_string(text.size()) + " bytes, max " +
            std::to_string(options.max_document_length) + ")");
    }

    const size_t budget = options.max_tokens_per_chunk;
    const size_t overlap_budget = std::min(options.overlap_tokens, budget / 4);
    TokenMeasure measure = counter_.measure_for(options.model);
    Packer packer(text, options, measure, overlap_budget, cancel);

    std::vector<Span> sections;
    std::vector<Span> units;
    if (!packer.build_sections(sections) || !packer.build_units(sections, units)) {
        return Result<ChunkingResult>::fail(ErrorKind::TIMEOUT, "Chunking cancelled");
    }
    LOG_DEBUG("[DocumentChunker] %zu sections, %zu packing units, budget %zu, overlap %zu",
              sections.size(), units.size(), budget, overlap_budget);

    ChunkingResult result;
    result.effective_overlap_tokens = overlap_budget;

    size_t u = 0;
    size_t prev_body_begin = 0;
    size_t prev_body_end = 0;
    while (u < units.size()) {
        if (packer.cancelled()) {
            return Result<ChunkingResult>::fail(ErrorKind::TIMEOUT, "Chunking cancelled");
        }
        if (result.chunks.size() >= options.max_chunks) {
            result.truncated = true;
            LOG_WARN("[DocumentChunker] Chunk limit %zu reached at byte %zu of %zu, returning partial result",
                     options.max_chunks, units[u].begin, text.size());
            break;
        }

        const size_t body_begin = units[u].begin;
        size_t chunk_begin = body_begin;
        size_t running = 0;
        if (!result.chunks.empty()) {
            chunk_begin = packer.select_overlap(prev_body_begin, prev_body_end);
            if (chunk_begin < body_begin) {
                running = measure.raw(text.substr(chunk_begin, body_begin - chunk_begin));
            }
        }

        // The first unit always goes in; units are sized to fit beside an overlap
        size_t v = u;
        running += units[v].raw;
        ++v;
        while (v < units.size() && measure.scale(running + units[v].raw) <= budget) {
            running += units[v].raw;
            ++v;
        }
        const size_t body_end = units[v - 1].end;

        TextChunk c;
        c.index = result.chunks.size() + 1;
        c.text = text.substr(chunk_begin, body_end - chunk_begin);
        c.overlap_length = body_begin - chunk_begin;
        c.has_overlap = c.overlap_length > 0;
        c.body_offset = body_begin;
        c.token_count = std::max<size_t>(1, measure.count(c.text));
        c.char_count = utf8_length(c.text);
        c.word_count = count_words(c.text);
        c.preview = make_preview(c.text, options.preview_chars);
        c.sentence_count = count_sentences(c.text);
        result.chunks.push_back(c);

        prev_body_begin = body_begin;
        prev_body_end = body_end;
        u = v;
    }

    // Drop empty or over-budget chunks; keep the smallest one if none survive
    const size_t ceiling = budget + budget / 10;
    std::vector<TextChunk> kept;
    for (size_t i = 0; i < result.chunks.size(); ++i) {
        const TextChunk& c = result.chunks[i];
        if (c.text.empty() || c.token_count == 0 || c.token_count > ceiling) {
            LOG_WARN("[DocumentChunker] Dropping chunk %zu (%zu tokens, ceiling %zu)",
                     c.index, c.token_count, ceiling);
            continue;
        }
        kept.push_back(c);
    }
    if (kept.empty() && !result.chunks.empty()) {
        size_t best = 0;
        for (size_t i = 1; i < result.chunks.size(); ++i) {
            if (result.chunks[i].token_count < result.chunks[best].token_count) best = i;
        }
        kept.push_back(result.chunks[best]);
    }
    for (size_t i = 0; i < kept.size(); ++i) {
        kept[i].index = i + 1;
    }
    result.chunks.swap(kept);

    ChunkingStats& st = result.stats;
    st.total_chunks = result.chunks.size();
    for (size_t i = 0; i < result.chunks.size(); ++i) {
        size_t t = result.chunks[i].token_count;
        st.total_tokens += t;
        st.min_tokens = (i == 0) ? t : std::min(st.min_tokens, t);
        st.max_tokens = std::max(st.max_tokens, t);
    }
    if (st.total_chunks > 0) {
        double avg = static_cast<double>(st.total_tokens) / static_cast<double>(st.total_chunks);
        st.average_tokens = static_cast<size_t>(std::llround(avg));
        st.efficiency = std::round(avg * 100.0 / static_cast<double>(budget));
    }

    LOG_DEBUG("[DocumentChunker] %zu chunks, avg %zu tokens%s",
              st.total_chunks, st.average_tokens, result.truncated ? " (truncated)" : "");
    return Result<ChunkingResult>::ok(result);
}

} // namespace docpipe
