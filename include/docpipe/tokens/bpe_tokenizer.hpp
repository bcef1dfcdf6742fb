/*
 * docpipe C++17 - Byte-pair encoding tokenizer
 *
 * Loads a tiktoken rank table ("<base64 token> <rank>" per line) and counts
 * tokens by merging byte pairs in rank order within each pre-tokenized
 * piece. With the cl100k_base table this is the GPT-4 family encoding.
 */
#ifndef docpipe_TOKENS_BPE_TOKENIZER_HPP
#define docpipe_TOKENS_BPE_TOKENIZER_HPP

#include <docpipe/tokens/tokenizer.hpp>
#include <memory>
#include <string>
#include <unordered_map>

namespace docpipe {

class BpeTokenizer : public Tokenizer {
public:
    // Empty rank table; populated by load_file or load_string
    BpeTokenizer() {}

    // Returns null and fills `error` when the file is missing or malformed
    static std::unique_ptr<BpeTokenizer> load_file(const std::string& path, std::string& error);
    static std::unique_ptr<BpeTokenizer> load_string(const std::string& ranks_text, std::string& error);

    size_t count(const std::string& text) const override;
    const char* name() const override { return "bpe-tiktoken"; }
    bool exact() const override { return true; }

    size_t vocab_size() const { return ranks_.size(); }

private:
    size_t count_piece(const std::string& piece) const;
    int rank_of(const std::string& bytes) const;

    std::unordered_map<std::string, int> ranks_;
};

} // namespace docpipe

#endif // docpipe_TOKENS_BPE_TOKENIZER_HPP
