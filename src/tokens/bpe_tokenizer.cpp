#include <docpipe/tokens/bpe_tokenizer.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

namespace docpipe {

namespace {

// Pieces longer than this are encoded in windows to bound the quadratic merge loop
const size_t MAX_PIECE_BYTES = 512;

bool decode_base64(const std::string& in, std::string& out) {
    if (in.empty() || in.size() % 4 != 0) return false;
    std::vector<unsigned char> buf(in.size() / 4 * 3 + 1);
    int n = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    if (n < 0) return false;
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t len = static_cast<size_t>(n);
    if (in[in.size() - 1] == '=') --len;
    if (in[in.size() - 2] == '=') --len;
    out.assign(reinterpret_cast<const char*>(buf.data()), len);
    return true;
}

} // anonymous namespace

std::unique_ptr<BpeTokenizer> BpeTokenizer::load_file(const std::string& path, std::string& error) {
    std::ifstream in(path.c_str(), std::ios::binary);
    if (!in) {
        error = "cannot open rank file '" + path + "'";
        return nullptr;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::unique_ptr<BpeTokenizer> tok = load_string(ss.str(), error);
    if (tok) {
        LOG_INFO("[BpeTokenizer] Loaded %zu ranks from %s", tok->vocab_size(), path.c_str());
    }
    return tok;
}

std::unique_ptr<BpeTokenizer> BpeTokenizer::load_string(const std::string& ranks_text, std::string& error) {
    std::unique_ptr<BpeTokenizer> tok = std::make_unique<BpeTokenizer>();
    std::istringstream lines(ranks_text);
    std::string line;
    size_t line_no = 0;
    while (std::getline(lines, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty()) continue;

        size_t space = line.find(' ');
        if (space == std::string::npos) {
            error = "line " + std::to_string(line_no) + ": expected '<token> <rank>'";
            return nullptr;
        }
        std::string bytes;
        if (!decode_base64(line.substr(0, space), bytes)) {
            error = "line " + std::to_string(line_no) + ": invalid base64 token";
            return nullptr;
        }
        char* end = nullptr;
        long rank = std::strtol(line.c_str() + space + 1, &end, 10);
        if (end == line.c_str() + space + 1 || rank < 0 || rank > INT_MAX) {
            error = "line " + std::to_string(line_no) + ": invalid rank";
            return nullptr;
        }
        tok->ranks_[bytes] = static_cast<int>(rank);
    }
    if (tok->ranks_.empty()) {
        error = "rank table is empty";
        return nullptr;
    }
    return tok;
}

int BpeTokenizer::rank_of(const std::string& bytes) const {
    std::unordered_map<std::string, int>::const_iterator it = ranks_.find(bytes);
    return it == ranks_.end() ? -1 : it->second;
}

size_t BpeTokenizer::count_piece(const std::string& piece) const {
    if (piece.empty()) return 0;
    if (rank_of(piece) >= 0) return 1;

    // Part boundaries; parts[i] spans [bounds[i], bounds[i+1])
    std::vector<size_t> bounds;
    bounds.reserve(piece.size() + 1);
    for (size_t i = 0; i <= piece.size(); ++i) {
        bounds.push_back(i);
    }

    while (bounds.size() > 2) {
        int best_rank = -1;
        size_t best_index = 0;
        for (size_t i = 0; i + 2 < bounds.size(); ++i) {
            int r = rank_of(piece.substr(bounds[i], bounds[i + 2] - bounds[i]));
            if (r >= 0 && (best_rank < 0 || r < best_rank)) {
                best_rank = r;
                best_index = i;
            }
        }
        if (best_rank < 0) break;
        bounds.erase(bounds.begin() + static_cast<std::ptrdiff_t>(best_index) + 1);
    }
    return bounds.size() - 1;
}

size_t BpeTokenizer::count(const std::string& text) const {
    size_t total = 0;
    size_t pos = 0;
    PieceKind kind;
    while (pos < text.size()) {
        size_t len = next_piece(text, pos, kind);
        for (size_t off = 0; off < len; off += MAX_PIECE_BYTES) {
            total += count_piece(text.substr(pos + off, std::min(MAX_PIECE_BYTES, len - off)));
        }
        pos += len;
    }
    return total;
}

} // namespace docpipe
