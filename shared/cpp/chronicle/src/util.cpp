#include "../include/util.hpp"
#include <openssl/sha.h>
#include <fnmatch.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <cmath>
#include <cstdlib>
#include <cstdio>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return (v && *v) ? std::string(v) : def;
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    std::string home = getenv_or("HOME", "");
    if (home.empty()) return path;
    return home + path.substr(1);
}

bool ensure_parent_dir(const std::filesystem::path& p) {
    auto parent = p.parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    return !ec;
}

std::string sha256_hex(const std::string& data) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::string content_fingerprint(const std::string& text) {
    return sha256_hex(text).substr(0, 16);
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    snprintf(out, sizeof(out), "%s.%06lld", buf, (long long)micros);
    return std::string(out);
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0, n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        int extra = 0;
        unsigned int cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;
        if (i + extra >= n) return false;
        for (int k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong encodings, surrogates, out of range
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

std::string read_text_file(const std::filesystem::path& p) {
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) throw SourceNotFound(p.string());
    if (!std::filesystem::is_regular_file(p, ec)) throw std::runtime_error("not a regular file: " + p.string());
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open file: " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    // rdbuf() of an empty file sets failbit on ss; only a bad stream is an error
    if (f.bad() || ss.bad()) throw std::runtime_error("failed reading file: " + p.string());
    std::string text = ss.str();
    if (!is_valid_utf8(text)) throw DecodeError("not valid UTF-8 text: " + p.string());
    return text;
}

std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::string& pattern) {
    std::vector<std::filesystem::path> out;
    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) throw SourceNotFound(root.string());
    if (std::filesystem::is_regular_file(root, ec)) {
        if (fnmatch(pattern.c_str(), root.filename().c_str(), 0) == 0) out.push_back(root);
        return out;
    }
    auto opts = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(root, opts, ec), end;
    if (ec) throw std::runtime_error("cannot list " + root.string() + ": " + ec.message());
    while (it != end) {
        std::error_code fec;
        const auto& entry = *it;
        if (entry.is_regular_file(fec) &&
            fnmatch(pattern.c_str(), entry.path().filename().c_str(), 0) == 0) {
            out.push_back(entry.path());
        } else if (fec) {
            std::cerr << "[chronicle] Skipping " << entry.path().string() << ": " << fec.message() << "\n";
            it.disable_recursion_pending();
        }
        it.increment(ec);
        if (ec) {
            // the iterator is unusable after a failed step; keep what was listed
            std::cerr << "[chronicle] Directory walk stopped under " << root.string() << ": "
                      << ec.message() << "\n";
            break;
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> chunk_words(const std::string& text, int window_size, int overlap) {
    if (window_size <= 0) throw std::invalid_argument("chunk window_size must be positive");
    if (overlap < 0) throw std::invalid_argument("chunk overlap must not be negative");
    if (overlap >= window_size) throw std::invalid_argument("chunk overlap must be less than window_size");

    std::vector<std::string> words;
    {
        std::istringstream ss(text);
        std::string w;
        while (ss >> w) words.push_back(std::move(w));
    }

    std::vector<std::string> chunks;
    const size_t step = static_cast<size_t>(window_size - overlap);
    for (size_t i = 0; i < words.size(); i += step) {
        size_t end = std::min(words.size(), i + static_cast<size_t>(window_size));
        std::string chunk;
        for (size_t j = i; j < end; ++j) {
            if (j > i) chunk += ' ';
            chunk += words[j];
        }
        chunks.push_back(std::move(chunk));
    }
    if (chunks.empty()) chunks.push_back(text);
    return chunks;
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += (double)a[i] * (double)b[i];
        na += (double)a[i] * (double)a[i];
        nb += (double)b[i] * (double)b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    double s = dot / (std::sqrt(na) * std::sqrt(nb));
    return (float)std::max(-1.0, std::min(1.0, s));
}
