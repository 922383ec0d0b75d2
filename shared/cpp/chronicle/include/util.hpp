#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <stdexcept>

// Source path does not exist at index time.
class SourceNotFound : public std::runtime_error {
public:
    explicit SourceNotFound(const std::string& path)
        : std::runtime_error("source not found: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

// Source file is not valid UTF-8 text.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string getenv_or(const char* key, const std::string& def);
std::string expand_home(const std::string& path);
bool ensure_parent_dir(const std::filesystem::path& p);

std::string sha256_hex(const std::string& data);
// First 16 hex chars of SHA-256; dedup key for chunk text.
std::string content_fingerprint(const std::string& text);

std::string now_iso8601();

bool is_valid_utf8(const std::string& s);
std::string read_text_file(const std::filesystem::path& p);
std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::string& pattern);

// Overlapping word windows: `window_size` words per chunk, advancing by
// window_size - overlap. Throws std::invalid_argument on a degenerate window.
std::vector<std::string> chunk_words(const std::string& text, int window_size, int overlap);

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);
