#pragma once
#include "embedder.hpp"
#include "semantic.hpp"
#include <string>
#include <cstddef>

struct ChronicleConfig {
    std::string db_path{"~/.chronicle/memory.db"};
    std::string semantic_db_path{"~/.chronicle/semantic.db"};
    std::string index_path{"~/.chronicle/notes"};
    EmbedConfig embed;
    ChunkingOptions chunking;
    int api_port{7100};
};

// Reads CHRONICLE_* / OLLAMA_URL from the environment over the defaults above.
// Throws std::invalid_argument when a numeric variable does not parse.
ChronicleConfig load_config();

// Parses a vector dimension; `what` names the source in the error.
// Throws std::invalid_argument on a malformed or negative value.
std::size_t parse_dimension(const std::string& value, const std::string& what);

// Expands '~' in the path fields.
void resolve_paths(ChronicleConfig& cfg);
