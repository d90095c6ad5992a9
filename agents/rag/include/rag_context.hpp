#pragma once
#include "store.hpp"
#include <optional>
#include <string>
#include <vector>

// Similarity search against a resolved index. Throws RetrievalError.
class Retriever {
public:
    Retriever(VectorStore& store, int default_limit) : store_(store), default_limit_(default_limit) {}

    std::vector<ScoredPoint> search(const std::string& index, const std::vector<float>& embedding,
                                    std::optional<int> limit = std::nullopt);
    int default_limit() const { return default_limit_; }

private:
    VectorStore& store_;
    int default_limit_;
};

// "Document ID: <id> (Score: x.xxxx)" blocks with "  - field: value" lines.
// When `fields` is non-empty only those payload fields are rendered.
std::string format_documents(const std::vector<ScoredPoint>& hits,
                             const std::vector<std::string>& fields = {});

// Picks the schema field the question asks about, judged by its last word.
std::optional<std::string> select_field(const std::string& question, const std::vector<std::string>& fields);
