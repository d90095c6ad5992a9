#include "../include/rag_context.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <set>
#include <sstream>

std::vector<ScoredPoint> Retriever::search(const std::string& index, const std::vector<float>& embedding,
                                           std::optional<int> limit) {
    try {
        return store_.query(index, embedding, limit.value_or(default_limit_));
    } catch (const BackendError& e) {
        throw RetrievalError(e.kind(), "search in " + index + " failed: " + e.what());
    }
}

// Payload keys that hold vectors or document blobs rather than text.
static const std::set<std::string> kSkippedFields = {
    "vector", "embedding", "pdf", "describe_pdf_data", "portfolio_detail_pdf_data",
};

std::string format_documents(const std::vector<ScoredPoint>& hits, const std::vector<std::string>& fields) {
    if (hits.empty()) return "No relevant documents found.";
    std::string out;
    for (const auto& hit : hits) {
        char score[32];
        std::snprintf(score, sizeof(score), "%.4f", hit.score);
        out += "Document ID: " + hit.id + " (Score: " + score + ")\n";
        if (!hit.payload.is_object()) {
            out += "  - Document content is not a valid JSON object.\n\n";
            continue;
        }
        for (auto it = hit.payload.begin(); it != hit.payload.end(); ++it) {
            if (kSkippedFields.count(it.key())) continue;
            if (!fields.empty() && std::find(fields.begin(), fields.end(), it.key()) == fields.end()) continue;
            const auto& v = it.value();
            out += "  - " + it.key() + ": " + (v.is_string() ? v.get<std::string>() : v.dump()) + "\n";
        }
        out += "\n";
    }
    return out;
}

static std::string without(const std::string& s, const char* chars) {
    std::string out;
    for (char c : s) {
        if (!std::strchr(chars, c)) out.push_back(c);
    }
    return out;
}

std::optional<std::string> select_field(const std::string& question, const std::vector<std::string>& fields) {
    std::string q = to_lower(trim(question));
    while (!q.empty() && std::ispunct((unsigned char)q.back())) q.pop_back();
    auto from = q.find(" from ");
    if (from != std::string::npos) q.erase(from);

    std::vector<std::string> words;
    std::istringstream ss(q);
    for (std::string w; ss >> w;) words.push_back(w);
    static const std::set<std::string> kVerbs = {"list", "show", "give", "tell", "what", "find"};
    if (!words.empty() && kVerbs.count(words.front())) words.erase(words.begin());
    if (words.empty()) return std::nullopt;

    const std::string term = without(words.back(), "_- ");
    for (const auto& f : fields) {
        if (without(to_lower(f), "_") == term) return f;
    }

    const std::string* best = nullptr;
    double best_score = 0.0;
    for (const auto& f : fields) {
        double score = jaro_winkler(term, without(to_lower(f), "_"));
        if (score > best_score) {
            best_score = score;
            best = &f;
        }
    }
    if (best && best_score >= 0.85) return *best;
    return std::nullopt;
}
