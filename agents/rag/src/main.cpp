#include "../include/errors.hpp"
#include "../include/settings.hpp"
#include "../include/util.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

static void usage() {
    std::cerr << "rag_cli usage:\n"
              << "  ingest --index <name> --file <docs.json|docs.jsonl> [--reset]\n"
              << "  ask --question \"...\" [--conversation <id>]\n"
              << "Backends are configured from the environment as for rag_gateway.\n";
}

// A JSON array of objects, or one object per line.
static std::vector<json> read_documents(const std::string& path) {
    auto text = read_text_file(path);
    auto first = text.find_first_not_of(" \t\r\n");
    std::vector<json> docs;
    if (first != std::string::npos && text[first] == '[') {
        for (auto& d : json::parse(text)) docs.push_back(d);
        return docs;
    }
    std::istringstream ss(text);
    for (std::string line; std::getline(ss, line);) {
        if (trim(line).empty()) continue;
        docs.push_back(json::parse(line));
    }
    return docs;
}

static std::string document_text(const json& doc) {
    std::string out;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (it.key() == "id" || it.key() == "vector") continue;
        out += it.key() + ": " + (it.value().is_string() ? it.value().get<std::string>() : it.value().dump()) + "\n";
    }
    return out;
}

static int ingest(RagRuntime& rt, const std::string& index, const std::string& file, int dimension,
                  bool reset) {
    auto docs = read_documents(file);
    if (reset) {
        rt.documents().reset(to_lower(index));
        std::cout << "[OK] Cleared index: " << to_lower(index) << "\n";
    }
    rt.documents().ensure_collection(to_lower(index), dimension);
    int n = 0;
    for (auto& doc : docs) {
        if (!doc.is_object()) throw std::runtime_error("documents must be JSON objects");
        std::string id;
        if (doc.contains("id")) id = doc["id"].is_string() ? doc["id"].get<std::string>() : doc["id"].dump();
        else id = uuid_from_seed(doc.dump());
        auto vec = rt.embedder().embed(document_text(doc));
        doc.erase("vector");
        rt.documents().upsert(to_lower(index), id, vec, doc);
        ++n;
    }
    return n;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 0;
    try {
        Settings settings = Settings::from_env();
        configure_logging(settings.log_level);
        if (cmd == "ingest") {
            std::string index, file;
            bool reset = false;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--index" && i + 1 < argc) index = argv[++i];
                else if (a == "--file" && i + 1 < argc) file = argv[++i];
                else if (a == "--reset") reset = true;
            }
            if (index.empty() || file.empty()) { usage(); curl_global_cleanup(); return 2; }
            RagRuntime rt(settings);
            int n = ingest(rt, index, file, settings.cache.dimension, reset);
            std::cout << "[OK] Ingested documents: " << n << "\n";
        } else if (cmd == "ask") {
            std::string question;
            std::string conversation = "cli";
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--question" && i + 1 < argc) question = argv[++i];
                else if (a == "--conversation" && i + 1 < argc) conversation = argv[++i];
            }
            if (question.empty()) { usage(); curl_global_cleanup(); return 2; }
            RagRuntime rt(settings);
            boost::asio::io_context ioc;
            auto fut = boost::asio::co_spawn(ioc,
                rt.orchestrator().handle(Query{question, conversation}, rt.config().current()),
                boost::asio::use_future);
            ioc.run();
            Reply reply;
            try {
                reply = fut.get();
            } catch (const GenerationError&) {
                reply.text = generation_failure_text(*rt.config().current()->prompts);
                rc = 1;
            }
            std::cout << "\n==== Answer (" << to_string(reply.kind) << ") ====\n\n" << reply.text << "\n\n";
        } else {
            usage();
            rc = 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
