#include "cli.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>

namespace rag_engine {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* kUsage = R"(usage: ragengine_cli [--config FILE] <command> [args]

commands:
  index <index> <file>... [--code LANGUAGE]     index files (one document each)
  retrieve <index> <query> [--top-k N] [--filter JSON]
  query <index> <query> [--top-k N] [--filter JSON] [--llm-params JSON] [--rerank-params JSON]
  update <index> <doc_id> <file> [--metadata JSON]
  list <index> [--limit N] [--offset N] [--max-text-length N]
  list-all [--limit N] [--offset N] [--max-text-length N]
  get <index> <doc_id>
  delete <index> <doc_id>...
  delete-index <index>
  indexes
  persist <index> [DIR]
  persist-all
  restore <index> <DIR>
)";

json page_to_json(const DocumentPage& page) {
    json docs = json::array();
    for (const auto& d : page.documents) docs.push_back(d.to_json());
    return {
        {"documents", docs},
        {"count", page.count},
        {"next_offset", page.next_offset ? json(*page.next_offset) : json()}
    };
}

} // namespace

const char* cli_usage() { return kUsage; }

Args Args::parse(int argc, char* argv[]) {
    return parse(std::vector<std::string>(argv + 1, argv + argc));
}

Args Args::parse(const std::vector<std::string>& argv) {
    Args a;
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argv.size()) throw InvalidRequestError("Missing value for " + arg);
            a.options[arg.substr(2)] = argv[++i];
        } else {
            a.positional.push_back(arg);
        }
    }
    return a;
}

std::string Args::opt(const std::string& name, const std::string& fallback) const {
    auto it = options.find(name);
    return it == options.end() ? fallback : it->second;
}

size_t Args::opt_size(const std::string& name, size_t fallback) const {
    auto it = options.find(name);
    if (it == options.end()) return fallback;
    try {
        return static_cast<size_t>(std::stoul(it->second));
    } catch (const std::exception&) {
        throw InvalidRequestError("--" + name + " expects a non-negative integer");
    }
}

json Args::opt_json(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return nullptr;
    try {
        return json::parse(it->second);
    } catch (const json::exception& e) {
        throw InvalidRequestError("--" + name + " is not valid JSON: " + e.what());
    }
}

const std::string& Args::at(size_t i, const char* what) const {
    if (i >= positional.size()) throw InvalidRequestError(std::string("Missing ") + what);
    return positional[i];
}

RagEngineCli::RagEngineCli(const EngineConfig& config)
    : engine_(std::make_unique<RetrievalEngine>(
          config,
          make_backend(config),
          make_embedding_model(config),
          make_completion_function(config))) {}

json RagEngineCli::run(const Args& args) {
    const std::string& command = args.at(0, "command");

    if (command == "index") return handle_index(args);
    if (command == "retrieve") {
        json results = json::array();
        for (const auto& r : engine_->retrieve(args.at(1, "index"), args.at(2, "query"),
                                               args.opt_size("top-k", 0), args.opt_json("filter"))) {
            results.push_back(r.to_json());
        }
        return {{"results", results}};
    }
    if (command == "query") {
        auto response = engine_->query(args.at(1, "index"), args.at(2, "query"),
                                       args.opt_size("top-k", 0), args.opt_json("llm-params"),
                                       args.opt_json("filter"), args.opt_json("rerank-params"));
        json nodes = json::array();
        for (const auto& r : response.source_nodes) nodes.push_back(r.to_json());
        return {{"response", response.response}, {"source_nodes", nodes}};
    }
    if (command == "update") return handle_update(args);
    if (command == "list") {
        return page_to_json(engine_->list_documents(args.at(1, "index"), args.opt_size("limit", 10),
                                                    args.opt_size("offset", 0), max_text_length(args)));
    }
    if (command == "list-all") {
        auto page = engine_->list_all_documents(args.opt_size("limit", 10), args.opt_size("offset", 0),
                                                max_text_length(args));
        json by_index = json::object();
        for (const auto& [name, docs] : page.indexes) {
            json list = json::array();
            for (const auto& d : docs) list.push_back(d.to_json());
            by_index[name] = list;
        }
        return {
            {"documents", by_index},
            {"count", page.count},
            {"next_offset", page.next_offset ? json(*page.next_offset) : json()}
        };
    }
    if (command == "get") {
        return engine_->get_document(args.at(1, "index"), args.at(2, "doc_id")).to_json();
    }
    if (command == "delete") {
        std::vector<std::string> ids(args.positional.begin() + 2, args.positional.end());
        if (ids.empty()) throw InvalidRequestError("Missing doc_id");
        auto result = engine_->remove(args.at(1, "index"), ids);
        return {{"deleted_doc_ids", result.deleted}, {"not_found_doc_ids", result.not_found}};
    }
    if (command == "delete-index") {
        engine_->delete_index(args.at(1, "index"));
        return {{"message", "Index '" + args.at(1, "index") + "' deleted successfully."}};
    }
    if (command == "indexes") return engine_->list_indexes();
    if (command == "persist") {
        std::optional<fs::path> dir;
        if (args.positional.size() > 2) dir = args.positional[2];
        engine_->persist(args.at(1, "index"), dir);
        return {{"message", "Successfully persisted index " + args.at(1, "index")}};
    }
    if (command == "persist-all") {
        engine_->persist_all();
        return {{"message", "Successfully persisted all indexes"}};
    }
    if (command == "restore") {
        engine_->restore(args.at(1, "index"), args.at(2, "directory"));
        return {{"message", "Successfully restored index " + args.at(1, "index")}};
    }
    throw InvalidRequestError("Unknown command: " + command);
}

std::optional<size_t> RagEngineCli::max_text_length(const Args& args) {
    if (!args.options.count("max-text-length")) return std::nullopt;
    return args.opt_size("max-text-length", 0);
}

std::string RagEngineCli::read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw NotFoundError("Cannot read " + path.string());
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

json RagEngineCli::handle_update(const Args& args) {
    UpdateRequestItem item;
    item.doc_id = args.at(2, "doc_id");
    const fs::path path = args.at(3, "file");
    item.text = read_file(path);
    item.metadata["source"] = path.string();

    json metadata = args.opt_json("metadata");
    if (!metadata.is_null()) {
        if (!metadata.is_object()) throw InvalidRequestError("--metadata must be a JSON object");
        for (const auto& [key, value] : metadata.items()) {
            item.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    auto result = engine_->update(args.at(1, "index"), {item});
    json updated = json::array();
    for (const auto& d : result.updated) updated.push_back(d.to_json());
    json unchanged = json::array();
    for (const auto& d : result.unchanged) unchanged.push_back(d.to_json());
    return {
        {"updated_documents", updated},
        {"unchanged_documents", unchanged},
        {"not_found_documents", result.not_found}
    };
}

json RagEngineCli::handle_index(const Args& args) {
    const std::string& index_name = args.at(1, "index");
    std::string language = args.opt("code");

    std::vector<Document> documents;
    for (size_t i = 2; i < args.positional.size(); ++i) {
        const fs::path path = args.positional[i];
        Document doc;
        doc.text = read_file(path);
        doc.metadata["source"] = path.string();
        if (!language.empty()) {
            doc.metadata["split_type"] = "code";
            doc.metadata["language"] = language;
        }
        documents.push_back(std::move(doc));
    }
    if (documents.empty()) throw InvalidRequestError("No files given");

    json written = json::array();
    for (const auto& d : engine_->index(index_name, documents)) written.push_back(d.to_json());
    return written;
}

} // namespace rag_engine
