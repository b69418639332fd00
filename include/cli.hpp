#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "retrieval_engine.hpp"

namespace rag_engine {

const char* cli_usage();

// Positional arguments plus `--name value` options.
struct Args {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    static Args parse(int argc, char* argv[]);
    static Args parse(const std::vector<std::string>& argv);

    std::string opt(const std::string& name, const std::string& fallback = "") const;
    size_t opt_size(const std::string& name, size_t fallback) const;
    nlohmann::json opt_json(const std::string& name) const;
    const std::string& at(size_t i, const char* what) const;
};

// Runs one command against an engine and returns its JSON output.
class RagEngineCli {
public:
    explicit RagEngineCli(const EngineConfig& config);
    explicit RagEngineCli(std::unique_ptr<RetrievalEngine> engine) : engine_(std::move(engine)) {}

    nlohmann::json run(const Args& args);

private:
    std::unique_ptr<RetrievalEngine> engine_;

    static std::optional<size_t> max_text_length(const Args& args);
    static std::string read_file(const std::filesystem::path& path);
    nlohmann::json handle_update(const Args& args);
    nlohmann::json handle_index(const Args& args);
};

} // namespace rag_engine
