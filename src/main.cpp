#include <spdlog/spdlog.h>
#include <iostream>

#include "cli.hpp"
#include "engine_config.hpp"
#include "errors.hpp"

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    try {
        rag_engine::Args args = rag_engine::Args::parse(argc, argv);
        if (args.positional.empty() || args.positional[0] == "help") {
            std::cout << rag_engine::cli_usage();
            return args.positional.empty() ? 1 : 0;
        }

        auto config = rag_engine::load_config(args.opt("config"));
        rag_engine::init_logging(config.log_level);

        rag_engine::RagEngineCli cli(config);
        std::cout << cli.run(args).dump(2) << std::endl;
        return 0;
    } catch (const rag_engine::InvalidRequestError& e) {
        spdlog::error("❌ {}", e.what());
        std::cerr << rag_engine::cli_usage();
        return 2;
    } catch (const rag_engine::RagError& e) {
        spdlog::error("❌ {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("❌ Unexpected failure: {}", e.what());
        return 1;
    }
}
