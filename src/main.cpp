#include "config.hpp"
#include "context_assembler.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "store/record_json.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: engramctl [options] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  stats USER             Show live intervention and reflection counts\n"
              << "  reflections USER       List recent reflections, most recent first\n"
              << "  context USER [MSG]     Render the personalization context for USER\n"
              << "  interventions USER     List USER's interventions, newest first\n"
              << "  export USER            Print USER's visible records as JSON\n"
              << "  clear USER --confirm   Delete every record of USER\n"
              << "  sweep                  Purge expired records now\n"
              << "  health                 Check store, embedder and generator wiring\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH          Config file (default: ~/.engram/config.json)\n"
              << "  --limit N              Max reflections or interventions to list (default: 10)\n"
              << "  --confirm              Required by clear\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  GOOGLE_API_KEY         API key for Gemini embeddings and reflections\n"
              << "  OPENAI_API_KEY         API key for OpenAI\n"
              << "  OLLAMA_BASE_URL        Base URL for Ollama (default: http://localhost:11434)\n"
              << "  ENGRAM_STORE_BACKEND   Store backend (sqlite, memory, none)\n"
              << "  ENGRAM_STORE_PATH      SQLite database path\n";
}

static nlohmann::json health_to_json(const engram::HealthReport& report) {
    nlohmann::json j = {
        {"status", report.store_ok ? "healthy" : "unhealthy"},
        {"store", {
            {"backend", report.backend},
            {"ok", report.store_ok},
            {"latency_ms", report.store_latency_ms}
        }},
        {"embedder", report.embedder.empty() ? nlohmann::json(nullptr) : nlohmann::json(report.embedder)},
        {"generator", report.generator.empty() ? nlohmann::json(nullptr) : nlohmann::json(report.generator)},
        {"dimensions", report.dimensions}
    };
    if (!report.store_error.empty()) j["store"]["error"] = report.store_error;
    return j;
}

static int run_command(engram::MemoryEngine& engine, const std::string& command,
                       const std::vector<std::string>& args, uint32_t limit,
                       bool confirmed) {
    auto need_user = [&]() -> bool {
        if (args.empty()) {
            std::cerr << "Error: '" << command << "' requires a USER argument\n";
            return false;
        }
        return true;
    };

    if (command == "stats") {
        if (!need_user()) return 1;
        std::cout << engram::stats_to_json(engine.stats(args[0])).dump(2) << "\n";
        return 0;
    }

    if (command == "reflections") {
        if (!need_user()) return 1;
        auto reflections = engine.reflections(args[0], limit);
        if (reflections.empty()) {
            std::cout << "No reflections for " << args[0] << "\n";
            return 0;
        }
        for (const auto& r : reflections) {
            std::cout << engram::iso8601_from_millis(r.created_at) << "  " << r.insight_text << "\n";
        }
        return 0;
    }

    if (command == "interventions") {
        if (!need_user()) return 1;
        auto records = engine.interventions(args[0]);
        if (records.empty()) {
            std::cout << "No interventions for " << args[0] << "\n";
            return 0;
        }
        if (records.size() > limit) records.resize(limit);
        for (const auto& r : records) {
            std::cout << engram::iso8601_from_millis(r.created_at) << "  ["
                      << engram::outcome_to_string(r.outcome) << "]  " << r.intervention_text;
            if (!r.task_label.empty()) std::cout << "  (" << r.task_label << ")";
            std::cout << "\n";
        }
        return 0;
    }

    if (command == "clear") {
        if (!need_user()) return 1;
        if (!confirmed) {
            std::cerr << "Refusing to clear " << args[0] << " without --confirm\n";
            return 1;
        }
        uint32_t removed = engine.clear(args[0]);
        std::cout << "Removed " << removed << " records for " << args[0] << "\n";
        return 0;
    }

    if (command == "context") {
        if (!need_user()) return 1;
        std::optional<std::string> message;
        if (args.size() > 1) message = args[1];
        std::cout << engram::render_bundle(engine.get_context(args[0], message)) << "\n";
        return 0;
    }

    if (command == "export") {
        if (!need_user()) return 1;
        nlohmann::json out = {
            {"user_id", args[0]},
            {"interventions", nlohmann::json::array()},
            {"reflections", nlohmann::json::array()}
        };
        for (const auto& i : engine.interventions(args[0])) {
            out["interventions"].push_back(engram::intervention_to_json(i));
        }
        for (const auto& r : engine.reflections(args[0], UINT32_MAX)) {
            out["reflections"].push_back(engram::reflection_to_json(r));
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (command == "sweep") {
        uint32_t removed = engine.sweep_now();
        std::cout << "Removed " << removed << " expired records\n";
        return 0;
    }

    if (command == "health") {
        auto report = engine.health();
        std::cout << health_to_json(report).dump(2) << "\n";
        return report.store_ok ? 0 : 2;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string command;
    std::vector<std::string> args;
    uint32_t limit = 10;
    bool confirmed = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            try {
                limit = static_cast<uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid --limit value: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--confirm") == 0) {
            confirmed = true;
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else if (command.empty()) {
            command = argv[i];
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }

    engram::Config config = config_path.empty()
        ? engram::Config::load()
        : engram::Config::load_from(config_path);
    // One-shot process: sweeps only run on request
    config.retention.sweep_interval = 0;

    engram::http_init();
    int rc = 1;
    try {
        engram::CurlHttpClient http_client;
        auto engine = engram::create_engine(config, http_client);
        rc = run_command(*engine, command, args, limit, confirmed);
    } catch (const engram::ValidationError& e) {
        std::cerr << "Invalid " << (e.field().empty() ? "input" : e.field())
                  << ": " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }
    engram::http_cleanup();
    return rc;
}
