#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <signal.h>

#include <spdlog/spdlog.h>

#include "logvec/common/logger.h"
#include "logvec/config.h"
#include "logvec/core/config.h"
#include "logvec/embedding/embedder.h"
#include "logvec/ingest/line_source.h"
#include "logvec/ingest/normalizer.h"
#include "logvec/pipeline/log_pipeline.h"
#include "logvec/query/query_engine.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace {

void InstallSignalHandlers() {
    // No SA_RESTART: a blocked read on stdin returns so the query loop can exit.
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGINT, &sa, nullptr) != 0 || sigaction(SIGTERM, &sa, nullptr) != 0) {
        LOGVEC_WARN("Failed to install signal handlers: {}", std::strerror(errno));
    }
}

std::vector<std::string> SplitCommand(const std::string& command) {
    std::vector<std::string> argv;
    std::istringstream in(command);
    std::string word;
    while (in >> word) {
        argv.push_back(word);
    }
    return argv;
}

void PrintUsage(const char* program) {
    std::cout << "logvec " << LOGVEC_VERSION << " - live log deduplication and similarity search" << std::endl;
    std::cout << "Usage: " << program << " [OPTIONS]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --source-cmd \"CMD ARGS\"   Command streaming log lines (default: journalctl -f -o short)" << std::endl;
    std::cout << "  --source-file PATH        Replay lines from a file instead of a command" << std::endl;
    std::cout << "  --dimension N             Embedding dimension (default: 384)" << std::endl;
    std::cout << "  --batch-size N            Lines per embedding batch (default: 16)" << std::endl;
    std::cout << "  --flush-interval SECONDS  Repeat summary interval (default: 10)" << std::endl;
    std::cout << "  --max-size N              Maximum indexed entries (default: 100000)" << std::endl;
    std::cout << "  --queue-capacity N        Ingest channel capacity (default: 10000)" << std::endl;
    std::cout << "  --default-k N             Results per query when k= is absent (default: 5)" << std::endl;
    std::cout << "  --warmup SECONDS          Wait before the first prompt (default: 5)" << std::endl;
    std::cout << "  --log-level LEVEL         Log level (trace, debug, info, warn, error, off)" << std::endl;
    std::cout << "  --help, -h                Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Queries may end with k=<n> and display=raw|pretty. Type 'exit' to quit." << std::endl;
}

void PrintResponse(const logvec::query::QueryResponse& response) {
    const std::string rule(80, '-');
    std::cout << rule << std::endl;
    std::cout << "Top " << response.query.options.k << " results (display="
              << logvec::core::DisplayModeName(response.query.options.display) << "):" << std::endl;
    if (response.empty()) {
        if (response.store_size == 0) {
            std::cout << "No logs indexed yet. Please wait for data to accumulate." << std::endl;
        } else {
            std::cout << "No matching results found." << std::endl;
        }
    }
    for (const auto& line : response.lines) {
        std::cout << line << std::endl;
    }
    std::cout << rule << std::endl << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    logvec::common::Logger::Init(/*use_stderr=*/true);
    InstallSignalHandlers();

    auto config = logvec::core::PipelineConfig::Default();
    int warmup_seconds = 5;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--source-cmd" && i + 1 < argc) {
                config.source.command = SplitCommand(argv[++i]);
            } else if (arg == "--source-file" && i + 1 < argc) {
                config.source.replay_file = argv[++i];
            } else if (arg == "--dimension" && i + 1 < argc) {
                config.store.dimension = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--batch-size" && i + 1 < argc) {
                config.batch.batch_size = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--flush-interval" && i + 1 < argc) {
                config.repeat_cache.flush_interval = std::chrono::seconds(std::stoi(argv[++i]));
            } else if (arg == "--max-size" && i + 1 < argc) {
                config.store.max_size = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--queue-capacity" && i + 1 < argc) {
                config.channel.capacity = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--default-k" && i + 1 < argc) {
                config.query.default_k = std::stoi(argv[++i]);
            } else if (arg == "--warmup" && i + 1 < argc) {
                warmup_seconds = std::stoi(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                std::string level_str = argv[++i];
                spdlog::level::level_enum level;
                if (logvec::common::Logger::ParseLevel(level_str, level)) {
                    logvec::common::Logger::SetLevel(level);
                } else {
                    std::cerr << "Unknown log level: " << level_str << ". Using default (info)." << std::endl;
                }
            } else if (arg == "--help" || arg == "-h") {
                PrintUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                std::cerr << "Use --help for usage information" << std::endl;
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        return 1;
    }

    auto valid = config.validate();
    if (!valid.ok()) {
        std::cerr << "Invalid configuration: " << valid.error() << std::endl;
        return 1;
    }

    int exit_code = 0;
    try {
        auto source = logvec::ingest::CreateLineSource(config.source.command, config.source.replay_file,
                                                       config.source.stop_grace);
        std::shared_ptr<logvec::embedding::Embedder> embedder =
            logvec::embedding::CreateHashingEmbedder(config.store.dimension);

        logvec::pipeline::LogPipeline pipeline(config, std::move(source), embedder);
        auto started = pipeline.start();
        if (!started.ok()) {
            std::cerr << "Failed to start pipeline: " << started.error() << std::endl;
            return 1;
        }

        std::cout << "Live log embedding system started (deduplication + similarity search)." << std::endl;
        if (warmup_seconds > 0) {
            std::cout << "Collecting initial logs..." << std::endl;
            auto warmup_end = std::chrono::steady_clock::now() + std::chrono::seconds(warmup_seconds);
            while (g_running.load() && std::chrono::steady_clock::now() < warmup_end) {
                if (pipeline.wait_for_stop(std::chrono::milliseconds(100))) {
                    break;
                }
            }
        }
        std::cout << "Ready for queries. Type 'exit' or 'quit' to stop." << std::endl << std::endl;

        while (g_running.load()) {
            if (pipeline.fatal_error()) {
                std::cerr << "Index failure: " << *pipeline.fatal_error() << std::endl;
                exit_code = 1;
                break;
            }
            if (pipeline.source_failed()) {
                std::cerr << "Log source terminated and could not be restarted." << std::endl;
                exit_code = 1;
                break;
            }

            std::cout << "Enter search query (or 'exit' to quit): " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) {
                std::cout << std::endl << "Exiting..." << std::endl;
                break;
            }
            if (logvec::ingest::is_blank(line)) {
                continue;
            }
            if (logvec::query::is_exit_command(line)) {
                std::cout << "Exiting..." << std::endl;
                break;
            }

            auto result = pipeline.query(line);
            if (!result.ok()) {
                std::cout << "Search error: " << result.error() << std::endl;
                continue;
            }
            if (logvec::ingest::is_blank(result.value().query.text)) {
                std::cout << "Empty query text; please provide a search term." << std::endl;
                continue;
            }
            PrintResponse(result.value());
        }

        std::cout << "Shutting down background threads..." << std::endl;
        auto stopped = pipeline.shutdown();
        if (!stopped.ok()) {
            std::cerr << "Shutdown reported: " << stopped.error() << std::endl;
            exit_code = 1;
        }
        std::cout << "Shutdown complete." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
    return exit_code;
}
