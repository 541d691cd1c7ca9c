#include <cstdlib>
#include <iostream>
#include <list>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "batch_driver.hpp"
#include "http_server.hpp"
#include "logging.hpp"
#include "outline_config.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  pdf_outliner outline <input_dir> <output_dir> [--jobs N]\n"
              << "  pdf_outliner collection <input_dir> <output_dir> [--input FILE] [--model ONNX] [--vocab TXT] [--top N]\n"
              << "  pdf_outliner serve <address> <port> <number_of_workers>\n"
              << "Common options:\n"
              << "  --config FILE      JSON file overriding the classifier constants\n"
              << "  --log-level LEVEL  trace, debug, info, warning, error or fatal\n"
              << "  --tessdata DIR     tesseract language data directory\n"
              << "  --no-ocr           skip pages without a text layer\n"
              << "  For IPv4, try:\n"
              << "    pdf_outliner serve 0.0.0.0 8080 4\n";
}

unsigned int parse_count(const std::string& option, const std::string& value) {
    unsigned long count = std::stoul(value);
    if (count == 0) {
        throw std::invalid_argument(option + " must be positive");
    }
    return static_cast<unsigned int>(count);
}

// splits the options off argv; return false on an unknown or incomplete option
bool parse_options(int argc, char* argv[], std::vector<std::string>& positional, Batch_Options& options) {
    std::string config_path;
    std::string log_level;
    std::optional<unsigned int> top;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--no-ocr") {
            options.enable_ocr = false;
            continue;
        }
        if (arg.size() < 2 || arg.compare(0, 2, "--") != 0) {
            positional.push_back(arg);
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }

        const std::string value = argv[++i];
        if (arg == "--config") {
            config_path = value;
        } else if (arg == "--log-level") {
            log_level = value;
        } else if (arg == "--jobs") {
            options.jobs = parse_count(arg, value);
        } else if (arg == "--input") {
            options.collection_input = value;
        } else if (arg == "--model") {
            options.model_path = value;
        } else if (arg == "--vocab") {
            options.vocab_path = value;
        } else if (arg == "--top") {
            top = parse_count(arg, value);
        } else if (arg == "--tessdata") {
            options.tessdata_path = value;
        } else {
            std::cerr << "Unknown option " << arg << "\n";
            return false;
        }
    }

    if (!log_level.empty() && !set_log_severity(log_level)) {
        std::cerr << "Unknown log level " << log_level << "\n";
        return false;
    }

    if (!config_path.empty()) {
        std::optional<Outline_Config> config = load_outline_config(config_path);
        if (!config) {
            return false;
        }
        options.config = *config;
    }

    // applied after the config file so the command line wins
    if (top) {
        options.config.top_sections = *top;
    }
    return true;
}

int serve(const std::vector<std::string>& positional, const Batch_Options& options) {
    auto const address = boost::asio::ip::make_address(positional[1]);
    unsigned short port = static_cast<unsigned short>(std::stoul(positional[2]));
    unsigned int num_workers = parse_count("number_of_workers", positional[3]);

    // assume that ioc is accessed from single thread
    boost::asio::io_context ioc{1};
    boost::asio::ip::tcp::acceptor acceptor{ioc, {address, port}};

    std::list<http_worker> workers;
    for (unsigned int i = 0; i < num_workers; ++i) {
        workers.emplace_back(acceptor, options);
        workers.back().start();
    }

    LOG_CHANNEL_INFO("http") << "Listening on " << positional[1] << ":" << port << " with " << num_workers << " workers";
    ioc.run();

    LOG_INFO << "Server stopped";
    return EXIT_SUCCESS;
}

}

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> positional;
        Batch_Options options;
        if (!parse_options(argc, argv, positional, options) || positional.empty()) {
            print_usage();
            return EXIT_FAILURE;
        }

        const std::string& mode = positional[0];
        if (mode == "outline" && positional.size() == 3) {
            return run_outline_batch(positional[1], positional[2], options);
        }
        if (mode == "collection" && positional.size() == 3) {
            return run_collection(positional[1], positional[2], options);
        }
        if (mode == "serve" && positional.size() == 4) {
            return serve(positional, options);
        }

        print_usage();
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
