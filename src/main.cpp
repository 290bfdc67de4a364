#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "FragmentRenderer.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <string>
#include <vector>

using namespace sqlquote;

namespace {

void setupLogging(spdlog::level::level_enum level) {
    try {
        // stdout carries the rendered fragments, so logs go to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);

        auto logger = std::make_shared<spdlog::logger>("sql-quote", console_sink);
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

std::vector<std::string> collectValues(const Config& config) {
    std::vector<std::string> values = config.values;

    if (config.input_file == "-") {
        ErrorContext context("reading stdin");
        auto lines = FragmentRenderer::readLines(std::cin);
        values.insert(values.end(), lines.begin(), lines.end());
    } else if (!config.input_file.empty()) {
        ErrorContext context("reading " + config.input_file);
        auto lines = FragmentRenderer::readFile(config.input_file);
        values.insert(values.end(), lines.begin(), lines.end());
    }

    return values;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Configuration problems are reported before the configured level is known
    setupLogging(spdlog::level::warn);

    try {
        Config config = Config::parseArgs(argc, argv);

        if (!config.validate()) {
            return ErrorHandler::ERR_USAGE;
        }

        setupLogging(config.logLevel());

        if (!config.config_file.empty()) {
            spdlog::debug("Using configuration from {}", config.config_file);
        }

        FragmentRenderer renderer(config.renderOptions());
        auto values = collectValues(config);
        auto fragments = renderer.renderAll(values);

        std::cout << renderer.format(fragments);
        std::cout.flush();

        spdlog::debug("Rendered {} fragments", fragments.size());
        return ErrorHandler::SUCCESS;

    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return ErrorHandler::exitCodeFor(e);
    }
}
