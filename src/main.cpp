#include <iostream>

#include "core/AnalysisPipeline.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/ResultAggregator.hpp"
#include "utils/ArgParser.hpp"
#include "utils/InterruptHandler.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    MotifColoc::Utils::ResourceMonitor monitor;

    MotifColoc::Config config;

    if (!MotifColoc::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    // Configure Logger
    auto& logger = MotifColoc::Utils::Logger::instance();
    logger.set_log_level(config.log_level);
    if (!config.log_file.empty()) {
        logger.set_log_file(config.log_file);
    }

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    config.print();

    LOG_INFO("Configuration valid. Starting analysis...");

    MotifColoc::Utils::InterruptHandler::install();

    int exit_code = 1;
    try {
        MotifColoc::AnalysisPipeline pipeline(config);

        MotifColoc::Utils::ScopedLogger main_scope("Main Execution");

        MotifColoc::PipelineReport report = pipeline.run();

        std::cout << "Analysis Complete." << std::endl;
        pipeline.print_summary(report);

        if (MotifColoc::Utils::InterruptHandler::interrupted()) {
            LOG_WARNING("Run was interrupted by signal " +
                        std::to_string(MotifColoc::Utils::InterruptHandler::last_signal()) +
                        "; results cover completed partitions only");
        }
        LOG_INFO("Output directory: " + config.output_dir);

        exit_code = MotifColoc::exit_code_for(report.status);

    } catch (const MotifColoc::InputError& e) {
        LOG_ERROR("Input error: " + std::string(e.what()));
    } catch (const MotifColoc::ConfigError& e) {
        LOG_ERROR("Configuration error: " + std::string(e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
    }

    MotifColoc::Utils::InterruptHandler::restore();

    monitor.print_stats("Total Execution");

    return exit_code;
}
