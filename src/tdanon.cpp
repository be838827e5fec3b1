#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "TableDefinitionAnonymizer.hpp"
#include "AnonymizerError.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    int result = 0;

    LogUtils::init(LogUtils::Level::Info);

    try {
        // 1. Parse command line and config file
        ParameterContext context;
        if (!context.init(argc, argv)) {
            LogUtils::shutdown();
            return 0;
        }

        const AnonymizerConfig& config = context.get_config();

        LogUtils::Level level = config.verbose ? LogUtils::Level::Debug : LogUtils::Level::Info;
        if (!config.log_file.empty()) {
            LogUtils::shutdown();
            LogUtils::init(level, config.log_file);
        } else {
            LogUtils::set_level(level);
        }

        // 2. Anonymize
        TableDefinitionAnonymizer anonymizer(config);
        anonymizer.run();

    } catch (const ConfigError& e) {
        LogUtils::error("Configuration error: {}", e.what());
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    } catch (const NotFoundError& e) {
        LogUtils::error("Error: {}", e.what());
        result = 1;
    } catch (const IoError& e) {
        LogUtils::error("IOError: {}", e.what());
        result = 1;
    } catch (const PatternError& e) {
        LogUtils::error("Regex Error: {}", e.what());
        result = 1;
    } catch (const std::exception& e) {
        LogUtils::error("An unexpected error occurred: {}", e.what());
        result = 1;
    }

    LogUtils::shutdown();
    return result;
}
