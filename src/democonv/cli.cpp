#include "democonv/cli.hpp"

#include <exception>
#include <ostream>
#include <stdexcept>

#include "democonv/converter.hpp"
#include "democonv/logger.hpp"

namespace democonv {
namespace {

void print_usage(const char* program, std::ostream& err) {
    err << "Usage: " << program
        << " --dataset <dir> --arm <left|right> --extrinsics <calibration> --out <file.hdf5>"
           " --data-type <hand|robot> [--config <yaml>] [--val-ratio=<r>] [--seed=<n>]"
           " [--workers=<n>] [--log-level=<debug|info|warn|error>]\n";
}

} // namespace

ConversionConfig resolve_config(const ConversionOverrides& overrides) {
    if (!overrides.arm.has_value()) {
        throw std::invalid_argument("Missing required argument --arm");
    }
    if (!overrides.source_type.has_value()) {
        throw std::invalid_argument("Missing required argument --data-type");
    }

    ConversionConfig config = load_config(overrides.config_path.value_or(kDefaultConfigPath));
    config.apply_overrides(overrides);
    return config;
}

int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err) {
    if (argc < 2) {
        print_usage(argc > 0 ? argv[0] : "demo_converter", err);
        return 1;
    }

    try {
        const ConversionOverrides overrides = ConversionOverrides::from_args(argc, argv);
        const ConversionConfig config = resolve_config(overrides);
        Logger::set_min_level(config.log_level);

        Logger::log(LogLevel::Info, std::string("Converting ") + to_string(config.source_type) + " episodes from " +
                                        config.dataset_dir + " (" + to_string(config.arm) + " arm, calibration " +
                                        config.calibration + ")");

        const Converter converter(config);
        converter.run();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what());
        return 1;
    }

    out << "Successful Conversion!" << std::endl;
    return 0;
}

} // namespace democonv
