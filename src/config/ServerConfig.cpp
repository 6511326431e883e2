#include "config/ServerConfig.hpp"

#include <boost/program_options.hpp>
#include <fstream>
#include <limits>
#include <sstream>

namespace config {

namespace po = boost::program_options;

namespace {

std::string render(const po::options_description& description) {
    std::ostringstream out;
    out << description;
    return out.str();
}

} // namespace

ServerConfig parse_server_config(int argc, const char* const argv[]) {
    ServerConfig config;

    po::options_description generic("Generic options");
    generic.add_options()
        ("help,h", "Show this help and exit")
        ("config,c", po::value<std::string>(), "Read settings from an INI configuration file");

    po::options_description settings("Server settings");
    settings.add_options()
        ("address", po::value<std::string>()->default_value(config.address), "Address to listen on")
        ("port,p", po::value<unsigned int>()->default_value(config.port), "TCP port to listen on")
        ("allowed_origin", po::value<std::string>()->default_value(config.allowed_origin),
         "Origin allowed by the CORS headers of the HTTP endpoints")
        ("websocket_path", po::value<std::string>()->default_value(config.websocket_path),
         "Path of the WebSocket endpoint")
        ("verbose,v", po::value<bool>()->default_value(false)->implicit_value(true),
         "Log every handled request");

    po::options_description command_line("numint_server");
    command_line.add(generic).add(settings);
    config.usage = render(command_line);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, command_line), vm);
        if (vm.count("help")) {
            config.help_requested = true;
            return config;
        }
        if (vm.count("config")) {
            const std::string path = vm["config"].as<std::string>();
            std::ifstream file(path);
            if (!file.is_open()) {
                throw ConfigError("Could not open configuration file: " + path);
            }
            // Values already stored from the command line are kept.
            po::store(po::parse_config_file(file, settings), vm);
        }
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }

    const unsigned int port = vm["port"].as<unsigned int>();
    if (port > std::numeric_limits<std::uint16_t>::max()) {
        throw ConfigError("port must be between 0 and 65535, got " + std::to_string(port));
    }
    config.port = static_cast<std::uint16_t>(port);
    config.address = vm["address"].as<std::string>();
    config.allowed_origin = vm["allowed_origin"].as<std::string>();
    config.websocket_path = vm["websocket_path"].as<std::string>();
    config.verbose = vm["verbose"].as<bool>();

    if (config.websocket_path.empty() || config.websocket_path.front() != '/') {
        throw ConfigError("websocket_path must start with '/'");
    }
    return config;
}

IntegrateOptions parse_integrate_options(int argc, const char* const argv[]) {
    IntegrateOptions options;
    const service::IntegrationRequest defaults;

    po::options_description description("numint_cli");
    description.add_options()
        ("help,h", "Show this help and exit")
        ("function,f", po::value<std::string>(), "Expression in x, e.g. \"sin(x)**2\"")
        ("lower,a", po::value<double>()->default_value(defaults.lower_bound), "Lower bound")
        ("upper,b", po::value<double>()->default_value(defaults.upper_bound), "Upper bound")
        ("points,n", po::value<int>()->default_value(defaults.num_points), "Number of sample points")
        ("method,m", po::value<std::string>()->default_value(defaults.method),
         "trapezoidal, simpson, midpoint or monte_carlo")
        ("seed,s", po::value<std::uint64_t>(), "Seed for monte_carlo")
        ("reference,r", po::value<std::string>(),
         "Compare with an adaptive reference integral: tanh_sinh or qags")
        ("json", po::value<bool>()->default_value(false)->implicit_value(true),
         "Print the result envelope as JSON");
    options.usage = render(description);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, description), vm);
        if (vm.count("help")) {
            options.help_requested = true;
            return options;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }

    if (!vm.count("function")) {
        throw ConfigError("the option '--function' is required");
    }
    options.request.function = vm["function"].as<std::string>();
    options.request.lower_bound = vm["lower"].as<double>();
    options.request.upper_bound = vm["upper"].as<double>();
    options.request.num_points = vm["points"].as<int>();
    options.request.method = vm["method"].as<std::string>();
    if (vm.count("seed")) {
        options.request.seed = vm["seed"].as<std::uint64_t>();
    }
    if (vm.count("reference")) {
        try {
            options.reference = traits::parse_quadrature_method(vm["reference"].as<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }
    options.json = vm["json"].as<bool>();
    return options;
}

} // namespace config
