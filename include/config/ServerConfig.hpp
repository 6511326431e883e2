/**
 * @file ServerConfig.hpp
 * @brief Command line and configuration file options of the NUMINT executables.
 *
 * Both executables read their options with Boost.Program_options. The server also accepts an
 * INI style file through `--config`; values given on the command line take precedence.
 *
 * Example configuration file:
 * @code
 * address = 127.0.0.1
 * port = 9000
 * allowed_origin = http://localhost:4200
 * verbose = true
 * @endcode
 */
#ifndef NUMINT_SERVER_CONFIG_HPP
#define NUMINT_SERVER_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "../service/IntegrationTypes.hpp"
#include "../traits/NUMINT_traits.hpp"

namespace config {

/**
 * @brief Raised for unknown, malformed or out of range options.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig
{
    std::string address = "0.0.0.0";
    std::uint16_t port = 8000;
    std::string allowed_origin = "http://localhost:4200";
    std::string websocket_path = "/ws";
    bool verbose = false;
    bool help_requested = false;
    std::string usage; ///< Rendered option descriptions, for --help.
};

/**
 * @brief Options of the one-shot command line integrator.
 */
struct IntegrateOptions
{
    service::IntegrationRequest request;
    std::optional<traits::QuadratureMethod> reference;
    bool json = false;
    bool help_requested = false;
    std::string usage;
};

/**
 * @brief Parses the server options.
 * @throws ConfigError on invalid input or an unreadable configuration file.
 */
ServerConfig parse_server_config(int argc, const char* const argv[]);

/**
 * @brief Parses the command line integrator options.
 * @throws ConfigError on invalid input or a missing --function.
 */
IntegrateOptions parse_integrate_options(int argc, const char* const argv[]);

} // namespace config

#endif // NUMINT_SERVER_CONFIG_HPP
