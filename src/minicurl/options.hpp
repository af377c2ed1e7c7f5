#ifndef MINICURL_OPTIONS_HPP
#define MINICURL_OPTIONS_HPP

#include "minicurl/client.hpp"
#include "minicurl/request.hpp"

#include <optional>
#include <string>
#include <vector>

namespace minicurl {

constexpr const char* kTlsVersionEnv = "MINICURL_TLS_VERSION";

struct CliOptions {
    std::string url;
    std::optional<std::string> output;
    RequestSpec request;
    ClientOptions client;
    bool include_headers = false;
    bool head_only = false;
    bool fail_on_error = false;
    bool silent = false;
    bool verbose = false;
    bool help = false;
};

// Parses the arguments after the program name. `tls_env` is the value of
// MINICURL_TLS_VERSION, if set; --tls-version overrides it. Throws UsageError.
CliOptions ParseArguments(const std::vector<std::string>& args, const char* tls_env = nullptr);

std::string HelpText();

} // namespace minicurl

#endif // MINICURL_OPTIONS_HPP
