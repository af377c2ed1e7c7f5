#include "minicurl/client.hpp"
#include "minicurl/error.hpp"
#include "minicurl/log.hpp"
#include "minicurl/options.hpp"
#include "minicurl/output.hpp"
#include "minicurl/transport.hpp"

#include <cstdlib>
#include <string>
#include <vector>

#include <fmt/core.h>

using namespace std;
using namespace minicurl;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitHttpError = 22;

int Run(const CliOptions& options)
{
    CurlGlobal curl_global;
    CurlConnector connector(options.client.transport);
    HttpClient client(connector, options.client);

    Result result = client.Execute(options.url, options.request);
    const Response& response = result.response;

    if (response.status.code >= 400) {
        if (options.fail_on_error) {
            return kExitHttpError;
        }
        log::Error("HTTP Error: {}", response.status.code);
        log::Notice("Response body: {}", response.body);
        return kExitFailure;
    }

    OutputSink sink(options.output);
    if (options.head_only) {
        sink.Write(response.HeadText());
    } else {
        if (options.include_headers) {
            sink.Write(response.HeadText());
        }
        sink.Write(response.body);
    }
    sink.Finish();

    if (sink.IsFile()) {
        log::Notice("Response body saved to '{}'", *options.output);
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[])
{
    CliOptions options;
    try {
        options = ParseArguments(vector<string>(argv + 1, argv + argc), getenv(kTlsVersionEnv));
    } catch (const UsageError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        fmt::print(stderr, "Usage: minicurl [OPTIONS] <URL>\n");
        fmt::print(stderr, "Try 'minicurl --help' for more information.\n");
        return kExitFailure;
    }

    if (options.help) {
        fmt::print("{}", HelpText());
        return kExitOk;
    }

    if (options.silent) {
        log::SetLevel(log::Level::Silent);
    } else if (options.verbose) {
        log::SetLevel(log::Level::Verbose);
    }

    try {
        return Run(options);
    } catch (const runtime_error& e) {
        log::Error("{}", e.what());
    }
    return kExitFailure;
}
