#include "minicurl/options.hpp"

#include "minicurl/error.hpp"
#include "minicurl/version.hpp"

#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>

using namespace std;

namespace minicurl {

namespace {

string ReadDataFile(const string& filename)
{
    ifstream file(filename, ios::binary);
    if (!file) {
        throw UsageError("Failed to read data file: " + filename);
    }
    ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

chrono::milliseconds ParseSeconds(const string& option, const string& text)
{
    size_t used = 0;
    double seconds = -1;
    try {
        seconds = stod(text, &used);
    } catch (const logic_error&) {
        used = 0;
    }
    if (used != text.size() || !(seconds > 0) || !isfinite(seconds)) {
        throw UsageError(option + " expects a positive number of seconds, got '" + text + "'");
    }
    return chrono::milliseconds(static_cast<long long>(seconds * 1000));
}

long long ParseCount(const string& option, const string& text, long long min_value)
{
    size_t used = 0;
    long long value = 0;
    try {
        value = stoll(text, &used);
    } catch (const logic_error&) {
        used = 0;
    }
    if (used == 0 || used != text.size() || value < min_value) {
        throw UsageError(option + " expects an integer >= " + to_string(min_value) + ", got '" + text + "'");
    }
    return value;
}

} // namespace

CliOptions ParseArguments(const vector<string>& args, const char* tls_env)
{
    CliOptions parsed;
    bool explicit_method = false;

    if (tls_env && *tls_env) {
        parsed.client.transport.min_tls_version = ParseTlsVersion(tls_env);
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const string& arg = args[i];
        auto value = [&]() -> const string& {
            if (i + 1 >= args.size()) {
                throw UsageError("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            parsed.help = true;
            return parsed;
        } else if (arg == "-v" || arg == "--verbose") {
            parsed.verbose = true;
        } else if (arg == "-s" || arg == "--silent") {
            parsed.silent = true;
        } else if (arg == "-o" || arg == "--output") {
            parsed.output = value();
        } else if (arg == "-X" || arg == "--request" || arg == "-m" || arg == "--method") {
            parsed.request.method = NormalizeMethod(value());
            explicit_method = true;
        } else if (arg == "-H" || arg == "--header") {
            auto [name, header_value] = ParseHeaderLine(value());
            parsed.request.headers.Add(name, header_value);
        } else if (arg == "-d" || arg == "--data") {
            const string& data = value();
            parsed.request.body = data.rfind('@', 0) == 0 ? ReadDataFile(data.substr(1)) : data;
        } else if (arg == "-i" || arg == "--include") {
            parsed.include_headers = true;
        } else if (arg == "-I" || arg == "--head") {
            parsed.head_only = true;
            parsed.request.method = "HEAD";
            explicit_method = true;
        } else if (arg == "-L" || arg == "--location") {
            parsed.client.follow_redirects = true;
        } else if (arg == "--max-redirs") {
            parsed.client.max_redirects = static_cast<int>(ParseCount(arg, value(), 0));
        } else if (arg == "-f" || arg == "--fail") {
            parsed.fail_on_error = true;
        } else if (arg == "-A" || arg == "--user-agent") {
            parsed.request.headers.Set("User-Agent", value());
        } else if (arg == "-u" || arg == "--user") {
            parsed.request.credentials = value();
        } else if (arg == "-k" || arg == "--insecure") {
            parsed.client.transport.verify_peer = false;
        } else if (arg == "--tls-version") {
            parsed.client.transport.min_tls_version = ParseTlsVersion(value());
        } else if (arg == "--connect-timeout") {
            parsed.client.transport.connect_timeout = ParseSeconds(arg, value());
        } else if (arg == "--max-time") {
            chrono::milliseconds timeout = ParseSeconds(arg, value());
            parsed.client.transport.read_timeout = timeout;
            parsed.client.transport.write_timeout = timeout;
        } else if (arg == "--max-filesize") {
            parsed.client.limits.max_response_size = static_cast<size_t>(ParseCount(arg, value(), 1));
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        } else if (parsed.url.empty()) {
            parsed.url = arg;
        } else {
            throw UsageError("Only one URL may be given, got '" + parsed.url + "' and '" + arg + "'");
        }
    }

    if (parsed.url.empty()) {
        throw UsageError("Missing URL");
    }
    if (parsed.request.body && !explicit_method) {
        parsed.request.method = "POST";
    }
    return parsed;
}

string HelpText()
{
    return "minicurl " MINICURL_VERSION " - a minimal HTTP/1.1 client\n"
           "\n"
           "Usage:\n"
           "    minicurl [OPTIONS] <URL>\n"
           "\n"
           "Options:\n"
           "    -o, --output <FILE>         Save the response body to a file\n"
           "    -X, --request <METHOD>      HTTP method to use (default: GET)\n"
           "    -m, --method <METHOD>       Alias for -X\n"
           "    -H, --header <HEADER>       Add a header to the request, 'Name: value'\n"
           "    -d, --data <DATA>           Send DATA as the request body (@file reads a file)\n"
           "    -i, --include               Include response headers in the output\n"
           "    -I, --head                  Fetch headers only (HEAD request)\n"
           "    -L, --location              Follow redirects\n"
           "        --max-redirs <N>        Maximum number of redirects to follow (default: 10)\n"
           "    -s, --silent                Print nothing but the response\n"
           "    -f, --fail                  Fail silently (exit 22) on HTTP errors\n"
           "    -A, --user-agent <NAME>     Custom User-Agent string\n"
           "    -u, --user <USER:PASS>      Basic authentication credentials\n"
           "    -k, --insecure              Skip TLS certificate verification\n"
           "        --tls-version <V>       Minimum TLS version: 1.0, 1.1, 1.2 (default), 1.3\n"
           "        --connect-timeout <S>   Connection timeout in seconds (default: 10)\n"
           "        --max-time <S>          Read/write timeout in seconds (default: 30)\n"
           "        --max-filesize <BYTES>  Maximum response size (default: 10485760)\n"
           "    -v, --verbose               Show connection and protocol details\n"
           "    -h, --help                  Display this help message\n"
           "\n"
           "Environment:\n"
           "    MINICURL_TLS_VERSION        Minimum TLS version (overridden by --tls-version)\n";
}

} // namespace minicurl
