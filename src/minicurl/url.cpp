#include "minicurl/url.hpp"

#include "minicurl/error.hpp"

#include <algorithm>
#include <cctype>

using namespace std;

namespace minicurl {

namespace {

[[noreturn]] void Invalid(const string& url, const string& why)
{
    throw HttpError(ErrorKind::InvalidUrl, Stage::Resolve, why + ": " + url);
}

bool StartsWithNoCase(const string& s, const string& prefix)
{
    if (s.size() < prefix.size()) {
        return false;
    }
    return equal(prefix.begin(), prefix.end(), s.begin(), [](char a, char b) {
        return tolower(static_cast<unsigned char>(a)) == tolower(static_cast<unsigned char>(b));
    });
}

// A scheme name ends at the first ':' and only counts when no path, query
// or fragment delimiter comes before it.
bool HasScheme(const string& location)
{
    size_t colon = location.find(':');
    if (colon == string::npos || colon == 0 || location.find_first_of("/?#") < colon) {
        return false;
    }
    if (!isalpha(static_cast<unsigned char>(location[0]))) {
        return false;
    }
    return all_of(location.begin() + 1, location.begin() + colon, [](char c) {
        return isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

uint16_t ParsePort(const string& url, const string& digits)
{
    if (digits.empty() || digits.size() > 5 ||
        !all_of(digits.begin(), digits.end(), [](char c) { return isdigit(static_cast<unsigned char>(c)); })) {
        Invalid(url, "Invalid port");
    }
    long port = stol(digits);
    if (port < 1 || port > 65535) {
        Invalid(url, "Port out of range");
    }
    return static_cast<uint16_t>(port);
}

// Splits "authority" into host and port, handling bracketed IPv6 literals.
void ParseAuthority(const string& url, const string& authority, ParsedUrl& out)
{
    string port_text;
    bool has_port = false;

    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == string::npos) {
            Invalid(url, "Missing ']' in IPv6 host");
        }
        out.host = authority.substr(0, close + 1);
        string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                Invalid(url, "Unexpected text after IPv6 host");
            }
            has_port = true;
            port_text = rest.substr(1);
        }
        if (out.host.size() == 2) {
            out.host.clear();
        }
    } else {
        size_t colon = authority.find(':');
        out.host = authority.substr(0, colon);
        if (colon != string::npos) {
            has_port = true;
            port_text = authority.substr(colon + 1);
        }
    }

    if (out.host.empty()) {
        Invalid(url, "Invalid host");
    }
    if (out.host.find('@') != string::npos) {
        Invalid(url, "Credentials in URL are not supported, use --user");
    }
    if (any_of(out.host.begin(), out.host.end(), [](char c) {
            unsigned char u = static_cast<unsigned char>(c);
            return u <= 0x20 || u == 0x7f;
        })) {
        Invalid(url, "Invalid character in host");
    }
    out.port = has_port ? ParsePort(url, port_text) : DefaultPort(out.scheme);
}

void SplitPathAndQuery(string rest, ParsedUrl& out)
{
    size_t hash = rest.find('#');
    if (hash != string::npos) {
        rest.erase(hash);
    }
    size_t question = rest.find('?');
    if (question != string::npos) {
        out.query = rest.substr(question + 1);
        rest.erase(question);
    } else {
        out.query.reset();
    }
    out.path = rest.empty() ? "/" : rest;
}

} // namespace

uint16_t DefaultPort(Scheme scheme)
{
    return scheme == Scheme::Encrypted ? 443 : 80;
}

string ParsedUrl::Target() const
{
    return query ? path + "?" + *query : path;
}

string ParsedUrl::Authority() const
{
    return IsDefaultPort() ? host : host + ":" + to_string(port);
}

string ParsedUrl::ToString() const
{
    return string(scheme == Scheme::Encrypted ? "https://" : "http://") + Authority() + Target();
}

bool operator==(const ParsedUrl& a, const ParsedUrl& b)
{
    return a.scheme == b.scheme && a.host == b.host && a.port == b.port &&
           a.path == b.path && a.query == b.query;
}

bool operator!=(const ParsedUrl& a, const ParsedUrl& b)
{
    return !(a == b);
}

ParsedUrl ParseUrl(const string& url)
{
    ParsedUrl parsed;
    string rest;
    if (StartsWithNoCase(url, "https://")) {
        parsed.scheme = Scheme::Encrypted;
        rest = url.substr(8);
    } else if (StartsWithNoCase(url, "http://")) {
        parsed.scheme = Scheme::Plain;
        rest = url.substr(7);
    } else {
        Invalid(url, "URL must start with http:// or https://");
    }

    size_t authority_end = rest.find_first_of("/?#");
    ParseAuthority(url, rest.substr(0, authority_end), parsed);
    SplitPathAndQuery(authority_end == string::npos ? string() : rest.substr(authority_end), parsed);
    return parsed;
}

ParsedUrl ResolveLocation(const ParsedUrl& base, const string& location)
{
    if (location.empty()) {
        Invalid(location, "Empty redirect location");
    }
    if (StartsWithNoCase(location, "http://") || StartsWithNoCase(location, "https://")) {
        return ParseUrl(location);
    }
    if (location.compare(0, 2, "//") == 0) {
        string scheme = base.scheme == Scheme::Encrypted ? "https:" : "http:";
        return ParseUrl(scheme + location);
    }
    if (HasScheme(location)) {
        Invalid(location, "Unsupported redirect scheme");
    }

    if (location[0] == '#') {
        return base;
    }

    ParsedUrl next = base;
    if (location[0] == '/') {
        SplitPathAndQuery(location, next);
    } else if (location[0] == '?') {
        SplitPathAndQuery(base.path + location, next);
    } else {
        string directory = base.path.substr(0, base.path.rfind('/') + 1);
        SplitPathAndQuery(directory + location, next);
    }
    return next;
}

} // namespace minicurl
