#include "minicurl/headers.hpp"

#include "minicurl/error.hpp"

#include <algorithm>
#include <cctype>

using namespace std;

namespace minicurl {

bool EqualsNoCase(const string& a, const string& b)
{
    return a.size() == b.size() && equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return tolower(static_cast<unsigned char>(x)) == tolower(static_cast<unsigned char>(y));
    });
}

void HeaderMap::Add(const string& name, const string& value)
{
    entries_.emplace_back(name, value);
}

void HeaderMap::Set(const string& name, const string& value)
{
    auto first = find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e) { return EqualsNoCase(e.first, name); });
    if (first == entries_.end()) {
        Add(name, value);
        return;
    }
    first->first = name;
    first->second = value;
    entries_.erase(remove_if(first + 1, entries_.end(),
                             [&](const Entry& e) { return EqualsNoCase(e.first, name); }),
                   entries_.end());
}

size_t HeaderMap::Remove(const string& name)
{
    size_t before = entries_.size();
    entries_.erase(remove_if(entries_.begin(), entries_.end(),
                             [&](const Entry& e) { return EqualsNoCase(e.first, name); }),
                   entries_.end());
    return before - entries_.size();
}

bool HeaderMap::Contains(const string& name) const
{
    return Get(name).has_value();
}

optional<string> HeaderMap::Get(const string& name) const
{
    for (const Entry& e : entries_) {
        if (EqualsNoCase(e.first, name)) {
            return e.second;
        }
    }
    return nullopt;
}

vector<string> HeaderMap::GetAll(const string& name) const
{
    vector<string> values;
    for (const Entry& e : entries_) {
        if (EqualsNoCase(e.first, name)) {
            values.push_back(e.second);
        }
    }
    return values;
}

HeaderMap::Entry ParseHeaderLine(const string& line)
{
    size_t colon = line.find(':');
    if (colon == string::npos || colon == 0) {
        throw UsageError("Header must look like 'Name: value': " + line);
    }
    string name = line.substr(0, colon);
    string value = line.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);
    return {name, value};
}

} // namespace minicurl
