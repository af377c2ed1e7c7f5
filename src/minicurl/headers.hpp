#ifndef MINICURL_HEADERS_HPP
#define MINICURL_HEADERS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace minicurl {

bool EqualsNoCase(const std::string& a, const std::string& b);

// Ordered header list. Lookups ignore case, names keep the case they were
// added with, and repeated names are kept in arrival order.
class HeaderMap {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    void Add(const std::string& name, const std::string& value);

    // Replaces every entry named `name` with a single one at the position
    // of the first.
    void Set(const std::string& name, const std::string& value);

    // Returns the number of entries removed.
    size_t Remove(const std::string& name);

    bool Contains(const std::string& name) const;
    std::optional<std::string> Get(const std::string& name) const;
    std::vector<std::string> GetAll(const std::string& name) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};

// Parses "Name: value" as given on the command line.
HeaderMap::Entry ParseHeaderLine(const std::string& line);

} // namespace minicurl

#endif // MINICURL_HEADERS_HPP
