#ifndef MINICURL_OUTPUT_HPP
#define MINICURL_OUTPUT_HPP

#include <fstream>
#include <optional>
#include <string>

namespace minicurl {

// Destination of the response: a file when a path is given, stdout otherwise.
class OutputSink {
public:
    explicit OutputSink(const std::optional<std::string>& path);

    void Write(const std::string& bytes);
    void Finish();

    bool IsFile() const { return path_.has_value(); }

private:
    std::optional<std::string> path_;
    std::ofstream file_;
};

} // namespace minicurl

#endif // MINICURL_OUTPUT_HPP
