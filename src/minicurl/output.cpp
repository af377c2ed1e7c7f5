#include "minicurl/output.hpp"

#include <cstdio>
#include <stdexcept>

using namespace std;

namespace minicurl {

OutputSink::OutputSink(const optional<string>& path) : path_(path)
{
    if (path_) {
        file_.open(*path_, ios::binary | ios::trunc);
        if (!file_) {
            throw runtime_error("Cannot create output file: " + *path_);
        }
    }
}

void OutputSink::Write(const string& bytes)
{
    if (path_) {
        file_.write(bytes.data(), static_cast<streamsize>(bytes.size()));
        if (!file_) {
            throw runtime_error("Write error on " + *path_);
        }
        return;
    }
    if (fwrite(bytes.data(), 1, bytes.size(), stdout) != bytes.size()) {
        throw runtime_error("Write error on standard output");
    }
}

void OutputSink::Finish()
{
    if (path_) {
        file_.close();
        if (!file_) {
            throw runtime_error("Write error on " + *path_);
        }
        return;
    }
    fflush(stdout);
}

} // namespace minicurl
