#include "gauntlet/sink.h"

namespace gauntlet {

FileSink::FileSink(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::trunc | std::ios::binary) {}

void FileSink::close() {
    std::lock_guard<std::mutex> lk(mu_);
    if (out_.is_open()) out_.close();
}

void FileSink::write(const char* data, size_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!out_.is_open() || n == 0) return;
    out_.write(data, (std::streamsize)n);
    out_.flush();
}

void StringSink::write(const char* data, size_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    buf_.append(data, n);
}

std::string StringSink::str() const {
    std::lock_guard<std::mutex> lk(mu_);
    return buf_;
}

} // namespace gauntlet
