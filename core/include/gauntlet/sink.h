#pragma once

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace gauntlet {

// Destination for child output and supervisor banners. Writes may come
// from the spawn loop and from timer callbacks at the same time, so every
// implementation serializes them.
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void write(const char* data, size_t n) = 0;
    void write(const std::string& s) { write(s.data(), s.size()); }
};

// Truncates the file on open and flushes after each write so a crashed run still
// leaves readable logs.
class FileSink final : public OutputSink {
public:
    explicit FileSink(const std::string& path);

    bool is_open() const { return out_.is_open(); }
    const std::string& path() const { return path_; }
    void close();

    using OutputSink::write;
    void write(const char* data, size_t n) override;

private:
    std::mutex mu_;
    std::string path_;
    std::ofstream out_;
};

// In-memory sink (captured output, tests).
class StringSink final : public OutputSink {
public:
    using OutputSink::write;
    void write(const char* data, size_t n) override;
    std::string str() const;

private:
    mutable std::mutex mu_;
    std::string buf_;
};

} // namespace gauntlet
