#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace objcat {

// Destination of the concatenated byte stream.
// write() returns false once the consumer can take no more data; the
// caller treats that as cancellation.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual bool write(std::span<const uint8_t> bytes) = 0;
    virtual bool flush() { return true; }
};

// Writes to a file descriptor (stdout for the CLI). A closed pipe (EPIPE)
// or any other write error makes write() return false.
class FdSink : public OutputSink {
public:
    explicit FdSink(int fd) : fd_(fd) {}

    bool write(std::span<const uint8_t> bytes) override;
    bool flush() override;

    // errno of the failed write, 0 while healthy
    int last_error() const { return last_error_; }

private:
    int fd_;
    int last_error_ = 0;
};

// Collects everything in memory
class StringSink : public OutputSink {
public:
    bool write(std::span<const uint8_t> bytes) override {
        data_.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        return true;
    }

    const std::string& data() const { return data_; }

private:
    std::string data_;
};

} // namespace objcat
