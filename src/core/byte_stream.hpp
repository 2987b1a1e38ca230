#pragma once

#include <string>
#include <memory>
#include <istream>
#include <cstddef>
#include <core/types.hpp>

// Sequential byte source read by HashComputer. One per opened file.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Read up to len bytes into buf. Returns 0 at end of stream.
    virtual Result<std::size_t> read(char* buf, std::size_t len) = 0;

    // Called once after end of stream. Remote streams report the tool's exit here.
    virtual Result<void> finish() { return Result<void>::Ok(); }
};

// ByteStream over any std::istream (files, in-memory buffers).
class IStreamByteStream : public ByteStream {
public:
    explicit IStreamByteStream(std::unique_ptr<std::istream> in)
        : in_(std::move(in)) {}

    Result<std::size_t> read(char* buf, std::size_t len) override {
        if (!in_) return Result<std::size_t>::Err("stream not open");
        if (in_->eof()) return Result<std::size_t>::Ok(0);
        in_->read(buf, static_cast<std::streamsize>(len));
        if (in_->bad()) return Result<std::size_t>::Err("read error");
        return Result<std::size_t>::Ok(static_cast<std::size_t>(in_->gcount()));
    }

private:
    std::unique_ptr<std::istream> in_;
};
