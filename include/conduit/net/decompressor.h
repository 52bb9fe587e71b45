#pragma once
#include <conduit/net/buffer.h>
#include <conduit/net/data_pipe.h>
#include <zlib.h>

namespace conduit::net {

// Streaming inflate stage for Content-Encoding gzip and deflate.
class Decompressor : public DataStage {
public:
    enum class Format {
        Auto,     // gzip or zlib, picked from the header
        Deflate,  // zlib-wrapped, or raw deflate when there is no zlib header
    };

    // max_output caps the total decoded size (0 = unlimited). Inflation
    // stops and RequestException is thrown as soon as the cap is passed.
    explicit Decompressor(Format format = Format::Auto, size_t max_output = 0);
    ~Decompressor() override;

    Decompressor(const Decompressor&) = delete;
    Decompressor& operator=(const Decompressor&) = delete;

    void put(const BufferChunk& data) override;
    BufferChunk get() override;
    bool empty() const override { return buffer_.empty(); }
    void flush() override;

    // A complete compressed stream has been decoded.
    bool finished() const { return stream_end_; }

    // Decoded bytes accumulated so far, not yet taken by get().
    const Buffer& data() const { return buffer_; }

private:
    void init(int window_bits);
    void inflate_bytes(const uint8_t* data, size_t len);

    Format format_;
    size_t max_output_;
    size_t produced_ = 0;
    z_stream strm_{};
    bool initialized_ = false;
    bool stream_end_ = false;
    bool saw_input_ = false;
    std::vector<uint8_t> pending_;  // header bytes held back for Deflate sniffing
    Buffer buffer_;
};

} // namespace conduit::net
