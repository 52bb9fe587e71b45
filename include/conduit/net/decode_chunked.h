#pragma once
#include <conduit/net/buffer.h>
#include <conduit/net/data_pipe.h>
#include <cstddef>
#include <string>

namespace conduit::net {

// Removes HTTP chunked transfer-coding framing.
//
//   chunked-body = *chunk last-chunk trailer CRLF
//   chunk        = chunk-size [ chunk-ext ] CRLF chunk-data CRLF
//
// Input may be split anywhere; decoded data is handed out as slices of the
// received fragments, so get() units follow the network reads rather than
// the protocol chunks. Trailer header lines are skipped, not parsed.
class DecodeChunked : public DataStage {
public:
    enum class State {
        HuntingSize,
        HuntingSeparator,
        Receiving,
        Trailer,
    };

    static constexpr size_t kMaxSizeLine = 80;

    void put(const BufferChunk& data) override;
    BufferChunk get() override;
    bool empty() const override { return buffer_.empty(); }
    void flush() override {}

    // The terminating chunk and the final CRLF have been seen.
    bool done() const { return state_ == State::Trailer && to_receive_ == 0; }

    State state() const { return state_; }
    // Bytes received after the body was complete.
    size_t excess_bytes() const { return excess_; }

private:
    size_t parse_size_line() const;
    size_t consume_trailer(const BufferChunk& data, size_t pos);

    State state_ = State::HuntingSize;
    std::string line_;
    size_t to_receive_ = 0;
    size_t trailer_line_ = 0;
    size_t excess_ = 0;
    Buffer buffer_;
};

} // namespace conduit::net
