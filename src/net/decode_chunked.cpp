#include <conduit/net/decode_chunked.h>
#include <conduit/net/errors.h>

#include <algorithm>

namespace conduit::net {

namespace {

int hex_digit_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
        return 10 + (ch - 'A');
    }
    return -1;
}

} // anonymous namespace

void DecodeChunked::put(const BufferChunk& data) {
    const size_t n = data.size();
    size_t pos = 0;

    while (pos < n) {
        switch (state_) {
            case State::Trailer:
                pos = consume_trailer(data, pos);
                break;

            case State::HuntingSize: {
                bool complete = false;
                while (pos < n) {
                    const char ch = static_cast<char>(data[pos++]);
                    if (ch == '\n') {
                        complete = true;
                        break;
                    }
                    if (line_.size() >= kMaxSizeLine) {
                        throw DecodingException("Can't find chunk size in the body");
                    }
                    line_.push_back(ch);
                }
                if (!complete) {
                    break;
                }

                const size_t chunk_size = parse_size_line();
                line_.clear();
                if (chunk_size == 0) {
                    state_ = State::Trailer;
                    to_receive_ = 2;  // final CRLF
                    trailer_line_ = 0;
                } else {
                    state_ = State::Receiving;
                    to_receive_ = chunk_size;
                }
                break;
            }

            case State::Receiving: {
                const size_t take = std::min(to_receive_, n - pos);
                buffer_.put(data.slice(pos, take));
                pos += take;
                to_receive_ -= take;
                if (to_receive_ == 0) {
                    state_ = State::HuntingSeparator;
                }
                break;
            }

            case State::HuntingSeparator:
                if (data[pos] == '\r' || data[pos] == '\n') {
                    ++pos;
                } else {
                    state_ = State::HuntingSize;
                    line_.clear();
                }
                break;
        }
    }
}

size_t DecodeChunked::parse_size_line() const {
    size_t value = 0;
    size_t digits = 0;
    for (char ch : line_) {
        if (ch == ';' || ch == '\r') {
            break;  // chunk extensions are ignored
        }
        const int v = hex_digit_value(ch);
        if (v < 0) {
            continue;
        }
        if (++digits > sizeof(size_t) * 2) {
            throw DecodingException("Chunk size too large: " + line_);
        }
        value = value * 16 + static_cast<size_t>(v);
    }
    if (digits == 0) {
        throw DecodingException("Can't find chunk size in the body");
    }
    return value;
}

size_t DecodeChunked::consume_trailer(const BufferChunk& data, size_t pos) {
    const size_t n = data.size();
    while (pos < n && to_receive_ > 0) {
        const char ch = static_cast<char>(data[pos++]);
        if (ch == '\n') {
            if (trailer_line_ == 0) {
                to_receive_ = 0;
            } else {
                // end of a trailer header line; the final CRLF is still due
                trailer_line_ = 0;
                to_receive_ = 2;
            }
        } else if (ch == '\r') {
            if (trailer_line_ == 0) {
                to_receive_ = 1;
            }
        } else {
            ++trailer_line_;
            to_receive_ = 2;
        }
    }
    if (to_receive_ == 0) {
        excess_ += n - pos;
        return n;
    }
    return pos;
}

BufferChunk DecodeChunked::get() {
    BufferChunk chunk = buffer_.front_chunk();
    buffer_.pop_front_chunk();
    return chunk;
}

} // namespace conduit::net
