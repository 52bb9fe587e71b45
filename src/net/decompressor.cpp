#include <conduit/net/decompressor.h>
#include <conduit/net/errors.h>

#include <string>

namespace conduit::net {

namespace {

constexpr int kAutoWindowBits = 15 + 32;  // gzip or zlib auto-detection
constexpr int kZlibWindowBits = 15;
constexpr int kRawWindowBits = -15;
constexpr size_t kInflateChunk = 16384;

bool looks_like_zlib_header(uint8_t cmf, uint8_t flg) {
    return (cmf & 0x0F) == 8 && (cmf >> 4) <= 7 && ((cmf << 8) | flg) % 31 == 0;
}

} // anonymous namespace

Decompressor::Decompressor(Format format, size_t max_output) : format_(format), max_output_(max_output) {
    if (format_ == Format::Auto) {
        init(kAutoWindowBits);
    }
}

Decompressor::~Decompressor() {
    if (initialized_) {
        inflateEnd(&strm_);
    }
}

void Decompressor::init(int window_bits) {
    strm_ = z_stream{};
    if (inflateInit2(&strm_, window_bits) != Z_OK) {
        throw DecodingException("inflateInit2 failed");
    }
    initialized_ = true;
}

void Decompressor::put(const BufferChunk& data) {
    if (data.empty()) {
        return;
    }
    saw_input_ = true;

    if (!initialized_) {
        // Content-Encoding: deflate is sent both with and without the zlib
        // wrapper; the first two bytes tell them apart.
        pending_.insert(pending_.end(), data.data(), data.data() + data.size());
        if (pending_.size() < 2) {
            return;
        }
        init(looks_like_zlib_header(pending_[0], pending_[1]) ? kZlibWindowBits : kRawWindowBits);
        std::vector<uint8_t> held;
        held.swap(pending_);
        inflate_bytes(held.data(), held.size());
        return;
    }

    inflate_bytes(data.data(), data.size());
}

void Decompressor::inflate_bytes(const uint8_t* data, size_t len) {
    strm_.next_in = const_cast<Bytef*>(data);
    strm_.avail_in = static_cast<uInt>(len);

    uint8_t out[kInflateChunk];
    while (true) {
        if (stream_end_) {
            if (strm_.avail_in == 0) {
                break;
            }
            // Another gzip member follows; anything else after the end of
            // the stream is ignored.
            if (format_ == Format::Auto && *strm_.next_in == 0x1f) {
                inflateReset(&strm_);
                stream_end_ = false;
            } else {
                strm_.avail_in = 0;
                break;
            }
        }

        strm_.next_out = out;
        strm_.avail_out = sizeof(out);
        const int ret = inflate(&strm_, Z_NO_FLUSH);

        const size_t have = sizeof(out) - strm_.avail_out;
        if (have > 0) {
            produced_ += have;
            if (max_output_ != 0 && produced_ > max_output_) {
                throw RequestException("ContentLength > max_content_length (" + std::to_string(max_output_) + ")");
            }
            buffer_.put(out, have);
        }

        if (ret == Z_STREAM_END) {
            stream_end_ = true;
            continue;
        }
        if (ret == Z_BUF_ERROR) {
            break;  // needs more input
        }
        if (ret != Z_OK) {
            std::string message = "inflate failed";
            if (strm_.msg != nullptr) {
                message += ": ";
                message += strm_.msg;
            }
            throw DecodingException(message);
        }
        if (strm_.avail_in == 0 && strm_.avail_out != 0) {
            break;
        }
    }
}

void Decompressor::flush() {
    if (!saw_input_) {
        return;
    }
    if (!initialized_ || !stream_end_) {
        throw DecodingException("compressed stream truncated");
    }
}

BufferChunk Decompressor::get() {
    BufferChunk chunk = buffer_.front_chunk();
    buffer_.pop_front_chunk();
    return chunk;
}

} // namespace conduit::net
