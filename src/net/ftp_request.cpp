#include <conduit/net/ftp_request.h>
#include <conduit/net/data_pipe.h>
#include <conduit/net/errors.h>
#include <conduit/net/tls_stream.h>
#include <conduit/core/diagnostics.h>

#include <cctype>
#include <iostream>
#include <vector>

namespace conduit::net {

namespace {

bool parse_reply_code(const std::string& line, int& code) {
    if (line.size() < 3) {
        return false;
    }
    code = 0;
    for (size_t i = 0; i < 3; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
            return false;
        }
        code = code * 10 + (line[i] - '0');
    }
    return line.size() == 3 || line[3] == ' ' || line[3] == '-';
}

// "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)"
bool parse_pasv(const std::string& text, std::string& host, uint16_t& port) {
    size_t pos = text.find('(');
    pos = pos == std::string::npos ? text.find_first_of("0123456789", 4) : pos + 1;
    if (pos == std::string::npos) {
        return false;
    }

    unsigned values[6] = {};
    for (int i = 0; i < 6; ++i) {
        if (pos >= text.size() || !std::isdigit(static_cast<unsigned char>(text[pos]))) {
            return false;
        }
        unsigned v = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            v = v * 10 + static_cast<unsigned>(text[pos] - '0');
            if (v > 255) {
                return false;
            }
            ++pos;
        }
        values[i] = v;
        if (i < 5) {
            if (pos >= text.size() || text[pos] != ',') {
                return false;
            }
            ++pos;
        }
    }

    host = std::to_string(values[0]) + "." + std::to_string(values[1]) + "." +
           std::to_string(values[2]) + "." + std::to_string(values[3]);
    port = static_cast<uint16_t>(values[4] * 256 + values[5]);
    return true;
}

} // anonymous namespace

FtpRequest::FtpRequest(RequestConfig config) : config_(std::move(config)) {}

FtpRequest::~FtpRequest() {
    close();
}

Response FtpRequest::get(const std::string& uri) {
    return transfer(uri, nullptr);
}

Response FtpRequest::post(const std::string& uri, const std::string& data) {
    auto body = body_from_string(data);
    return transfer(uri, body.get());
}

Response FtpRequest::post(const std::string& uri, std::unique_ptr<BodySource> body) {
    if (!body) {
        body = body_from_string({});
    }
    return transfer(uri, body.get());
}

void FtpRequest::close() {
    if (control_ && control_->is_connected() && state_ != State::Transferring) {
        try {
            command("QUIT");
        } catch (const NetError& e) {
            core::DiagnosticEmitter::shared().debug("ftp", "quit", e.what());
        }
    }
    drop_control();
}

// ---------------------------------------------------------------------------
// Transfer
// ---------------------------------------------------------------------------

Response FtpRequest::transfer(const std::string& uri_text, BodySource* upload) {
    auto uri = Uri::parse(uri_text);
    if (!uri) {
        throw RequestException("Can't parse URI: " + uri_text);
    }
    if (uri->scheme != "ftp") {
        throw RequestException("Unsupported scheme for an FTP request: " + uri->scheme);
    }

    active_ = config_;
    if (active_.buffer_size == 0) {
        active_.buffer_size = core::config::kDefaultBufferSize;
    }
    const std::string verb = upload ? "STOR " : "RETR ";
    core::DiagnosticEmitter::shared().debug("ftp", "request", verb + uri->to_string(false));

    Response resp;
    try {
        resp = [&]() -> Response {
            if (auto refused = open_session(*uri)) {
                return to_response(*uri, *refused);
            }

            Reply reply = command("TYPE I");
            if (!reply.ok()) {
                return to_response(*uri, reply);
            }

            auto data = open_data_connection(reply);
            if (!data) {
                return to_response(*uri, reply);
            }

            const std::string path = url_decode(uri->path);
            reply = command((upload ? "STOR " : "RETR ") + path);
            if (!reply.preliminary() && !reply.ok()) {
                data->close();
                return to_response(*uri, reply);
            }

            state_ = State::Transferring;
            Response result = to_response(*uri, reply);
            if (upload) {
                send_data(*data, *upload);
            } else {
                receive_data(*data, result);
            }
            data->close();

            if (reply.preliminary()) {
                reply = read_reply();
            }
            state_ = State::LoggedIn;
            result.status = static_cast<uint16_t>(reply.code);
            result.status_text = reply.text;
            return result;
        }();
    } catch (...) {
        drop_control();
        throw;
    }

    if (!active_.keep_alive) {
        close();
    }
    return resp;
}

std::optional<FtpRequest::Reply> FtpRequest::open_session(const Uri& uri) {
    auto& log = core::DiagnosticEmitter::shared();

    std::string user = uri.username;
    std::string password = uri.password;
    if (user.empty() && active_.authenticator) {
        user = active_.authenticator->user_name();
        password = active_.authenticator->password();
    }
    if (user.empty()) {
        user = "anonymous";
        if (password.empty()) {
            password = "anonymous@";
        }
    }

    const std::string key = uri.host + "|" + std::to_string(uri.port) + "|" + user;
    if (control_ && control_->is_connected() && state_ == State::LoggedIn && key == session_key_) {
        try {
            if (command("NOOP").ok()) {
                log.debug("ftp", "session", "reusing control connection to " + uri.host);
                return std::nullopt;
            }
        } catch (const NetError& e) {
            log.warning("ftp", "session", std::string("stale control connection: ") + e.what());
        }
        drop_control();
    } else if (control_) {
        close();
    }

    control_ = make_stream("ftp");
    control_->connect(uri.host, uri.port, active_.timeout);
    control_->set_read_timeout(active_.timeout);
    state_ = State::Connected;
    control_host_ = uri.host;
    session_key_ = key;

    Reply reply = read_reply();
    if (!reply.ok()) {
        drop_control();
        return reply;
    }

    reply = command("USER " + user);
    if (reply.code == 331) {
        reply = command("PASS " + password);
    }
    if (!reply.ok()) {
        drop_control();
        return reply;
    }

    state_ = State::LoggedIn;
    return std::nullopt;
}

std::unique_ptr<NetworkStream> FtpRequest::open_data_connection(Reply& reply) {
    reply = command("PASV");
    if (reply.code != 227) {
        return nullptr;
    }

    std::string host;
    uint16_t port = 0;
    if (!parse_pasv(reply.text, host, port)) {
        throw NetworkException("Can't parse PASV reply: " + reply.text);
    }
    if (host == "0.0.0.0") {
        host = control_host_;
    }

    auto data = std::make_unique<TcpStream>();
    data->connect(host, port, active_.timeout);
    data->set_read_timeout(active_.timeout);
    return data;
}

void FtpRequest::receive_data(NetworkStream& data, Response& resp) {
    DataPipe pipe;
    std::vector<uint8_t> buf(active_.buffer_size);
    const size_t limit = active_.max_content_length;

    while (true) {
        const size_t n = data.receive(buf.data(), buf.size());
        if (n == 0) {
            break;
        }
        pipe.put(BufferChunk(buf.data(), n));
        for (auto& chunk : pipe.get_chunks()) {
            resp.body.put(std::move(chunk));
        }
        if (limit != 0 && resp.body.length() > limit) {
            throw RequestException("ContentLength > max_content_length (" + std::to_string(limit) + ")");
        }
        if (active_.verbosity >= 2) {
            std::cout << "< " << resp.body.length() << " bytes of data received\n";
            std::cout.flush();
        }
    }
    pipe.flush();
    for (auto& chunk : pipe.get_chunks()) {
        resp.body.put(std::move(chunk));
    }
}

void FtpRequest::send_data(NetworkStream& data, BodySource& body) {
    size_t sent = 0;
    while (auto chunk = body.next_chunk()) {
        data.send(chunk->data(), chunk->size());
        sent += chunk->size();
        if (active_.verbosity >= 2) {
            std::cout << "> " << sent << " bytes of data sent\n";
            std::cout.flush();
        }
    }
}

// ---------------------------------------------------------------------------
// Control channel
// ---------------------------------------------------------------------------

FtpRequest::Reply FtpRequest::command(const std::string& line) {
    if (!control_) {
        throw NetworkException("FTP control connection is not open");
    }
    if (active_.verbosity >= 1) {
        std::cout << "> " << (line.rfind("PASS ", 0) == 0 ? std::string("PASS ****") : line) << "\n";
        std::cout.flush();
    }
    control_->send(line + "\r\n");
    return read_reply();
}

FtpRequest::Reply FtpRequest::read_reply() {
    Reply reply;
    std::string line = read_line();
    if (!parse_reply_code(line, reply.code)) {
        throw NetworkException("Malformed FTP reply: " + line);
    }
    reply.text = line.size() > 4 ? line.substr(4) : std::string();

    if (line.size() > 3 && line[3] == '-') {
        // Multi-line reply ends with "<code> "
        const std::string last_prefix = line.substr(0, 3) + " ";
        const size_t limit = active_.max_headers_length;
        while (true) {
            line = read_line();
            reply.text += "\n" + line;
            if (limit != 0 && reply.text.size() > limit) {
                throw RequestException("FTP reply too long (limit " + std::to_string(limit) + " bytes)");
            }
            if (line.rfind(last_prefix, 0) == 0 || line == last_prefix.substr(0, 3)) {
                break;
            }
        }
    }

    if (active_.verbosity >= 1) {
        std::cout << "< " << reply.code << " " << reply.text << "\n";
        std::cout.flush();
    }
    return reply;
}

std::string FtpRequest::read_line() {
    const size_t limit = active_.max_headers_length;
    std::vector<uint8_t> buf(active_.buffer_size == 0 ? core::config::kDefaultBufferSize
                                                      : active_.buffer_size);
    while (true) {
        const auto nl = control_buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = control_buffer_.substr(0, nl);
            control_buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        if (limit != 0 && control_buffer_.size() > limit) {
            throw RequestException("FTP reply too long (limit " + std::to_string(limit) + " bytes)");
        }

        const size_t n = control_->receive(buf.data(), buf.size());
        if (n == 0) {
            throw NetworkException("FTP server closed the control connection");
        }
        control_buffer_.append(reinterpret_cast<const char*>(buf.data()), n);
    }
}

void FtpRequest::drop_control() {
    if (control_) {
        control_->close();
        control_.reset();
    }
    control_buffer_.clear();
    session_key_.clear();
    state_ = State::Disconnected;
}

Response FtpRequest::to_response(const Uri& uri, const Reply& reply) {
    Response resp;
    resp.status = static_cast<uint16_t>(reply.code);
    resp.status_text = reply.text;
    resp.uri = uri;
    return resp;
}

} // namespace conduit::net
