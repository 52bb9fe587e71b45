#pragma once
#include <conduit/net/body_source.h>
#include <conduit/net/http_request.h>
#include <conduit/net/network_stream.h>
#include <conduit/net/response.h>
#include <conduit/net/uri.h>
#include <memory>
#include <optional>
#include <string>

namespace conduit::net {

// FTP client for single-file retrieve (RETR) and store (STOR) in passive
// mode. The logged-in control connection is kept for the next request to
// the same server and user while keep_alive is set.
//
// Server refusals (550 and friends) come back as the response status;
// only transport faults and limit violations throw.
class FtpRequest {
public:
    enum class State {
        Disconnected,
        Connected,
        LoggedIn,
        Transferring,
    };

    explicit FtpRequest(RequestConfig config = {});
    ~FtpRequest();

    FtpRequest(const FtpRequest&) = delete;
    FtpRequest& operator=(const FtpRequest&) = delete;

    RequestConfig& config() { return config_; }
    const RequestConfig& config() const { return config_; }

    Response get(const std::string& uri);
    Response post(const std::string& uri, const std::string& data);
    Response post(const std::string& uri, std::unique_ptr<BodySource> body);

    State state() const { return state_; }

    // Send QUIT and drop the control connection.
    void close();

private:
    struct Reply {
        int code = 0;
        std::string text;

        bool preliminary() const { return code >= 100 && code < 200; }
        bool ok() const { return code >= 200 && code < 300; }
    };

    Response transfer(const std::string& uri, BodySource* upload);
    // Reuse or establish a logged-in session; a refusal is returned.
    std::optional<Reply> open_session(const Uri& uri);
    std::unique_ptr<NetworkStream> open_data_connection(Reply& reply);
    void receive_data(NetworkStream& data, Response& resp);
    void send_data(NetworkStream& data, BodySource& body);

    Reply command(const std::string& line);
    Reply read_reply();
    std::string read_line();
    void drop_control();

    static Response to_response(const Uri& uri, const Reply& reply);

    RequestConfig config_;
    RequestConfig active_;  // snapshot for the request in flight
    std::unique_ptr<NetworkStream> control_;
    std::string session_key_;
    std::string control_host_;
    std::string control_buffer_;
    State state_ = State::Disconnected;
};

} // namespace conduit::net
