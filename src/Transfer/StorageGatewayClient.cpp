#include "StorageGatewayClient.hpp"
#include "../common/VoiceErrors.hpp"
#include "../common/debug_log.hpp"

namespace voicenote {

using websocketpp::lib::placeholders::_1;
using websocketpp::lib::placeholders::_2;
using websocketpp::lib::bind;

StorageGatewayClient::StorageGatewayClient(const std::string& server_url, const std::string& bucket,
                                           std::chrono::milliseconds timeout)
    : _server_url(server_url)
    , _bucket(bucket)
    , _timeout(timeout)
    , _connected(false)
    , _next_request_id(1) {

    _endpoint.clear_access_channels(websocketpp::log::alevel::all);
    _endpoint.clear_error_channels(websocketpp::log::elevel::all);

    _endpoint.init_asio();
    _endpoint.start_perpetual();

    _endpoint.set_open_handler(bind(&StorageGatewayClient::OnOpen, this, _1));
    _endpoint.set_close_handler(bind(&StorageGatewayClient::OnClose, this, _1));
    _endpoint.set_fail_handler(bind(&StorageGatewayClient::OnFail, this, _1));
    _endpoint.set_message_handler(bind(&StorageGatewayClient::OnMessage, this, _1, _2));

    _thread = std::make_unique<std::thread>([this]() {
        try {
            _endpoint.run();
        } catch (const std::exception& e) {
            ERROR_LOG("StorageGatewayClient: websocket run error: " << e.what());
        }
    });
}

StorageGatewayClient::~StorageGatewayClient() {
    Disconnect();
    _endpoint.stop_perpetual();
    if (_thread && _thread->joinable()) {
        _thread->join();
    }
}

bool StorageGatewayClient::Connect() {
    if (_connected) {
        return true;
    }

    std::future<bool> opened;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _open_promise = std::make_unique<std::promise<bool>>();
        opened = _open_promise->get_future();
    }

    websocketpp::lib::error_code ec;
    ws_client::connection_ptr con = _endpoint.get_connection(_server_url, ec);
    if (ec) {
        ERROR_LOG("StorageGatewayClient: could not create connection: " << ec.message());
        return false;
    }
    _endpoint.connect(con);

    if (opened.wait_for(_timeout) != std::future_status::ready) {
        ERROR_LOG("StorageGatewayClient: timed out connecting to " << _server_url);
        return false;
    }
    return opened.get();
}

void StorageGatewayClient::Disconnect() {
    if (_connected) {
        websocketpp::lib::error_code ec;
        _endpoint.close(_hdl, websocketpp::close::status::normal, "", ec);
        if (ec) {
            ERROR_LOG("StorageGatewayClient: error closing connection: " << ec.message());
        }
        _connected = false;
    }
    FailPending("connection closed");
}

std::string StorageGatewayClient::ExtractObjectPath(const std::string& url, const std::string& bucket) {
    const std::string marker = "/" + bucket + "/";
    const size_t pos = url.find(marker);
    if (pos == std::string::npos) {
        return "";
    }

    std::string path = url.substr(pos + marker.size());
    const size_t query = path.find_first_of("?#");
    if (query != std::string::npos) {
        path.erase(query);
    }
    return path;
}

std::string StorageGatewayClient::Upload(const UploadRequest& request) {
    nlohmann::json message = {
        {"type", "upload"},
        {"bucket", _bucket},
        {"path", request.objectPath},
        {"content_type", request.contentType},
        {"payload", request.payload},
        {"context", request.context},
        {"sender_id", request.senderId}
    };
    if (request.durationSeconds) {
        message["duration_seconds"] = *request.durationSeconds;
    }

    nlohmann::json reply = SendRequest(std::move(message));
    std::string url = reply.value("url", "");
    if (url.empty()) {
        throw TransferFailure("Storage gateway returned no public URL for " + request.objectPath);
    }
    return url;
}

void StorageGatewayClient::Delete(const std::string& url) {
    std::string path = ExtractObjectPath(url, _bucket);
    if (path.empty()) {
        WARN_LOG("StorageGatewayClient: could not extract file path from URL: " << url);
        return;
    }

    SendRequest({
        {"type", "delete"},
        {"bucket", _bucket},
        {"path", path}
    });
    DEBUG_LOG("StorageGatewayClient: deleted " << path << DEBUG_LOG_ENDL);
}

nlohmann::json StorageGatewayClient::SendRequest(nlohmann::json message) {
    if (!_connected) {
        throw TransferFailure("Not connected to storage gateway");
    }

    std::string requestId;
    std::future<nlohmann::json> reply;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        requestId = std::to_string(_next_request_id++);
        reply = _pending[requestId].get_future();
    }
    message["request_id"] = requestId;

    websocketpp::lib::error_code ec;
    _endpoint.send(_hdl, message.dump(), websocketpp::frame::opcode::text, ec);
    if (ec) {
        std::lock_guard<std::mutex> lock(_mutex);
        _pending.erase(requestId);
        throw TransferFailure("Error sending request: " + ec.message());
    }

    if (reply.wait_for(_timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(_mutex);
        _pending.erase(requestId);
        throw TransferFailure("Storage gateway did not answer request " + requestId);
    }

    // get() rethrows when the connection dropped while waiting
    nlohmann::json result = reply.get();
    if (!result.value("ok", false)) {
        throw TransferFailure("Storage gateway error: " + result.value("error", std::string("unknown error")));
    }
    return result;
}

void StorageGatewayClient::FailPending(const std::string& reason) {
    std::map<std::string, std::promise<nlohmann::json>> pending;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        pending.swap(_pending);
    }
    for (auto& entry : pending) {
        entry.second.set_exception(std::make_exception_ptr(TransferFailure("Storage request aborted: " + reason)));
    }
}

void StorageGatewayClient::OnOpen(websocketpp::connection_hdl hdl) {
    _hdl = hdl;
    _connected = true;
    DEBUG_LOG("StorageGatewayClient: connected to " << _server_url << DEBUG_LOG_ENDL);

    std::lock_guard<std::mutex> lock(_mutex);
    if (_open_promise) {
        _open_promise->set_value(true);
        _open_promise.reset();
    }
}

void StorageGatewayClient::OnClose(websocketpp::connection_hdl hdl) {
    _connected = false;
    DEBUG_LOG("StorageGatewayClient: disconnected" << DEBUG_LOG_ENDL);
    FailPending("connection closed");
}

void StorageGatewayClient::OnFail(websocketpp::connection_hdl hdl) {
    _connected = false;
    ERROR_LOG("StorageGatewayClient: connection to " << _server_url << " failed");

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_open_promise) {
            _open_promise->set_value(false);
            _open_promise.reset();
        }
    }
    FailPending("connection failed");
}

void StorageGatewayClient::OnMessage(websocketpp::connection_hdl hdl, ws_client::message_ptr msg) {
    nlohmann::json reply;
    std::string requestId;
    try {
        reply = nlohmann::json::parse(msg->get_payload());
        requestId = reply.value("request_id", "");
    } catch (const nlohmann::json::exception& e) {
        ERROR_LOG("StorageGatewayClient: error parsing message: " << e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _pending.find(requestId);
    if (it == _pending.end()) {
        DEBUG_LOG("StorageGatewayClient: ignoring reply for unknown request '" << requestId << "'" << DEBUG_LOG_ENDL);
        return;
    }
    it->second.set_value(std::move(reply));
    _pending.erase(it);
}

} // namespace voicenote
