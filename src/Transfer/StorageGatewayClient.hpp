#pragma once

#include "IStorageBackend.hpp"

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace voicenote {

typedef websocketpp::client<websocketpp::config::asio_client> ws_client;

// Talks to the storage gateway over a websocket. Every request carries a
// request_id and blocks until the matching reply arrives or the timeout
// expires.
//
//   -> {"type":"upload","request_id":"3","bucket":...,"path":...,"payload":...}
//   <- {"request_id":"3","ok":true,"url":"https://.../voice-messages/<path>"}
class StorageGatewayClient : public IStorageBackend {
public:
    StorageGatewayClient(const std::string& server_url, const std::string& bucket,
                         std::chrono::milliseconds timeout);
    ~StorageGatewayClient() override;

    bool Connect();
    void Disconnect();
    bool IsConnected() const { return _connected; }

    std::string Upload(const UploadRequest& request) override;
    void Delete(const std::string& url) override;

    // Object path after "/<bucket>/" in a public URL, empty when absent
    static std::string ExtractObjectPath(const std::string& url, const std::string& bucket);

private:
    nlohmann::json SendRequest(nlohmann::json message);

    void OnMessage(websocketpp::connection_hdl hdl, ws_client::message_ptr msg);
    void OnOpen(websocketpp::connection_hdl hdl);
    void OnClose(websocketpp::connection_hdl hdl);
    void OnFail(websocketpp::connection_hdl hdl);
    void FailPending(const std::string& reason);

    ws_client _endpoint;
    websocketpp::connection_hdl _hdl;
    std::string _server_url;
    std::string _bucket;
    std::chrono::milliseconds _timeout;

    std::unique_ptr<std::thread> _thread;
    std::atomic<bool> _connected;
    std::unique_ptr<std::promise<bool>> _open_promise;

    std::map<std::string, std::promise<nlohmann::json>> _pending;
    uint64_t _next_request_id;
    std::mutex _mutex;
};

} // namespace voicenote
