#pragma once

#include <nlohmann/json.hpp>
#include <string>

enum class ReadStatus {
    Command,    // cmd holds one parsed request
    Incomplete, // no full line buffered yet
    Closed,     // peer hung up or errored
    Invalid,    // a line arrived but was not JSON
};

class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    // Receive what is available and return the first complete line.
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    // Return a further line already buffered, without reading the socket.
    virtual ReadStatus next_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
