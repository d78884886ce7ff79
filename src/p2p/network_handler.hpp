#ifndef NETWORK_HANDLER_HPP
#define NETWORK_HANDLER_HPP

#include <iostream>
#include <string>
#include <zmq.hpp>
#include <cstring>
#include <chrono>

namespace p2p {

// "ip:port" -> (ip, port). Returns false when the port is missing or invalid.
inline bool splitEndpoint(const std::string &endpoint, std::string &ip, int &port) {
    size_t sep = endpoint.rfind(':');
    if (sep == std::string::npos || sep == 0 || sep + 1 >= endpoint.size()) {
        return false;
    }
    try {
        size_t used = 0;
        port = std::stoi(endpoint.substr(sep + 1), &used);
        if (used != endpoint.size() - sep - 1 || port <= 0 || port > 65535) {
            return false;
        }
    } catch (const std::exception &) {
        return false;
    }
    ip = endpoint.substr(0, sep);
    return true;
}

// DEALER socket wrapper. Every outgoing message is two frames: an identity
// frame "\x01<local_ip>\x00<local_port>" naming where replies should go, then
// the payload.
class NetworkHandler {
public:
    // Return a reference to a shared ZeroMQ context.
    static zmq::context_t& getContext() {
        static zmq::context_t context(1);
        return context;
    }

    NetworkHandler() : NetworkHandler("127.0.0.1", 0) {}

    NetworkHandler(std::string local_ip, int local_port)
        : socket(getContext(), ZMQ_DEALER), connected(false), local_ip(std::move(local_ip)), local_port(local_port) {
        socket.set(zmq::sockopt::linger, 1000);
    }

    NetworkHandler(const NetworkHandler &) = delete;
    NetworkHandler &operator=(const NetworkHandler &) = delete;

    ~NetworkHandler() {
        disconnect();
    }

    // Connect to a remote endpoint.
    bool connect(const std::string &address, int port) {
        return attach(address, port, false);
    }

    // Bind to a local endpoint (used for receiving messages).
    bool bind(const std::string &address, int port) {
        return attach(address, port, true);
    }

    bool sendData(const std::string &data) {
        if (!connected) {
            std::cerr << "[NetworkHandler] Not connected. Cannot send data." << std::endl;
            return false;
        }

        try {
            std::string identity;
            identity.push_back('\x01');
            identity += local_ip;
            identity.push_back('\x00');
            identity += std::to_string(local_port);

            zmq::message_t id_msg(identity.data(), identity.size());
            zmq::message_t content_msg(data.data(), data.size());

            socket.send(id_msg, zmq::send_flags::sndmore);
            socket.send(content_msg, zmq::send_flags::none);
        } catch (const zmq::error_t &e) {
            std::cerr << "[NetworkHandler] ZeroMQ send error: " << e.what() << std::endl;
            return false;
        }
        return true;
    }

    // Receive one message, waiting at most timeout_ms (-1 blocks). Returns an
    // empty string on timeout or on a malformed identity frame.
    std::string receiveData(std::string& sender_ip, int& sender_port, int timeout_ms = -1) {
        if (!connected) {
            std::cerr << "[NetworkHandler] Not connected. Cannot receive data." << std::endl;
            return "";
        }

        try {
            zmq::pollitem_t item = { static_cast<void*>(socket), 0, ZMQ_POLLIN, 0 };
            int rc = zmq::poll(&item, 1, std::chrono::milliseconds(timeout_ms));
            if (rc == 0 || !(item.revents & ZMQ_POLLIN)) {
                return "";
            }

            zmq::message_t identity;
            zmq::message_t content;
            if (!socket.recv(identity, zmq::recv_flags::none)) {
                return "";
            }
            if (!identity.more() || !socket.recv(content, zmq::recv_flags::none)) {
                std::cerr << "[NetworkHandler] Dropping single-frame message" << std::endl;
                return "";
            }

            if (!parseIdentity(identity.to_string(), sender_ip, sender_port)) {
                std::cerr << "[NetworkHandler] Dropping message with malformed identity frame" << std::endl;
                return "";
            }

            return content.to_string();
        } catch (const zmq::error_t &e) {
            std::cerr << "[NetworkHandler] ZeroMQ receive error: " << e.what() << std::endl;
        }
        return "";
    }

    void disconnect() {
        if (connected) {
            try {
                socket.close();
            } catch (const zmq::error_t &e) {
                std::cerr << "[NetworkHandler] ZeroMQ disconnect error: " << e.what() << std::endl;
            }
            connected = false;
        }
    }

    bool isConnected() const {
        return connected;
    }

    static bool parseIdentity(const std::string &identity, std::string &ip, int &port) {
        if (identity.size() < 3 || identity[0] != '\x01') {
            return false;
        }
        std::string ip_port = identity.substr(1);
        size_t sep = ip_port.find('\0');
        if (sep == std::string::npos) {
            return false;
        }
        try {
            port = std::stoi(ip_port.substr(sep + 1));
        } catch (const std::exception &) {
            return false;
        }
        ip = ip_port.substr(0, sep);
        return true;
    }

private:
    zmq::socket_t socket;
    bool connected;
    std::string local_ip;
    int local_port;

    bool attach(const std::string &address, int port, bool asServer) {
        disconnect();
        if (!socket) {
            // closed by an earlier disconnect
            socket = zmq::socket_t(getContext(), ZMQ_DEALER);
            socket.set(zmq::sockopt::linger, 1000);
        }

        std::string endpoint = "tcp://" + address + ":" + std::to_string(port);
        try {
            if (asServer) {
                socket.bind(endpoint);
            } else {
                socket.connect(endpoint);
            }
            connected = true;
        } catch (const zmq::error_t &e) {
            std::cerr << "[NetworkHandler] ZeroMQ " << (asServer ? "binding" : "connection")
                      << " error on " << endpoint << ": " << e.what() << std::endl;
            connected = false;
        }
        return connected;
    }
};

} // namespace p2p

#endif // NETWORK_HANDLER_HPP
