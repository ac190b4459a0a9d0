#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "protocol.hpp"
#include "transport.hpp"

namespace tftpc {

struct TransferOptions {
    Transport::endpoint server{asio::ip::address_v4::loopback(), kDefaultServerPort};
    std::chrono::milliseconds timeout{0};   // 0 blocks forever, no retransmission
    int retries{5};
    bool strict_blocks{false};
};

// Tracks the transfer ID of one exchange and the datagram to retransmit
// when a receive times out.
class PeerChannel {
public:
    PeerChannel(Transport& transport, const TransferOptions& opts);

    std::optional<TransferError> send_request(std::vector<uint8_t> datagram);
    std::optional<TransferError> send(std::vector<uint8_t> datagram);
    std::optional<TransferError> receive(size_t& len);

    const uint8_t* data() const { return buf_.data(); }
    bool peer_known() const { return peer_known_; }
    const Transport::endpoint& peer() const { return peer_; }
private:
    std::optional<TransferError> transmit(const Transport::endpoint& to);
    void reject_stranger(const Transport::endpoint& from);

    Transport& transport_;
    const TransferOptions& opts_;
    Transport::endpoint peer_;
    bool peer_known_{false};
    std::vector<uint8_t> last_sent_;
    std::vector<uint8_t> buf_;
};

class ReadTransfer {
public:
    enum class State { Start, AwaitData, SendAck, Done, Failed };

    ReadTransfer(Transport& transport, std::string path, const TransferOptions& opts);
    std::optional<TransferError> run(std::vector<uint8_t>& out);
    State state() const { return state_; }
private:
    std::optional<TransferError> on_data(size_t len);
    std::optional<TransferError> fail(TransferError err);

    std::string path_;
    TransferOptions opts_;
    PeerChannel channel_;
    State state_{State::Start};
    std::vector<uint8_t> buffer_;
    DataPacket current_;
    size_t current_len_{0};
    bool current_is_new_{true};
    uint16_t expected_block_{1};
};

class WriteTransfer {
public:
    enum class State { Start, AwaitAck, SendData, Done, Failed };

    WriteTransfer(Transport& transport, std::string path,
                  const std::vector<uint8_t>& data, const TransferOptions& opts);
    std::optional<TransferError> run();
    State state() const { return state_; }
    size_t data_packets_sent() const { return data_packets_sent_; }
private:
    std::optional<TransferError> on_ack(uint16_t block, size_t len);
    std::optional<TransferError> fail(TransferError err);

    std::string path_;
    const std::vector<uint8_t>& data_;
    TransferOptions opts_;
    PeerChannel channel_;
    State state_{State::Start};
    uint16_t next_block_{1};
    bool final_sent_{false};
    size_t data_packets_sent_{0};
};

// Downloads `path`. On success `out` holds the whole file; on failure it is
// left empty.
std::optional<TransferError> get_file(const std::string& path, Transport& transport,
                                      std::vector<uint8_t>& out,
                                      const TransferOptions& opts = {});

std::optional<TransferError> put_file(const std::string& path,
                                      const std::vector<uint8_t>& data,
                                      Transport& transport,
                                      const TransferOptions& opts = {});

} // namespace tftpc
