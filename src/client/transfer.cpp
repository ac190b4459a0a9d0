#include "transfer.hpp"
#include "logging.hpp"
#include <algorithm>

namespace tftpc {

// Blocks 1..65535 without wrapping; the last block must be short.
static constexpr size_t kMaxUploadSize = 65535 * kBlockSize;

static std::string endpoint_str(const Transport::endpoint &ep) {
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

PeerChannel::PeerChannel(Transport &transport, const TransferOptions &opts)
    : transport_(transport), opts_(opts), buf_(64 * 1024) {}

std::optional<TransferError> PeerChannel::transmit(const Transport::endpoint &to) {
  std::error_code ec;
  transport_.send_to(last_sent_.data(), last_sent_.size(), to, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "send to %s failed: %s",
                           endpoint_str(to).c_str(), ec.message().c_str());
    return TransferError::transport(ec);
  }
  return std::nullopt;
}

std::optional<TransferError>
PeerChannel::send_request(std::vector<uint8_t> datagram) {
  last_sent_ = std::move(datagram);
  peer_known_ = false;
  return transmit(opts_.server);
}

std::optional<TransferError> PeerChannel::send(std::vector<uint8_t> datagram) {
  last_sent_ = std::move(datagram);
  return transmit(peer_known_ ? peer_ : opts_.server);
}

void PeerChannel::reject_stranger(const Transport::endpoint &from) {
  Logger::instance().log(LogLevel::WARN,
                         "datagram from unknown TID %s (peer is %s), rejected",
                         endpoint_str(from).c_str(), endpoint_str(peer_).c_str());
  auto err = encode_error(
      rfc_error_code(TransferErrorKind::UnknownTransferID), "Unknown transfer ID");
  std::error_code ec;
  transport_.send_to(err.data(), err.size(), from, ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, "could not reject %s: %s",
                           endpoint_str(from).c_str(), ec.message().c_str());
}

std::optional<TransferError> PeerChannel::receive(size_t &len) {
  int attempts = 0;
  for (;;) {
    Transport::endpoint from;
    std::error_code ec;
    size_t n = transport_.recv_from(buf_.data(), buf_.size(), from,
                                    opts_.timeout, ec);
    if (ec == asio::error::timed_out) {
      if (attempts >= opts_.retries) {
        Logger::instance().log(LogLevel::ERROR,
                               "no reply after %d retransmissions", attempts);
        return TransferError::from_kind(TransferErrorKind::Timeout);
      }
      attempts++;
      Logger::instance().log(LogLevel::WARN, "timeout, retransmitting (%d/%d)",
                             attempts, opts_.retries);
      if (auto err = transmit(peer_known_ ? peer_ : opts_.server))
        return err;
      continue;
    }
    if (ec) {
      Logger::instance().log(LogLevel::ERROR, "receive failed: %s",
                             ec.message().c_str());
      return TransferError::transport(ec);
    }
    if (!peer_known_) {
      peer_ = from;
      peer_known_ = true;
      Logger::instance().log(LogLevel::DEBUG, "peer TID %s",
                             endpoint_str(peer_).c_str());
    } else if (from != peer_) {
      reject_stranger(from);
      continue;
    }
    len = n;
    return std::nullopt;
  }
}

ReadTransfer::ReadTransfer(Transport &transport, std::string path,
                           const TransferOptions &opts)
    : path_(std::move(path)), opts_(opts), channel_(transport, opts_) {}

std::optional<TransferError> ReadTransfer::fail(TransferError err) {
  state_ = State::Failed;
  buffer_.clear();
  Logger::instance().log(LogLevel::ERROR, "get %s failed: %s", path_.c_str(),
                         err.describe().c_str());
  return err;
}

std::optional<TransferError> ReadTransfer::on_data(size_t len) {
  const uint8_t *d = channel_.data();
  auto pkt = decode_data(d, len);
  if (!pkt)
    return TransferError::invalid_response(d, len);
  current_is_new_ = true;
  if (pkt->block != expected_block_) {
    bool duplicate = expected_block_ > 1 &&
                     pkt->block == (uint16_t)(expected_block_ - 1);
    if (opts_.strict_blocks && !duplicate) {
      Logger::instance().log(LogLevel::WARN, "DATA %u out of sequence, want %u",
                             (unsigned)pkt->block, (unsigned)expected_block_);
      return TransferError::invalid_response(d, len);
    }
    if (opts_.strict_blocks)
      current_is_new_ = false;
    else
      Logger::instance().log(LogLevel::DEBUG, "DATA %u while expecting %u",
                             (unsigned)pkt->block, (unsigned)expected_block_);
  }
  if (current_is_new_)
    expected_block_ = (uint16_t)(pkt->block + 1);
  current_ = std::move(*pkt);
  current_len_ = len;
  return std::nullopt;
}

std::optional<TransferError> ReadTransfer::run(std::vector<uint8_t> &out) {
  out.clear();
  for (;;) {
    switch (state_) {
    case State::Start: {
      auto rrq = encode_request(Opcode::ReadRequest, path_);
      if (rrq.empty())
        return fail(TransferError::from_kind(TransferErrorKind::IllegalOperation,
                                             "filename contains NUL"));
      Logger::instance().log(LogLevel::INFO, "RRQ %s to %s", path_.c_str(),
                             endpoint_str(opts_.server).c_str());
      if (auto err = channel_.send_request(std::move(rrq)))
        return fail(std::move(*err));
      state_ = State::AwaitData;
      break;
    }
    case State::AwaitData: {
      size_t len = 0;
      if (auto err = channel_.receive(len))
        return fail(std::move(*err));
      const uint8_t *d = channel_.data();
      auto op = decode_opcode(d, len);
      if (op && *op == Opcode::Data) {
        if (auto err = on_data(len))
          return fail(std::move(*err));
        state_ = State::SendAck;
      } else if (op && *op == Opcode::Error) {
        return fail(error_from_datagram(d, len));
      } else {
        return fail(TransferError::invalid_response(d, len));
      }
      break;
    }
    case State::SendAck: {
      Logger::instance().log(LogLevel::TRACE, "DATA %u, %zu bytes",
                             (unsigned)current_.block, current_.payload.size());
      if (auto err = channel_.send(encode_ack(current_.block)))
        return fail(std::move(*err));
      if (!current_is_new_) {
        state_ = State::AwaitData;
        break;
      }
      buffer_.insert(buffer_.end(), current_.payload.begin(),
                     current_.payload.end());
      state_ = current_len_ < kMaxDatagram ? State::Done : State::AwaitData;
      break;
    }
    case State::Done:
      Logger::instance().log(LogLevel::INFO, "get %s done, %zu bytes",
                             path_.c_str(), buffer_.size());
      out.swap(buffer_);
      return std::nullopt;
    default:
      return TransferError::from_kind(TransferErrorKind::IllegalOperation,
                                      "transfer already finished");
    }
  }
}

WriteTransfer::WriteTransfer(Transport &transport, std::string path,
                             const std::vector<uint8_t> &data,
                             const TransferOptions &opts)
    : path_(std::move(path)), data_(data), opts_(opts),
      channel_(transport, opts_) {}

std::optional<TransferError> WriteTransfer::fail(TransferError err) {
  state_ = State::Failed;
  Logger::instance().log(LogLevel::ERROR, "put %s failed: %s", path_.c_str(),
                         err.describe().c_str());
  return err;
}

std::optional<TransferError> WriteTransfer::on_ack(uint16_t block,
                                                   size_t len) {
  if (final_sent_) {
    if (!opts_.strict_blocks || block == next_block_) {
      state_ = State::Done;
      return std::nullopt;
    }
    // resend the final chunk
    state_ = State::SendData;
    return std::nullopt;
  }
  if (block == next_block_) {
    next_block_++;
  } else if (opts_.strict_blocks && block != (uint16_t)(next_block_ - 1)) {
    Logger::instance().log(LogLevel::WARN, "ACK %u out of sequence, want %u",
                           (unsigned)block, (unsigned)next_block_);
    return TransferError::invalid_response(channel_.data(), len);
  }
  state_ = State::SendData;
  return std::nullopt;
}

std::optional<TransferError> WriteTransfer::run() {
  for (;;) {
    switch (state_) {
    case State::Start: {
      if (data_.size() >= kMaxUploadSize)
        return fail(TransferError::from_kind(
            TransferErrorKind::FileTooLarge,
            std::to_string(data_.size()) + " bytes needs more than 65535 blocks"));
      auto wrq = encode_request(Opcode::WriteRequest, path_);
      if (wrq.empty())
        return fail(TransferError::from_kind(TransferErrorKind::IllegalOperation,
                                             "filename contains NUL"));
      Logger::instance().log(LogLevel::INFO, "WRQ %s (%zu bytes) to %s",
                             path_.c_str(), data_.size(),
                             endpoint_str(opts_.server).c_str());
      if (auto err = channel_.send_request(std::move(wrq)))
        return fail(std::move(*err));
      state_ = State::AwaitAck;
      break;
    }
    case State::AwaitAck: {
      size_t len = 0;
      if (auto err = channel_.receive(len))
        return fail(std::move(*err));
      const uint8_t *d = channel_.data();
      auto op = decode_opcode(d, len);
      if (op && *op == Opcode::Acknowledgment) {
        auto ack = decode_ack(d, len);
        if (!ack)
          return fail(TransferError::invalid_response(d, len));
        Logger::instance().log(LogLevel::TRACE, "ACK %u", (unsigned)ack->block);
        if (auto err = on_ack(ack->block, len))
          return fail(std::move(*err));
      } else if (op && *op == Opcode::Error) {
        return fail(error_from_datagram(d, len));
      } else {
        return fail(TransferError::invalid_response(d, len));
      }
      break;
    }
    case State::SendData: {
      size_t start = (size_t)(next_block_ - 1) * kBlockSize;
      size_t end = std::min((size_t)next_block_ * kBlockSize, data_.size());
      size_t n = end - start;
      if (n < kBlockSize)
        final_sent_ = true;
      Logger::instance().log(LogLevel::TRACE, "DATA %u, %zu bytes%s",
                             (unsigned)next_block_, n,
                             final_sent_ ? " (last)" : "");
      if (auto err =
              channel_.send(encode_data(next_block_, data_.data() + start, n)))
        return fail(std::move(*err));
      data_packets_sent_++;
      state_ = State::AwaitAck;
      break;
    }
    case State::Done:
      Logger::instance().log(LogLevel::INFO, "put %s done, %zu bytes in %zu blocks",
                             path_.c_str(), data_.size(), data_packets_sent_);
      return std::nullopt;
    default:
      return TransferError::from_kind(TransferErrorKind::IllegalOperation,
                                      "transfer already finished");
    }
  }
}

std::optional<TransferError> get_file(const std::string &path,
                                      Transport &transport,
                                      std::vector<uint8_t> &out,
                                      const TransferOptions &opts) {
  ReadTransfer t(transport, path, opts);
  return t.run(out);
}

std::optional<TransferError> put_file(const std::string &path,
                                      const std::vector<uint8_t> &data,
                                      Transport &transport,
                                      const TransferOptions &opts) {
  WriteTransfer t(transport, path, data, opts);
  return t.run();
}

} // namespace tftpc
