/* @file InstrumentLink.cpp
 * @brief manages request/reply coms with the electronic load via SCPI over TCP
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

// HVLoad headers
#include "core/Errors.hpp"
#include "core/InstrumentLink.hpp"
#include "protocols/ScpiCodec.hpp"

using namespace hvload::core;
namespace scpi = hvload::protocols::scpi;
using hvload::protocols::Command;
using hvload::protocols::Response;

InstrumentLink::InstrumentLink(std::shared_ptr<ErrorMonitor> errorMonitor, LinkSettings settings,
                               std::unique_ptr<io::TcpChannel> channel)
    : errorMonitor_(std::move(errorMonitor)), settings_(settings), channel_(std::move(channel)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[InstrumentLink] error monitor is nullptr");
  if (!channel_)
    channel_ = std::make_unique<io::TcpChannel>();
}

InstrumentLink::~InstrumentLink() { channel_->close(); }

void InstrumentLink::connect(const std::string& address, std::uint16_t port) {
  std::lock_guard<std::mutex> lock(ioMtx_);

  address_ = address;
  port_ = port;
  state_ = ConnectionState::Connecting;

  if (!channel_->open(address_, port_, settings_.connectTimeout)) {
    state_ = ConnectionState::Disconnected;
    std::string errMsg = "[InstrumentLink] cannot reach " + address + ":" + std::to_string(port);
    errorMonitor_->notifyFailure(errMsg);
    throw ConnectionError(errMsg, address + ":" + std::to_string(port));
  }
  state_ = ConnectionState::Connected;

  // single attempt: a silent *IDN? does not make the link unusable
  const Command idn = scpi::identify();
  identity_.clear();
  if (channel_->writeLine(idn.toWire())) {
    auto line = channel_->readLine(settings_.requestTimeout);
    if (line && line->size() <= io::TcpChannel::kMaxLineBytes) {
      if (auto reply = Response::fromWire(*line))
        identity_ = reply->body;
    }
  }
  if (identity_.empty())
    std::cerr << "[InstrumentLink] no reply to *IDN? from " << address << ":" << port << "\n";
  else
    std::cerr << "[InstrumentLink] connected to " << identity_ << "\n";
}

void InstrumentLink::disconnect() {
  std::lock_guard<std::mutex> lock(ioMtx_);
  if (channel_->isOpen()) {
    if (!channel_->writeLine(scpi::setInputState(false).toWire()))
      std::cerr << "[InstrumentLink] input-off on disconnect was not delivered\n";
    channel_->close();
  }
  state_ = ConnectionState::Disconnected;
}

void InstrumentLink::release() {
  std::lock_guard<std::mutex> lock(ioMtx_);
  channel_->close();
  state_ = ConnectionState::Disconnected;
}

void InstrumentLink::setMode(StepKind kind, double magnitude) {
  std::lock_guard<std::mutex> lock(ioMtx_);
  send(scpi::setFunction(kind));
  send(scpi::setLevel(kind, magnitude));
}

void InstrumentLink::setInputEnabled(bool on) {
  std::lock_guard<std::mutex> lock(ioMtx_);
  send(scpi::setInputState(on));
}

Measurement InstrumentLink::queryMeasurement() {
  std::lock_guard<std::mutex> lock(ioMtx_);
  Measurement m;
  m.voltage = measure(scpi::measureVoltage(), "V");
  m.current = measure(scpi::measureCurrent(), "A");
  return m;
}

InstrumentStatus InstrumentLink::queryStatus() {
  std::lock_guard<std::mutex> lock(ioMtx_);
  InstrumentStatus status;
  status.reading.voltage = measure(scpi::measureVoltage(), "V");
  status.reading.current = measure(scpi::measureCurrent(), "A");
  status.power = measure(scpi::measurePower(), "W");

  const Command inputCmd = scpi::queryInputState();
  Response inputReply = query(inputCmd);
  auto on = scpi::parseInputState(inputReply);
  if (!on)
    throw ProtocolError("[InstrumentLink] unparseable reply to " + inputCmd.payload,
                        inputReply.body);
  status.inputOn = *on;

  status.function = scpi::functionName(query(scpi::queryFunction()));
  return status;
}

std::optional<FaultCode> InstrumentLink::queryFault() {
  std::lock_guard<std::mutex> lock(ioMtx_);
  const Command cmd = scpi::queryError();
  Response reply = query(cmd);
  auto entry = scpi::parseError(reply);
  if (!entry)
    throw ProtocolError("[InstrumentLink] unparseable reply to " + cmd.payload, reply.body);
  if (entry->code == 0)
    return std::nullopt;
  return FaultCode{ entry->code, entry->message };
}

std::string InstrumentLink::identity() const {
  std::lock_guard<std::mutex> lock(ioMtx_);
  return identity_;
}

//---request/reply plumbing----------------------------------------------

double InstrumentLink::measure(const Command& cmd, std::string_view unit) {
  Response reply = query(cmd);
  auto value = scpi::parseMeasurement(reply, unit);
  if (!value)
    throw ProtocolError("[InstrumentLink] unparseable reply to " + cmd.payload, reply.body);
  return *value;
}

Response InstrumentLink::query(const Command& cmd) {
  requireConnected(cmd);

  const unsigned attempts = settings_.maxRetries + 1;
  unsigned unanswered = 0; // timed-out attempts whose reply may still turn up
  for (unsigned attempt = 0; attempt < attempts; ++attempt) {
    checkAbort(cmd.payload);
    if (attempt > 0)
      waitBackoff(attempt, cmd.payload);
    if (!ensureOpen())
      continue;

    // whatever is already buffered belongs to an earlier request
    channel_->discardInput();
    if (!channel_->writeLine(cmd.toWire())) {
      std::cerr << "[InstrumentLink] write failed: " << cmd.payload << "\n";
      continue;
    }

    auto line = channel_->readLine(settings_.requestTimeout);
    if (!line) {
      ++unanswered;
      std::cerr << "[InstrumentLink] no reply to " << cmd.payload << " (attempt " << attempt + 1
                << "/" << attempts << ")\n";
      continue;
    }

    if (line->size() > io::TcpChannel::kMaxLineBytes)
      throw ProtocolError("[InstrumentLink] overlong reply to " + cmd.payload,
                          line->substr(0, 64) + "...");
    auto reply = Response::fromWire(*line);
    if (!reply)
      throw ProtocolError("[InstrumentLink] malformed reply to " + cmd.payload, *line);
    if (unanswered > 0)
      drainLateReplies(unanswered, cmd.payload);
    return *reply;
  }

  giveUp("[InstrumentLink] " + cmd.payload + " timed out after " + std::to_string(attempts) +
         " attempts");
  throw TimeoutError("[InstrumentLink] " + cmd.payload + " timed out", cmd.payload, attempts);
}

// Each timed-out attempt may still be answered. Consume those extra replies
// now so they cannot be read as the answer to the next request.
void InstrumentLink::drainLateReplies(unsigned count, const std::string& context) {
  for (unsigned i = 0; i < count; ++i) {
    auto late = channel_->readLine(settings_.requestTimeout);
    if (!late)
      return;
    std::cerr << "[InstrumentLink] dropped late reply to " << context << ": " << *late << "\n";
  }
}

void InstrumentLink::send(const Command& cmd) {
  requireConnected(cmd);

  const unsigned attempts = settings_.maxRetries + 1;
  for (unsigned attempt = 0; attempt < attempts; ++attempt) {
    checkAbort(cmd.payload);
    if (attempt > 0)
      waitBackoff(attempt, cmd.payload);
    if (!ensureOpen())
      continue;

    if (channel_->writeLine(cmd.toWire()))
      return;
    std::cerr << "[InstrumentLink] write failed: " << cmd.payload << " (attempt " << attempt + 1
              << "/" << attempts << ")\n";
  }

  giveUp("[InstrumentLink] connection lost sending " + cmd.payload);
  throw ConnectionError("[InstrumentLink] connection lost sending " + cmd.payload, cmd.payload);
}

void InstrumentLink::requireConnected(const Command& cmd) const {
  const ConnectionState s = state_.load();
  if (s == ConnectionState::Disconnected || s == ConnectionState::Faulted)
    throw ConnectionError(std::string("[InstrumentLink] link is ") + toString(s), cmd.payload);
}

bool InstrumentLink::ensureOpen() {
  if (channel_->isOpen())
    return true;
  if (!settings_.autoReconnect)
    return false;

  std::cerr << "[InstrumentLink] reconnecting to " << address_ << ":" << port_ << "\n";
  state_ = ConnectionState::Connecting;
  if (!channel_->open(address_, port_, settings_.connectTimeout))
    return false;
  state_ = ConnectionState::Connected;
  return true;
}

void InstrumentLink::waitBackoff(unsigned attempt, const std::string& context) {
  using namespace std::chrono;
  const double scale = std::pow(settings_.backoffFactor, static_cast<double>(attempt - 1));
  const auto wait = duration_cast<milliseconds>(settings_.backoff * scale);
  const auto deadline = steady_clock::now() + wait;

  // sliced so Stop does not wait out the whole backoff
  while (steady_clock::now() < deadline) {
    checkAbort(context);
    std::this_thread::sleep_for(std::min<steady_clock::duration>(milliseconds(10),
                                                                 deadline - steady_clock::now()));
  }
}

void InstrumentLink::checkAbort(const std::string& context) const {
  if (abortCheck_ && abortCheck_())
    throw AbortedError(context);
}

void InstrumentLink::giveUp(const std::string& message) {
  state_ = ConnectionState::Faulted;
  channel_->close();
  errorMonitor_->notifyFailure(message);
}
