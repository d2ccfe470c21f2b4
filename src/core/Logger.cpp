/* @file Logger.cpp
 * @brief ring-buffered CSV writer thread for run logs
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <iostream>
#include <sstream>

// HVLoad headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

namespace hvload {
  namespace core {

    namespace {
      std::string quoted(const std::string& text) {
        std::string out = "\"";
        for (char c : text) {
          if (c == '"')
            out += '"';
          out += c;
        }
        out += '"';
        return out;
      }
    } // namespace

    Logger::Logger(std::size_t capacity)
        : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

    Logger::~Logger() { finishRun(); }

    bool Logger::startNewRun(const std::string& csvPath) {
      finishRun();
      {
        std::lock_guard<std::mutex> lock(fileMtx_);
        if (!file_.open(csvPath))
          return false;
        if (!file_.write(kHeader)) {
          file_.close();
          return false;
        }
      }
      accepted_ = 0;
      dropped_ = 0;
      {
        std::lock_guard<std::mutex> lock(progressMtx_);
        written_ = 0;
      }
      running_ = true;
      worker_ = std::thread(&Logger::drain, this);
      return true;
    }

    void Logger::log(const LogEvent& event) {
      if (!running_)
        return;
      if (buffer_->tryPush(event))
        ++accepted_;
      else
        ++dropped_;
    }

    void Logger::logMessage(const std::string& event, const std::string& message,
                            std::optional<std::size_t> stepIndex) {
      LogEvent ev;
      ev.timestamp = WallClock::now();
      ev.event = event;
      ev.stepIndex = stepIndex;
      ev.message = message;
      log(ev);
    }

    void Logger::finishRun() {
      if (!running_.exchange(false))
        return;
      if (worker_.joinable())
        worker_.join();

      std::lock_guard<std::mutex> lock(fileMtx_);
      file_.close();
      if (dropped_ > 0)
        std::cerr << "[Logger] " << dropped_ << " rows dropped (queue full)\n";
    }

    void Logger::publish(const Sample& sample) {
      LogEvent ev;
      ev.timestamp = sample.timestamp;
      ev.event = "sample";
      ev.sample = sample;
      ev.stepIndex = sample.stepIndex;
      log(ev);
    }

    void Logger::flush() {
      if (!running_)
        return;
      {
        std::unique_lock<std::mutex> lock(progressMtx_);
        progressCv_.wait_for(lock, std::chrono::seconds(1),
                             [this] { return written_ >= accepted_.load(); });
      }
      std::lock_guard<std::mutex> lock(fileMtx_);
      if (!file_.flush())
        std::cerr << "[Logger] flush failed\n";
    }

    std::string Logger::toCsv(const LogEvent& event) {
      std::ostringstream os;
      os << formatIso8601(event.timestamp) << ',';
      if (event.sample)
        os << event.sample->elapsedS;
      os << ',' << event.event << ',';
      if (event.stepIndex)
        os << *event.stepIndex + 1; // 1-based, as shown to the operator
      os << ',';
      if (event.sample) {
        const Sample& s = *event.sample;
        os << s.voltage << ',' << s.current << ',' << s.power << ',' << s.cumulativeEnergyJ;
      } else {
        os << ",,,";
      }
      os << ',';
      if (!event.message.empty())
        os << quoted(event.message);
      os << '\n';
      return os.str();
    }

    void Logger::drain() {
      while (running_ || buffer_->size() > 0) {
        auto ev = buffer_->popFor(std::chrono::milliseconds(100));

        std::lock_guard<std::mutex> lock(fileMtx_);
        if (!ev) {
          // idle: push what we have to the disk
          if (!file_.flush())
            std::cerr << "[Logger] flush failed\n";
          continue;
        }
        if (!file_.write(toCsv(*ev)))
          std::cerr << "[Logger] write failed\n";
        {
          std::lock_guard<std::mutex> progress(progressMtx_);
          ++written_;
        }
        progressCv_.notify_all();
      }
    }

  } // namespace core
} // namespace hvload
