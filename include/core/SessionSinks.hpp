#pragma once
/** @file  SessionSinks.hpp
 *  @brief Outbound observer contracts of the discharge engine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace hvload::core {

  struct Sample;
  struct SessionSummary;

  /**
 * @class SampleSink
 * @brief Receives every Sample, in order, from the sampling thread.
 *
 *  Fire-and-forget: nothing a sink does feeds back into the engine, and a
 *  throwing sink is logged and skipped.
 */
  class SampleSink {
  public:
    virtual ~SampleSink() = default;
    virtual void publish(const Sample& sample) = 0;
    virtual void flush() {} ///< session ended (completed or faulted)
  };

  /// Receives the SessionSummary once per completed session.
  class SummarySink {
  public:
    virtual ~SummarySink() = default;
    virtual void publish(const SessionSummary& summary) = 0;
  };

} // namespace hvload::core
