/* @file DischargeEngine.cpp
 * @brief discharge session FSM: command queue, sampling tick, step advance, shutdown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>
#include <stdexcept>

// HVLoad headers
#include "core/DischargeEngine.hpp"

using namespace hvload::core;

DischargeEngine::DischargeEngine(std::shared_ptr<Instrument> instrument,
                                 std::shared_ptr<ErrorMonitor> errorMonitor,
                                 EngineSettings settings)
    : instrument_(std::move(instrument)), errorMonitor_(std::move(errorMonitor)),
      settings_(settings) {
  if (!instrument_)
    throw std::invalid_argument("[DischargeEngine] instrument is nullptr");
  if (!errorMonitor_)
    throw std::invalid_argument("[DischargeEngine] error monitor is nullptr");
  if (settings_.sampleInterval.count() <= 0)
    throw std::invalid_argument("[DischargeEngine] sample interval must be positive");

  instrument_->setAbortCheck([this] { return stopRequested_.load(); });
}

DischargeEngine::~DischargeEngine() {
  shutdown();
  instrument_->setAbortCheck({});
}

//---control surface--------------------------------------------------------

void DischargeEngine::start(ValidatedProfile profile, SessionMetadata metadata) {
  if (instrument_->connectionState() != ConnectionState::Connected)
    throw ConnectionError(std::string("[DischargeEngine] cannot start, instrument is ") +
                          toString(instrument_->connectionState()));

  PendingCommand cmd{ CommandKind::Start, std::move(profile), std::move(metadata) };
  enqueue(std::move(cmd), "Start");
}

void DischargeEngine::pause() { enqueue({ CommandKind::Pause }, "Pause"); }

void DischargeEngine::resume() { enqueue({ CommandKind::Resume }, "Resume"); }

void DischargeEngine::stop() {
  enqueue({ CommandKind::Stop }, "Stop");
  wakeCv_.notify_all();
}

void DischargeEngine::reset() {
  std::lock_guard<std::mutex> lock(mtx_);
  const EngineState projected = projectedStateLocked();
  if (projected != EngineState::Idle)
    throw StateError("Reset", toString(projected));

  session_.reset();
  lastFault_.reset();
}

void DischargeEngine::acknowledge() {
  EngineState prev;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    const EngineState projected = projectedStateLocked();
    if (projected != EngineState::Completed && projected != EngineState::Faulted)
      throw StateError("Acknowledge", toString(projected));
    prev = state_;
    state_ = EngineState::Idle;
  }
  notifyState(prev, EngineState::Idle);
}

//---instrument access outside a session-------------------------------------

void DischargeEngine::requireOutsideSession(const char* name) const {
  std::lock_guard<std::mutex> lock(mtx_);
  const EngineState projected = projectedStateLocked();
  if (projected != EngineState::Idle && projected != EngineState::Completed)
    throw StateError(name, toString(projected));
}

void DischargeEngine::connect(const std::string& address, std::uint16_t port) {
  std::lock_guard<std::mutex> tickLock(tickMtx_);
  requireOutsideSession("Connect");
  instrument_->connect(address, port);
}

InstrumentStatus DischargeEngine::probeStatus() {
  std::lock_guard<std::mutex> tickLock(tickMtx_);
  requireOutsideSession("Probe");
  return instrument_->queryStatus();
}

void DischargeEngine::release() {
  shutdown();
  std::lock_guard<std::mutex> tickLock(tickMtx_);
  if (state() == EngineState::Faulted) {
    std::cerr << "[DischargeEngine] faulted, closing the instrument without further commands\n";
    instrument_->release();
    return;
  }
  instrument_->disconnect();
}

void DischargeEngine::enqueue(PendingCommand cmd, const char* name) {
  std::lock_guard<std::mutex> lock(mtx_);
  const EngineState projected = projectedStateLocked();

  bool allowed = false;
  switch (cmd.kind) {
  case CommandKind::Start:
    allowed = projected == EngineState::Idle || projected == EngineState::Completed ||
              projected == EngineState::Faulted;
    break;
  case CommandKind::Pause:
    allowed = projected == EngineState::Running;
    break;
  case CommandKind::Resume:
    allowed = projected == EngineState::Paused;
    break;
  case CommandKind::Stop:
    allowed = projected == EngineState::Running || projected == EngineState::Paused;
    break;
  }
  if (!allowed)
    throw StateError(name, toString(projected));

  if (cmd.kind == CommandKind::Stop)
    stopRequested_ = true; // pending link retries give up now
  pending_.push_back(std::move(cmd));
}

EngineState DischargeEngine::projectedStateLocked() const {
  EngineState s = state_;
  for (const auto& cmd : pending_) {
    switch (cmd.kind) {
    case CommandKind::Start:
    case CommandKind::Resume:
      s = EngineState::Running;
      break;
    case CommandKind::Pause:
      s = EngineState::Paused;
      break;
    case CommandKind::Stop:
      s = EngineState::Stopping;
      break;
    }
  }
  return s;
}

//---observers----------------------------------------------------------------

void DischargeEngine::addSampleSink(std::shared_ptr<SampleSink> sink) {
  if (!sink)
    throw std::invalid_argument("[DischargeEngine] sample sink is nullptr");
  std::lock_guard<std::mutex> lock(observersMtx_);
  sampleSinks_.push_back(std::move(sink));
}

void DischargeEngine::setSummarySink(std::shared_ptr<SummarySink> sink) {
  std::lock_guard<std::mutex> lock(observersMtx_);
  summarySink_ = std::move(sink);
}

void DischargeEngine::registerStateListener(StateListener cb) {
  std::lock_guard<std::mutex> lock(observersMtx_);
  stateListeners_.push_back(std::move(cb));
}

void DischargeEngine::registerStepListener(StepListener cb) {
  std::lock_guard<std::mutex> lock(observersMtx_);
  stepListeners_.push_back(std::move(cb));
}

//---loop---------------------------------------------------------------------

void DischargeEngine::tick() {
  std::lock_guard<std::mutex> tickLock(tickMtx_);

  applyPending();
  if (state() != EngineState::Running)
    return;

  sampleOnce();
  if (stopRequested_)
    applyPending(); // Stop arrived mid-sample: finish within this iteration
}

void DischargeEngine::launch() {
  if (running_.exchange(true))
    return;
  worker_ = std::thread(&DischargeEngine::workerLoop, this);
}

void DischargeEngine::shutdown() {
  if (!running_.exchange(false))
    return;
  wakeCv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

void DischargeEngine::workerLoop() {
  auto next = std::chrono::steady_clock::now();
  while (running_) {
    tick();

    next += settings_.sampleInterval;
    const auto now = std::chrono::steady_clock::now();
    if (next < now)
      next = now; // overran the interval, do not burst to catch up

    std::unique_lock<std::mutex> lock(wakeMtx_);
    wakeCv_.wait_until(lock, next, [this] { return !running_ || stopRequested_; });
  }
}

void DischargeEngine::applyPending() {
  std::deque<PendingCommand> cmds;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    cmds.swap(pending_);
  }
  for (auto& cmd : cmds)
    apply(cmd);
}

void DischargeEngine::apply(PendingCommand& cmd) {
  const EngineState s = state();

  switch (cmd.kind) {
  case CommandKind::Start:
    if (s == EngineState::Idle || s == EngineState::Completed || s == EngineState::Faulted)
      return beginSession(cmd);
    break;
  case CommandKind::Pause:
    if (s == EngineState::Running)
      return pauseOutput();
    break;
  case CommandKind::Resume:
    if (s == EngineState::Paused)
      return resumeOutput();
    break;
  case CommandKind::Stop:
    if (s == EngineState::Running || s == EngineState::Paused)
      return finish(EndReason::UserStop);
    break;
  }

  // the session moved on (completed or faulted) after the command was accepted
  static constexpr const char* kNames[] = { "Start", "Pause", "Resume", "Stop" };
  std::cerr << "[DischargeEngine] dropping " << kNames[static_cast<int>(cmd.kind)]
            << ": engine is " << toString(s) << "\n";
  if (cmd.kind == CommandKind::Stop)
    stopRequested_ = false;
}

void DischargeEngine::beginSession(PendingCommand& cmd) {
  errorMonitor_->clear();
  Step first;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    lastFault_.reset();
    session_.emplace(ActiveSession{ std::move(*cmd.profile), std::move(cmd.metadata) });
    session_->startedAt = WallClock::now();
    session_->startedMono = std::chrono::steady_clock::now();
    first = session_->profile.step(0);
  }
  std::cerr << "[DischargeEngine] step 1: " << describe(first) << "\n";

  try {
    instrument_->setMode(first.kind, first.magnitude);
    instrument_->setInputEnabled(true);
  } catch (const AbortedError&) {
    // Stop is queued right behind us and will shut the input off
  } catch (const DischargeError& e) {
    fault(e);
    return;
  }
  transitionTo(EngineState::Running);
}

void DischargeEngine::pauseOutput() {
  try {
    instrument_->setInputEnabled(false);
  } catch (const AbortedError&) {
    return; // Stop follows
  } catch (const DischargeError& e) {
    fault(e);
    return;
  }
  transitionTo(EngineState::Paused);
}

void DischargeEngine::resumeOutput() {
  Step step;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    step = session_->profile.step(session_->activeStep);
  }
  try {
    instrument_->setMode(step.kind, step.magnitude);
    instrument_->setInputEnabled(true);
  } catch (const AbortedError&) {
    return;
  } catch (const DischargeError& e) {
    fault(e);
    return;
  }
  transitionTo(EngineState::Running);
}

//---sampling-----------------------------------------------------------------

void DischargeEngine::sampleOnce() {
  bool pollFault;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    pollFault = settings_.faultPollEvery > 0 && (session_->ticks + 1) % settings_.faultPollEvery == 0;
  }

  Measurement m;
  std::optional<FaultCode> deviceFault;
  try {
    m = instrument_->queryMeasurement();
    if (pollFault)
      deviceFault = instrument_->queryFault();
  } catch (const AbortedError&) {
    return;
  } catch (const DischargeError& e) {
    fault(e);
    return;
  }

  const double intervalS = std::chrono::duration<double>(settings_.sampleInterval).count();
  Sample sample;
  bool stopMet;
  bool lastStep;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ActiveSession& s = *session_;
    ++s.ticks;

    sample.timestamp = WallClock::now();
    sample.elapsedS =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - s.startedMono).count();
    sample.voltage = m.voltage;
    sample.current = m.current;
    sample.power = m.voltage * m.current;
    // a load only sinks energy; negative readings near zero must not run the total backwards
    sample.energyIncrementJ = std::max(0.0, sample.power) * intervalS;
    s.energyJ += sample.energyIncrementJ;
    sample.cumulativeEnergyJ = s.energyJ;
    sample.stepIndex = s.activeStep;
    s.history.push_back(sample);

    stopMet = s.profile.step(s.activeStep).stop.isMet(m.voltage, m.current);
    lastStep = s.activeStep + 1 == s.profile.stepCount();
  }

  publish(sample);

  if (deviceFault) {
    fault(DeviceFaultError(deviceFault->code, deviceFault->message));
    return;
  }
  if (!stopMet)
    return;

  std::cerr << "[DischargeEngine] step " << sample.stepIndex + 1 << " stop condition met (V="
            << sample.voltage << ", I=" << sample.current << ")\n";
  if (lastStep)
    finish(EndReason::ProfileComplete);
  else
    advanceStep();
}

void DischargeEngine::advanceStep() {
  std::size_t finished;
  std::size_t next;
  Step step;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    finished = session_->activeStep;
    next = ++session_->activeStep;
    step = session_->profile.step(next);
  }
  std::cerr << "[DischargeEngine] step " << next + 1 << ": " << describe(step) << "\n";

  std::vector<StepListener> listeners;
  {
    std::lock_guard<std::mutex> lock(observersMtx_);
    listeners = stepListeners_;
  }
  for (auto& cb : listeners)
    cb(finished, next);

  try {
    instrument_->setMode(step.kind, step.magnitude);
  } catch (const AbortedError&) {
    return;
  } catch (const DischargeError& e) {
    fault(e);
  }
}

void DischargeEngine::finish(EndReason reason) {
  transitionTo(EngineState::Stopping);
  stopRequested_ = false; // the shutdown command itself must go through

  try {
    instrument_->setInputEnabled(false);
  } catch (const DischargeError& e) {
    fault(e);
    return;
  }
  flushSinks();

  SessionSummary summary;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    const ActiveSession& s = *session_;
    summary.profile = s.profile.profile();
    summary.metadata = s.metadata;
    summary.instrument = instrument_->identity();
    summary.testMode = settings_.testMode;
    summary.reason = reason;
    summary.startedAt = s.startedAt;
    summary.endedAt = WallClock::now();
    summary.totalEnergyJ = s.energyJ;
    summary.samples = s.history;
  }
  transitionTo(EngineState::Completed);

  std::shared_ptr<SummarySink> sink;
  {
    std::lock_guard<std::mutex> lock(observersMtx_);
    sink = summarySink_;
  }
  if (!sink)
    return;
  try {
    sink->publish(summary);
  } catch (const std::exception& e) {
    std::cerr << "[DischargeEngine] summary sink failed: " << e.what() << "\n";
  }
}

void DischargeEngine::fault(const DischargeError& err) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    FaultReport report;
    report.kind = err.kind();
    report.message = err.what();
    report.context = err.context();
    report.stepIndex = err.stepIndex();
    if (!report.stepIndex && session_)
      report.stepIndex = session_->activeStep;
    lastFault_ = std::move(report);
    pending_.clear();
  }
  stopRequested_ = false;

  transitionTo(EngineState::Faulted);
  errorMonitor_->notifyFailure(std::string("[DischargeEngine] ") + toString(err.kind()) +
                               ": " + err.what());
  flushSinks();
}

//---helpers------------------------------------------------------------------

EngineState DischargeEngine::state() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_;
}

std::size_t DischargeEngine::activeStepIndex() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return session_ ? session_->activeStep : 0;
}

double DischargeEngine::energyJ() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return session_ ? session_->energyJ : 0.0;
}

std::vector<Sample> DischargeEngine::history() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return session_ ? session_->history : std::vector<Sample>{};
}

std::optional<FaultReport> DischargeEngine::lastFault() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return lastFault_;
}

void DischargeEngine::transitionTo(EngineState next) {
  EngineState prev;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    prev = state_;
    state_ = next;
  }
  if (prev != next)
    notifyState(prev, next);
}

void DischargeEngine::notifyState(EngineState from, EngineState to) {
  std::cerr << "[DischargeEngine] " << toString(from) << " -> " << toString(to) << "\n";

  std::vector<StateListener> listeners;
  {
    std::lock_guard<std::mutex> lock(observersMtx_);
    listeners = stateListeners_;
  }
  for (auto& cb : listeners)
    cb(from, to);
}

void DischargeEngine::publish(const Sample& sample) {
  std::vector<std::shared_ptr<SampleSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(observersMtx_);
    sinks = sampleSinks_;
  }
  for (auto& sink : sinks) {
    try {
      sink->publish(sample);
    } catch (const std::exception& e) {
      std::cerr << "[DischargeEngine] sample sink failed: " << e.what() << "\n";
    }
  }
}

void DischargeEngine::flushSinks() {
  std::vector<std::shared_ptr<SampleSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(observersMtx_);
    sinks = sampleSinks_;
  }
  for (auto& sink : sinks) {
    try {
      sink->flush();
    } catch (const std::exception& e) {
      std::cerr << "[DischargeEngine] sample sink flush failed: " << e.what() << "\n";
    }
  }
}
