#pragma once
/** @file  InstrumentFactory.hpp
 *  @brief Runtime registry that maps instrument names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace hvload::core {

  class Instrument;

  /**
 * @class InstrumentFactory
 * @brief Register & instantiate instruments by string key ("tcp", "simulated").
 *
 *  * Keeps SystemCoordinator decoupled from concrete instruments.
 *  * Creators are lambdas returning `shared_ptr<Instrument>`.
 */
  class InstrumentFactory {
  public:
    using Creator = std::function<std::shared_ptr<Instrument>()>;

    /// Register an instrument under \p name.  Returns false on duplicate.
    bool registerInstrument(const std::string& name, Creator maker);

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::shared_ptr<Instrument> create(const std::string& name) const;

    bool contains(const std::string& name) const { return creators_.count(name) != 0; }
    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace hvload::core
