/* @file InstrumentFactory.cpp
 * @brief name -> instrument registry
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <stdexcept>

#include "core/Instrument.hpp"
#include "core/InstrumentFactory.hpp"

namespace hvload::core {

  bool InstrumentFactory::registerInstrument(const std::string& name, Creator maker) {
    if (!maker)
      return false;
    return creators_.emplace(name, std::move(maker)).second;
  }

  std::shared_ptr<Instrument> InstrumentFactory::create(const std::string& name) const {
    auto it = creators_.find(name);
    if (it == creators_.end())
      throw std::out_of_range("[InstrumentFactory] unknown instrument '" + name + "'");
    return it->second();
  }

  std::vector<std::string> InstrumentFactory::names() const {
    std::vector<std::string> out;
    out.reserve(creators_.size());
    for (const auto& [name, _] : creators_)
      out.push_back(name);
    std::sort(out.begin(), out.end());
    return out;
  }

} // namespace hvload::core
