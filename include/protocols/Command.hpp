#pragma once
/** @file  Command.hpp
 *  @brief One SCPI command or query line with its wire framing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

namespace hvload {
  namespace protocols {
    struct Command {
      std::string payload;

      /// SCPI queries end in '?', and only queries get a reply.
      bool isQuery() const { return !payload.empty() && payload.back() == '?'; }
      std::string toWire() const { return payload + "\n"; }
    };

  } // namespace protocols
} // namespace hvload
