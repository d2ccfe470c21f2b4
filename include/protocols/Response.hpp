#pragma once
/** @file  Response.hpp
 *  @brief One reply line read back from the instrument.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <optional>
#include <string>

namespace hvload {
  namespace protocols {
    struct Response {
      std::string body; ///< reply text, terminator and surrounding blanks removed

      /// Strips framing; nullopt for an empty line or one carrying control bytes.
      static std::optional<Response> fromWire(const std::string& line) {
        auto first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
          return std::nullopt;
        auto last = line.find_last_not_of(" \t\r\n");

        Response response;
        response.body = line.substr(first, last - first + 1);

        bool printable = std::all_of(response.body.begin(), response.body.end(), [](char c) {
          auto u = static_cast<unsigned char>(c);
          return u >= 0x20 && u < 0x7f;
        });
        if (!printable)
          return std::nullopt;
        return response;
      }
    };
  } // namespace protocols
} // namespace hvload
