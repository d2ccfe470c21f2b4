#pragma once
/** @file  SessionArchive.hpp
 *  @brief Writes each completed session to a JSON file for certificate generation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/SessionSinks.hpp"

namespace hvload {
  namespace io {

    /**
 * @class SessionArchive
 * @brief SummarySink that stores `<registration>_discharge_<YYYYmmdd_HHMMSS>[_TEST].json`.
 *
 *  The directory is created on first use. IO failures throw `std::runtime_error`.
 */
    class SessionArchive : public core::SummarySink {
    public:
      explicit SessionArchive(std::string directory);

      void publish(const core::SessionSummary& summary) override;

      /// Full path of the most recent archive, empty before the first one.
      const std::string& lastPath() const { return lastPath_; }

      static std::string fileName(const core::SessionSummary& summary);
      static nlohmann::json toJson(const core::SessionSummary& summary);

    private:
      std::string dir_;
      std::string lastPath_;
    };

  } // namespace io
} // namespace hvload
