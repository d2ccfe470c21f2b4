/* @file ScpiCodec.cpp
 * @brief SCPI command strings and reply parsing for the electronic load
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <utility>

// HVLoad headers
#include "protocols/ScpiCodec.hpp"

namespace hvload::protocols::scpi {

  namespace {

    std::string upper(std::string_view s) {
      std::string out(s);
      std::transform(out.begin(), out.end(), out.begin(),
                     [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
      return out;
    }

    std::string_view trim(std::string_view s) {
      auto first = s.find_first_not_of(" \t");
      if (first == std::string_view::npos)
        return {};
      auto last = s.find_last_not_of(" \t");
      return s.substr(first, last - first + 1);
    }

    template <typename T> std::optional<T> toNumber(std::string_view s) {
      if (!s.empty() && s.front() == '+')
        s.remove_prefix(1); // from_chars rejects an explicit plus sign
      if (s.empty())
        return std::nullopt;
      T value{};
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
      if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
      return value;
    }

    // INPut:FUNCtion? codes, from the N69200 programming manual
    constexpr std::array<std::pair<int, const char*>, 22> kFunctionCodes{ {
        { 0, "CC" },     { 1, "CV" },      { 2, "CR" },    { 3, "CP" },    { 4, "CCD" },
        { 5, "ESR" },    { 6, "AUTO" },    { 7, "DISCHARGE" }, { 8, "CHARGE" }, { 9, "OCP" },
        { 10, "CVD" },   { 11, "CRD" },    { 12, "MPPT" }, { 13, "CVCC" }, { 14, "CRCC" },
        { 15, "CPCC" },  { 16, "CVCR" },   { 18, "CCDWAVE" }, { 19, "SWEEP" }, { 20, "OPP" },
        { 21, "CPD" },   { 22, "SZ" },
    } };

  } // namespace

  Command identify() { return { "*IDN?" }; }

  Command setFunction(core::StepKind kind) {
    return { std::string("INPut:FUNCtion ") + core::toString(kind) };
  }

  Command setLevel(core::StepKind kind, double magnitude) {
    std::ostringstream os;
    os << "STATic:" << core::toString(kind) << ":HIGH:LEVel " << std::fixed << std::setprecision(3)
       << magnitude;
    return { os.str() };
  }

  Command setInputState(bool on) { return { on ? "INPut:STATe 1" : "INPut:STATe 0" }; }
  Command queryInputState() { return { "INPut:STATe?" }; }
  Command queryFunction() { return { "INPut:FUNCtion?" }; }
  Command measureVoltage() { return { "MEASure:VOLTage?" }; }
  Command measureCurrent() { return { "MEASure:CURRent?" }; }
  Command measurePower() { return { "MEASure:POWer?" }; }
  Command queryError() { return { "SYSTem:ERRor?" }; }

  std::optional<double> parseMeasurement(const Response& reply, std::string_view unit) {
    std::string text = upper(reply.body);
    std::string_view view = trim(text);

    const std::string u = upper(unit);
    if (!u.empty() && view.size() >= u.size() && view.substr(view.size() - u.size()) == u)
      view = trim(view.substr(0, view.size() - u.size()));

    bool numeric = !view.empty() && std::all_of(view.begin(), view.end(), [](char c) {
      return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+' ||
             c == 'E';
    });
    if (!numeric)
      return std::nullopt;
    return toNumber<double>(view);
  }

  std::optional<ErrorEntry> parseError(const Response& reply) {
    std::string_view view = trim(reply.body);
    auto comma = view.find(',');

    auto code = toNumber<int>(trim(view.substr(0, comma)));
    if (!code)
      return std::nullopt;

    ErrorEntry entry;
    entry.code = *code;
    if (comma != std::string_view::npos) {
      std::string_view msg = trim(view.substr(comma + 1));
      if (msg.size() >= 2 && msg.front() == '"' && msg.back() == '"')
        msg = msg.substr(1, msg.size() - 2);
      entry.message = std::string(msg);
    }
    return entry;
  }

  std::optional<bool> parseInputState(const Response& reply) {
    const std::string v = upper(trim(reply.body));
    if (v == "1" || v == "ON")
      return true;
    if (v == "0" || v == "OFF")
      return false;
    return std::nullopt;
  }

  std::string functionName(const Response& reply) {
    if (auto code = toNumber<int>(trim(reply.body))) {
      for (const auto& [c, name] : kFunctionCodes)
        if (c == *code)
          return name;
    }
    return std::string(trim(reply.body));
  }

} // namespace hvload::protocols::scpi
