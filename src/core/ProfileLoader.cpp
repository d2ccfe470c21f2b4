/* @file ProfileLoader.cpp
 * @brief profiles.json parsing and legacy migration
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <iostream>

// Third-party headers
#include <nlohmann/json.hpp>

// HVLoad headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/ProfileLoader.hpp"

namespace hvload::core {

  namespace {

    constexpr double kLegacyCvStopCurrent = 0.1; // A

    std::string upper(std::string s) {
      std::transform(s.begin(), s.end(), s.begin(),
                     [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
      return s;
    }

    StepKind parseKind(const std::string& text, std::size_t index) {
      const std::string t = upper(text);
      if (t == "CC")
        return StepKind::ConstantCurrent;
      if (t == "CP")
        return StepKind::ConstantPower;
      if (t == "CV")
        return StepKind::ConstantVoltage;
      throw ValidationError("unknown step type '" + text + "'", index);
    }

    double number(const nlohmann::json& step, const char* key, std::size_t index) {
      auto it = step.find(key);
      if (it == step.end() || !it->is_number())
        throw ValidationError(std::string("step needs numeric '") + key + "'", index);
      return it->get<double>();
    }

    Step parseStep(const nlohmann::json& s, std::size_t index) {
      if (!s.is_object())
        throw ValidationError("step must be an object", index);
      auto type = s.find("type");
      if (type == s.end() || !type->is_string())
        throw ValidationError("step needs a 'type'", index);

      Step step;
      step.kind = parseKind(type->get<std::string>(), index);
      step.magnitude = number(s, "value", index);

      const bool cv = step.kind == StepKind::ConstantVoltage;
      if (s.contains("stop_condition_type")) {
        const std::string metric = upper(s.at("stop_condition_type").get<std::string>());
        if (metric == "VOLTAGE")
          step.stop.metric = StopMetric::Voltage;
        else if (metric == "CURRENT")
          step.stop.metric = StopMetric::Current;
        else
          throw ValidationError("unknown stop condition '" + metric + "'", index);
        step.stop.threshold = number(s, "stop_condition_value", index);
      } else if (cv) {
        // CV holds voltage, so a voltage stop can never trigger
        step.stop = { StopMetric::Current, kLegacyCvStopCurrent };
      } else if (s.contains("stop_voltage")) {
        step.stop = { StopMetric::Voltage, number(s, "stop_voltage", index) };
      } else {
        step.stop = { StopMetric::Voltage, 0.0 };
      }
      return step;
    }

  } // namespace

  ProfileMap parseProfiles(const nlohmann::json& j) {
    if (!j.is_object())
      throw ValidationError("profile file must map names to step lists");

    ProfileMap out;
    for (const auto& [name, steps] : j.items()) {
      if (!steps.is_array())
        throw ValidationError("profile '" + name + "' must be a list of steps");
      DischargeProfile p{ name, {} };
      try {
        for (std::size_t i = 0; i < steps.size(); ++i)
          p.steps.push_back(parseStep(steps[i], i));
      } catch (const nlohmann::json::exception& e) {
        throw ValidationError("profile '" + name + "': " + e.what());
      }
      out.emplace(name, std::move(p));
    }
    return out;
  }

  ProfileMap defaultProfiles() {
    ProfileMap out;
    out["Default CC"] = { "Default CC",
                          { { StepKind::ConstantCurrent, 10.0, { StopMetric::Voltage, 350.0 } },
                            { StepKind::ConstantCurrent, 5.0, { StopMetric::Voltage, 300.0 } } } };
    out["Default CP"] = { "Default CP",
                          { { StepKind::ConstantPower, 2000.0, { StopMetric::Voltage, 320.0 } } } };
    out["Default CV"] = { "Default CV",
                          { { StepKind::ConstantVoltage, 380.0, { StopMetric::Current, 0.5 } } } };
    return out;
  }

  ProfileMap loadProfiles(const std::string& path) {
    ConfigLoader loader(path);
    if (!loader.exists()) {
      std::cerr << "[ProfileLoader] " << path << " not found, using built-in profiles\n";
      return defaultProfiles();
    }
    return parseProfiles(loader.load());
  }

  nlohmann::json toJson(const DischargeProfile& profile) {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& s : profile.steps) {
      steps.push_back({ { "type", toString(s.kind) },
                        { "value", s.magnitude },
                        { "stop_condition_type", toString(s.stop.metric) },
                        { "stop_condition_value", s.stop.threshold } });
    }
    return steps;
  }

} // namespace hvload::core
