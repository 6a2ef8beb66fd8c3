// Copyright 2024 Tenstorrent Corporation.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string_view>
#include <vector>
#include "PlicConfig.hpp"
#include "vplic/VPlic.hpp"


using namespace TT_VPLIC;


PlicConfig::PlicConfig()
  : config_(std::make_unique<nlohmann::json>())
{
}


PlicConfig::~PlicConfig() = default;


bool
PlicConfig::loadConfigFile(const std::string& filePath)
{
  std::ifstream ifs(filePath);
  if (not ifs.good())
    {
      std::cerr << "Error: Failed to open config file '" << filePath
                << "' for input.\n";
      return false;
    }

  try
    {
      // Use json::parse rather than operator>> to allow comments to be ignored
      *config_ = nlohmann::json::parse(ifs, nullptr /* callback */, true /* allow_exceptions */,
                                       true /* ignore_comments */);
    }
  catch (std::exception& e)
    {
      std::cerr << "Error: Failed to parse config file '" << filePath << "': "
                << e.what() << "\n";
      return false;
    }

  if (not config_->is_object())
    {
      std::cerr << "Error: Config file '" << filePath << "' does not contain a JSON object\n";
      return false;
    }

  return true;
}


bool
PlicConfig::loadConfigText(const std::string& text)
{
  try
    {
      *config_ = nlohmann::json::parse(text, nullptr, true, true);
    }
  catch (std::exception& e)
    {
      std::cerr << "Error: Failed to parse config text: " << e.what() << "\n";
      return false;
    }

  if (not config_->is_object())
    {
      std::cerr << "Error: Config text does not contain a JSON object\n";
      return false;
    }

  return true;
}


namespace TT_VPLIC
{

  /// Convert given json value to an unsigned integer honoring any
  /// hexadecimal prefix (0x) if any. Return true on sucess and false
  /// on failure.
  template <typename UT>
  bool
  getJsonUnsigned(std::string_view tag, const nlohmann::json& js, UT& value)
  {
    value = 0;

    if (js.is_number_unsigned())
      {
        uint64_t u64 = js.get<uint64_t>();
        value = static_cast<UT>(u64);
        if (value != u64)
          {
            std::cerr << "Error: Overflow in config file value for '" << tag << "': "
                      << u64 << '\n';
            return false;
          }
        return true;
      }

    if (js.is_string())
      {
        char*       end = nullptr;
        std::string str = js.get<std::string>();
        uint64_t    u64 = strtoull(str.c_str(), &end, 0);
        if (str.empty() or (end and *end))
          {
            std::cerr << "Error: Invalid config file unsigned value for '" << tag << "': "
                      << str << '\n';
            return false;
          }
        value = static_cast<UT>(u64);
        if (value != u64)
          {
            std::cerr << "Error: Overflow in config file value for '" << tag << "': "
                      << str << '\n';
            return false;
          }

        return true;
      }

    std::cerr << "Error: Config file entry '" << tag << "' must contain a non-negative number\n";
    return false;
  }


  /// Convert given json array value to a vector of unsigned integers
  /// honoring any hexadecimal prefix (0x) if any. Return true on
  /// sucess an false on failure.
  template <typename UT>
  bool
  getJsonUnsignedVec(std::string_view tag, const nlohmann::json& js,
                     std::vector<UT>& vec)
  {
    vec.clear();

    if (not js.is_array())
      {
        std::cerr << "Error: Invalid config file value for '" << tag << "'"
                  << " -- expecting array of numbers\n";
        return false;
      }

    unsigned errors = 0;

    for (const auto& item : js)
      {
        UT val = 0;
        if (getJsonUnsigned(tag, item, val))
          vec.push_back(val);
        else
          errors++;
      }

    return errors == 0;
  }


  /// Convert given json entry to a boolean value. Return ture on
  /// success and false on failure.
  bool
  getJsonBoolean(std::string_view tag, const nlohmann::json& js, bool& value)
  {
    value = false;

    if (js.is_boolean())
      {
        value = js.get<bool>();
        return true;
      }

    if (js.is_number())
      {
        value = js.get<unsigned>() != 0;
        return true;
      }

    if (js.is_string())
      {
        std::string str = js.get<std::string>();
        if (str == "0" or str == "false" or str == "False")
          value = false;
        else if (str == "1" or str == "true" or str == "True")
          value = true;
        else
          {
            std::cerr << "Error: Invalid config file boolean value for '" << tag << "': "
                      << str << '\n';
            return false;
          }
        return true;
      }

    std::cerr << "Error: Config file entry '" << tag << "' must contain a bool\n";
    return false;
  }
}


bool
PlicConfig::hasDevice() const
{
  return config_->is_object() and config_->contains("vplic");
}


bool
PlicConfig::applyConfig(VPlicParams& params, bool& trace) const
{
  std::string_view tag = "vplic";
  if (not hasDevice())
    return true;  // Nothing to apply

  const auto& conf = config_->at(tag);
  if (not conf.is_object())
    {
      std::cerr << "Error: Config file entry 'vplic' must be an object\n";
      return false;
    }

  unsigned errors = 0;

  tag = "base";
  if (conf.contains(tag))
    if (not getJsonUnsigned("vplic.base", conf.at(tag), params.base))
      errors++;

  tag = "size";
  if (conf.contains(tag))
    {
      uint64_t size = 0;
      if (getJsonUnsigned("vplic.size", conf.at(tag), size))
        params.size = size;
      else
        errors++;
    }

  tag = "contexts";
  if (conf.contains(tag))
    if (not getJsonUnsigned("vplic.contexts", conf.at(tag), params.contexts))
      errors++;

  tag = "host_base";
  if (conf.contains(tag))
    {
      uint64_t hostBase = 0;
      if (getJsonUnsigned("vplic.host_base", conf.at(tag), hostBase))
        params.hostBase = hostBase;
      else
        errors++;
    }

  tag = "filter_claims";
  if (conf.contains(tag))
    if (not getJsonBoolean("vplic.filter_claims", conf.at(tag), params.filterClaims))
      errors++;

  tag = "assigned_irqs";
  if (conf.contains(tag))
    if (not getJsonUnsignedVec("vplic.assigned_irqs", conf.at(tag), params.assignedIrqs))
      errors++;

  tag = "trace";
  if (conf.contains(tag))
    if (not getJsonBoolean("vplic.trace", conf.at(tag), trace))
      errors++;

  for (const auto& item : conf.items())
    {
      static const std::vector<std::string> known = { "base", "size", "contexts", "host_base",
                                                      "filter_claims", "assigned_irqs", "trace" };
      if (std::find(known.begin(), known.end(), item.key()) == known.end())
        std::cerr << "Warning: Unknown entry 'vplic." << item.key()
                  << "' in configuration file.\n";
    }

  return errors == 0;
}
