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

#pragma once

#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>


namespace TT_VPLIC
{

  struct VPlicParams;


  /// Manage loading of a configuration file and applying it to the
  /// parameters of a virtual PLIC.
  class PlicConfig
  {
  public:

    PlicConfig();

    ~PlicConfig();

    PlicConfig(const PlicConfig&) = delete;
    void operator= (const PlicConfig&) = delete;

    /// Load given configuration file (JSON file) into this object.
    /// Return true on success and false if file cannot be opened or if the file
    /// does not contain a valid JSON object. Comments are allowed in the file.
    bool loadConfigFile(const std::string& filePath);

    /// Same as loadConfigFile but parse the given text.
    bool loadConfigText(const std::string& text);

    /// Apply the "vplic" section of the loaded configuration to the given
    /// parameters. Entries absent from the section leave the corresponding
    /// parameters unmodified. Return true on success and false if an entry
    /// has an invalid value. Set trace to the value of the "trace" entry if
    /// present.
    bool applyConfig(VPlicParams& params, bool& trace) const;

    /// Return true if a "vplic" section is present.
    bool hasDevice() const;

  private:

    std::unique_ptr<nlohmann::json> config_;
  };
}
