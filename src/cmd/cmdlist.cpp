/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "cmdlist.h"
#include "analyze.h"
#include "geotag.h"
#include "showconfig.h"

namespace cmd {

  std::map<std::string, Command*> commands = {
      {"analyze", new Analyze()},
      {"geotag", new Geotag()},
      {"config", new ShowConfig()}
  };

  std::map<std::string, std::string> aliases = {
      {"a", "analyze"},
      {"review", "analyze"},
      {"g", "geotag"},
      {"gps", "geotag"},
      {"cfg", "config"}
  };

  Command *findCommand(const std::string &name) {
      std::string key = name;
      auto alias = aliases.find(key);
      if (alias != aliases.end()) key = alias->second;

      auto it = commands.find(key);
      return it != commands.end() ? it->second : nullptr;
  }

}
