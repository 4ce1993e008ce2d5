#pragma once

#include "../stringio.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>
#include <cstdio>
#include <iostream>
#include <gitversion/version.h>
#include <yaml-cpp/yaml.h>

#define PROGRAM_NAME "RevTag"

namespace config {

class ConfigStore
{
public:
  ConfigStore();
  /** Parse command line arguments (and config file, if given).
   * @return true: program can run normally, false: indication to stop
   */
  bool parseArgs(int ac, char* av[]);
  /** Did parseArgs() stop because of an error (as opposed to --help/--version)? */
  bool hasError() const;
  /** The command line passed to parseArgs(). */
  std::string getCommandLine() const;
  template<typename T>
    T getValue(const char* key);
  template<typename T>
    T getValue(const std::string key);
  /** Value(s) of a key holding either a single scalar or a sequence. */
  std::vector<std::string> getList(const char* key);

private:
  YAML::Node _config;
  std::string m_cmd_line;
  bool m_has_error;
  /** Print summary of run parameters to stderr. */
  void printSummary();
}; /* class ConfigStore */

bool fileExists(std::string filename);

/*--------------------------------*
 * function templates definitions *
 *--------------------------------*/

template<typename T>
T ConfigStore::getValue(const char* key) {
  std::vector<std::string> keys = stringio::split(std::string(key), ':');
  YAML::Node node = _config[keys[0]];
  for (unsigned i=1; i<keys.size(); i++) {
    if (!node) {
      break;
    }
    node.reset(node[keys[i]]);
  }
  if (!node) {
    fprintf(stderr, "[WARN] ConfigStore: unknown parameter: '%s'\n", key);
    return T();
  }
  return node.as<T>();
}

template<typename T>
T
ConfigStore::getValue(const std::string key) {
  return getValue<T>(key.c_str());
}

} /* namespace config */
