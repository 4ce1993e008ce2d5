#include "ConfigStore.hpp"
#include "../stringio.hpp"
#include <sstream>

using namespace std;
namespace fs = boost::filesystem;

namespace config {

// default constructor
ConfigStore::ConfigStore()
: m_has_error(false)
{
  _config = YAML::Node();
}

bool ConfigStore::parseArgs (int ac, char* av[])
{
  // default values
  string fn_config = "";
  string fn_input = "-";
  string fn_output = "-";
  vector<string> vec_rev;
  vector<string> vec_revcomp;
  long progress_interval = 100000;
  int verb = 1;

  m_cmd_line = stringio::joinArgs(ac, av);

  // program description
  stringstream ss;
  ss << endl << PROGRAM_NAME << " " << version::GIT_TAG_NAME << endl;
  ss << "Reverse (and complement) array-like SAM tags of reverse-strand alignments." << endl << endl;
  ss << "Available options";

  namespace po = boost::program_options;

  po::options_description desc(ss.str());
  desc.add_options()
    ("version,V", "print version string")
    ("help,h", "print help message")
    ("config,c", po::value<string>(&fn_config), "config file (YAML)")
    ("input,i", po::value<string>(&fn_input), "input SAM/BAM file or stream [default: stdin]")
    ("output,o", po::value<string>(&fn_output), "output SAM/BAM file or stream [default: stdout]")
    ("rev", po::value<vector<string>>(&vec_rev)->composing(), "SAM tag with array values to reverse (can be repeated)")
    ("revcomp", po::value<vector<string>>(&vec_revcomp)->composing(), "SAM tag with sequence values to reverse complement (can be repeated)")
    ("progress-interval", po::value<long>(&progress_interval), "log progress every N records (0: never)")
    ("verbosity,v", po::value<int>(&verb), "detail level of console output")
  ;

  po::variables_map var_map;

  try {
    po::store(po::parse_command_line(ac, av, desc), var_map);

    if (var_map.count("version")) {
      std::cerr << PROGRAM_NAME << " " << version::GIT_TAG_NAME << endl;
      return false;
    }

    if (var_map.count("help")) {
      std::cerr << desc << std::endl;
      return false;
    }

    po::notify(var_map);  // might throw an error, so call after checking for "help"
  }
  catch (std::exception &e) {
    std::cerr << std::endl << "ArgumentError: " << e.what() << std::endl;
    std::cerr << desc << std::endl;
    m_has_error = true;
    return false;
  }

  // check: config file exists
  if (fn_config.length() > 0) {
    if (!fileExists(fn_config)) {
      fprintf(stderr, "\nArgumentError: File '%s' does not exist.\n", fn_config.c_str());
      m_has_error = true;
      return false;
    }
    // initialize global configuration from config file
    try {
      _config = YAML::LoadFile(fn_config);
    } catch (const YAML::Exception& e) {
      fprintf(stderr, "\nArgumentError: Could not parse config file '%s':\n  %s\n", fn_config.c_str(), e.what());
      m_has_error = true;
      return false;
    }
  }

  // Manage paths / filenames
  //---------------------------------------------------------------------------

  // get config file's absolute directory
  fs::path path_conf( fs::current_path() );
  if ( fn_config.length() > 0 ) { // find files relative to config directory
    path_conf = fs::absolute( fs::path( fn_config ) ).parent_path();
  }

  // overwrite/set config params
  // (making sure parameters are set)

  // input file (paths in config file are relative to config location)
  if (var_map.count("input") || !_config["input"]) {
    _config["input"] = fn_input;
  } else {
    fs::path path_input( _config["input"].as<string>() );
    if ( path_input.string() != "-" && path_input.is_relative() ) {
      _config["input"] = (path_conf / path_input).string();
    }
  }
  fn_input = _config["input"].as<string>();
  // output file
  if (var_map.count("output") || !_config["output"]) {
    _config["output"] = fn_output;
  } else {
    fs::path path_output( _config["output"].as<string>() );
    if ( path_output.string() != "-" && path_output.is_relative() ) {
      _config["output"] = (path_conf / path_output).string();
    }
  }
  fn_output = _config["output"].as<string>();
  // tags to reverse (command line list replaces config file list)
  if (var_map.count("rev") || !_config["rev"]) {
    _config["rev"] = vec_rev;
  }
  // tags to reverse complement
  if (var_map.count("revcomp") || !_config["revcomp"]) {
    _config["revcomp"] = vec_revcomp;
  }
  // progress logging
  if (var_map.count("progress-interval") || !_config["progress-interval"]) {
    _config["progress-interval"] = progress_interval;
  }
  // how chatty should status messages be?
  if (var_map.count("verbosity") || !_config["verbosity"]) {
    _config["verbosity"] = verb;
  }

  //---------------------------------------------------------------------------
  // perform sanity checks
  //---------------------------------------------------------------------------

  try {
    progress_interval = _config["progress-interval"].as<long>();
    verb = _config["verbosity"].as<int>();
    getList("rev");
    getList("revcomp");
  } catch (const YAML::Exception& e) {
    fprintf(stderr, "\nArgumentError: Invalid parameter value in config file: %s\n", e.what());
    m_has_error = true;
    return false;
  }
  if (progress_interval < 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'progress-interval' must be >= 0 (found %ld).\n", progress_interval);
    m_has_error = true;
    return false;
  }
  // input file exists?
  if (fn_input.length() > 0 && fn_input != "-" && !fileExists(fn_input)) {
    fprintf(stderr, "\nArgumentError: Input file '%s' does not exist.\n", fn_input.c_str());
    m_has_error = true;
    return false;
  }

  if (verb > 0) {
    printSummary();
  }

  return true;
}

void ConfigStore::printSummary ()
{
  string str_rev = stringio::join(getList("rev"), ",");
  string str_revcomp = stringio::join(getList("revcomp"), ",");
  fprintf(stderr, "################################################################################\n");
  fprintf(stderr, "%s %s\n", PROGRAM_NAME, version::GIT_TAG_NAME);
  fprintf(stderr, "================================================================================\n");
  fprintf(stderr, "Running with the following options:\n");
  fprintf(stderr, "--------------------------------------------------------------------------------\n");
  fprintf(stderr, "  input:\t\t%s\n", _config["input"].as<string>().c_str());
  fprintf(stderr, "  output:\t\t%s\n", _config["output"].as<string>().c_str());
  fprintf(stderr, "  reverse:\t\t%s\n", str_rev.length() > 0 ? str_rev.c_str() : "-");
  fprintf(stderr, "  reverse complement:\t%s\n", str_revcomp.length() > 0 ? str_revcomp.c_str() : "-");
  fprintf(stderr, "################################################################################\n");
}

bool ConfigStore::hasError () const
{
  return m_has_error;
}

string ConfigStore::getCommandLine () const
{
  return m_cmd_line;
}

vector<string> ConfigStore::getList (const char* key)
{
  vector<string> values;
  YAML::Node node = _config[key];
  if (!node || node.IsNull()) {
    return values;
  }
  if (node.IsScalar()) {
    values.push_back(node.as<string>());
    return values;
  }
  return node.as<vector<string>>();
}

bool fileExists(string filename) {
  boost::system::error_code ec;
  return fs::exists(fs::path(filename), ec);
}

} /* namespace config */
