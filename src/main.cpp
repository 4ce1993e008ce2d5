/**
 * Reverse (and complement) array-like SAM tags of reverse-strand alignments.
 *
 * For records with FLAG 0x10 set, values of the selected tags are brought
 * into forward-strand orientation; all other records pass through unchanged.
 */
#include "core/bamio.hpp"
#include "core/config/ConfigStore.hpp"
#include "core/tagio.hpp"

#include <gitversion/version.h>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

using namespace std;
using config::ConfigStore;
using bamio::ProgramInfo;
using bamio::RunStats;
using bamio::StrandTagRewriter;
using tagio::InvalidTagName;
using tagio::TagSelection;

int main (int argc, char* argv[])
{
  // user params (defined in config file or command line)
  ConfigStore config;
  bool args_ok = config.parseArgs(argc, argv);
  if (!args_ok) { return config.hasError() ? EXIT_FAILURE : EXIT_SUCCESS; }

  string fn_input = config.getValue<string>("input");
  string fn_output = config.getValue<string>("output");
  long progress_interval = config.getValue<long>("progress-interval");
  int verbosity = config.getValue<int>("verbosity");

  // tag names are checked before any record is read
  TagSelection selection;
  try {
    selection.rev = tagio::validateTagNames(config.getList("rev"));
    selection.revcomp = tagio::validateTagNames(config.getList("revcomp"));
  } catch (const InvalidTagName& e) {
    fprintf(stderr, "[ERROR] %s\n", e.what());
    return EXIT_FAILURE;
  }

  ProgramInfo program;
  program.id = version::PROGRAM_ID;
  program.version = version::GIT_TAG_NAME;
  program.cmd_line = config.getCommandLine();

  StrandTagRewriter rewriter(program, selection);
  rewriter.progress_interval = static_cast<unsigned long>(progress_interval);
  rewriter.verbosity = verbosity;

  try {
    rewriter.run(fn_input, fn_output);
  } catch (const std::exception& e) {
    fprintf(stderr, "[ERROR] %s\n", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
