#include "bamio.hpp"
#include "stringio.hpp"
#include <boost/format.hpp>
#include <boost/timer/timer.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <set>

using namespace std;
using namespace seqan;

namespace bamio {

StrandTagRewriter::StrandTagRewriter(const ProgramInfo& program, const tagio::TagSelection& selection)
: progress_interval(100000), verbosity(1), m_program(program), m_selection(selection)
{}

RunStats StrandTagRewriter::run(const string& fn_in, const string& fn_out) const {
  BamFileIn bam_in;
  if (isStdStream(fn_in)) {
    if (verbosity > 0) {
      fprintf(stderr, "[INFO] Input: stdin\n");
    }
    if (!open(bam_in, std::cin)) {
      throw StreamError("Could not read SAM/BAM data from stdin");
    }
  } else {
    if (verbosity > 0) {
      fprintf(stderr, "[INFO] Input: %s\n", fn_in.c_str());
    }
    if (!open(bam_in, fn_in.c_str())) {
      throw StreamError("Could not open input file '" + fn_in + "'");
    }
  }

  // SAM output goes through a plain stream, BAM output needs BGZF compression
  ofstream fs_out;
  BamFileOut bam_out(context(bam_in));
  if (isStdStream(fn_out)) {
    if (verbosity > 0) {
      fprintf(stderr, "[INFO] Output: stdout\n");
    }
    if (!open(bam_out, std::cout, Sam())) {
      throw StreamError("Could not write SAM data to stdout");
    }
  } else {
    if (verbosity > 0) {
      fprintf(stderr, "[INFO] Output: %s\n", fn_out.c_str());
    }
    if (stringio::endsWith(fn_out, ".cram")) {
      throw StreamError("CRAM output is not supported: '" + fn_out + "'");
    }
    if (stringio::endsWith(fn_out, ".bam")) {
      if (!open(bam_out, fn_out.c_str())) {
        throw StreamError("Could not create output file '" + fn_out + "'");
      }
    } else {
      fs_out.open(fn_out.c_str());
      if (!fs_out.is_open() || !open(bam_out, fs_out, Sam())) {
        throw StreamError("Could not create output file '" + fn_out + "'");
      }
    }
  }

  return process(bam_in, bam_out);
}

RunStats StrandTagRewriter::process(BamFileIn& bam_in, BamFileOut& bam_out) const {
  RunStats stats;

  // NOTE: reading the header first is mandatory (advances file pointer)
  BamHeader header;
  readHeader(header, bam_in);
  addProgramRecord(header);
  writeHeader(bam_out, header);

  boost::timer::cpu_timer timer;
  BamAlignmentRecord record;
  while (!atEnd(bam_in)) {
    readRecord(record, bam_in);
    ++stats.n_records;
    if (hasFlagRC(record)) {
      ++stats.n_reverse;
      if (processRecord(record)) {
        ++stats.n_modified;
      }
    }
    writeRecord(bam_out, record);

    if (verbosity > 0 && progress_interval > 0 && stats.n_records % progress_interval == 0) {
      fprintf(stderr, "[INFO] Processed %lu alignment records (%s elapsed)\n",
              stats.n_records, timer.format(1, "%ws").c_str());
    }
  }

  if (verbosity > 0) {
    fprintf(stderr, "[INFO] Processed %lu alignment records in total, %lu on reverse strand, %lu with tags rewritten (%s elapsed)\n",
            stats.n_records, stats.n_reverse, stats.n_modified, timer.format(1, "%ws").c_str());
  }

  return stats;
}

bool StrandTagRewriter::processRecord(BamAlignmentRecord& record) const {
  if (!hasFlagRC(record)) {
    return false;
  }
  unsigned n_replaced = tagio::reorientTags(record, m_selection);
  if (verbosity > 1 && n_replaced > 0) {
    fprintf(stderr, "[DEBUG] %s: rewrote %u tag(s)\n", toCString(record.qName), n_replaced);
  }
  return n_replaced > 0;
}

void StrandTagRewriter::addProgramRecord(BamHeader& header) const {
  // collect IDs of programs already present in header
  set<string> pg_ids;
  for (unsigned i=0; i<length(header); i++) {
    if (header[i].type == BAM_HEADER_PROGRAM) {
      CharString pg_id;
      if (getTagValue(pg_id, "ID", header[i])) {
        pg_ids.insert(string(toCString(pg_id)));
      }
    }
  }
  string id = m_program.id;
  for (unsigned n=1; pg_ids.count(id) > 0; n++) {
    id = (boost::format("%s.%u") % m_program.id % n).str();
  }

  BamHeaderRecord record;
  record.type = BAM_HEADER_PROGRAM;
  appendValue(record.tags, Pair<CharString>());
  assign(back(record.tags).i1, "ID", Exact());
  assign(back(record.tags).i2, id, Exact());
  appendValue(record.tags, Pair<CharString>());
  assign(back(record.tags).i1, "PN", Exact());
  assign(back(record.tags).i2, m_program.id, Exact());
  appendValue(record.tags, Pair<CharString>());
  assign(back(record.tags).i1, "VN", Exact());
  assign(back(record.tags).i2, m_program.version, Exact());
  if (!m_program.cmd_line.empty()) {
    appendValue(record.tags, Pair<CharString>());
    assign(back(record.tags).i1, "CL", Exact());
    assign(back(record.tags).i2, m_program.cmd_line, Exact());
  }
  appendValue(header, record);
}

bool isStdStream(const string& filename) {
  return filename.empty() || filename == "-";
}

} // namespace bamio
