#ifndef BAMIO_H
#define BAMIO_H

#include "tagio.hpp"
#include <seqan/bam_io.h>
#include <stdexcept>
#include <string>

/**
 * Methods to support the input/output of SAM/BAM files
 */
namespace bamio {

/** Identifies the program in the @PG line added to the output header. */
struct ProgramInfo
{
  /** program ID and name (PG-ID, PG-PN) */
  std::string id;
  /** program version (PG-VN) */
  std::string version;
  /** command line (PG-CL) */
  std::string cmd_line;
};

/** Record counts collected while rewriting a stream. */
struct RunStats
{
  unsigned long n_records;
  unsigned long n_reverse;
  /** reverse-strand records with at least one tag replaced */
  unsigned long n_modified;

  RunStats() : n_records(0), n_reverse(0), n_modified(0) {}
};

/** An input or output stream could not be opened. */
class StreamError : public std::runtime_error
{
public:
  explicit StreamError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Copies alignment records from input to output, rewriting selected tags
 * of reverse-strand records into forward-strand orientation.
 */
class StrandTagRewriter {
public:
  /** log progress every n records (0: never) */
  unsigned long progress_interval;
  /** 0: errors only, 1: info, 2: debug */
  int verbosity;

  StrandTagRewriter(const ProgramInfo& program, const tagio::TagSelection& selection);

  /**
   * Rewrite a SAM/BAM file.
   *
   * \param fn_in   Input file; "-" or empty reads from stdin (SAM or BAM).
   * \param fn_out  Output file; "-" or empty writes SAM to stdout.
   *                Paths ending in ".bam" are written as BAM, others as SAM.
   * \throws        StreamError if a stream cannot be opened; errors raised
   *                while reading or writing records propagate unchanged.
   */
  RunStats run(const std::string& fn_in, const std::string& fn_out) const;

  /** Copy header and records from an open input to an open output. */
  RunStats process(seqan::BamFileIn& bam_in, seqan::BamFileOut& bam_out) const;

  /**
   * Rewrite a single record (no-op for forward-strand records).
   * \returns true if any tag value was replaced
   */
  bool processRecord(seqan::BamAlignmentRecord& record) const;

  /** Append a @PG line for this program, keeping PG IDs unique. */
  void addProgramRecord(seqan::BamHeader& header) const;

private:
  ProgramInfo m_program;
  tagio::TagSelection m_selection;
};

/** Does the file name denote stdin/stdout? */
bool isStdStream(const std::string& filename);

} // namespace bamio

#endif /* BAMIO_H */
