/**
 * lazycsv - Command-line utility for scanning CSV files with liblazycsv
 *
 * Every command drives the lazy engine directly: cells are only decoded when
 * a command needs their text, and nothing is indexed ahead of time.
 */

#include "lazycsv/lazycsv.h"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

using namespace std;
using lazycsv::Cell;
using lazycsv::Csv;
using lazycsv::CsvItem;
using lazycsv::Dialect;
using lazycsv::ParseError;

constexpr size_t DEFAULT_NUM_ROWS = 10;
constexpr const char* VERSION = "0.1.0";

void printVersion() {
  cout << "lazycsv version " << VERSION << '\n';
  cout << "SIMD target: " << lazycsv::simd_best_target() << '\n';
}

void printUsage(const char* prog) {
  cerr << "lazycsv - Lazy, zero-copy CSV scanner\n\n";
  cerr << "Usage: " << prog << " <command> [options] [csvfile]\n\n";
  cerr << "Commands:\n";
  cerr << "  count         Count the number of rows\n";
  cerr << "  head          Display the first N rows (default: " << DEFAULT_NUM_ROWS << ")\n";
  cerr << "  check         Scan and decode every cell, report the first error\n";
  cerr << "  select        Select specific columns by 0-based index\n";
  cerr << "\nArguments:\n";
  cerr << "  csvfile       Path to CSV file, or '-' to read from stdin.\n";
  cerr << "                If omitted, reads from stdin.\n";
  cerr << "\nOptions:\n";
  cerr << "  -n <num>      Number of rows (for head)\n";
  cerr << "  -c <cols>     Comma-separated column indices (for select)\n";
  cerr << "  -s <num>      Skip the first N lines before scanning\n";
  cerr << "  -p            Report every bad cell instead of stopping (for check)\n";
  cerr << "  -d <delim>    Field delimiter (default: comma)\n";
  cerr << "                Values: comma, tab, semicolon, pipe, or single character\n";
  cerr << "  -v            Verbose trace on stderr\n";
  cerr << "  -D            Dump the head of the input buffer on stderr\n";
  cerr << "  -T            Print a timing summary on stderr\n";
  cerr << "  -h            Show this help message\n";
  cerr << "  -V            Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " count data.csv\n";
  cerr << "  " << prog << " head -n 5 data.csv\n";
  cerr << "  " << prog << " check -d tab data.tsv\n";
  cerr << "  " << prog << " check -p data.csv\n";
  cerr << "  " << prog << " select -c 0,2 data.csv\n";
  cerr << "  cat data.csv | " << prog << " count\n";
}

static bool isStdinInput(const char* filename) {
  return filename == nullptr || strcmp(filename, "-") == 0;
}

static void reportError(const ParseError& err) {
  lazycsv::debug::global_trace().log_error(err);
  cerr << "Error: " << err.to_string() << endl;
}

// Load a file or stdin - returns true on success
static bool loadInput(const char* filename, lazycsv::FileBuffer& buffer) {
  auto& trace = lazycsv::debug::global_trace();
  try {
    LAZYCSV_TIMED_PHASE(trace, "load", 0);
    if (isStdinInput(filename)) {
      trace.log_str("reading stdin");
      buffer = lazycsv::load_stdin();
    } else {
      trace.log("reading file %s", filename);
      buffer = lazycsv::load_file(filename);
    }
  } catch (const lazycsv::ParseException& e) {
    reportError(e.error());
    return false;
  }
  trace.log("loaded %zu bytes", buffer.size());
  trace.dump_buffer("input", buffer.data(), buffer.size());
  return true;
}

// Gather the cells of the next row. Returns false at the end or on error.
static bool readRow(Csv& csv, vector<Cell>& row) {
  row.clear();
  CsvItem item;
  while (csv.next(item)) {
    if (item.is_row_end()) return true;
    row.push_back(item.cell);
  }
  return false;
}

// Decode a cell for output; the error carries the row and column.
static bool decodeCell(const Cell& cell, size_t line, size_t column, string& out) {
  auto text = cell.try_as_str();
  if (!text.ok()) {
    ParseError err = text.to_error();
    err.line = line;
    err.column = column;
    reportError(err);
    return false;
  }
  out = std::move(*text.value).into_string();
  return true;
}

// Helper function to output a row with proper quoting
static void outputRow(const vector<string>& row, const Dialect& dialect) {
  for (size_t i = 0; i < row.size(); ++i) {
    if (i > 0)
      cout << dialect.delimiter;
    bool needs_quote = row[i].find(dialect.delimiter) != string::npos ||
                       row[i].find(lazycsv::QUOTE_CHAR) != string::npos ||
                       row[i].find('\n') != string::npos || row[i].find('\r') != string::npos;
    if (needs_quote) {
      cout << lazycsv::QUOTE_CHAR;
      for (char c : row[i]) {
        if (c == lazycsv::QUOTE_CHAR)
          cout << lazycsv::QUOTE_CHAR;
        cout << c;
      }
      cout << lazycsv::QUOTE_CHAR;
    } else {
      cout << row[i];
    }
  }
  cout << '\n';
}

// Command: count
int cmdCount(Csv& csv) {
  auto& trace = lazycsv::debug::global_trace();
  size_t rows = 0;
  {
    LAZYCSV_TIMED_PHASE(trace, "scan", csv.size());
    CsvItem item;
    while (csv.next(item)) {
      if (item.is_row_end()) ++rows;
    }
  }
  if (csv.failed()) {
    reportError(*csv.error());
    return 1;
  }
  cout << rows << endl;
  return 0;
}

// Command: head
int cmdHead(Csv& csv, size_t num_rows) {
  vector<Cell> cells;
  vector<string> row;
  size_t emitted = 0;
  while (emitted < num_rows && readRow(csv, cells)) {
    const size_t line = csv.line() - 1;
    row.resize(cells.size());
    for (size_t i = 0; i < cells.size(); ++i) {
      if (!decodeCell(cells[i], line, i + 1, row[i]))
        return 1;
    }
    outputRow(row, csv.dialect());
    ++emitted;
  }
  if (csv.failed()) {
    reportError(*csv.error());
    return 1;
  }
  return 0;
}

// Command: check
// Strict mode stops at the first error. Permissive mode keeps decoding past
// bad cells and only stops on a syntax error.
int cmdCheck(Csv& csv, lazycsv::ErrorMode mode) {
  auto& trace = lazycsv::debug::global_trace();
  LAZYCSV_TIMED_PHASE(trace, "check", csv.size());

  lazycsv::ErrorCollector errors(mode);
  size_t rows = 0;
  size_t cells = 0;
  size_t column = 0;
  CsvItem item;
  while (!errors.should_stop() && csv.next(item, errors)) {
    if (item.is_row_end()) {
      ++rows;
      column = 0;
      continue;
    }
    ++cells;
    ++column;
    auto text = item.cell.try_as_str();
    if (!text.ok()) {
      ParseError err = text.to_error();
      err.line = csv.line();
      err.column = column;
      trace.log_error(err);
      errors.add_error(err);
    }
  }
  if (csv.failed()) trace.log_error(*csv.error());

  if (!errors.has_errors()) {
    cout << "OK: " << rows << " rows, " << cells << " cells" << endl;
    return 0;
  }
  if (errors.error_count() == 1) {
    cerr << "Error: " << errors.errors()[0].to_string() << endl;
  } else {
    cerr << errors.summary();
  }
  return 1;
}

// Parse "0,2,5" into column indices
static bool parseColumns(const string& list, vector<size_t>& columns) {
  stringstream ss(list);
  string token;
  while (getline(ss, token, ',')) {
    if (token.empty()) {
      cerr << "Error: Empty column index in '" << list << "'\n";
      return false;
    }
    char* endptr;
    long val = strtol(token.c_str(), &endptr, 10);
    if (*endptr != '\0' || val < 0) {
      cerr << "Error: Invalid column index '" << token << "'\n";
      return false;
    }
    columns.push_back(static_cast<size_t>(val));
  }
  if (columns.empty()) {
    cerr << "Error: No columns given\n";
    return false;
  }
  return true;
}

// Command: select
int cmdSelect(Csv& csv, const vector<size_t>& columns) {
  vector<Cell> cells;
  vector<string> row(columns.size());
  while (readRow(csv, cells)) {
    const size_t line = csv.line() - 1;
    for (size_t i = 0; i < columns.size(); ++i) {
      if (columns[i] >= cells.size()) {
        cerr << "Error: Column index " << columns[i] << " is out of range (row " << line
             << " has " << cells.size() << " columns)" << endl;
        return 1;
      }
      if (!decodeCell(cells[columns[i]], line, columns[i] + 1, row[i]))
        return 1;
    }
    outputRow(row, csv.dialect());
  }
  if (csv.failed()) {
    reportError(*csv.error());
    return 1;
  }
  return 0;
}

// Helper function to parse delimiter string
static bool parseDialect(const string& delimiter_str, Dialect& dialect) {
  if (delimiter_str == "comma" || delimiter_str == ",") {
    dialect = Dialect::csv();
  } else if (delimiter_str == "tab" || delimiter_str == "\\t") {
    dialect = Dialect::tsv();
  } else if (delimiter_str == "semicolon" || delimiter_str == ";") {
    dialect = Dialect::semicolon();
  } else if (delimiter_str == "pipe" || delimiter_str == "|") {
    dialect = Dialect::pipe();
  } else if (delimiter_str.length() == 1) {
    dialect.delimiter = delimiter_str[0];
  } else {
    cerr << "Error: Unknown delimiter '" << delimiter_str << "'\n";
    return false;
  }
  if (!dialect.is_valid()) {
    cerr << "Error: Delimiter cannot be a quote or a newline character\n";
    return false;
  }
  return true;
}

int main(int argc, char* argv[]) {
  setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
    printUsage(argv[0]);
    return 0;
  }
  if (strcmp(argv[1], "-V") == 0 || strcmp(argv[1], "--version") == 0) {
    printVersion();
    return 0;
  }

  string command = argv[1];
  optind = 2;

  size_t num_rows = DEFAULT_NUM_ROWS;
  size_t skip_lines = 0;
  string columns;
  string delimiter_str = "comma";
  lazycsv::ErrorMode error_mode = lazycsv::ErrorMode::STRICT;
  lazycsv::DebugConfig debug_config;

  int c;
  while ((c = getopt(argc, argv, "n:c:s:d:pvDThV")) != -1) {
    switch (c) {
    case 'n': {
      char* endptr;
      long val = strtol(optarg, &endptr, 10);
      if (*endptr != '\0' || val < 0) {
        cerr << "Error: Invalid row count '" << optarg << "'\n";
        return 1;
      }
      num_rows = static_cast<size_t>(val);
      break;
    }
    case 's': {
      char* endptr;
      long val = strtol(optarg, &endptr, 10);
      if (*endptr != '\0' || val < 0) {
        cerr << "Error: Invalid skip count '" << optarg << "'\n";
        return 1;
      }
      skip_lines = static_cast<size_t>(val);
      break;
    }
    case 'c':
      columns = optarg;
      break;
    case 'd':
      delimiter_str = optarg;
      break;
    case 'p':
      error_mode = lazycsv::ErrorMode::PERMISSIVE;
      break;
    case 'v':
      debug_config.verbose = true;
      break;
    case 'D':
      debug_config.dump_buffers = true;
      break;
    case 'T':
      debug_config.timing = true;
      break;
    case 'h':
      printUsage(argv[0]);
      return 0;
    case 'V':
      printVersion();
      return 0;
    default:
      printUsage(argv[0]);
      return 1;
    }
  }

  lazycsv::debug::set_config(debug_config);
  auto& trace = lazycsv::debug::global_trace();

  const char* filename = nullptr;
  if (optind < argc) {
    filename = argv[optind];
  }

  Dialect dialect;
  if (!parseDialect(delimiter_str, dialect))
    return 1;

  vector<size_t> selected;
  if (command == "select") {
    if (columns.empty()) {
      cerr << "Error: -c option required for select command\n";
      return 1;
    }
    if (!parseColumns(columns, selected))
      return 1;
  } else if (command != "count" && command != "head" && command != "check") {
    cerr << "Error: Unknown command '" << command << "'\n";
    printUsage(argv[0]);
    return 1;
  }

  trace.log_simd_path(lazycsv::simd_best_target().c_str());
  trace.log_dialect(dialect.delimiter);

  lazycsv::FileBuffer buffer;
  if (!loadInput(filename, buffer))
    return 1;

  Csv csv(buffer.data(), buffer.size(), dialect);
  if (skip_lines > 0) {
    csv.skip_rows(skip_lines);
    trace.log("skipped %zu lines, cursor at byte %zu", skip_lines, csv.position());
  }

  int result = 0;
  if (command == "count") {
    result = cmdCount(csv);
  } else if (command == "head") {
    result = cmdHead(csv, num_rows);
  } else if (command == "check") {
    result = cmdCheck(csv, error_mode);
  } else {
    result = cmdSelect(csv, selected);
  }

  trace.print_timing_summary();

  std::cout.flush();
  std::cerr.flush();
  fflush(stdout);
  fflush(stderr);
  return result;
}
