/*
 * Copyright (c) 2003-2023, John Wiegley.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of New Artisans LLC nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <system.hh>

#include "global.h"
#include "csv.h"

namespace reckon {

std::string _init_file;

namespace {
  string version_string()
  {
    std::ostringstream buf;
    buf << Reckon_VERSION_MAJOR << '.' << Reckon_VERSION_MINOR << '.'
        << Reckon_VERSION_PATCH;
    if (Reckon_VERSION_DATE != 0)
      buf << '-' << Reckon_VERSION_DATE;
    return buf.str();
  }

  std::vector<string> read_statement(const path& pathname)
  {
    path filename(resolve_path(pathname));
    if (! exists(filename) || is_directory(filename))
      throw_(std::runtime_error,
             _f("Cannot read statement file %1%") % filename);

    ifstream in(filename);
    return read_lines(in);
  }

  void require_operands(const strings_list& args, std::size_t count,
                        const char * usage)
  {
    if (args.size() < count + 1)
      throw_(std::logic_error, _f("Usage: reckon %1%") % usage);
  }

  void require_company_and_period(const config_t& config)
  {
    if (config.company_id <= 0)
      throw_(config_error, _("A company must be given with --company"));
    if (config.period_id <= 0)
      throw_(config_error, _("A fiscal period must be given with --period"));
  }
}

const string version = version_string();

global_scope_t::global_scope_t(const char ** envp)
{
  // Read the user's options, in the following order:
  //
  //  1. initialization file (~/.reckonrc)
  //  2. environment variables (RECKON_<option>)
  //  3. command-line (--option or -o)
  read_init();
  read_environment_settings(envp);
}

global_scope_t::~global_scope_t()
{
#if LOGGING_ON
  if (log_stream)
    _log_stream = &std::cerr;
#endif
}

void global_scope_t::read_init()
{
  // If --init-file was given on the command line, _init_file was filled
  // in by handle_debug_options, and the file must exist.  Otherwise try
  // the default locations, but don't fail if there isn't one.
  path init_file;
  if (! _init_file.empty()) {
    init_file = resolve_path(_init_file);
    if (! exists(init_file))
      throw_(config_error,
             _f("Could not find specified init file %1%") % init_file);
  } else {
    // in order, try to read the init file from:
    // - $XDG_CONFIG_HOME/reckon/reckonrc
    // - $HOME/.config/reckon/reckonrc
    // - $HOME/.reckonrc
    // - ./.reckonrc
    if (const char * xdg_config_home = std::getenv("XDG_CONFIG_HOME"))
      init_file = (path(xdg_config_home) / "reckon" / "reckonrc");
    if (! exists(init_file)) {
      if (const char * home_var = std::getenv("HOME")) {
        init_file = (path(home_var) / ".config" / "reckon" / "reckonrc");
        if (! exists(init_file))
          init_file = (path(home_var) / ".reckonrc");
      }
      if (! exists(init_file))
        init_file = ("./.reckonrc");
    }
  }

  if (exists(init_file)) {
    TRACE_START(init, 1, "Read initialization file");
    process_init_file(config, init_file);
    config.init_file = init_file;
    TRACE_FINISH(init, 1);
  }
}

void global_scope_t::read_environment_settings(const char ** envp)
{
  TRACE_START(environment, 1, "Processed environment variables");

  if (envp)
    process_environment(config, envp, "RECKON_");

  TRACE_FINISH(environment, 1);
}

strings_list global_scope_t::read_command_arguments(int argc, char ** argv)
{
  TRACE_START(arguments, 1, "Processed command-line arguments");

  strings_list args;
  process_arguments(config, argc - 1, argv + 1, args);

  TRACE_FINISH(arguments, 1);

  return args;
}

void global_scope_t::normalize_session_options()
{
#if LOGGING_ON
  if (config.verbose_mode && _log_level < LOG_INFO)
    _log_level = LOG_INFO;

#if DEBUG_ON
  if (config.debug_category) {
    _log_level       = LOG_DEBUG;
    _log_category    = *config.debug_category;
    _log_category_re = none;
  }
#endif

  if (! config.log_file.empty()) {
    log_stream.reset(new ofstream(config.log_file));
    if (! *log_stream)
      throw_(config_error,
             _f("Cannot write log file %1%") % config.log_file);
    _log_stream = log_stream.get();
  }
#endif

  INFO("Init file: " << (config.init_file.empty() ?
                         string("(none)") : config.init_file.string()));
  INFO("Company " << config.company_id << ", fiscal period "
       << config.period_id << ", default year " << config.default_year);
}

void global_scope_t::report_error(const std::exception& err)
{
  std::cout.flush();            // first display anything that was pending

  if (caught_signal == NONE_CAUGHT) {
    // Display any pending error context information
    string context = error_context();
    if (! context.empty())
      std::cerr << context << std::endl;

    std::cerr << _("Error: ") << err.what() << std::endl;
  } else {
    caught_signal = NONE_CAUGHT;
  }
}

int global_scope_t::execute_command(strings_list args)
{
  string verb = args.front();

  DEBUG("reckon.command", "Command verb: " << verb);

  if (verb == "ingest" || verb == "import")
    return ingest_command(args);
  else if (verb == "classify")
    return classify_command(args);
  else if (verb == "trial-balance" || verb == "tb")
    return trial_balance_command(args);

  throw_(std::logic_error, _f("Unrecognized command '%1%'") % verb);
  return 1;
}

int global_scope_t::execute_command_wrapper(strings_list args)
{
  int status = 1;

  try {
    status = execute_command(args);
  }
  catch (const std::exception& err) {
    report_error(err);
  }

  return status;
}

int global_scope_t::ingest_command(const strings_list& args)
{
  require_operands(args, 1, "ingest STATEMENT [--history FILE]");
  require_company_and_period(config);

  strings_list::const_iterator arg = ++args.begin();
  path statement(*arg);

  memory_transaction_store_t store(config);
  if (config.history_file) {
    ifstream in(*config.history_file);
    if (! in)
      throw_(csv_error, _f("Cannot read history file %1%")
             % *config.history_file);
    csv_reader reader(in, *config.history_file);
    read_history(reader, store);
  }

  session_t       session(config, store);
  import_result_t result(session.ingest(read_statement(statement),
                                        statement.string()));

  print_import_result(std::cout, result);
  return 0;
}

int global_scope_t::classify_command(const strings_list& args)
{
  require_operands(args, 1, "classify STATEMENT");

  strings_list::const_iterator arg = ++args.begin();
  path statement(*arg);

  memory_transaction_store_t store(config);
  session_t                  session(config, store);

  print_line_reports(std::cout,
                     session.classify(read_statement(statement),
                                      statement.string()));
  return 0;
}

int global_scope_t::trial_balance_command(const strings_list& args)
{
  require_operands(args, 2, "trial-balance JOURNAL PERIODS");
  require_company_and_period(config);

  strings_list::const_iterator arg = ++args.begin();
  path journal_file(resolve_path(*arg++));
  path periods_file(resolve_path(*arg));

  memory_journal_store_t journal;

  {
    ifstream in(periods_file);
    if (! in)
      throw_(csv_error, _f("Cannot read fiscal periods file %1%")
             % periods_file);
    csv_reader reader(in, periods_file);
    read_fiscal_periods(reader, journal);
  }
  {
    ifstream in(journal_file);
    if (! in)
      throw_(csv_error, _f("Cannot read journal file %1%") % journal_file);
    csv_reader reader(in, journal_file);
    read_journal(reader, journal);
  }

  trial_balance_t tb(compute_trial_balance(journal, config,
                                           config.company_id,
                                           config.period_id));
  print_trial_balance(std::cout, tb);

  return tb.balanced ? 0 : 1;
}

void handle_debug_options(int argc, char * argv[])
{
  for (int i = 1; i < argc; i++) {
    if (argv[i][0] == '-') {
      if ((std::strcmp(argv[i], "--init-file") == 0 ||
                std::strcmp(argv[i], "-i") == 0) && i + 1 < argc) {
        _init_file = argv[i + 1];
        i++;
      }
      else if (std::strncmp(argv[i], "--init-file=", 12) == 0) {
        _init_file = argv[i] + 12;
      }
#if LOGGING_ON
      else if (std::strcmp(argv[i], "--verbose") == 0 ||
               std::strcmp(argv[i], "-v") == 0) {
        _log_level = LOG_INFO;
      }
#if DEBUG_ON
      else if (std::strcmp(argv[i], "--debug") == 0 && i + 1 < argc) {
        _log_level    = LOG_DEBUG;
        _log_category = argv[i + 1];
        i++;
      }
#endif
#endif
    }
  }
}

} // namespace reckon
