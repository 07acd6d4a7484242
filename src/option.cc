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

#include "option.h"
#include "config.h"

namespace reckon {

namespace {
  option_t * search_options(const char * name)
  {
    int first = 0;
    int last  = CONFIG_OPTIONS_SIZE - 1;
    while (first <= last) {
      int mid = (first + last) / 2; // compute mid point.

      int result;
      if ((result = (int)name[0] - (int)config_options[mid].long_opt[0]) == 0)
        result = std::strcmp(name, config_options[mid].long_opt);

      if (result > 0)
        first = mid + 1;        // repeat search in top half.
      else if (result < 0)
        last = mid - 1;         // repeat search in bottom half.
      else
        return &config_options[mid];
    }
    return NULL;
  }

  option_t * search_options(const char letter)
  {
    for (int i = 0; i < CONFIG_OPTIONS_SIZE; i++)
      if (letter == config_options[i].short_opt)
        return &config_options[i];
    return NULL;
  }

  void invoke_option(config_t& config, option_t * opt, const char * arg)
  {
    try {
      opt->handler(config, arg);
    }
    catch (const std::exception&) {
      add_error_context(_f("While parsing option '--%1%'%2%:")
                        % opt->long_opt
                        % (opt->short_opt != '\0' ?
                           string(" (-") + opt->short_opt + ")" : string()));
      throw;
    }
  }

  long parse_id(const char * arg, const char * what)
  {
    try {
      long id = lexical_cast<long>(arg);
      if (id <= 0)
        throw_(config_error, _f("%1% must be a positive number, not '%2%'")
               % what % arg);
      return id;
    }
    catch (const bad_lexical_cast&) {
      throw_(config_error, _f("%1% must be a number, not '%2%'") % what % arg);
    }
    return 0;
  }
}

bool process_option(config_t& config, const string& name, const char * arg)
{
  option_t * opt = search_options(name.c_str());
  if (opt) {
    if (opt->wants_arg && ! arg)
      throw_(config_error, _f("Missing option argument for --%1%") % name);
    invoke_option(config, opt, arg);
    return true;
  }
  return false;
}

void process_arguments(config_t& config, int argc, char ** argv,
                       strings_list& args)
{
  for (int i = 0; i < argc; i++) {
    string word(argv[i]);

    if (word.length() < 2 || word[0] != '-') {
      args.push_back(word);
      continue;
    }

    // --long-option or -s
    if (word[1] == '-') {
      if (word.length() == 2) {
        for (i++; i < argc; i++)
          args.push_back(argv[i]);
        break;
      }

      string name(word.substr(2));
      optional<string> value;
      string::size_type eq = name.find('=');
      if (eq != string::npos) {
        value = name.substr(eq + 1);
        name  = name.substr(0, eq);
      }

      option_t * opt = search_options(name.c_str());
      if (! opt)
        throw_(config_error, _f("Illegal option --%1%") % name);

      if (opt->wants_arg && ! value) {
        if (++i == argc)
          throw_(config_error,
                 _f("Missing option argument for --%1%") % name);
        value = string(argv[i]);
      }
      invoke_option(config, opt, value ? value->c_str() : NULL);
    }
    else {
      std::list<option_t *> opt_queue;

      for (string::size_type x = 1; x < word.length(); x++) {
        option_t * opt = search_options(word[x]);
        if (! opt)
          throw_(config_error, _f("Illegal option -%1%") % word[x]);
        opt_queue.push_back(opt);
      }

      foreach (option_t * opt, opt_queue) {
        const char * value = NULL;
        if (opt->wants_arg) {
          if (++i == argc)
            throw_(config_error,
                   _f("Missing option argument for -%1%") % opt->short_opt);
          value = argv[i];
        }
        invoke_option(config, opt, value);
      }
    }
  }
}

void process_environment(config_t& config, const char ** envp,
                         const string& tag)
{
  const char *      tag_p   = tag.c_str();
  string::size_type tag_len = tag.length();

  for (const char ** p = envp; *p; p++) {
    if (std::strncmp(*p, tag_p, tag_len) != 0)
      continue;

    string name;
    const char * q;
    for (q = *p + tag_len; *q && *q != '='; q++)
      if (*q == '_')
        name += '-';
      else
        name += static_cast<char>(std::tolower(static_cast<unsigned char>(*q)));

    if (*q == '=') {
      try {
        process_option(config, name, q + 1);
      }
      catch (const std::exception&) {
        add_error_context(_f("While parsing environment variable '%1%':")
                          % *p);
        throw;
      }
    }
  }
}

void process_init_file(config_t& config, const path& init_file)
{
  ifstream in(init_file);
  if (! in)
    throw_(config_error, _f("Could not read init file %1%") % init_file);

  INFO("Reading init file " << init_file);

  string      line;
  std::size_t linenum = 0;
  while (std::getline(in, line)) {
    linenum++;

    string text(trimmed(line));
    if (text.empty() || text[0] == '#' || text[0] == ';')
      continue;

    try {
      strings_list words(split_arguments(text.c_str()));
      if (words.empty())
        continue;

      string name(words.front());
      words.pop_front();
      if (starts_with(name, "--"))
        name = name.substr(2);

      optional<string> value;
      string::size_type eq = name.find('=');
      if (eq != string::npos) {
        value = name.substr(eq + 1);
        name  = name.substr(0, eq);
      }
      else if (! words.empty()) {
        value = join(words, " ");
      }

      if (! process_option(config, name, value ? value->c_str() : NULL))
        throw_(config_error, _f("Illegal option --%1%") % name);
    }
    catch (const std::exception&) {
      add_error_context(_f("While reading init file %1%")
                        % file_context(init_file, linenum));
      throw;
    }
  }
}

//////////////////////////////////////////////////////////////////////

void option_help(std::ostream& out)
{
  out << "usage: reckon [options] COMMAND [ARGS]...\n\n\
Commands:\n\
  ingest STATEMENT        classify, parse and import a statement's lines\n\
  classify STATEMENT      show how each statement line is recognized\n\
  trial-balance JOURNAL PERIODS\n\
                          compute a trial balance from journal CSV data\n\n\
Options:\n\
  -h, --help              display this help text\n\
      --version           show version information\n\
  -i, --init-file FILE    read options from FILE (default: ~/.reckonrc)\n\
  -c, --company ID        company whose data is being processed\n\
  -p, --period ID         fiscal period being processed\n\
      --history FILE      CSV of previously imported transactions\n\
      --statement-date D  date used for lines that carry none\n\
      --default-year Y    year for month/day dates with no statement period\n\
      --account-class D=T classify accounts starting with digit D as T\n\
      --description-match normalized|icase\n\
                          how descriptions are compared for duplicates\n\
  -v, --verbose           log informative messages\n\
      --debug CATEGORY    log debug messages whose category matches\n\
      --log-file FILE     write log messages to FILE\n";
}

//////////////////////////////////////////////////////////////////////
//
// Option handlers
//

OPT_BEGIN(account_class) {
  config.set_account_class(optarg);
} OPT_END(account_class);

OPT_BEGIN(company) {
  config.company_id = parse_id(optarg, "Company");
} OPT_END(company);

OPT_BEGIN(debug) {
  config.debug_category = string(optarg);
} OPT_END(debug);

OPT_BEGIN(default_year) {
  try {
    config.default_year = lexical_cast<unsigned short>(optarg);
  }
  catch (const bad_lexical_cast&) {
    throw_(config_error, _f("Invalid year '%1%'") % optarg);
  }
  if (config.default_year < 1400 || config.default_year > 9999)
    throw_(config_error, _f("Invalid year '%1%'") % optarg);
} OPT_END(default_year);

OPT_BEGIN(description_match) {
  string mode(lowered(optarg));
  if (mode == "normalized")
    config.description_match = MATCH_NORMALIZED;
  else if (mode == "icase")
    config.description_match = MATCH_ICASE;
  else
    throw_(config_error, _f("Unknown description match '%1%'") % optarg);
} OPT_END(description_match);

OPT_BEGIN(help) {
  config.show_help = true;
} OPT_END(help);

OPT_BEGIN(history) {
  config.history_file = resolve_path(optarg);
} OPT_END(history);

OPT_BEGIN(init_file) {
  config.init_file = resolve_path(optarg);
} OPT_END(init_file);

OPT_BEGIN(log_file) {
  config.log_file = resolve_path(optarg);
} OPT_END(log_file);

OPT_BEGIN(period) {
  config.period_id = parse_id(optarg, "Fiscal period");
} OPT_END(period);

OPT_BEGIN(statement_date) {
  config.statement_date = parse_date(optarg);
} OPT_END(statement_date);

OPT_BEGIN(verbose) {
  config.verbose_mode = true;
} OPT_END(verbose);

OPT_BEGIN(version) {
  config.show_version = true;
} OPT_END(version);

option_t config_options[CONFIG_OPTIONS_SIZE] = {
  { "account-class",     '\0', true,  opt_account_class },
  { "company",           'c',  true,  opt_company },
  { "debug",             '\0', true,  opt_debug },
  { "default-year",      '\0', true,  opt_default_year },
  { "description-match", '\0', true,  opt_description_match },
  { "help",              'h',  false, opt_help },
  { "history",           '\0', true,  opt_history },
  { "init-file",         'i',  true,  opt_init_file },
  { "log-file",          '\0', true,  opt_log_file },
  { "period",            'p',  true,  opt_period },
  { "statement-date",    '\0', true,  opt_statement_date },
  { "verbose",           'v',  false, opt_verbose },
  { "version",           '\0', false, opt_version },
};

} // namespace reckon
