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

/**
 * @file   global.h
 * @author John Wiegley
 *
 * @brief Contains the top-level functions used by main.cc
 */
#pragma once

#include "option.h"
#include "config.h"
#include "report.h"

namespace reckon {

extern std::string _init_file;

class global_scope_t : public noncopyable
{
  config_t            config;
  unique_ptr<ofstream> log_stream;

public:
  global_scope_t(const char ** envp);
  ~global_scope_t();

  config_t& configuration() {
    return config;
  }

  void         read_init();
  void         read_environment_settings(const char ** envp);
  strings_list read_command_arguments(int argc, char ** argv);
  void         normalize_session_options();

  void report_error(const std::exception& err);

  int  execute_command(strings_list args);
  /**
   * @return the exit status of the command; errors are reported here and
   *         give a status of 1.
   */
  int  execute_command_wrapper(strings_list args);

  int  ingest_command(const strings_list& args);
  int  classify_command(const strings_list& args);
  int  trial_balance_command(const strings_list& args);

  void show_version_info(std::ostream& out) {
    out << "Reckon " << version
        << _(", bank statement ingestion and trial balances");
    out <<
      _("\n\nCopyright (c) 2003-2023, John Wiegley.  All rights reserved.\n\n\
This program is made available under the terms of the BSD Public License.\n\
See LICENSE file included with the distribution for details and disclaimer.");
    out << std::endl;
  }
};

void handle_debug_options(int argc, char * argv[]);

} // namespace reckon
