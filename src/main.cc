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

#include "global.h"             // This is where the meat of main() is, which
                                // was moved there for the sake of clarity here

using namespace reckon;

int main(int argc, char * argv[], char * envp[])
{
  int status = 1;

  // The very first thing we do is handle some very special command-line
  // options, since they affect how the environment is setup:
  //
  //   --verbose           ; turns on logging
  //   --debug CATEGORY    ; turns on debug logging
  //   --init-file         ; directs reckon to use a different init file
  handle_debug_options(argc, argv);

  INFO("Reckon starting");

  // Initialize global Boost/C++ environment
  std::ios::sync_with_stdio(false);

  std::signal(SIGINT, sigint_handler);
#if !defined(_WIN32) && !defined(__CYGWIN__)
  std::signal(SIGPIPE, sigpipe_handler);
#endif

#if HAVE_GETTEXT
  ::textdomain("reckon");
#endif

  global_scope_t * global_scope = NULL;

  try {
    global_scope = new global_scope_t(const_cast<const char **>(envp));

    // Look for options and a command verb in the command-line arguments
    strings_list args = global_scope->read_command_arguments(argc, argv);
    global_scope->normalize_session_options();

    config_t& config(global_scope->configuration());

    if (config.show_version) {
      global_scope->show_version_info(std::cout);
      status = 0;
    }
    else if (config.show_help || args.empty()) {
      option_help(std::cout);
      status = config.show_help ? 0 : 1;
    }
    else {
      status = global_scope->execute_command_wrapper(args);
    }
  }
  catch (const std::exception& err) {
    if (global_scope)
      global_scope->report_error(err);
    else
      std::cerr << "Exception during initialization: " << err.what()
                << std::endl;
  }

  // Deleting the scope closes any --log-file stream.
  delete global_scope;

  INFO("Reckon ended");

  // Return the final status to the operating system, either 1 for error or 0
  // for a successful completion.
  return status;
}

// main.cc ends here.
