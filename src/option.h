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
 * @addtogroup config
 */

/**
 * @file   option.h
 * @author John Wiegley
 *
 * @ingroup config
 *
 * @brief Table-driven option processing.
 *
 * The same table serves the command-line, `RECKON_' environment
 * variables and the lines of an init file.  It must be kept sorted by
 * long option name, since lookups are a binary search.
 */
#pragma once

#include "utils.h"

namespace reckon {

class config_t;

typedef void (*handler_t)(config_t& config, const char * arg);

struct option_t {
  const char * long_opt;
  char         short_opt;
  bool         wants_arg;
  handler_t    handler;
};

#define CONFIG_OPTIONS_SIZE 13
extern option_t config_options[CONFIG_OPTIONS_SIZE];

bool process_option(config_t& config, const string& name,
                    const char * arg = NULL);

/**
 * Consume every option in `argv', wherever it appears; the remaining
 * words (the command verb and its operands) are appended to `args'.
 * A bare "--" ends option processing.
 */
void process_arguments(config_t& config, int argc, char ** argv,
                       strings_list& args);

void process_environment(config_t& config, const char ** envp,
                         const string& tag);

/**
 * Read an init file whose lines are long options, with or without
 * their leading dashes.  Blank lines and lines starting with `#' or
 * `;' are ignored.
 */
void process_init_file(config_t& config, const path& init_file);

void option_help(std::ostream& out);

#define OPT_BEGIN(tag)                                  \
    void opt_ ## tag(config_t& config, const char * optarg)

#define OPT_END(tag)

} // namespace reckon
