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
 * @file   config.h
 * @author John Wiegley
 *
 * @ingroup config
 *
 * @brief Run-time configuration shared by every part of the engine.
 *
 * A config_t is filled in once at start-up (init file, then environment,
 * then command-line) and is afterwards only ever passed by const
 * reference.  Nothing in the engine consults global tables for account
 * classification or years; it all comes from here.
 */
#pragma once

#include "utils.h"
#include "times.h"

namespace reckon {

DECLARE_EXCEPTION(config_error, std::runtime_error);

enum account_type_t {
  ACCOUNT_ASSET,
  ACCOUNT_LIABILITY,
  ACCOUNT_EQUITY,
  ACCOUNT_REVENUE,
  ACCOUNT_EXPENSE
};

/**
 * The side on which an account type ordinarily carries a positive
 * balance.  The character values are what reports print.
 */
enum normal_side_t {
  NORMAL_DEBIT  = 'D',
  NORMAL_CREDIT = 'C'
};

optional<account_type_t> string_to_account_type(const string& str);
const char *             account_type_name(const account_type_t type);

inline normal_side_t normal_side(const account_type_t type) {
  switch (type) {
  case ACCOUNT_ASSET:
  case ACCOUNT_EXPENSE:
    return NORMAL_DEBIT;
  case ACCOUNT_LIABILITY:
  case ACCOUNT_EQUITY:
  case ACCOUNT_REVENUE:
    break;
  }
  return NORMAL_CREDIT;
}

/**
 * How descriptions are compared when looking for duplicates.
 *
 * MATCH_NORMALIZED trims both ends, collapses inner whitespace runs to
 * one space and ignores case.  MATCH_ICASE only ignores case.
 * Punctuation is significant under both.
 */
enum description_match_t {
  MATCH_NORMALIZED,
  MATCH_ICASE
};

class config_t
{
public:
  typedef std::map<char, account_type_t> class_map_t;

  class_map_t         account_classes;
  unsigned short      default_year;
  description_match_t description_match;

  path             init_file;
  path             log_file;
  optional<string> debug_category;
  bool             verbose_mode;
  bool             show_help;
  bool             show_version;

  // Parameters of the command being run
  long             company_id;
  long             period_id;
  optional<path>   history_file;
  optional<date_t> statement_date;

  config_t();

  /**
   * The account type implied by the leading digit of `code', if the
   * digit has a class assigned.
   */
  optional<account_type_t> class_of_code(const string& code) const;

  /**
   * Resolve an account's type: an explicit tag always wins, otherwise
   * the code's leading digit decides.  Throws config_error when neither
   * is available.
   */
  account_type_t account_type(const string&                   code,
                              const optional<account_type_t>& tag) const;

  void set_account_class(const string& spec);

  string normalize_description(const string& desc) const;
};

} // namespace reckon
