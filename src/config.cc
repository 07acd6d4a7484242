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

#include "config.h"

namespace reckon {

optional<account_type_t> string_to_account_type(const string& text)
{
  string str(lowered(trimmed(text)));

  if (str == "asset" || str == "assets")
    return ACCOUNT_ASSET;
  else if (str == "liability" || str == "liabilities")
    return ACCOUNT_LIABILITY;
  else if (str == "equity")
    return ACCOUNT_EQUITY;
  else if (str == "revenue" || str == "income")
    return ACCOUNT_REVENUE;
  else if (str == "expense" || str == "expenses")
    return ACCOUNT_EXPENSE;
  else
    return none;
}

const char * account_type_name(const account_type_t type)
{
  switch (type) {
  case ACCOUNT_ASSET:     return "asset";
  case ACCOUNT_LIABILITY: return "liability";
  case ACCOUNT_EQUITY:    return "equity";
  case ACCOUNT_REVENUE:   return "revenue";
  case ACCOUNT_EXPENSE:   return "expense";
  }
  return "unknown";
}

config_t::config_t()
  : default_year(2024),
    description_match(MATCH_NORMALIZED),
    verbose_mode(false),
    show_help(false),
    show_version(false),
    company_id(0),
    period_id(0)
{
  account_classes['1'] = ACCOUNT_ASSET;
  account_classes['2'] = ACCOUNT_LIABILITY;
  account_classes['3'] = ACCOUNT_EQUITY;
  account_classes['4'] = ACCOUNT_REVENUE;
  account_classes['5'] = ACCOUNT_REVENUE;
  account_classes['6'] = ACCOUNT_REVENUE;
  account_classes['7'] = ACCOUNT_EXPENSE;
  account_classes['8'] = ACCOUNT_EXPENSE;
  account_classes['9'] = ACCOUNT_EXPENSE;
}

optional<account_type_t> config_t::class_of_code(const string& code) const
{
  string str(trimmed(code));
  if (str.empty())
    return none;

  class_map_t::const_iterator i = account_classes.find(str[0]);
  if (i == account_classes.end())
    return none;
  return (*i).second;
}

account_type_t
config_t::account_type(const string&                   code,
                       const optional<account_type_t>& tag) const
{
  if (tag)
    return *tag;

  if (optional<account_type_t> type = class_of_code(code))
    return *type;

  throw_(config_error,
         _f("Cannot classify account %1%: no type given and no class for its leading digit")
         % code);
  return ACCOUNT_ASSET;
}

void config_t::set_account_class(const string& spec)
{
  string::size_type pos = spec.find('=');
  if (pos != 1 || ! std::isdigit(static_cast<unsigned char>(spec[0])))
    throw_(config_error,
           _f("Account class must be given as DIGIT=TYPE, not '%1%'") % spec);

  optional<account_type_t> type = string_to_account_type(spec.substr(2));
  if (! type)
    throw_(config_error, _f("Unknown account type '%1%'") % spec.substr(2));

  account_classes[spec[0]] = *type;

  DEBUG("config.classes",
        "Accounts beginning with " << spec[0] << " are "
        << account_type_name(*type));
}

string config_t::normalize_description(const string& desc) const
{
  switch (description_match) {
  case MATCH_NORMALIZED:
    return lowered(collapse_ws(desc));
  case MATCH_ICASE:
    break;
  }
  return lowered(desc);
}

} // namespace reckon
