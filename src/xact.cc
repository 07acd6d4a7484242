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

#include "xact.h"

namespace reckon {

namespace {
  const char * debit_keywords[] = {
    "withdrawal", "debit", "payment", "transfer to", "atm", "eft out", NULL
  };
  const char * credit_keywords[] = {
    "deposit", "credit", "salary", "transfer from", "interest", "dividend",
    "eft in", "refund", NULL
  };

  bool contains_any(const string& text, const char ** keywords)
  {
    for (const char ** p = keywords; *p; p++)
      if (contains_icase(text, *p))
        return true;
    return false;
  }
}

const char * xact_type_name(const xact_type_t type)
{
  switch (type) {
  case XACT_DEBIT:       return "DEBIT";
  case XACT_CREDIT:      return "CREDIT";
  case XACT_SERVICE_FEE: return "SERVICE_FEE";
  }
  return "UNKNOWN";
}

xact_type_t determine_type(const amount_t& debit,
                           const amount_t& credit,
                           const amount_t& service_fee,
                           const string&   description)
{
  xact_type_t type;

  if (service_fee.sign() > 0 ||
      contains_icase(description, "fee") ||
      contains_icase(description, "charge"))
    type = XACT_SERVICE_FEE;
  else if (debit.sign() > 0 && credit.is_zero())
    type = XACT_DEBIT;
  else if (credit.sign() > 0 && debit.is_zero())
    type = XACT_CREDIT;
  else if (contains_any(description, debit_keywords))
    type = XACT_DEBIT;
  else if (contains_any(description, credit_keywords))
    type = XACT_CREDIT;
  else if ((credit - debit).sign() >= 0)
    type = XACT_CREDIT;
  else
    type = XACT_DEBIT;

  DEBUG("xact.type",
        "debit " << debit << " credit " << credit << " fee " << service_fee
        << " \"" << description << "\" => " << xact_type_name(type));

  return type;
}

standardized_xact_t::standardized_xact_t(const date_t&             date,
                                         const string&             description,
                                         const amount_t&           debit,
                                         const amount_t&           credit,
                                         const optional<amount_t>& balance,
                                         const amount_t&           service_fee,
                                         const optional<string>&   reference)
  : _date(date), _description(description), _debit(debit),
    _credit(credit), _balance(balance), _service_fee(service_fee),
    _reference(reference),
    _type(determine_type(debit, credit, service_fee, description))
{
}

standardized_xact_t standardized_xact_t::build(const raw_fields_t& fields)
{
  if (! fields.date || ! is_valid(*fields.date))
    throw build_error("date", _("Date is required"));

  string description(trimmed(fields.description));
  if (description.empty())
    throw build_error("description", _("Description is required"));

  // Statements print debits either as negative figures or in their own
  // column; only magnitudes are kept.
  amount_t debit(value_or_zero(fields.debit).abs());
  amount_t credit(value_or_zero(fields.credit).abs());
  amount_t service_fee(value_or_zero(fields.service_fee).abs());

  optional<string> reference;
  if (fields.reference && ! trimmed(*fields.reference).empty())
    reference = trimmed(*fields.reference);

  return standardized_xact_t(*fields.date, description, debit, credit,
                             fields.balance, service_fee, reference);
}

amount_t standardized_xact_t::amount() const
{
  switch (_type) {
  case XACT_DEBIT:
    return _debit;
  case XACT_CREDIT:
    return _credit;
  case XACT_SERVICE_FEE:
    if (_service_fee.is_nonzero())
      return _service_fee;
    else if (_debit.is_nonzero())
      return _debit;
    else
      return _credit;
  }
  return amount_t(0L);
}

bool standardized_xact_t::valid() const
{
  if (! is_valid(_date)) {
    DEBUG("reckon.validate", "standardized_xact_t: ! is_valid(_date)");
    return false;
  }
  if (_description.empty()) {
    DEBUG("reckon.validate", "standardized_xact_t: _description.empty()");
    return false;
  }
  if (_debit.sign() < 0 || _credit.sign() < 0 || _service_fee.sign() < 0) {
    DEBUG("reckon.validate", "standardized_xact_t: negative amount");
    return false;
  }
  if (_type != determine_type(_debit, _credit, _service_fee, _description)) {
    DEBUG("reckon.validate", "standardized_xact_t: type out of date");
    return false;
  }
  return true;
}

std::ostream& operator<<(std::ostream& out, const standardized_xact_t& xact)
{
  out << format_date(xact.date(), FMT_WRITTEN) << ' '
      << std::left << std::setw(12) << xact_type_name(xact.type()) << ' '
      << std::right << std::setw(14) << xact.amount() << "  "
      << xact.description();
  if (xact.balance())
    out << "  [balance " << *xact.balance() << ']';
  if (xact.reference())
    out << "  (" << *xact.reference() << ')';
  return out;
}

bank_xact_t bank_xact_t::from(const standardized_xact_t& xact,
                              const long company_id, const long period_id)
{
  bank_xact_t row;

  row.company_id = company_id;
  row.period_id  = period_id;
  row.date       = xact.date();
  row.details    = xact.description();
  row.debit      = xact.debit() + xact.service_fee();
  row.credit     = xact.credit();
  row.balance    = xact.balance();
  row.created    = CURRENT_TIME();

  return row;
}

} // namespace reckon
