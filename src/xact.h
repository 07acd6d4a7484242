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
 * @addtogroup data
 */

/**
 * @file   xact.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Statement transactions: raw fields, standardized and persisted forms.
 */
#pragma once

#include "amount.h"
#include "times.h"

namespace reckon {

/**
 * Raised when a field bag lacks a required field.  field() names it
 * ("date" or "description").
 */
class build_error : public std::runtime_error
{
  string _field;

public:
  explicit build_error(const string& field, const string& why) throw()
    : std::runtime_error(why), _field(field) {}
  virtual ~build_error() throw() {}

  const string& field() const {
    return _field;
  }
};

/**
 * Everything a parser managed to extract from one statement row.  Any
 * field may be missing; monetary fields that are missing count as zero
 * once the bag is built into a transaction.
 */
struct raw_fields_t
{
  optional<date_t>   date;
  string             description;
  optional<amount_t> debit;
  optional<amount_t> credit;
  optional<amount_t> service_fee;
  optional<amount_t> balance;
  optional<string>   reference;

  std::size_t        linenum;
  string             parser;

  raw_fields_t() : linenum(0) {}
};

enum xact_type_t {
  XACT_DEBIT,
  XACT_CREDIT,
  XACT_SERVICE_FEE
};

const char * xact_type_name(const xact_type_t type);

/**
 * Decide what kind of transaction a set of amounts and a description
 * describe.  The first matching rule wins:
 *
 *  1. a non-zero service fee, or "fee"/"charge" in the description;
 *  2. a debit with no credit;
 *  3. a credit with no debit;
 *  4. debit keywords, then credit keywords, in the description;
 *  5. the sign of credit - debit, zero counting as a credit.
 */
xact_type_t determine_type(const amount_t& debit,
                           const amount_t& credit,
                           const amount_t& service_fee,
                           const string&   description);

/**
 * @class standardized_xact_t
 *
 * @brief An immutable, validated statement transaction.
 *
 * Instances are only made by build(), which enforces the required
 * fields.  The type is recomputed from the stored fields and cannot be
 * set independently.
 */
class standardized_xact_t
{
  date_t             _date;
  string             _description;
  amount_t           _debit;
  amount_t           _credit;
  optional<amount_t> _balance;
  amount_t           _service_fee;
  optional<string>   _reference;
  xact_type_t        _type;

  standardized_xact_t(const date_t&             date,
                      const string&             description,
                      const amount_t&           debit,
                      const amount_t&           credit,
                      const optional<amount_t>& balance,
                      const amount_t&           service_fee,
                      const optional<string>&   reference);

public:
  static standardized_xact_t build(const raw_fields_t& fields);

  const date_t& date() const {
    return _date;
  }
  const string& description() const {
    return _description;
  }
  const amount_t& debit() const {
    return _debit;
  }
  const amount_t& credit() const {
    return _credit;
  }
  const optional<amount_t>& balance() const {
    return _balance;
  }
  const amount_t& service_fee() const {
    return _service_fee;
  }
  const optional<string>& reference() const {
    return _reference;
  }
  xact_type_t type() const {
    return _type;
  }

  /**
   * The amount belonging to the derived type.  A service fee recognized
   * only by its description carries its figure in the debit or credit
   * column, which is returned in that case.
   */
  amount_t amount() const;

  bool valid() const;
};

std::ostream& operator<<(std::ostream& out, const standardized_xact_t& xact);

/**
 * A transaction as the persistence collaborator stores it.  Service
 * fees are folded into the debit column.
 */
struct bank_xact_t
{
  long               id;
  long               company_id;
  long               period_id;
  date_t             date;
  string             details;
  amount_t           debit;
  amount_t           credit;
  optional<amount_t> balance;
  datetime_t         created;

  bank_xact_t() : id(0), company_id(0), period_id(0) {}

  static bank_xact_t from(const standardized_xact_t& xact,
                          const long company_id, const long period_id);
};

} // namespace reckon
