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
 * @addtogroup math
 */

/**
 * @file   amount.h
 * @author John Wiegley
 *
 * @ingroup math
 *
 * @brief Basic type for handling exact monetary math: amount_t.
 *
 * This file contains the most basic numerical type in Reckon: amount_t.
 * Every monetary figure that flows through the engine (statement
 * debits, credits, fees, running balances and journal postings) is an
 * amount_t.  The value is held as a GMP rational so that sums over
 * many postings never drift; there is no floating-point anywhere in
 * the path from statement text to trial balance.
 */
#pragma once

#include "utils.h"

namespace reckon {

DECLARE_EXCEPTION(amount_error, std::runtime_error);

/**
 * @class amount_t
 *
 * @brief Encapsulates exact fixed-point decimal amounts.
 *
 * An amount remembers the number of decimal places it was written
 * with (its precision), and always displays back at that precision,
 * with a minimum of two places.  Internal precision is never lost:
 * arithmetic is performed on the underlying rational, and the result
 * carries the larger precision of its operands.
 */
class amount_t
  : public boost::totally_ordered<amount_t,
           boost::totally_ordered<amount_t, long,
           boost::additive<amount_t,
           boost::additive<amount_t, long> > > >
{
public:
  typedef uint_least16_t precision_t;

  /**
   * The number of decimal places shown for amounts whose own precision
   * is smaller, so that "35" displays as "35.00".
   */
  static const precision_t display_precision = 2;

protected:
  mpq_t       quantity;
  precision_t prec;
  bool        has_quantity;

  void _init() {
    mpq_init(quantity);
  }

public:
  /**
   * Constructors.  amount_t() creates a value for which `is_null' is
   * true.  In value situations such an amount behaves as zero.
   *
   * amount_t(long) converts an integer with precision zero.
   *
   * amount_t(string) parses statement text: thousands separators,
   * currency symbols, a leading or trailing minus sign, parentheses,
   * and CR/DR suffixes are all understood.  Parsing failures throw
   * amount_error.
   */
  amount_t() : prec(0), has_quantity(false) {
    _init();
  }
  amount_t(const long val);
  amount_t(const string& val) : prec(0), has_quantity(false) {
    _init();
    parse(val);
  }
  amount_t(const char * val) : prec(0), has_quantity(false) {
    _init();
    parse(val);
  }

  amount_t(const amount_t& amt)
    : prec(amt.prec), has_quantity(amt.has_quantity) {
    _init();
    mpq_set(quantity, amt.quantity);
  }
  amount_t& operator=(const amount_t& amt);

  ~amount_t() {
    mpq_clear(quantity);
  }

  /**
   * Comparison operators.  The fundamental comparison operation is
   * `compare', which returns a value less than, greater than or equal
   * to zero.  A null amount compares as zero.
   */
  int compare(const amount_t& amt) const;
  int compare(const long val) const {
    return compare(amount_t(val));
  }

  bool operator==(const amount_t& amt) const {
    return compare(amt) == 0;
  }
  bool operator<(const amount_t& amt) const {
    return compare(amt) < 0;
  }
  bool operator==(const long val) const {
    return compare(val) == 0;
  }
  bool operator<(const long val) const {
    return compare(val) < 0;
  }
  bool operator>(const long val) const {
    return compare(val) > 0;
  }

  /**
   * Binary arithmetic operators.  Only in-place operators are defined
   * here; the remainder are provided by `boost::additive<>'.
   */
  amount_t& operator+=(const amount_t& amt);
  amount_t& operator-=(const amount_t& amt);
  amount_t& operator+=(const long val) {
    return *this += amount_t(val);
  }
  amount_t& operator-=(const long val) {
    return *this -= amount_t(val);
  }

  precision_t precision() const {
    return prec;
  }

  amount_t negated() const {
    amount_t temp(*this);
    temp.in_place_negate();
    return temp;
  }
  amount_t& in_place_negate();
  amount_t operator-() const {
    return negated();
  }

  amount_t abs() const {
    if (sign() < 0)
      return negated();
    return *this;
  }

  /**
   * Truth tests.  sign() returns an integer less than, greater than, or
   * equal to zero depending on whether the amount is negative, zero, or
   * greater than zero.
   *
   * is_null() returns true if an amount has never been given a value.
   */
  int sign() const;

  bool is_nonzero() const {
    return sign() != 0;
  }
  bool is_zero() const {
    return sign() == 0;
  }
  bool is_null() const {
    return ! has_quantity;
  }

  /**
   * Parsing methods.  parse() reads an amount from statement text and
   * throws amount_error if the text is not a monetary figure.
   * parse_amount_text() is the non-throwing variant used by the line
   * parsers, where an unreadable column simply means "absent".
   */
  void parse(const string& str);

  /**
   * Conversion methods.  to_string() returns the amount at its display
   * precision with a leading minus sign when negative, e.g. "-1500.00".
   */
  string to_string() const;

  void print(std::ostream& out) const {
    out << to_string();
  }

  bool valid() const;
};

optional<amount_t> parse_amount_text(const string& str);

inline std::ostream& operator<<(std::ostream& out, const amount_t& amt) {
  amt.print(out);
  return out;
}

/**
 * An optional amount with the null-as-zero rule applied.
 */
inline amount_t value_or_zero(const optional<amount_t>& amt) {
  return amt ? *amt : amount_t(0L);
}

} // namespace reckon
