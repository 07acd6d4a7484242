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

#include "amount.h"
#include "mask.h"

namespace reckon {

namespace {
  // The unsigned figure, once currency symbols, signs and grouping have
  // been stripped: digits with an optional fractional part.
  const boost::regex figure_re("^([0-9]+)(?:\\.([0-9]+))?$");

  // Digit groups separated by a comma or a single space: "1,234,567"
  // or "1 234 567".
  const boost::regex grouped_re("^[0-9]{1,3}(?:[, ][0-9]{3})+(?:\\.[0-9]+)?$");

  void power_of_ten(mpz_t result, amount_t::precision_t exponent)
  {
    mpz_ui_pow_ui(result, 10, exponent);
  }
}

amount_t::amount_t(const long val) : prec(0), has_quantity(true)
{
  _init();
  mpq_set_si(quantity, val, 1);
}

amount_t& amount_t::operator=(const amount_t& amt)
{
  if (this != &amt) {
    mpq_set(quantity, amt.quantity);
    prec         = amt.prec;
    has_quantity = amt.has_quantity;
  }
  return *this;
}

int amount_t::compare(const amount_t& amt) const
{
  return mpq_cmp(quantity, amt.quantity);
}

amount_t& amount_t::operator+=(const amount_t& amt)
{
  if (! amt.has_quantity)
    return *this;

  mpq_add(quantity, quantity, amt.quantity);
  if (amt.prec > prec)
    prec = amt.prec;
  has_quantity = true;

  return *this;
}

amount_t& amount_t::operator-=(const amount_t& amt)
{
  if (! amt.has_quantity)
    return *this;

  mpq_sub(quantity, quantity, amt.quantity);
  if (amt.prec > prec)
    prec = amt.prec;
  has_quantity = true;

  return *this;
}

amount_t& amount_t::in_place_negate()
{
  mpq_neg(quantity, quantity);
  return *this;
}

int amount_t::sign() const
{
  return mpq_sgn(quantity);
}

void amount_t::parse(const string& str)
{
  string text(trimmed(str));
  if (text.empty())
    throw_(amount_error, _("No quantity specified for amount"));

  bool negative = false;

  // Trailing CR/DR markers, as printed on many statements
  if (text.length() > 2) {
    string suffix(to_upper_copy(text.substr(text.length() - 2)));
    if (suffix == "DR" || suffix == "CR") {
      negative = suffix == "DR";
      text     = trimmed(text.substr(0, text.length() - 2));
    }
  }

  if (! text.empty() && text[0] == '(' && text[text.length() - 1] == ')') {
    negative = true;
    text     = trimmed(text.substr(1, text.length() - 2));
  }
  if (! text.empty() && text[text.length() - 1] == '-') {
    negative = true;
    text     = trimmed(text.substr(0, text.length() - 1));
  }
  if (! text.empty() && text[0] == '-') {
    negative = ! negative;
    text     = trimmed(text.substr(1));
  }

  // Currency designators: "R 1,200.00", "$12.00", "ZAR 5.00"
  if (starts_with(text, "ZAR"))
    text = trimmed(text.substr(3));
  else if (! text.empty() && (text[0] == 'R' || text[0] == '$'))
    text = trimmed(text.substr(1));

  if (! text.empty() && text[0] == '-') {
    negative = ! negative;
    text     = trimmed(text.substr(1));
  }

  if (boost::regex_match(text, grouped_re))
    erase_all_regex(text, boost::regex("[, ]"));

  boost::smatch what;
  if (! boost::regex_match(text, what, figure_re))
    throw_(amount_error, _f("Invalid amount: %1%") % str);

  string digits(what[1]);
  string fraction(what[2].matched ? string(what[2]) : string());

  mpz_t numerator;
  mpz_t denominator;
  mpz_init(numerator);
  mpz_init(denominator);

  mpz_set_str(numerator, (digits + fraction).c_str(), 10);
  power_of_ten(denominator, static_cast<precision_t>(fraction.length()));

  mpq_set_num(quantity, numerator);
  mpq_set_den(quantity, denominator);
  mpq_canonicalize(quantity);

  mpz_clear(numerator);
  mpz_clear(denominator);

  if (negative)
    mpq_neg(quantity, quantity);

  prec         = static_cast<precision_t>(fraction.length());
  has_quantity = true;

  DEBUG("amount.parse", "Parsed \"" << str << "\" as " << to_string());
}

optional<amount_t> parse_amount_text(const string& str)
{
  if (trimmed(str).empty())
    return none;
  try {
    return amount_t(str);
  }
  catch (const amount_error& err) {
    DEBUG("amount.parse", "Rejected amount text: " << err.what());
    return none;
  }
}

string amount_t::to_string() const
{
  precision_t places = prec < display_precision ? display_precision : prec;

  mpz_t scale;
  mpz_t scaled;
  mpz_t remainder;
  mpz_init(scale);
  mpz_init(scaled);
  mpz_init(remainder);

  // Round half away from zero at the display precision.  Amounts read
  // from statements are exact decimals, so this only matters for
  // derived figures.
  power_of_ten(scale, places);
  mpz_mul(scaled, mpq_numref(quantity), scale);
  mpz_tdiv_qr(scaled, remainder, scaled, mpq_denref(quantity));
  mpz_mul_ui(remainder, remainder, 2);
  mpz_abs(remainder, remainder);
  if (mpz_cmp(remainder, mpq_denref(quantity)) >= 0) {
    if (mpq_sgn(quantity) < 0)
      mpz_sub_ui(scaled, scaled, 1);
    else
      mpz_add_ui(scaled, scaled, 1);
  }

  bool negative = mpz_sgn(scaled) < 0;
  mpz_abs(scaled, scaled);

  char * buf = mpz_get_str(NULL, 10, scaled);
  string digits(buf);
  void (*freefunc)(void *, size_t);
  mp_get_memory_functions(NULL, NULL, &freefunc);
  freefunc(buf, std::strlen(buf) + 1);

  mpz_clear(scale);
  mpz_clear(scaled);
  mpz_clear(remainder);

  if (digits.length() <= places)
    digits.insert(0, places + 1 - digits.length(), '0');

  std::ostringstream out;
  if (negative)
    out << '-';
  out << digits.substr(0, digits.length() - places);
  if (places > 0)
    out << '.' << digits.substr(digits.length() - places);
  return out.str();
}

bool amount_t::valid() const
{
  if (prec > 1024) {
    DEBUG("reckon.validate", "amount_t: prec > 1024");
    return false;
  }
  if (mpz_sgn(mpq_denref(quantity)) <= 0) {
    DEBUG("reckon.validate", "amount_t: denominator <= 0");
    return false;
  }
  return true;
}

} // namespace reckon
