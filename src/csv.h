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
 * @file   csv.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Reading fiscal periods, journal lines and import history from CSV.
 *
 * The first line of each file names its columns.  Column names are
 * matched loosely (case is ignored, underscores count as spaces), and
 * columns that are not recognized are skipped.
 */
#pragma once

#include "journal.h"
#include "store.h"
#include "mask.h"

namespace reckon {

DECLARE_EXCEPTION(csv_error, std::runtime_error);

class csv_reader
{
public:
  enum headers_t {
    FIELD_ID = 0,
    FIELD_COMPANY,
    FIELD_PERIOD,
    FIELD_ENTRY,
    FIELD_DATE,
    FIELD_START,
    FIELD_END,
    FIELD_CODE,
    FIELD_ACCOUNT,
    FIELD_TYPE,
    FIELD_NAME,
    FIELD_DETAILS,
    FIELD_DEBIT,
    FIELD_CREDIT,
    FIELD_BALANCE,

    FIELD_UNKNOWN
  };

  typedef std::map<headers_t, string> record_t;

private:
  std::istream& in;
  path          pathname;
  std::size_t   linenum;
  string        linebuf;

  std::array<std::pair<mask_t, headers_t>, 16> masks;

  std::vector<headers_t> index;
  std::vector<string>    names;

public:
  csv_reader(std::istream& _in, const path& _pathname = "<input>")
    : in(_in), pathname(_pathname), linenum(0),
      masks{ std::make_pair(mask_t("^(id|transaction ?id)$"), FIELD_ID),
             std::make_pair(mask_t("^company( ?id)?$"), FIELD_COMPANY),
             std::make_pair(mask_t("^(fiscal ?)?period( ?id)?$"), FIELD_PERIOD),
             std::make_pair(mask_t("^((journal ?)?entry( ?id)?|ref(erence)?)$"), FIELD_ENTRY),
             std::make_pair(mask_t("^(transaction ?)?date$"), FIELD_DATE),
             std::make_pair(mask_t("^(start|begin)( ?date)?$"), FIELD_START),
             std::make_pair(mask_t("^end( ?date)?$"), FIELD_END),
             std::make_pair(mask_t("^(account ?)?code$"), FIELD_CODE),
             std::make_pair(mask_t("^account( ?name)?$"), FIELD_ACCOUNT),
             std::make_pair(mask_t("^(account ?)?type$"), FIELD_TYPE),
             std::make_pair(mask_t("^(period ?)?name$"), FIELD_NAME),
             std::make_pair(mask_t("^(details|desc(ription)?|payee)$"), FIELD_DETAILS),
             std::make_pair(mask_t("^debits?( ?amount)?$"), FIELD_DEBIT),
             std::make_pair(mask_t("^credits?( ?amount)?$"), FIELD_CREDIT),
             std::make_pair(mask_t("^balance$"), FIELD_BALANCE),
             std::make_pair(mask_t(""), FIELD_UNKNOWN) } {
    read_index();
  }

  void   read_index();
  string read_field(std::istream& instr);
  bool   next_line();

  /**
   * Read the next data line into `record'; false at end of input.
   */
  bool read_record(record_t& record);

  bool has_field(const headers_t field) const {
    return std::find(index.begin(), index.end(), field) != index.end();
  }

  /**
   * Raise csv_error unless the header named `field'.
   */
  void require(const headers_t field, const char * what) const;

  const string& get_last_line() const {
    return linebuf;
  }
  const path& get_pathname() const {
    return pathname;
  }
  std::size_t get_linenum() const {
    return linenum;
  }
  string location() const {
    return file_context(pathname, linenum);
  }
};

/**
 * Columns: id, company, name, start, end.
 */
void read_fiscal_periods(csv_reader& reader, memory_journal_store_t& journal);

/**
 * Columns: entry, company, period, date, description, account code,
 * account name, account type, debit, credit.  All rows naming the same
 * entry form one journal entry, which must balance.  Returns the number
 * of entries posted.
 */
std::size_t read_journal(csv_reader& reader, memory_journal_store_t& journal);

/**
 * Previously imported bank transactions.  Columns: id, company, period,
 * date, details, debit, credit, balance.
 */
std::size_t read_history(csv_reader& reader, transaction_store_t& store);

} // namespace reckon
