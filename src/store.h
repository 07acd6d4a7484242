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
 * @file   store.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief The persisted transaction store, and an in-memory rendition of it.
 */
#pragma once

#include "xact.h"

namespace reckon {

class config_t;

DECLARE_EXCEPTION(store_error, std::runtime_error);

/**
 * The fields which identify a statement transaction.  Missing debit and
 * credit amounts are zero; a missing balance only matches another
 * missing balance.
 */
struct xact_key_t
{
  long               company_id;
  date_t             date;
  amount_t           debit;
  amount_t           credit;
  string             description;
  optional<amount_t> balance;

  xact_key_t() : company_id(0) {}

  static xact_key_t of(const bank_xact_t& xact);
};

std::ostream& operator<<(std::ostream& out, const xact_key_t& key);

class transaction_store_t
{
public:
  virtual ~transaction_store_t() {}

  virtual bool exists(const xact_key_t& key) const {
    return static_cast<bool>(find(key));
  }

  virtual optional<bank_xact_t> find(const xact_key_t& key) const = 0;

  /**
   * Persist a new row and return its id.  Failures raise store_error.
   */
  virtual long insert(const bank_xact_t& xact) = 0;
};

/**
 * Rows held in memory, indexed by company and date.  Descriptions are
 * compared under the configured normalization.
 */
class memory_transaction_store_t : public transaction_store_t
{
  typedef std::multimap<std::pair<long, date_t>, std::size_t> index_map;

  const config_t&          config;
  std::vector<bank_xact_t> rows;
  index_map                index;
  long                     next_id;

public:
  explicit memory_transaction_store_t(const config_t& _config)
    : config(_config), next_id(1) {}

  virtual optional<bank_xact_t> find(const xact_key_t& key) const;
  virtual long insert(const bank_xact_t& xact);

  const std::vector<bank_xact_t>& transactions() const {
    return rows;
  }
  std::size_t size() const {
    return rows.size();
  }

protected:
  bool matches(const bank_xact_t& row, const xact_key_t& key) const;
};

} // namespace reckon
