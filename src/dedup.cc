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

#include "dedup.h"

namespace reckon {

bool duplicate_checker_t::is_duplicate(const bank_xact_t * candidate) const
{
  if (! candidate) {
    WARN("Duplicate check requested for a null transaction");
    return false;
  }

  xact_key_t key(xact_key_t::of(*candidate));
  bool       found = store.exists(key);

  DEBUG("dedup", (found ? "Duplicate: " : "New: ") << key);
  return found;
}

optional<bank_xact_t>
duplicate_checker_t::find_duplicate(const bank_xact_t * candidate) const
{
  if (! candidate) {
    WARN("Duplicate lookup requested for a null transaction");
    return none;
  }

  xact_key_t            key(xact_key_t::of(*candidate));
  optional<bank_xact_t> existing = store.find(key);

  if (existing)
    DEBUG("dedup", "Duplicate of transaction " << existing->id << ": " << key);
  else
    DEBUG("dedup", "New: " << key);

  return existing;
}

} // namespace reckon
