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
 * @addtogroup util
 */

/**
 * @file   mask.h
 * @author John Wiegley
 *
 * @ingroup util
 *
 * @brief Regular expression masking.
 */
#pragma once

#include "utils.h"

namespace reckon {

class mask_t
{
public:
  boost::regex expr;

  explicit mask_t(const string& pattern, bool icase = true);

  mask_t() : expr() {}
  mask_t(const mask_t& m) : expr(m.expr) {}
  ~mask_t() throw() {}

  mask_t& operator=(const mask_t& other) {
    expr = other.expr;
    return *this;
  }
  mask_t& operator=(const string& other);

  bool operator<(const mask_t& other) const {
    return expr < other.expr;
  }
  bool operator==(const mask_t& other) const {
    return expr == other.expr;
  }

  bool match(const string& text) const {
    DEBUG("mask.match",
          "Matching: \"" << text << "\" =~ /" << str() << "/ = "
          << (boost::regex_search(text, expr) ? "true" : "false"));
    return boost::regex_search(text, expr);
  }

  /**
   * Anchored match of the whole text; captured groups land in `what'.
   */
  bool match_all(const string& text, boost::smatch& what) const {
    return boost::regex_match(text, what, expr);
  }
  bool match_all(const string& text) const {
    return boost::regex_match(text, expr);
  }

  bool search(const string& text, boost::smatch& what) const {
    return boost::regex_search(text, what, expr);
  }

  bool empty() const {
    return expr.empty();
  }

  string str() const {
    if (! empty())
      return expr.str();
    else
      return empty_string;
  }

  bool valid() const {
    if (expr.status() != 0) {
      DEBUG("reckon.validate", "mask_t: expr.status() != 0");
      return false;
    }
    return true;
  }
};

inline std::ostream& operator<<(std::ostream& out, const mask_t& mask) {
  out << mask.str();
  return out;
}

} // namespace reckon
