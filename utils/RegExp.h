#pragma once
/*
 *      Copyright (C) 2005-2008 Team XBMC
 *      http://www.xbmc.org
 *
 *  This Program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2, or (at your option)
 *  any later version.
 *
 *  This Program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with XBMC; see the file COPYING.  If not, write to
 *  the Free Software Foundation, 675 Mass Ave, Cambridge, MA 02139, USA.
 *  http://www.gnu.org/copyleft/gpl.html
 *
 */

#include <string>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include "utils/NoMoveCopy.h"

// Thin wrapper over a compiled PCRE2 pattern. Not thread safe: match state
// is kept in the object, so each thread needs its own instance.
class CRegExp : public NoMoveCopy
{
public:
  explicit CRegExp(const char *re, bool casesensitive = false);

  ~CRegExp();

  int RegFind(const std::string& str, int startoffset = 0);
  int GetMatchCount() const { return m_iMatchCount; }
  std::string GetMatch(int iSub = 0) const;

  // Match as an integer in the given base, -1 if the group is empty
  long GetMatchAsLong(int iSub, int base = 10) const;

private:
  pcre2_code       *m_re         = nullptr;
  pcre2_match_data *m_match_data = nullptr;
  PCRE2_SIZE       *m_iOvector   = nullptr;
  int         m_iMatchCount = 0;
  uint32_t    m_iOptions = PCRE2_DOTALL;
  std::string m_subject;
  std::string m_pattern;
};
