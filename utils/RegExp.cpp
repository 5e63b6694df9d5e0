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
#include <stdlib.h>

#include "RegExp.h"
#include "log.h"
#include "VobSubError.h"

CRegExp::CRegExp(const char *re, bool casesensitive /* = false */)
: m_pattern(re)
{
  if(!casesensitive)
    m_iOptions |= PCRE2_CASELESS;

  int errCode;
  PCRE2_SIZE errOffset;

  m_re = pcre2_compile((PCRE2_SPTR)re, PCRE2_ZERO_TERMINATED, m_iOptions, &errCode, &errOffset, nullptr);
  if (!m_re)
  {
    CLogLog(LOGERROR, "PCRE: Compilation failed for expression '%s' at offset %d", re, (int)errOffset);
    throw VobSubError("PCRE: Compilation failed for expression '" + m_pattern + "'");
  }

  m_match_data = pcre2_match_data_create_from_pattern(m_re, nullptr);
  if (!m_match_data)
  {
    pcre2_code_free(m_re);
    throw VobSubError("PCRE: Failed to allocate match data");
  }
}


CRegExp::~CRegExp()
{
  pcre2_match_data_free(m_match_data);
  pcre2_code_free(m_re);
}

int CRegExp::RegFind(const std::string &str, int startoffset)
{
  m_iMatchCount = 0;
  m_iOvector = nullptr;

  m_subject = str;
  int rc = pcre2_match(m_re, (PCRE2_SPTR)m_subject.c_str(), m_subject.size(), startoffset, 0, m_match_data, nullptr);

  if (rc < 1)
  {
    if(rc != PCRE2_ERROR_NOMATCH)
      CLogLog(LOGERROR, "PCRE: Error: %d", rc);

    return -1;
  }

  m_iMatchCount = rc;
  m_iOvector = pcre2_get_ovector_pointer(m_match_data);

  return (int)m_iOvector[0];
}

std::string CRegExp::GetMatch(int iSub /* = 0 */) const
{
  if (iSub < 0 || iSub >= m_iMatchCount)
    return "";

  PCRE2_SIZE pos = m_iOvector[(iSub*2)];
  PCRE2_SIZE end = m_iOvector[(iSub*2)+1];
  if (pos == PCRE2_UNSET || end < pos)
    return "";

  return m_subject.substr(pos, end - pos);
}

long CRegExp::GetMatchAsLong(int iSub, int base) const
{
  std::string m = GetMatch(iSub);
  if(m.empty())
    return -1;

  return strtol(m.c_str(), nullptr, base);
}
