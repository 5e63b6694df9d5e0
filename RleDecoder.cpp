/*
 *      Copyright (C) 2026 The vobsubocr developers
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 675 Mass Ave, Cambridge, MA 02139, USA.
 */

#include <stdint.h>
#include <vector>

#include "RleDecoder.h"
#include "utils/log.h"

using namespace std;

namespace RleDecoder {

class NibbleReader
{
public:
  NibbleReader(const vector<uint8_t> &src, int ofs, int len)
  : m_src(src), m_ofs(ofs), m_count(len * 2) {}

  bool AtEnd() const { return m_index >= m_count; }
  int Index() const { return m_index; }
  void Align() { if(m_index & 1) m_index++; }

  // a code cut short by the end of the buffer reads as zeros
  int Next()
  {
    if(m_index >= m_count)
    {
      m_index++;
      return 0;
    }

    int b = m_src[m_ofs + (m_index >> 1)];
    int n = (m_index & 1) ? (b & 0x0F) : (b >> 4);
    m_index++;
    return n;
  }

private:
  const vector<uint8_t> &m_src;
  int m_ofs;
  int m_count;
  int m_index = 0;
};

void DecodeField(const vector<uint8_t> &src, int src_ofs, int src_len,
                 vector<uint8_t> &trg, int trg_ofs, int width, int max_pixels)
{
  if(width <= 0 || src_ofs < 0 || src_ofs >= (int)src.size())
    return;

  if(src_len > (int)src.size() - src_ofs)
  {
    CLogLog(LOGWARNING, "RLE field at %d truncated from %d to %d bytes", src_ofs, src_len, (int)src.size() - src_ofs);
    src_len = src.size() - src_ofs;
  }

  NibbleReader nibbles(src, src_ofs, src_len);
  const int trg_size = trg.size();
  int sum_pixels = 0;
  int x = 0;

  while(!nibbles.AtEnd() && sum_pixels < max_pixels)
  {
    int len;
    int tmp = nibbles.Next();

    if(tmp == 0)
    {
      // three or four nibble code
      tmp = nibbles.Next();
      if((tmp & 0xC) != 0)
      {
        // three nibble code
        len = tmp << 2;
        tmp = nibbles.Next();
        len |= tmp >> 2;
      }
      else
      {
        // four nibble code or line feed
        len = tmp << 6;
        tmp = nibbles.Next();
        len |= tmp << 2;
        tmp = nibbles.Next();
        len |= tmp >> 2;

        if(len == 0)
        {
          // fill to the end of the row
          len = width - x;
          if(len <= 0 || sum_pixels >= max_pixels)
          {
            len = 0;
            trg_ofs += 2 * width;
            sum_pixels = ((trg_ofs / width) / 2) * width;
            x = 0;
          }
          nibbles.Align();
        }
      }
    }
    else
    {
      // one or two nibble code
      len = tmp >> 2;
      if(len == 0)
      {
        len = tmp << 2;
        tmp = nibbles.Next();
        len |= tmp >> 2;
      }
    }

    uint8_t col = tmp & 0x3;
    sum_pixels += len;

    for(int i = 0; i < len; i++)
    {
      if(trg_ofs + x >= trg_size)
        return;

      trg[trg_ofs + x] = col;
      x++;
      if(x >= width)
      {
        // lines are interlaced
        trg_ofs += 2 * width;
        x = 0;
        nibbles.Align();
      }
    }
  }
}

}
