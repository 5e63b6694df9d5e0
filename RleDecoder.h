#pragma once
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

namespace RleDecoder
{
  /* Decodes one field of a 2 bit run length encoded bitmap.
   *
   * src_len bytes starting at src_ofs are read as nibbles. Runs are written
   * to trg starting at trg_ofs; a full row advances the target by two rows
   * because the even and odd fields interleave. Decoding stops when the
   * nibbles run out or max_pixels have been produced. Writes never leave
   * trg, whatever the input.
   */
  void DecodeField(const std::vector<uint8_t> &src, int src_ofs, int src_len,
                   std::vector<uint8_t> &trg, int trg_ofs, int width, int max_pixels);
}
