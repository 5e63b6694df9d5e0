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

#include "utils/simple_geometry.h"

struct SubtitleIndex;
class SubStream;

struct DecodedImage
{
  int width  = 0;
  int height = 0;
  Rect area;                  // position within the frame
  std::vector<uint8_t> rgba;  // 4 bytes per pixel, row major
  int duration = -1;          // -1 if the stream carries none
  bool forced = false;
};

namespace SubpictureDecoder
{
  /* Decodes the subpicture unit starting at the current position of
   * stream. Corruption with a known fallback is logged; anything that
   * prevents building the bitmap throws ParseError or IoError.
   */
  DecodedImage Decode(const SubtitleIndex &idx, SubStream &stream, bool invert);

  // Seeks to file_pos first
  DecodedImage DecodeAt(const SubtitleIndex &idx, SubStream &stream, int64_t file_pos, bool invert);

  // Exposed for tests: the decoded 2 bit pixel values before colour mapping
  std::vector<uint8_t> DecodePixels(const std::vector<uint8_t> &rle, int rle_size,
                                    int even_ofs, int odd_ofs, int width, int height);
}
