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
#include <string>
#include <vector>

#define VOBSUB_PALETTE_SIZE 16

struct Color
{
  Color() : red(0), green(0), blue(0) {}
  Color(uint8_t r, uint8_t g, uint8_t b) : red(r), green(g), blue(b) {}

  bool operator==(const Color &o) const { return red == o.red && green == o.green && blue == o.blue; }
  bool operator!=(const Color &o) const { return !(*this == o); }

  // "RRGGBB", upper case hex
  std::string ToString() const;

  uint8_t red, green, blue;
};

// One line of the .idx timestamp table
struct SubpictureItem
{
  int64_t timestamp; // milliseconds
  int64_t file_pos;  // byte offset into the .sub
};

// Parsed .idx file. Entries the file doesn't mention keep their unset
// value: -1 for integers and tri-state flags, a negative number for ratios.
struct SubtitleIndex
{
  int width       = -1;
  int height      = -1;
  int origin_x    = -1;
  int origin_y    = -1;
  double scale_x  = -1.0;
  double scale_y  = -1.0;
  double alpha    = -1.0;
  int smooth      = -1;
  int fade_in     = -1;
  int fade_out    = -1;
  int time_offset = -1;
  int forced_subs = -1;
  int lang_idx    = -1;
  std::string language;
  int stream_index = -1;

  std::vector<Color> palette;
  std::vector<SubpictureItem> items;

  bool HasValidPalette() const { return palette.size() == VOBSUB_PALETTE_SIZE; }
};

namespace IdxParser
{
  // Both throw ParseError naming the offending value; Load also throws
  // IoError if the file can't be read.
  SubtitleIndex Parse(const std::string &text);
  SubtitleIndex Load(const std::string &path);

  bool ParseBool(const std::string &value);
  int ParseInt(const std::string &value);
  double ParsePercent(const std::string &value);
  Color ParseColor(const std::string &value);
}
