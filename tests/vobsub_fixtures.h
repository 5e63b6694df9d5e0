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

// Builders for small synthetic .idx/.sub pairs

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <string>
#include <vector>

// Palette used by every fixture: 0 black, 1 white, 2 red, 3 blue, rest grey
static inline std::string fixture_palette_line()
{
  std::string line = "palette: 000000, ffffff, ff0000, 0000ff";
  for(int i = 4; i < 16; i++)
    line += ", 808080";
  return line;
}

static inline std::string fixture_idx_text(const std::vector<std::string> &timestamps)
{
  std::string text =
    "# VobSub index file, v7 (do not modify this line!)\n"
    "size: 720x480\n"
    "org: 0, 0\n"
    "scale: 100%, 100%\n"
    "alpha: 100%\n"
    "smooth: OFF\n"
    "fadein/out: 50, 50\n"
    "align: OFF at LEFT TOP\n"
    "time offset: 0\n"
    "forced subs: OFF\n";
  text += fixture_palette_line() + "\n";
  text +=
    "custom colors: OFF, tridx: 0000, colors: 000000, 000000, 000000, 000000\n"
    "langidx: 0\n"
    "\n"
    "# English\n"
    "id: en, index: 0\n";
  for(size_t i = 0; i < timestamps.size(); i++)
    text += "timestamp: " + timestamps[i] + "\n";
  return text;
}

/* One 36 byte subpicture unit: a 4x2 bitmap filled with pixel value color,
 * pixel values 0..3 mapped to palette entries 0..3, alpha 0/15/15/15, and
 * a second control sequence after stop_delay ticks of 10 ms.
 */
static inline std::vector<uint8_t> fixture_unit(int color, int stop_delay)
{
  uint8_t rle = (uint8_t)(0x10 | (color & 3));  // run of 4
  uint8_t delay_hi = (uint8_t)(stop_delay >> 8);
  uint8_t delay_lo = (uint8_t)(stop_delay & 0xFF);

  uint8_t unit[] = {
    0x00, 0x24,                          // unit size 36
    0x00, 0x06,                          // control sequence at 6
    rle, rle,                            // even and odd field
    0x00, 0x00,                          // first sequence delay
    0x00, 0x1E,                          // next sequence at 30
    0x01,                                // start display
    0x03, 0x32, 0x10,                    // palette 3 2 1 0
    0x04, 0xFF, 0xF0,                    // alpha 15 15 15 0
    0x05, 0x00, 0x00, 0x03, 0x00, 0x00, 0x01,  // area 0-3 x 0-1
    0x06, 0x00, 0x04, 0x00, 0x05,        // fields at 4 and 5
    0xFF,
    delay_hi, delay_lo,                  // second sequence: stop
    0x00, 0x1E,                          // points to itself
    0x02, 0xFF,
  };
  return std::vector<uint8_t>(unit, unit + sizeof(unit));
}

// Pack header, PES header of private stream 1 and the payload
static inline std::vector<uint8_t> fixture_packet(const std::vector<uint8_t> &payload, bool first, int truncate_to = -1)
{
  static const uint8_t pack[] = {
    0x00, 0x00, 0x01, 0xBA, 0x44, 0x00, 0x04, 0x00, 0x04, 0x01, 0x01, 0x89, 0xC3, 0xF8,
  };
  std::vector<uint8_t> p(pack, pack + sizeof(pack));

  int pts_length = first ? 5 : 0;
  int length = 3 + pts_length + 1 + payload.size();

  uint8_t pes[] = { 0x00, 0x00, 0x01, 0xBD, (uint8_t)(length >> 8), (uint8_t)(length & 0xFF),
                    0x81, (uint8_t)(first ? 0x80 : 0x00), (uint8_t)pts_length };
  p.insert(p.end(), pes, pes + sizeof(pes));

  if(first)
  {
    static const uint8_t pts[] = { 0x21, 0x00, 0x01, 0x00, 0x01 };
    p.insert(p.end(), pts, pts + sizeof(pts));
  }
  p.push_back(0x20);  // sub stream id
  p.insert(p.end(), payload.begin(), payload.end());

  if(truncate_to >= 0 && (size_t)truncate_to < p.size())
    p.resize(truncate_to);
  return p;
}

// Appends data and pads to the next 0x800 sector
static inline void fixture_append_sector(std::vector<uint8_t> &sub, const std::vector<uint8_t> &data)
{
  sub.insert(sub.end(), data.begin(), data.end());
  sub.resize((sub.size() + 0x7FF) / 0x800 * 0x800, 0);
}

// Writes data to a new file in /tmp ending in suffix, returns "" on failure
static inline std::string fixture_temp_file(const std::string &suffix, const std::string &data)
{
  std::string path = "/tmp/vobsubocr-test-XXXXXX" + suffix;
  int fd = mkstemps(&path[0], suffix.length());
  if(fd < 0)
    return std::string();

  FILE *f = fdopen(fd, "wb");
  if(!f)
  {
    close(fd);
    return std::string();
  }
  bool ok = fwrite(data.data(), 1, data.size(), f) == data.size();
  fclose(f);
  return ok ? path : std::string();
}
