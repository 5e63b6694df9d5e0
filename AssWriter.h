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
#include <ostream>
#include <string>
#include <vector>

class Subtitle;

namespace AssWriter
{
  // H:MM:SS.cc
  std::string FormatTime(int64_t ms);

  // play_res_x/y of -1 are left out of [Script Info]
  void Write(std::ostream &out, const std::vector<Subtitle> &events, int play_res_x, int play_res_y);

  // Throws IoError if the file can't be written
  void WriteFile(const std::string &path, const std::vector<Subtitle> &events, int play_res_x, int play_res_y);
}
