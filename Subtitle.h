#pragma once
/*
 *
 *		Copyright (C) 2020 Michael J. Walsh
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 675 Mass Ave, Cambridge, MA 02139, USA.
 */

#include <stdint.h>
#include <string>

// One subtitle event. Times in milliseconds, text already escaped for ASS
class Subtitle {
  public:
  Subtitle() : start(0), stop(0) {}
  Subtitle(int64_t start, int64_t stop, const std::string &text);

  // stop = start + duration; a missing duration gives a zero length event
  static Subtitle FromRecognizedText(int64_t timestamp, int duration, const std::string &ocr_text);

  int64_t start;
  int64_t stop;
  std::string text;
};
