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

#include <string>

struct DecodedImage;

namespace ImageWriter
{
  // Straight RGBA, 8 bits per channel. Throws IoError when the file can't be written
  void WritePng(const DecodedImage &image, const std::string &path);

  // "<dir>/<stem>-0001.png" for index 0
  std::string ImagePath(const std::string &dir, const std::string &stem, int index);
}
