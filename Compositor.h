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

#include "SubtitleIndex.h"

struct ControlHeader;

namespace Compositor
{
  struct Rgba
  {
    uint8_t r, g, b, a;
  };

  // Resolves the four 2 bit pixel values to colours. A fully transparent
  // slot 0 takes the colour of slot 3. invert swaps slots 1 and 3.
  void BuildColorMap(const ControlHeader &header, const std::vector<Color> &palette, bool invert, Rgba map[4]);

  // Four bytes per pixel, row major
  void Compose(const std::vector<uint8_t> &pixels, const Rgba map[4], std::vector<uint8_t> &rgba);
}
