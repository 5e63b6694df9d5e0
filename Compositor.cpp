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

#include "Compositor.h"
#include "ControlHeader.h"
#include "VobSubError.h"

using namespace std;

namespace Compositor {

void BuildColorMap(const ControlHeader &header, const vector<Color> &palette, bool invert, Rgba map[4])
{
  if(palette.size() != VOBSUB_PALETTE_SIZE)
    throw ParseError("Palette must have 16 entries");

  for(int i = 0; i < 4; i++)
  {
    const Color &c = palette[header.palette[i] & 0x0F];
    map[i].r = c.red;
    map[i].g = c.green;
    map[i].b = c.blue;
    map[i].a = (header.alpha[i] & 0x0F) * 0xFF / 0x0F;
  }

  // transparent background takes the outline colour
  if(map[0].a == 0)
  {
    map[0].r = map[3].r;
    map[0].g = map[3].g;
    map[0].b = map[3].b;
  }

  if(invert)
  {
    const Color &c1 = palette[header.palette[1] & 0x0F];
    const Color &c3 = palette[header.palette[3] & 0x0F];
    map[1].r = c3.red; map[1].g = c3.green; map[1].b = c3.blue;
    map[3].r = c1.red; map[3].g = c1.green; map[3].b = c1.blue;
  }
}

void Compose(const vector<uint8_t> &pixels, const Rgba map[4], vector<uint8_t> &rgba)
{
  rgba.resize(pixels.size() * 4);

  uint8_t *out = rgba.empty() ? nullptr : &rgba[0];
  for(size_t i = 0; i < pixels.size(); i++)
  {
    const Rgba &c = map[pixels[i] & 0x3];
    *out++ = c.r;
    *out++ = c.g;
    *out++ = c.b;
    *out++ = c.a;
  }
}

}
