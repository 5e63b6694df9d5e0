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

// Subpicture control commands
enum ControlCommand
{
  CMD_FORCE_DISPLAY   = 0x00,
  CMD_START_DISPLAY   = 0x01,
  CMD_PALETTE         = 0x03,
  CMD_ALPHA           = 0x04,
  CMD_DISPLAY_AREA    = 0x05,
  CMD_RLE_OFFSETS     = 0x06,
  CMD_COLOR_UPDATE    = 0x07,
  CMD_END             = 0xFF,
  CMD_UNKNOWN         = -1,
};

ControlCommand ControlCommandFromByte(uint8_t cmd);

// Chained control sequences followed before giving up on a duration
#define MAX_CONTROL_SEQUENCES 32

// Delay units: the colour update path counts in 1024 ticks, a chained
// end sequence in 10 ticks
#define DELAY_SCALE_UPDATE  1024
#define DELAY_SCALE_CHAINED 10

struct ControlHeader
{
  int palette[4] = {0, 0, 0, 0};  // indices into the 16 entry .idx palette
  int alpha[4]   = {0, 0, 0, 0};  // 0 - 15
  int alpha_sum  = 0;

  Rect area;                      // display area, x/y relative to the frame
  bool has_area  = false;

  int even_ofs   = -1;            // relative to the RLE buffer start
  int odd_ofs    = -1;
  bool has_rle_offsets = false;

  int duration   = -1;            // -1 when the stream doesn't say
  bool forced    = false;
  bool color_update = false;
  int sequence_count = 0;
};

namespace ControlHeaderParser
{
  // ctrl_ofs_rel is the control offset stored in the unit header; the
  // pointers inside the header are relative to the unit start.
  // Only a buffer too short to hold the end sequence pointer throws.
  ControlHeader Parse(const std::vector<uint8_t> &ctrl_header, int ctrl_ofs_rel);
}
