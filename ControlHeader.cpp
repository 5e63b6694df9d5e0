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

extern "C" {
#include <libavutil/intreadwrite.h>
}

#include "ControlHeader.h"
#include "VobSubError.h"
#include "utils/log.h"

using namespace std;

ControlCommand ControlCommandFromByte(uint8_t cmd)
{
  switch(cmd)
  {
  case CMD_FORCE_DISPLAY:
  case CMD_START_DISPLAY:
  case CMD_PALETTE:
  case CMD_ALPHA:
  case CMD_DISPLAY_AREA:
  case CMD_RLE_OFFSETS:
  case CMD_COLOR_UPDATE:
  case CMD_END:
    return (ControlCommand)cmd;
  default:
    return CMD_UNKNOWN;
  }
}

namespace ControlHeaderParser {

class HeaderBuffer
{
public:
  explicit HeaderBuffer(const vector<uint8_t> &buf) : m_buf(buf) {}

  int Size() const { return m_buf.size(); }
  bool Has(int index, int count) const { return index >= 0 && index + count <= Size(); }
  int U8(int index) const { return m_buf[index]; }
  int U16(int index) const { return AV_RB16(&m_buf[index]); }

private:
  const vector<uint8_t> &m_buf;
};

// two bytes holding four nibbles, slot 3 first
static void read_nibbles(const HeaderBuffer &buf, int index, int out[4])
{
  int tmp = buf.U8(index);
  out[3] = tmp >> 4;
  out[2] = tmp & 0x0F;
  tmp = buf.U8(index + 1);
  out[1] = tmp >> 4;
  out[0] = tmp & 0x0F;
}

static int nibble_sum(const int v[4])
{
  return v[0] + v[1] + v[2] + v[3];
}

static int end_sequence_offset(const HeaderBuffer &buf, int index, int ctrl_ofs_rel, int n)
{
  int ofs = buf.U16(index) - ctrl_ofs_rel - 2;
  if(ofs < 0 || ofs > buf.Size())
  {
    CLogLog(LOGWARNING, "Invalid end sequence offset -> no end time (%d)", n);
    ofs = buf.Size();
  }
  return ofs;
}

static bool truncated(const HeaderBuffer &buf, int index, int count, int cmd)
{
  if(buf.Has(index, count))
    return false;

  CLogLog(LOGWARNING, "Control command 0x%02x truncated at index %d", cmd, index);
  return true;
}

ControlHeader Parse(const vector<uint8_t> &ctrl_header, int ctrl_ofs_rel)
{
  HeaderBuffer buf(ctrl_header);
  ControlHeader h;

  if(!buf.Has(0, 2))
    throw ParseError("Control header too short");

  int ctrl_size = buf.Size();
  int end_seq_ofs = end_sequence_offset(buf, 0, ctrl_ofs_rel, 1);
  int index = 2;
  bool done = false;

  while(index < end_seq_ofs && !done)
  {
    int cmd = buf.U8(index);
    index++;

    switch(ControlCommandFromByte(cmd))
    {
    case CMD_FORCE_DISPLAY:
      h.forced = true;
      break;

    case CMD_START_DISPLAY:
      break;

    case CMD_PALETTE:
      if(truncated(buf, index, 2, cmd)) { done = true; break; }
      read_nibbles(buf, index, h.palette);
      index += 2;
      CLogLog(LOGDEBUG, "Palette: %d %d %d %d", h.palette[0], h.palette[1], h.palette[2], h.palette[3]);
      break;

    case CMD_ALPHA:
      if(truncated(buf, index, 2, cmd)) { done = true; break; }
      read_nibbles(buf, index, h.alpha);
      h.alpha_sum += nibble_sum(h.alpha);
      index += 2;
      CLogLog(LOGDEBUG, "Alpha: %d %d %d %d", h.alpha[0], h.alpha[1], h.alpha[2], h.alpha[3]);
      break;

    case CMD_DISPLAY_AREA:
      {
        if(truncated(buf, index, 6, cmd)) { done = true; break; }
        int a = buf.U8(index), b = buf.U8(index + 1), c = buf.U8(index + 2);
        int d = buf.U8(index + 3), e = buf.U8(index + 4), f = buf.U8(index + 5);
        h.area.x = (a << 4) | (b >> 4);
        h.area.width = (((b & 0xF) << 8) | c) - h.area.x + 1;
        h.area.y = (d << 4) | (e >> 4);
        h.area.height = (((e & 0xF) << 8) | f) - h.area.y + 1;
        h.has_area = true;
        index += 6;
        CLogLog(LOGDEBUG, "Area info: %d,%d %dx%d", h.area.x, h.area.y, h.area.width, h.area.height);
      }
      break;

    case CMD_RLE_OFFSETS:
      if(truncated(buf, index, 4, cmd)) { done = true; break; }
      // stored offsets count the 4 byte unit header
      h.even_ofs = buf.U16(index) - 4;
      h.odd_ofs = buf.U16(index + 2) - 4;
      h.has_rle_offsets = true;
      index += 4;
      CLogLog(LOGDEBUG, "RLE ofs: %08x, %08x", h.even_ofs, h.odd_ofs);
      break;

    case CMD_COLOR_UPDATE:
      {
        h.color_update = true;
        if(truncated(buf, index, 12, cmd)) { done = true; break; }

        int alpha_update[4];
        read_nibbles(buf, index + 10, alpha_update);
        int alpha_update_sum = nibble_sum(alpha_update);

        // only use more opaque colors, the frame keeps its own alpha
        if(alpha_update_sum > h.alpha_sum)
        {
          h.alpha_sum = alpha_update_sum;
          read_nibbles(buf, index + 8, h.palette);
        }

        // jump to the end sequence for the delay
        index = end_seq_ofs;
        if(truncated(buf, index, 4, cmd)) { done = true; break; }
        h.duration = buf.U16(index) * DELAY_SCALE_UPDATE;
        end_seq_ofs = end_sequence_offset(buf, index + 2, ctrl_ofs_rel, 2);
        index += 4;
      }
      break;

    case CMD_END:
      done = true;
      break;

    case CMD_UNKNOWN:
      CLogLog(LOGWARNING, "Unknown control sequence %d skipped", cmd);
      break;
    }
  }

  if(end_seq_ofs != ctrl_size)
  {
    h.sequence_count = 1;
    int prev = -1;
    int next = end_seq_ofs;

    while(next != prev)
    {
      if(h.sequence_count > MAX_CONTROL_SEQUENCES)
      {
        CLogLog(LOGWARNING, "Control sequence chain too long, stopped after %d", MAX_CONTROL_SEQUENCES);
        break;
      }

      if(!buf.Has(next, 4))
      {
        CLogLog(LOGWARNING, "Control sequence at index %d truncated", next);
        break;
      }

      prev = next;
      h.duration = buf.U16(prev) * DELAY_SCALE_CHAINED;
      next = buf.U16(prev + 2) - ctrl_ofs_rel - 2;
      h.sequence_count++;
    }

    if(h.sequence_count > 2)
      CLogLog(LOGWARNING, "Control sequence(s) ignored - result may be erratic");
  }
  else
  {
    CLogLog(LOGWARNING, "Duration information not found");
  }

  if(h.color_update)
    CLogLog(LOGWARNING, "Palette update/alpha fading detected - result may be erratic");

  if(h.alpha_sum == 0)
    CLogLog(LOGWARNING, "Invisible caption due to zero alpha");

  return h;
}

}
