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

class PacketReader;

#define PACK_START_CODE        0x000001BA
#define PRIVATE_STREAM_1_CODE  0x000001BD
#define PACK_HEADER_SIZE       13
#define DVD_SECTOR_SIZE        0x800

// One contiguous range of the .sub holding RLE data, relative to the
// reader's base offset
struct RleFragment
{
  int64_t offset;
  int     length;
};

// Control header and RLE ranges of one subpicture unit, gathered from
// as many PES packets as it spans
struct SubpictureFragments
{
  std::vector<uint8_t> ctrl_header;  // always exactly ctrl_size bytes
  int ctrl_ofs_rel = 0;              // control offset as stored in the unit header
  int ctrl_size    = -1;
  int rle_size     = 0;              // declared
  int rle_found    = 0;              // accumulated over all fragments
  int packet_count = 0;
  std::vector<RleFragment> rle_fragments;
};

namespace FragmentAssembler
{
  // Reader must be positioned at the pack header of the first packet.
  // Misaligned packets and short control headers are logged and repaired;
  // missing start codes throw ParseError.
  SubpictureFragments Assemble(PacketReader &reader);

  // Concatenates the RLE fragments in stream order
  std::vector<uint8_t> ReadRleBuffer(PacketReader &reader, const SubpictureFragments &fragments);
}
