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

#include <stdio.h>
#include <string>
#include <vector>

extern "C" {
#include <libavformat/avio.h>
}

#include "SubpictureDecoder.h"
#include "SubtitleIndex.h"
#include "SubStream.h"
#include "PacketReader.h"
#include "FragmentAssembler.h"
#include "ControlHeader.h"
#include "RleDecoder.h"
#include "Compositor.h"
#include "VobSubError.h"
#include "utils/log.h"

using namespace std;

namespace SubpictureDecoder {

vector<uint8_t> DecodePixels(const vector<uint8_t> &rle, int rle_size,
                             int even_ofs, int odd_ofs, int width, int height)
{
  int size_even, size_odd;
  if(odd_ofs > even_ofs)
  {
    size_even = odd_ofs - even_ofs;
    size_odd = rle_size - odd_ofs;
  }
  else
  {
    size_odd = even_ofs - odd_ofs;
    size_even = rle_size - even_ofs;
  }

  if(size_even <= 0 || size_odd <= 0 || even_ofs < 0 || odd_ofs < 0)
    throw ParseError("Corrupt buffer offset information");

  vector<uint8_t> pixels((size_t)width * height, 0);

  // even lines
  RleDecoder::DecodeField(rle, even_ofs, size_even, pixels, 0, width,
      width * (height / 2 + (height & 1)));

  // odd lines
  RleDecoder::DecodeField(rle, odd_ofs, size_odd, pixels, width, width,
      (height / 2) * width);

  return pixels;
}

DecodedImage Decode(const SubtitleIndex &idx, SubStream &stream, bool invert)
{
  if(!idx.HasValidPalette())
    throw ParseError("Index palette must have 16 entries");

  PacketReader reader(stream);
  SubpictureFragments fragments = FragmentAssembler::Assemble(reader);
  ControlHeader header = ControlHeaderParser::Parse(fragments.ctrl_header, fragments.ctrl_ofs_rel);

  if(!header.has_area || header.area.IsEmpty())
    throw ParseError("Missing or empty display area");

  if(!header.has_rle_offsets)
    throw ParseError("Corrupt buffer offset information");

  if(idx.width > 0 && idx.height > 0 && header.area.Exceeds(Dimension(idx.width, idx.height)))
    CLogLog(LOGWARNING, "Subpicture too large: %dx%d > %dx%d",
        header.area.width, header.area.height, idx.width, idx.height);

  vector<uint8_t> rle = FragmentAssembler::ReadRleBuffer(reader, fragments);
  vector<uint8_t> pixels = DecodePixels(rle, fragments.rle_size, header.even_ofs, header.odd_ofs,
      header.area.width, header.area.height);

  Compositor::Rgba color_map[4];
  Compositor::BuildColorMap(header, idx.palette, invert, color_map);

  DecodedImage image;
  image.width = header.area.width;
  image.height = header.area.height;
  image.area = header.area;
  image.duration = header.duration;
  image.forced = header.forced;
  Compositor::Compose(pixels, color_map, image.rgba);

  return image;
}

DecodedImage DecodeAt(const SubtitleIndex &idx, SubStream &stream, int64_t file_pos, bool invert)
{
  if(file_pos < 0 || file_pos >= stream.Size())
  {
    char buf[80];
    snprintf(buf, sizeof(buf), "File position %08llx beyond end of stream", (long long)file_pos);
    throw IoError(buf);
  }

  if(avio_seek(stream.Context(), file_pos, SEEK_SET) < 0)
    throw IoError("avio_seek failed");

  return Decode(idx, stream, invert);
}

}
