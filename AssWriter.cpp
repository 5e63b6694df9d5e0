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
#include <fstream>
#include <string>
#include <vector>

#include "AssWriter.h"
#include "Subtitle.h"
#include "VobSubError.h"

using namespace std;

namespace AssWriter {

string FormatTime(int64_t ms)
{
  if(ms < 0)
    ms = 0;

  int64_t cs = (ms + 5) / 10;
  char buf[32];
  snprintf(buf, sizeof(buf), "%lld:%02d:%02d.%02d",
      (long long)(cs / 360000),
      (int)(cs / 6000 % 60),
      (int)(cs / 100 % 60),
      (int)(cs % 100));

  return string(buf);
}

void Write(ostream &out, const vector<Subtitle> &events, int play_res_x, int play_res_y)
{
  out << "[Script Info]\n"
      << "ScriptType: v4.00+\n"
      << "WrapStyle: 0\n"
      << "ScaledBorderAndShadow: yes\n";

  if(play_res_x > 0 && play_res_y > 0)
    out << "PlayResX: " << play_res_x << "\n"
        << "PlayResY: " << play_res_y << "\n";

  out << "\n[V4+ Styles]\n"
      << "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, BackColour, "
         "Bold, Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, BorderStyle, Outline, "
         "Shadow, Alignment, MarginL, MarginR, MarginV, Encoding\n"
      << "Style: Default,Arial,20,&H00FFFFFF,&H000000FF,&H00000000,&H00000000,"
         "0,0,0,0,100,100,0,0,1,2,2,2,10,10,10,1\n";

  out << "\n[Events]\n"
      << "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\n";

  for(size_t i = 0; i < events.size(); i++)
  {
    out << "Dialogue: 0,"
        << FormatTime(events[i].start) << ","
        << FormatTime(events[i].stop) << ",Default,,0,0,0,,"
        << events[i].text << "\n";
  }
}

void WriteFile(const string &path, const vector<Subtitle> &events, int play_res_x, int play_res_y)
{
  ofstream out(path.c_str());
  if(!out.is_open())
    throw IoError("Failed to open " + path + " for writing");

  Write(out, events, play_res_x, play_res_y);

  out.flush();
  if(!out.good())
    throw IoError("Failed to write " + path);
}

}
