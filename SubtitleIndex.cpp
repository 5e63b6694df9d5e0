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
#include <vector>
#include <fstream>
#include <sstream>
#include <stdio.h>
#include <stdlib.h>
#include <errno.h>

#include "SubtitleIndex.h"
#include "VobSubError.h"
#include "utils/RegExp.h"
#include "utils/misc.h"
#include "utils/log.h"

using namespace std;

string Color::ToString() const
{
  char buf[8];
  snprintf(buf, sizeof(buf), "%02X%02X%02X", red, green, blue);
  return string(buf);
}

namespace IdxParser {

static vector<string> split(const string &value, char sep)
{
  vector<string> parts;
  size_t start = 0;

  for(;;)
  {
    size_t n = value.find(sep, start);
    if(n == string::npos)
    {
      parts.push_back(value.substr(start));
      return parts;
    }

    parts.push_back(value.substr(start, n - start));
    start = n + 1;
  }
}

static void expect_parts(const vector<string> &parts, size_t count, const string &key, const string &value)
{
  if(parts.size() < count)
    throw ParseError("invalid " + key + " value: " + value);
}

bool ParseBool(const string &raw)
{
  string value = Trim(raw);
  if(value == "ON")
    return true;
  if(value == "OFF")
    return false;

  throw ParseError("unknown boolean value: " + value);
}

int ParseInt(const string &raw)
{
  string value = Trim(raw);
  if(value.empty())
    throw ParseError("unknown integer value: " + value);

  char *end;
  errno = 0;
  long n = strtol(value.c_str(), &end, 10);
  if(*end != '\0' || errno == ERANGE || n > INT32_MAX || n < INT32_MIN)
    throw ParseError("unknown integer value: " + value);

  return (int)n;
}

double ParsePercent(const string &raw)
{
  string value = Trim(raw);
  if(value.length() < 2 || value[value.length() - 1] != '%')
    throw ParseError("unknown float value: " + value);

  string number = Trim(value.substr(0, value.length() - 1));
  char *end;
  double d = strtod(number.c_str(), &end);
  if(number.empty() || *end != '\0')
    throw ParseError("unknown float value: " + value);

  return d / 100;
}

Color ParseColor(const string &raw)
{
  static const char *pattern = "^([0-9a-f]{2})([0-9a-f]{2})([0-9a-f]{2})";

  string value = Trim(raw);
  CRegExp color_match(pattern);
  if(color_match.RegFind(value) < 0)
    throw ParseError("unknown color value: " + value);

  return Color(color_match.GetMatchAsLong(1, 16),
      color_match.GetMatchAsLong(2, 16),
      color_match.GetMatchAsLong(3, 16));
}

static SubpictureItem parse_timestamp(CRegExp &timestamp_match, const string &value)
{
  if(timestamp_match.RegFind(value) < 0)
    throw ParseError("invalid idx item: " + value);

  SubpictureItem item;
  item.timestamp = timestamp_match.GetMatchAsLong(1) * 3600000LL
      + timestamp_match.GetMatchAsLong(2) * 60000LL
      + timestamp_match.GetMatchAsLong(3) * 1000LL
      + timestamp_match.GetMatchAsLong(4);
  item.file_pos = strtoll(timestamp_match.GetMatch(5).c_str(), nullptr, 16);

  return item;
}

SubtitleIndex Parse(const string &text)
{
  CRegExp timestamp_match("^(\\d{2}):(\\d{2}):(\\d{2}):(\\d{3}), filepos: ([0-9a-f]+)");
  CRegExp id_match("^([a-z]*)\\s*,\\s*index:\\s*(\\d+)");

  SubtitleIndex idx;
  istringstream in(text);
  string line;

  while(getline(in, line))
  {
    line = Trim(line);

    size_t colon = line.find(':');
    if(colon == string::npos)
      continue;

    string key = Trim(line.substr(0, colon));
    string value = Trim(line.substr(colon + 1));

    if(key == "size")
    {
      vector<string> parts = split(value, 'x');
      expect_parts(parts, 2, key, value);
      idx.width = ParseInt(parts[0]);
      idx.height = ParseInt(parts[1]);
    }
    else if(key == "org")
    {
      vector<string> parts = split(value, ',');
      expect_parts(parts, 2, key, value);
      idx.origin_x = ParseInt(parts[0]);
      idx.origin_y = ParseInt(parts[1]);
    }
    else if(key == "scale")
    {
      vector<string> parts = split(value, ',');
      expect_parts(parts, 2, key, value);
      idx.scale_x = ParsePercent(parts[0]);
      idx.scale_y = ParsePercent(parts[1]);
    }
    else if(key == "alpha")
    {
      idx.alpha = ParsePercent(value);
    }
    else if(key == "smooth")
    {
      idx.smooth = ParseBool(value);
    }
    else if(key == "fadein/out")
    {
      vector<string> parts = split(value, ',');
      expect_parts(parts, 2, key, value);
      idx.fade_in = ParseInt(parts[0]);
      idx.fade_out = ParseInt(parts[1]);
    }
    else if(key == "time offset")
    {
      idx.time_offset = ParseInt(value);
    }
    else if(key == "forced subs")
    {
      idx.forced_subs = ParseBool(value);
    }
    else if(key == "palette")
    {
      vector<string> parts = split(value, ',');
      idx.palette.clear();
      for(size_t i = 0; i < parts.size(); i++)
        idx.palette.push_back(ParseColor(parts[i]));

      if(!idx.HasValidPalette())
        CLogLog(LOGWARNING, "IdxParser: palette has %d entries, expected %d",
            (int)idx.palette.size(), VOBSUB_PALETTE_SIZE);
    }
    else if(key == "langidx")
    {
      idx.lang_idx = ParseInt(value);
    }
    else if(key == "id")
    {
      if(id_match.RegFind(value) > -1)
      {
        idx.language = id_match.GetMatch(1);
        idx.stream_index = id_match.GetMatchAsLong(2);
      }
      else
      {
        CLogLog(LOGWARNING, "IdxParser: ignoring malformed id line: %s", value.c_str());
      }
    }
    else if(key == "timestamp")
    {
      idx.items.push_back(parse_timestamp(timestamp_match, value));
    }
  }

  CLogLog(LOGDEBUG, "IdxParser: %dx%d, %d palette entries, %d items",
      idx.width, idx.height, (int)idx.palette.size(), (int)idx.items.size());

  return idx;
}

SubtitleIndex Load(const string &path)
{
  ifstream idx_file(path.c_str());
  if(!idx_file.is_open())
    throw IoError("Failed to open index file: " + path);

  stringstream buffer;
  buffer << idx_file.rdbuf();
  if(idx_file.bad())
    throw IoError("Failed to read index file: " + path);

  return Parse(buffer.str());
}

}
