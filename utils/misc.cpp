/*
 *
 *      Copyright (C) 2020 Michael J. Walsh
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
#include <stdio.h>
#include <errno.h>
#include <sys/stat.h>

#include "misc.h"

using namespace std;

// Check file exists and is readable
bool Exists(const string& path)
{
  FILE *file = fopen(path.c_str(), "r");
  if(file)
  {
    fclose(file);
    return true;
  }
  return false;
}

bool IsDirectory(const string& path)
{
  struct stat fileStat;
  return stat(path.c_str(), &fileStat) == 0 && S_ISDIR(fileStat.st_mode);
}

// mkdir -p
bool MakeDirectories(const string& path)
{
  if(path.empty() || IsDirectory(path))
    return true;

  size_t slash = path.find_last_of('/', path.length() - 2);
  if(slash != string::npos && slash > 0 && !MakeDirectories(path.substr(0, slash)))
    return false;

  if(mkdir(path.c_str(), 0777) != 0 && errno != EEXIST)
    return false;

  return IsDirectory(path);
}

static size_t extension_pos(const string &path)
{
  size_t dot = path.rfind('.');
  size_t slash = path.rfind('/');
  if(dot == string::npos || (slash != string::npos && dot < slash))
    return string::npos;

  return dot;
}

string GetExtension(const string &path)
{
  size_t dot = extension_pos(path);
  return dot == string::npos ? string() : path.substr(dot);
}

string ReplaceExtension(const string &path, const char *ext)
{
  size_t dot = extension_pos(path);
  return (dot == string::npos ? path : path.substr(0, dot)) + ext;
}

string GetStem(const string &path)
{
  size_t slash = path.rfind('/');
  string name = slash == string::npos ? path : path.substr(slash + 1);

  size_t dot = name.rfind('.');
  return dot == string::npos || dot == 0 ? name : name.substr(0, dot);
}

static bool is_space(char c)
{
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

string TrimRight(const string &in)
{
  size_t end = in.length();
  while(end > 0 && is_space(in[end - 1])) end--;

  return in.substr(0, end);
}

string Trim(const string &in)
{
  size_t start = 0;
  while(start < in.length() && is_space(in[start])) start++;

  return TrimRight(in.substr(start));
}

string EscapeLineBreaks(const string &in)
{
  string out;
  out.reserve(in.length());

  for(size_t i = 0; i < in.length(); i++)
  {
    if(in[i] == '\n')
      out += "\\N";
    else
      out += in[i];
  }
  return out;
}
