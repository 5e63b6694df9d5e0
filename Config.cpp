/*
 * Copyright (C) 2022 by Michael J. Walsh
 * Copyright (C) 2013 by Mitch Draves
 *
 * This file is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This file is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include <string>
#include <fstream>
#include <iostream>
#include <stdlib.h>
#include <string.h>

#include "Config.h"
#include "utils/misc.h"

using namespace std;

namespace Config {

struct option_lookup
{
  const char* k;
  enum ConfigOption v;
};

const struct option_lookup table[] = {
// NB this list is CASE SENSITIVELY sorted
  {"invert", OPTION_INVERT},
  {"log", OPTION_LOG},
  {"ocr_command", OPTION_OCR_COMMAND},
  {"ocr_lang", OPTION_OCR_LANG},
  {"output_dir", OPTION_OUTPUT_DIR},
  {"threads", OPTION_THREADS},
};

const int item_size = sizeof(const option_lookup);
const int item_count = sizeof(table) / sizeof(const option_lookup);

static int compare(const void *a, const void *b)
{
  const char *ia = (const char *)a;
  const struct option_lookup *ib = (const struct option_lookup *)b;

  return strcmp(ia, ib->k);
}

ConfigOption convertStringToOption(const string &name)
{
  struct option_lookup *result = (struct option_lookup *)
    bsearch(name.c_str(), table, item_count, item_size, compare);

  return result == nullptr ? INVALID_OPTION : result->v;
}

static bool parseFlag(const string &value, bool &out)
{
  if(value == "1" || value == "yes" || value == "on" || value == "true")
    out = true;
  else if(value == "0" || value == "no" || value == "off" || value == "false")
    out = false;
  else
    return false;

  return true;
}

bool applyOption(ConfigOption option, const string &value, Options &opts)
{
  switch(option)
  {
  case OPTION_INVERT:
    return parseFlag(value, opts.invert);
  case OPTION_LOG:
    {
      int level = CLogLevelFromString(value.c_str());
      if(level < 0)
        return false;
      opts.log_level = level;
    }
    return true;
  case OPTION_OCR_COMMAND:
    if(value.empty())
      return false;
    opts.ocr_command = value;
    return true;
  case OPTION_OCR_LANG:
    opts.ocr_lang = value;
    return true;
  case OPTION_OUTPUT_DIR:
    opts.output_dir = value;
    return true;
  case OPTION_THREADS:
    {
      int n = atoi(value.c_str());
      if(n < 1)
        return false;
      opts.threads = n;
    }
    return true;
  case INVALID_OPTION:
    break;
  }
  return false;
}

/* Parses a line from the config file in the form 'option:value'.
Returns false for comments and lines without a colon. */
static bool getOptionAndValueFromString(const string &line, string &name, string &value)
{
  if(line.empty() || line[0] == '#')
    return false;

  size_t colonIndex = line.find(":");
  if(colonIndex == string::npos)
    return false;

  name = Trim(line.substr(0, colonIndex));
  value = Trim(line.substr(colonIndex+1));
  return true;
}

bool readConfigFile(const char *filepath, Options &opts)
{
  ifstream config_file(filepath);

  if(!config_file.is_open())
  {
    cerr << "Failed to open config file: " << filepath << endl;
    return false;
  }

  string line;
  string name, value;
  int line_no = 0;

  while(getline(config_file, line))
  {
    line_no++;
    if(!getOptionAndValueFromString(Trim(line), name, value))
      continue;

    ConfigOption option = convertStringToOption(name);
    if(option == INVALID_OPTION)
    {
      cerr << filepath << ":" << line_no << ": unknown option '" << name << "'" << endl;
      continue;
    }

    if(!applyOption(option, value, opts))
      cerr << filepath << ":" << line_no << ": bad value for " << name << ": " << value << endl;
  }

  return true;
}

}
