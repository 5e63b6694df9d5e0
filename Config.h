#pragma once
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

#include "utils/log.h"

struct Options
{
  std::string source;
  std::string output_ass;
  std::string output_dir;
  std::string ocr_command = "tesseract";
  std::string ocr_lang;
  bool ocr         = true;
  bool invert      = false;
  int threads      = 1;
  int log_level    = LOGNONE;
  std::string log_file;
};

enum ConfigOption
{
  INVALID_OPTION = -1,
  OPTION_INVERT,
  OPTION_LOG,
  OPTION_OCR_COMMAND,
  OPTION_OCR_LANG,
  OPTION_OUTPUT_DIR,
  OPTION_THREADS,
};

namespace Config
{
  ConfigOption convertStringToOption(const std::string &name);

  // Applies one option:value pair. Returns false for an unknown option or
  // a value that doesn't parse.
  bool applyOption(ConfigOption option, const std::string &value, Options &opts);

  // Lines of the form 'option:value', '#' starts a comment. Returns false
  // if the file can't be opened; bad lines are reported and skipped.
  bool readConfigFile(const char *filepath, Options &opts);
}
