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

#include <string>
#include <vector>

#include "Subtitle.h"

struct SubtitleIndex;
class SubStream;
class TextRecognizer;

struct ExtractorConfig
{
  std::string sub_path;
  std::string image_dir;            // no images are written when empty
  std::string image_stem;
  bool invert           = false;
  int threads           = 1;
  TextRecognizer *recognizer = nullptr; // events get empty text when nullptr
  bool print_progress   = true;
};

// Decodes every subpicture of an .idx/.sub pair into subtitle events.
// A subpicture that fails to decode is logged and left out.
class VobSubExtractor
{
public:
  VobSubExtractor(const SubtitleIndex &idx, const ExtractorConfig &config);

  // Returns the number of items that failed. Throws IoError only if the
  // .sub can't be opened at all.
  int Run(std::vector<Subtitle> &events);

private:
  struct ItemResult
  {
    bool ok = false;
    Subtitle event;
    std::string error;
  };

  class DecodeWorker;

  ItemResult ProcessItem(SubStream &stream, size_t index) const;
  void Report(size_t index, const ItemResult &result) const;
  void RunSerial(std::vector<ItemResult> &results);
  void RunParallel(std::vector<ItemResult> &results, int threads);

  const SubtitleIndex &m_idx;
  ExtractorConfig m_config;
};
