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
#include <memory>

#include "VobSubExtractor.h"
#include "SubtitleIndex.h"
#include "SubStream.h"
#include "SubpictureDecoder.h"
#include "TextRecognizer.h"
#include "ImageWriter.h"
#include "WorkerThread.h"
#include "VobSubError.h"
#include "utils/log.h"

using namespace std;

// Decodes every step'th item starting at first, on its own stream handle
class VobSubExtractor::DecodeWorker : public WorkerThread
{
public:
  DecodeWorker(const VobSubExtractor &extractor, vector<ItemResult> &results, size_t first, size_t step)
  : m_extractor(extractor), m_results(results), m_first(first), m_step(step) {}

  ~DecodeWorker() override
  {
    if(Running())
      Join();
  }

protected:
  void Process() override
  {
    try
    {
      SubStreamFile stream(m_extractor.m_config.sub_path);
      for(size_t i = m_first; i < m_results.size(); i += m_step)
        m_results[i] = m_extractor.ProcessItem(stream, i);
    }
    catch(const VobSubError &e)
    {
      CLogLog(LOGERROR, "DecodeWorker: %s", e.what());
      for(size_t i = m_first; i < m_results.size(); i += m_step)
      {
        if(!m_results[i].ok && m_results[i].error.empty())
          m_results[i].error = e.what();
      }
    }
  }

private:
  const VobSubExtractor &m_extractor;
  vector<ItemResult> &m_results;
  size_t m_first;
  size_t m_step;
};

static string format_timestamp(int64_t ms)
{
  char buf[32];
  snprintf(buf, sizeof(buf), "%d:%02d:%02d.%03d",
      (int)(ms / 3600000), (int)(ms / 60000 % 60), (int)(ms / 1000 % 60), (int)(ms % 1000));
  return string(buf);
}

VobSubExtractor::VobSubExtractor(const SubtitleIndex &idx, const ExtractorConfig &config)
: m_idx(idx),
  m_config(config)
{
  if(m_config.threads < 1)
    m_config.threads = 1;
}

VobSubExtractor::ItemResult VobSubExtractor::ProcessItem(SubStream &stream, size_t index) const
{
  const SubpictureItem &item = m_idx.items[index];
  ItemResult result;

  DecodedImage image;
  try
  {
    image = SubpictureDecoder::DecodeAt(m_idx, stream, item.file_pos, m_config.invert);
  }
  catch(const VobSubError &e)
  {
    CLogLog(LOGERROR, "Subpicture %d at %s: %s", (int)index + 1, format_timestamp(item.timestamp).c_str(), e.what());
    result.error = e.what();
    return result;
  }

  if(image.duration < 0)
    CLogLog(LOGWARNING, "Subpicture %d has no duration", (int)index + 1);

  if(!m_config.image_dir.empty())
  {
    string path = ImageWriter::ImagePath(m_config.image_dir, m_config.image_stem, index);
    try
    {
      ImageWriter::WritePng(image, path);
    }
    catch(const VobSubError &e)
    {
      CLogLog(LOGERROR, "%s", e.what());
    }
  }

  string text;
  if(m_config.recognizer)
  {
    try
    {
      text = m_config.recognizer->Recognize(image);
    }
    catch(const VobSubError &e)
    {
      CLogLog(LOGERROR, "Subpicture %d: %s", (int)index + 1, e.what());
    }
  }

  result.event = Subtitle::FromRecognizedText(item.timestamp, image.duration, text);
  result.ok = true;
  return result;
}

void VobSubExtractor::Report(size_t index, const ItemResult &result) const
{
  if(!m_config.print_progress)
    return;

  printf("%s\n", format_timestamp(m_idx.items[index].timestamp).c_str());
  if(result.ok)
    printf("%s\n\n", result.event.text.c_str());
  else
    printf("Failed: %s\n\n", result.error.c_str());

  fflush(stdout);
}

void VobSubExtractor::RunSerial(vector<ItemResult> &results)
{
  SubStreamFile stream(m_config.sub_path);

  for(size_t i = 0; i < results.size(); i++)
  {
    results[i] = ProcessItem(stream, i);
    Report(i, results[i]);
  }
}

void VobSubExtractor::RunParallel(vector<ItemResult> &results, int threads)
{
  // fail early and in one place if the file is unreadable
  {
    SubStreamFile readable(m_config.sub_path);
  }

  vector<unique_ptr<DecodeWorker> > workers;
  for(int t = 0; t < threads; t++)
  {
    workers.push_back(unique_ptr<DecodeWorker>(new DecodeWorker(*this, results, t, threads)));
    if(!workers.back()->Create())
      throw VobSubError("Failed to start decode worker");
  }

  for(size_t t = 0; t < workers.size(); t++)
    workers[t]->Join();

  for(size_t i = 0; i < results.size(); i++)
    Report(i, results[i]);
}

int VobSubExtractor::Run(vector<Subtitle> &events)
{
  vector<ItemResult> results(m_idx.items.size());

  int threads = m_config.threads;
  if((size_t)threads > results.size())
    threads = results.size();

  if(threads > 1)
    RunParallel(results, threads);
  else
    RunSerial(results);

  int failed = 0;
  for(size_t i = 0; i < results.size(); i++)
  {
    if(results[i].ok)
      events.push_back(results[i].event);
    else
      failed++;
  }

  if(failed > 0)
    CLogLog(LOGWARNING, "%d of %d subpictures failed to decode", failed, (int)results.size());

  return failed;
}
