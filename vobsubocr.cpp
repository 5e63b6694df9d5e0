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
#include <stdlib.h>
#include <stdint.h>
#include <getopt.h>
#include <string.h>

extern "C" {
#include <libavutil/log.h>
}

#include <string>
#include <vector>
#include <memory>

#include "utils/log.h"
#include "utils/misc.h"
#include "Config.h"
#include "SubtitleIndex.h"
#include "VobSubExtractor.h"
#include "TextRecognizer.h"
#include "AssWriter.h"
#include "VobSubError.h"

static void print_usage()
{
  puts(
    "Usage: vobsubocr [OPTIONS] FILE.idx|FILE.sub\n"
    "\n"
    "Decodes VobSub subpictures, runs OCR on them and writes an ASS file.\n"
    "\n"
    "    -o  --output-ass FILE       ASS file to write (required)\n"
    "    -O  --output-dir DIR        Also save every subpicture as a PNG in DIR\n"
    "        --invert                Swap palette slots 1 and 3\n"
    "    -j  --threads N             Decode with N worker threads\n"
    "        --ocr-command CMD       OCR program (default: tesseract)\n"
    "        --ocr-lang LANG         Language passed to the OCR program\n"
    "        --no-ocr                Don't run OCR, events get empty text\n"
    "    -c  --config FILE           Read option:value pairs from FILE\n"
    "        --log LEVEL             none, fatal, severe, error, warning, notice, info or debug\n"
    "    -g  --genlog [FILE]         Write the log to FILE (default ./vobsubocr.log)\n"
    "        --ffmpeg-log LEVEL      quiet, panic, fatal, error, warning, info, verbose, debug or trace\n"
    "    -h  --help                  Print this help\n");
}

static int ffmpeg_level_from_string(const char *arg)
{
  if(arg[0] >= '0' && arg[0] <= '9')
    return atoi(arg);
  else if(strcmp("quiet", arg) == 0)
    return AV_LOG_QUIET;
  else if(strcmp("panic", arg) == 0)
    return AV_LOG_PANIC;
  else if(strcmp("fatal", arg) == 0)
    return AV_LOG_FATAL;
  else if(strcmp("error", arg) == 0)
    return AV_LOG_ERROR;
  else if(strcmp("warning", arg) == 0)
    return AV_LOG_WARNING;
  else if(strcmp("info", arg) == 0)
    return AV_LOG_INFO;
  else if(strcmp("verbose", arg) == 0)
    return AV_LOG_VERBOSE;
  else if(strcmp("debug", arg) == 0)
    return AV_LOG_DEBUG;
  else if(strcmp("trace", arg) == 0)
    return AV_LOG_TRACE;

  return -1;
}

int main(int argc, char *argv[])
{
  const int invert_opt      = 0x101;
  const int ocr_command_opt = 0x102;
  const int ocr_lang_opt    = 0x103;
  const int no_ocr_opt      = 0x104;
  const int log_opt         = 0x105;
  const int ffmpeg_log_opt  = 0x106;

  struct option longopts[] = {
    { "output-ass",   required_argument,  NULL,          'o' },
    { "output-dir",   required_argument,  NULL,          'O' },
    { "invert",       no_argument,        NULL,          invert_opt },
    { "threads",      required_argument,  NULL,          'j' },
    { "ocr-command",  required_argument,  NULL,          ocr_command_opt },
    { "ocr-lang",     required_argument,  NULL,          ocr_lang_opt },
    { "no-ocr",       no_argument,        NULL,          no_ocr_opt },
    { "config",       required_argument,  NULL,          'c' },
    { "log",          required_argument,  NULL,          log_opt },
    { "genlog",       optional_argument,  NULL,          'g' },
    { "ffmpeg-log",   required_argument,  NULL,          ffmpeg_log_opt },
    { "help",         no_argument,        NULL,          'h' },
    { 0, 0, 0, 0 }
  };
  const char *shortopts = "o:O:j:c:g::h";

  Options opts;
  int c;

  av_log_set_level(AV_LOG_ERROR);

  // the config file is read first so the command line can override it
  while ((c = getopt_long(argc, argv, shortopts, longopts, NULL)) != -1)
  {
    if(c == 'c' && !Config::readConfigFile(optarg, opts))
      return EXIT_FAILURE;
    else if(c == '?')
      return EXIT_FAILURE;
  }

  optind = 0;
  while ((c = getopt_long(argc, argv, shortopts, longopts, NULL)) != -1)
  {
    switch (c)
    {
      case 'o':
        opts.output_ass = optarg;
        break;
      case 'O':
        opts.output_dir = optarg;
        break;
      case invert_opt:
        opts.invert = true;
        break;
      case 'j':
        opts.threads = atoi(optarg);
        if(opts.threads < 1)
        {
          printf("Bad argument for -%c: thread count must be at least 1\n", c);
          return EXIT_FAILURE;
        }
        break;
      case ocr_command_opt:
        opts.ocr_command = optarg;
        break;
      case ocr_lang_opt:
        opts.ocr_lang = optarg;
        break;
      case no_ocr_opt:
        opts.ocr = false;
        break;
      case 'c':
        break;
      case log_opt:
        opts.log_level = CLogLevelFromString(optarg);
        if(opts.log_level < 0)
        {
          printf("Bad argument for --log: %s\n", optarg);
          return EXIT_FAILURE;
        }
        break;
      case 'g':
        opts.log_file = optarg ? optarg : "./vobsubocr.log";
        if(opts.log_level == LOGNONE)
          opts.log_level = LOGDEBUG;
        break;
      case ffmpeg_log_opt:
        {
          int level = ffmpeg_level_from_string(optarg);
          if(level < 0)
          {
            printf("Bad argument for --ffmpeg-log: %s\n", optarg);
            return EXIT_FAILURE;
          }
          av_log_set_level(level);
        }
        break;
      case 'h':
        print_usage();
        return EXIT_SUCCESS;
      default:
        return EXIT_FAILURE;
    }
  }

  if (optind >= argc)
  {
    print_usage();
    return EXIT_FAILURE;
  }
  opts.source = argv[optind];

  if(opts.output_ass.empty())
  {
    puts("An output file must be given with -o");
    return EXIT_FAILURE;
  }

  if(opts.log_level != LOGNONE)
    CLogInit(opts.log_level, opts.log_file.empty() ? NULL : opts.log_file.c_str());

  std::string idx_path, sub_path;
  std::string ext = GetExtension(opts.source);
  if(ext == ".idx")
  {
    idx_path = opts.source;
    sub_path = ReplaceExtension(opts.source, ".sub");
  }
  else if(ext == ".sub")
  {
    sub_path = opts.source;
    idx_path = ReplaceExtension(opts.source, ".idx");
  }
  else
  {
    printf("Source must be a .idx or .sub file: %s\n", opts.source.c_str());
    return EXIT_FAILURE;
  }

  const std::string *paths[] = { &idx_path, &sub_path };
  for(int i = 0; i < 2; i++)
  {
    if(!Exists(*paths[i]))
    {
      printf("File \"%s\" not found.\n", paths[i]->c_str());
      return EXIT_FAILURE;
    }
  }

  if(!opts.output_dir.empty() && !MakeDirectories(opts.output_dir))
  {
    printf("Failed to create directory \"%s\"\n", opts.output_dir.c_str());
    return EXIT_FAILURE;
  }

  try
  {
    SubtitleIndex idx = IdxParser::Load(idx_path);
    if(!idx.HasValidPalette())
    {
      printf("%s: palette has %d entries, expected %d\n", idx_path.c_str(),
          (int)idx.palette.size(), VOBSUB_PALETTE_SIZE);
      return EXIT_FAILURE;
    }

    std::unique_ptr<TextRecognizer> recognizer;
    if(opts.ocr)
      recognizer.reset(new CommandTextRecognizer(opts.ocr_command, opts.ocr_lang));

    ExtractorConfig config;
    config.sub_path = sub_path;
    config.image_dir = opts.output_dir;
    config.image_stem = GetStem(sub_path);
    config.invert = opts.invert;
    config.threads = opts.threads;
    config.recognizer = recognizer.get();

    std::vector<Subtitle> events;
    VobSubExtractor extractor(idx, config);
    int failed = extractor.Run(events);

    AssWriter::WriteFile(opts.output_ass, events, idx.width, idx.height);

    printf("Wrote %d events to %s", (int)events.size(), opts.output_ass.c_str());
    if(failed > 0)
      printf(" (%d subpictures failed)", failed);
    puts("");
  }
  catch(const VobSubError &e)
  {
    fprintf(stderr, "%s\n", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
