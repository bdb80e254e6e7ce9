/* Copyright © 2026 pdf2extract authors
 *
 * This file is part of pdf2extract.
 *
 * pdf2extract is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * pdf2extract is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 */

#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>

#include "config.hh"

class Arguments
{
protected:
  std::vector<std::string> strings;
  std::vector<char *> pointers;
public:
  explicit Arguments(const std::vector<std::string> &args)
  : strings(args)
  {
    this->strings.insert(this->strings.begin(), "pdf2extract");
    for (std::string &s : this->strings)
      this->pointers.push_back(&s[0]);
    this->pointers.push_back(nullptr);
  }
  int argc() const
  {
    return static_cast<int>(this->strings.size());
  }
  char * const *argv()
  {
    return this->pointers.data();
  }
};

static Config parse(const std::vector<std::string> &args)
{
  Arguments arguments(args);
  Config config;
  config.read_config(arguments.argc(), arguments.argv());
  return config;
}

static bool fails(const std::vector<std::string> &args)
{
  try
  {
    parse(args);
  }
  catch (const Config::Error &)
  {
    return true;
  }
  return false;
}

static void test_defaults()
{
  Config config = parse({"--pdf_path=book.pdf", "--output_dir=out"});
  assert(config.pdf_path == "book.pdf");
  assert(config.output_dir == "out");
  assert(config.start_page == 1);
  assert(config.end_page == 0);
  assert(!config.spread_mode);
  assert(config.verbose == 1);
  assert(Config::zoom == 2);
}

static void test_all_options()
{
  Config config = parse({
    "--pdf_path", "a/b.pdf", "--output_dir", "c",
    "--start_page", "3", "--end_page=9", "--spread_mode", "--quiet"
  });
  assert(config.pdf_path == "a/b.pdf");
  assert(config.output_dir == "c");
  assert(config.start_page == 3);
  assert(config.end_page == 9);
  assert(config.spread_mode);
  assert(config.verbose == 0);
}

static void test_aliases()
{
  Config config = parse({
    "--pdf-path=x.pdf", "-o", "dir", "-f", "2", "-l", "4", "--spread-mode", "-v", "-v"
  });
  assert(config.pdf_path == "x.pdf");
  assert(config.output_dir == "dir");
  assert(config.start_page == 2);
  assert(config.end_page == 4);
  assert(config.spread_mode);
  assert(config.verbose == 3);
  config = parse({"--pdf_path=x.pdf", "--output-dir=d", "--start-page=5", "--end-page=6"});
  assert(config.output_dir == "d");
  assert(config.start_page == 5);
  assert(config.end_page == 6);
}

static void test_errors()
{
  assert(fails({"--output_dir=out"}));
  assert(fails({"--pdf_path=book.pdf"}));
  assert(fails({"--pdf_path=book.pdf", "--output_dir=out", "stray"}));
  assert(fails({"--pdf_path=book.pdf", "--output_dir=out", "--start_page=3x"}));
  assert(fails({"--pdf_path=book.pdf", "--output_dir=out", "--end_page="}));
  assert(fails({"--pdf_path=book.pdf", "--output_dir=out", "--no-such-option"}));
  try
  {
    parse({"--pdf_path=book.pdf", "--output_dir=out", "--start_page=one"});
    assert(false);
  }
  catch (const Config::Error &ex)
  {
    assert(std::string(ex.what()).find("one") != std::string::npos);
    assert(!ex.is_quiet());
  }
}

static void test_help_and_version()
{
  try
  {
    parse({"--help"});
    assert(false);
  }
  catch (const Config::NeedHelp &ex)
  {
    assert(ex.is_quiet());
  }
  try
  {
    parse({"--version"});
    assert(false);
  }
  catch (const Config::NeedVersion &)
  { }
}

int main()
{
  test_defaults();
  test_all_options();
  test_aliases();
  test_errors();
  test_help_and_version();
  return 0;
}

// vim:ts=2 sts=2 sw=2 et
