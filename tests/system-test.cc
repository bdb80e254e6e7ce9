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
#include <stdexcept>
#include <string>

#include "system.hh"

static const char full_device[] = "/dev/full";

static void test_write_read()
{
  TemporaryDirectory tmpdir;
  std::string path = tmpdir / "data.bin";
  std::string data("\x89PNG\r\n\x1a\n\0tail", 13);
  write_file(path, data);
  assert(read_file(path) == data);
  write_file(path, "");
  assert(read_file(path).empty());
}

static void test_short_write_to_full_device()
{
  if (!path_exists(full_device))
    return;
  bool thrown = false;
  try
  {
    write_file(full_device, std::string(100, 'x'));
  }
  catch (const POSIXError &)
  {
    thrown = true;
  }
  assert(thrown);
}

static void test_long_write_to_full_device()
{
  if (!path_exists(full_device))
    return;
  bool thrown = false;
  try
  {
    write_file(full_device, std::string(1 << 20, 'x'));
  }
  catch (const std::runtime_error &)
  {
    thrown = true;
  }
  assert(thrown);
}

static void test_make_directories()
{
  TemporaryDirectory tmpdir;
  std::string nested = tmpdir / "a/b/c/";
  make_directories(nested);
  assert(path_exists(tmpdir / "a/b/c"));
  make_directories(nested);
  write_file(tmpdir / "a/file", "x");
  bool thrown = false;
  try
  {
    make_directories(tmpdir / "a/file/d");
  }
  catch (const NotADirectory &)
  {
    thrown = true;
  }
  assert(thrown);
}

static void test_read_errors()
{
  TemporaryDirectory tmpdir;
  bool thrown = false;
  try
  {
    read_file(tmpdir / "missing.pdf");
  }
  catch (const NoSuchFileOrDirectory &)
  {
    thrown = true;
  }
  assert(thrown);
  make_directories(tmpdir / "dir.pdf");
  thrown = false;
  try
  {
    read_file(tmpdir / "dir.pdf");
  }
  catch (const POSIXError &)
  {
    thrown = true;
  }
  assert(thrown);
}

static void test_temporary_directory_cleanup()
{
  std::string path;
  {
    TemporaryDirectory tmpdir;
    path = tmpdir / "";
    make_directories(tmpdir / "x/y");
    write_file(tmpdir / "x/y/z.png", "png");
    assert(path_exists(path));
  }
  assert(!path_exists(path));
}

int main()
{
  test_write_read();
  test_short_write_to_full_device();
  test_long_write_to_full_device();
  test_make_directories();
  test_read_errors();
  test_temporary_directory_cleanup();
  return 0;
}

// vim:ts=2 sts=2 sw=2 et
