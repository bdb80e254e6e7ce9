/* Copyright © 2007-2018 Jakub Wilk <jwilk@jwilk.net>
 * Copyright © 2009 Mateusz Turcza
 * Copyright © 2026 pdf2extract authors
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

#include "autoconf.hh"
#include "system.hh"

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <dirent.h>
#include <libgen.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "debug.hh"

/* constants
 * =========
 */

static const char path_separator = '/';


/* class POSIXError : OSError
 * ==========================
 */

std::string POSIXError::error_message(const std::string &context)
{
  /* POSIX says that ``strerror()`` returns a locale-dependent error message.
   * No need to translate. */
  std::string message = strerror(errno);
  if (context.length())
    message = context + ": " + message;
  return message;
}

void throw_posix_error(const std::string &context)
{
  switch (errno)
  {
  case ENOTDIR:
    throw NotADirectory(context);
  case ENOENT:
    throw NoSuchFileOrDirectory(context);
  default:
    throw POSIXError(context);
  }
}

static void warn_posix_error(const std::string &context)
{
  try
  {
    throw_posix_error(context);
  }
  catch (const POSIXError &e)
  {
    warning(e.what());
  }
}


/* class Directory
 * ===============
 */

std::string Directory::operator/(const std::string &entry) const
{
  return join_path(this->name, entry);
}


/* class OutputDirectory : Directory
 * =================================
 */

OutputDirectory::OutputDirectory(const std::string &name)
: Directory()
{
  make_directories(name);
  this->name = name;
}


/* class TemporaryPathTemplate
 * ===========================
 */

class TemporaryPathTemplate
{
protected:
  std::vector<char> buffer;
  static const char *temporary_directory()
  {
    const char *result = getenv("TMPDIR");
    if (result == nullptr)
      result = P_tmpdir;
    return result;
  }
public:
  TemporaryPathTemplate()
  : buffer(strlen(this->temporary_directory()) + strlen(PACKAGE_NAME) + 9)
  {
    sprintf(
      this->buffer.data(),
      "%s%c%s.XXXXXX",
      this->temporary_directory(),
      path_separator,
      PACKAGE_NAME
    );
  }
  operator char * ()
  {
    return this->buffer.data();
  }
};


/* class TemporaryDirectory : Directory
 * ====================================
 */

TemporaryDirectory::TemporaryDirectory() : Directory()
{
  TemporaryPathTemplate path_buffer;
  if (mkdtemp(path_buffer) == nullptr)
    throw_posix_error(static_cast<char*>(path_buffer));
  this->name += path_buffer;
}

TemporaryDirectory::~TemporaryDirectory()
{
  try
  {
    remove_tree(this->name);
  }
  catch (const POSIXError &e)
  {
    warning(e.what());
  }
}


/* class File : std::fstream
 * =========================
 */

File::openmode File::get_default_open_mode()
{
  return std::fstream::out | std::fstream::trunc;
}

void File::open(const std::string &path, File::openmode mode)
{
  mode |=
    std::fstream::in |
    std::fstream::binary;
  this->exceptions(std::ifstream::failbit | std::ifstream::badbit);
  this->std::fstream::open(path.c_str(), mode);
  this->exceptions(std::ifstream::badbit);
}

File::File(const std::string &path)
{
  this->open(path, this->get_default_open_mode());
}


/* class ExistingFile : File
 * =========================
 */

File::openmode ExistingFile::get_default_open_mode()
{
  return File::openmode();
}

ExistingFile::ExistingFile(const std::string &path)
: File()
{
  this->open(path, this->get_default_open_mode());
}


/* utility functions
 * =================
 */

void copy_stream(std::istream &istream, std::ostream &ostream, bool seek)
{
  if (seek)
    istream.seekg(0, std::ios::beg);
  char buffer[BUFSIZ];
  while (!istream.eof())
  {
    istream.read(buffer, sizeof buffer);
    ostream.write(buffer, istream.gcount());
  }
}

void split_path(const std::string &path, std::string &directory_name, std::string &file_name)
{
  /* POSIX-compliant ``basename()`` and ``dirname()`` would split ``/foo/bar/``
   * into ``/foo`` and ``bar``, instead of desired ``/foo/bar`` and an empty
   * string. To deal with this weirdness, a trailing ``!`` character is
   * appended to the split path.
   */
  {
    std::vector<char> buffer(path.length() + 2);
    sprintf(buffer.data(), "%s!", path.c_str());
    directory_name = ::dirname(buffer.data());
  }
  {
    std::vector<char> buffer(path.length() + 2);
    sprintf(buffer.data(), "%s!", path.c_str());
    file_name = ::basename(buffer.data());
    size_t length = file_name.length();
    assert(length > 0);
    assert(file_name[length - 1] == '!');
    file_name.erase(length - 1);
  }
}

std::string absolute_path(const std::string &path, const std::string &dir_name)
{
  if (path.length() == 0)
    return path;
  if (path[0] != '.')
    return path;
  if (path.length() == 1 || path[1] == path_separator)
    return dir_name + path_separator + path.substr(std::min(static_cast<size_t>(2), path.length()));
  if (path[1] != '.')
    return path;
  if (path.length() == 2 || path[2] == path_separator)
    return dir_name + path_separator + path;
  return path;
}

std::string join_path(const std::string &directory_name, const std::string &file_name)
{
  if (directory_name.empty())
    return file_name;
  if (directory_name[directory_name.length() - 1] == path_separator)
    return directory_name + file_name;
  return directory_name + path_separator + file_name;
}

bool path_exists(const std::string &path)
{
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

void make_directories(const std::string &orig_path)
{
  std::string path = orig_path;
  while (path.length() > 1 && path[path.length() - 1] == path_separator)
    path.erase(path.length() - 1);
  struct stat st;
  if (stat(path.c_str(), &st) == 0)
  {
    if (S_ISDIR(st.st_mode))
      return;
    errno = ENOTDIR;
    throw_posix_error(path);
  }
  std::string parent, base;
  split_path(path, parent, base);
  if (!base.empty() && parent != path)
    make_directories(parent);
  if (mkdir(path.c_str(), 0777) != 0 && errno != EEXIST)
    throw_posix_error(path);
}

void remove_tree(const std::string &path)
{
  DIR *dir = opendir(path.c_str());
  if (dir == nullptr)
    throw_posix_error(path);
  while (true)
  {
    errno = 0;
    struct dirent *entry = readdir(dir);
    if (entry == nullptr)
    {
      if (errno != 0)
      {
        int saved_errno = errno;
        closedir(dir);
        errno = saved_errno;
        throw_posix_error(path);
      }
      break;
    }
    std::string name = entry->d_name;
    if (name == "." || name == "..")
      continue;
    std::string child = join_path(path, name);
    struct stat st;
    if (lstat(child.c_str(), &st) != 0)
    {
      warn_posix_error(child);
      continue;
    }
    if (S_ISDIR(st.st_mode))
    {
      try
      {
        remove_tree(child);
      }
      catch (const POSIXError &e)
      {
        warning(e.what());
      }
    }
    else if (unlink(child.c_str()) != 0)
      warn_posix_error(child);
  }
  if (closedir(dir) != 0)
    throw_posix_error(path);
  if (rmdir(path.c_str()) != 0)
    throw_posix_error(path);
}

std::string read_file(const std::string &path)
{
  struct stat st;
  if (stat(path.c_str(), &st) != 0)
    throw_posix_error(path);
  if (S_ISDIR(st.st_mode))
  {
    errno = EISDIR;
    throw_posix_error(path);
  }
  ExistingFile file(path);
  std::ostringstream buffer;
  copy_stream(file, buffer, false);
  return buffer.str();
}

void write_file(const std::string &path, const std::string &data)
{
  File file(path);
  errno = 0;
  file.write(data.data(), data.size());
  /* Small writes stay buffered until close(); a failed flush only sets
   * failbit, which is not in the exception mask. */
  file.close();
  if (file.fail())
  {
    if (errno == 0)
      errno = EIO;
    throw_posix_error(path);
  }
}

// vim:ts=2 sts=2 sw=2 et
