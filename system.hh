/* Copyright © 2007-2022 Jakub Wilk <jwilk@jwilk.net>
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

#ifndef PDF2EXTRACT_SYSTEM_HH
#define PDF2EXTRACT_SYSTEM_HH

#include <cstddef>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

class OSError : public std::runtime_error
{
protected:
  explicit OSError(const std::string &message)
  : std::runtime_error(message)
  { }
};

class POSIXError : public OSError
{
public:
  static std::string error_message(const std::string &context);
  explicit POSIXError(const std::string &context)
  : OSError(error_message(context))
  { }
};

[[noreturn]]
void throw_posix_error(const std::string &context);

class NoSuchFileOrDirectory : public POSIXError
{
public:
  explicit NoSuchFileOrDirectory(const std::string &context)
  : POSIXError(context)
  { }
};

class NotADirectory : public POSIXError
{
public:
  explicit NotADirectory(const std::string &context)
  : POSIXError(context)
  { }
};

class Directory
{
protected:
  std::string name;
  Directory()
  : name("")
  { }
public:
  virtual ~Directory()
  { }
  std::string operator/(const std::string &entry) const;
};

/* A directory that is created (with parents) if it does not exist yet. */

class OutputDirectory : public Directory
{
public:
  explicit OutputDirectory(const std::string &name);
};

/* A fresh directory under $TMPDIR, removed together with its contents. */

class TemporaryDirectory : public Directory
{
private:
  TemporaryDirectory(const TemporaryDirectory&) = delete;
  TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
public:
  TemporaryDirectory();
  virtual ~TemporaryDirectory();
};

class File : public std::fstream
{
private:
  File(const File&) = delete;
  File& operator=(const File&) = delete;
protected:
  virtual File::openmode get_default_open_mode();
  void open(const std::string &path, File::openmode mode);
  File()
  { }
public:
  explicit File(const std::string &path);
  virtual ~File()
  { }
};

class ExistingFile : public File
{
private:
  ExistingFile(const ExistingFile &) = delete;
  ExistingFile& operator=(const ExistingFile &) = delete;
protected:
  virtual File::openmode get_default_open_mode();
public:
  explicit ExistingFile(const std::string &path);
  virtual ~ExistingFile()
  { }
};

void copy_stream(std::istream &istream, std::ostream &ostream, bool seek);

void split_path(const std::string &path, std::string &directory_name, std::string &file_name);

std::string absolute_path(const std::string &path, const std::string &dir_name);

std::string join_path(const std::string &directory_name, const std::string &file_name);

bool path_exists(const std::string &path);

void make_directories(const std::string &path);

void remove_tree(const std::string &path);

std::string read_file(const std::string &path);

/* Throws POSIXError if the data could not be written out in full. */
void write_file(const std::string &path, const std::string &data);

#endif

// vim:ts=2 sts=2 sw=2 et
