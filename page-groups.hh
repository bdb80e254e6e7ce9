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

#ifndef PDF2EXTRACT_PAGE_GROUPS_HH
#define PDF2EXTRACT_PAGE_GROUPS_HH

#include <stdexcept>
#include <string>
#include <vector>

/* class PageRange
 * ===============
 */

/* Inclusive 1-based range of physical pages, validated against a document. */

class PageRange
{
public:
  int start;
  int end;

  /* Resolves the command-line sentinels:
   * start 0 means the first page;
   * end 0 (or below) means the last page, and larger values are clamped to it.
   */
  static PageRange resolve(int start, int end, int total_pages);

  class Invalid : public std::runtime_error
  {
  public:
    explicit Invalid(const std::string &message)
    : std::runtime_error(message)
    { }
  };
};


/* class Unit
 * ==========
 */

/* One processing unit: a single page, or a spread of two facing pages. */

class Unit
{
public:
  enum kind_t
  {
    SINGLE,
    SPREAD,
  };
protected:
  kind_t kind;
  int left;
  int right;
  Unit(kind_t kind, int left, int right)
  : kind(kind), left(left), right(right)
  { }
public:
  static Unit single(int page);
  static Unit spread(int left, int right);

  kind_t get_kind() const
  {
    return this->kind;
  }

  /* Physical page numbers, ascending. */
  std::vector<int> get_pages() const;

  int get_first_page() const
  {
    return this->left;
  }

  /* "p3" or "p4_5" */
  std::string get_id() const;

  /* "page_3.png" or "page_4_5.png" */
  std::string get_file_name() const;

  bool operator==(const Unit &other) const
  {
    return this->kind == other.kind && this->left == other.left && this->right == other.right;
  }
};

std::vector<Unit> plan_units(int start_page, int end_page, bool spread_mode);

#endif

// vim:ts=2 sts=2 sw=2 et
