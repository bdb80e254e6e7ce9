/* Copyright © 2008-2015 Jakub Wilk <jwilk@jwilk.net>
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

#include "string-utils.hh"

#include <cerrno>
#include <climits>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <vector>

#include "system.hh"

std::string string_vprintf(const char *message, va_list args)
{
    char small_buffer[256];
    va_list args_copy;
    va_copy(args_copy, args);
    int length = vsnprintf(small_buffer, sizeof small_buffer, message, args_copy);
    va_end(args_copy);
    if (length < 0)
        throw_posix_error("vsnprintf()");
    if (static_cast<size_t>(length) < sizeof small_buffer)
        return std::string(small_buffer, length);
    if (length == INT_MAX) {
        errno = ENOMEM;
        throw_posix_error("vsnprintf()");
    }
    std::vector<char> buffer(length + 1);
    length = vsnprintf(buffer.data(), buffer.size(), message, args);
    if (length < 0)
        throw_posix_error("vsnprintf()");
    return std::string(buffer.data(), length);
}

std::string string_printf(const char *message, ...)
{
    va_list args;
    va_start(args, message);
    std::string result = string_vprintf(message, args);
    va_end(args);
    return result;
}

std::string string::join(const std::vector<std::string> &items, const std::string &separator)
{
    std::string result;
    bool first = true;
    for (const std::string &item : items) {
        if (!first)
            result += separator;
        result += item;
        first = false;
    }
    return result;
}

void string::rstrip(std::string &s, const std::string &chars)
{
    size_t pos = s.find_last_not_of(chars);
    if (pos == std::string::npos)
        s.clear();
    else
        s.erase(pos + 1);
}

// vim:ts=4 sts=4 sw=4 et
