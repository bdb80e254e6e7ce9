/* Copyright © 2015 Jakub Wilk <jwilk@jwilk.net>
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

#include "version.hh"

#include <sstream>

#include <Magick++.h>
#include <nlohmann/json.hpp>

#include "autoconf.hh"

static std::string get_gm_version()
{
    unsigned long n;
    std::stringstream stream(
        MagickLib::GetMagickVersion(&n)
    );
    std::string junk, result;
    stream >> junk >> result;
    return result;
}

static std::string get_json_version()
{
    std::ostringstream stream;
    stream
        << NLOHMANN_JSON_VERSION_MAJOR << "."
        << NLOHMANN_JSON_VERSION_MINOR << "."
        << NLOHMANN_JSON_VERSION_PATCH;
    return stream.str();
}

const std::string get_version()
{
    std::ostringstream stream;
    stream << PACKAGE_STRING;
    stream << " (Poppler " POPPLER_VERSION_STRING;
    stream << ", GraphicsMagick++ " << get_gm_version();
    stream << ", nlohmann/json " << get_json_version();
    stream << ")";
    return stream.str();
}

const std::string get_multiline_version()
{
    std::ostringstream stream;
    stream << PACKAGE_STRING << "\n";
    stream << "+ Poppler " POPPLER_VERSION_STRING << "\n";
    stream << "+ GraphicsMagick++ " << get_gm_version() << " (Q" << QuantumDepth << ")\n";
    stream << "+ nlohmann/json " << get_json_version() << "\n";
    return stream.str();
}

// vim:ts=4 sts=4 sw=4 et
